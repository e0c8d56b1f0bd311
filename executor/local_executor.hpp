#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <memory>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace executor {

// How to run the sources of one language.
struct Interpreter {
  proto::Language language = proto::LANGUAGE_UNSPECIFIED;
  // Absolute path of the interpreter, empty if it is not installed.
  std::string path;
  // Arguments before the name of the source file.
  std::vector<std::string> args;
  // Name given to the source inside the working directory.
  std::string source_file;
  // Strings that the interpreter writes on stderr when it runs out of memory.
  std::vector<std::string> oom_markers;
};

// Interpreters named by --python_interpreter and --dsl_interpreter, looked up
// in PATH.
std::vector<Interpreter> DefaultInterpreters();

// Runs each request in a fresh temporary directory, inside the best sandbox
// available on this machine. Requests whose policy forbids the network are
// refused if that sandbox cannot enforce it, unless allow_unisolated is set.
class LocalExecutor : public Executor {
 public:
  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const proto::SecurityPolicy& policy,
                                 const std::atomic<bool>* cancelled) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;
  LocalExecutor(std::string temp_directory,
                std::vector<Interpreter> interpreters,
                bool keep_sandboxes = false, bool allow_unisolated = false);

 private:
  static const constexpr char* kBoxDir = "box";

  const Interpreter* FindInterpreter(proto::Language language) const;

  // Creates the temporary directory of an execution, trying twice.
  std::unique_ptr<util::TempDir> MakeWorkingArea() const;

  sandbox::ExecutionOptions MakeOptions(const Interpreter& interpreter,
                                        const std::string& sandbox_dir,
                                        const proto::SecurityPolicy& policy,
                                        const std::atomic<bool>* cancelled);

  proto::ExecutionResult MakeResult(const sandbox::ExecutionInfo& info,
                                    const Interpreter& interpreter,
                                    const proto::SecurityPolicy& policy);

  std::string temp_directory_;
  std::vector<Interpreter> interpreters_;
  bool keep_sandboxes_;
  bool allow_unisolated_;
};

}  // namespace executor

#endif
