#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values. A zero limit means "no limit".
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;

  // Bytes kept from each of stdout and stderr. When a stream goes over the
  // limit the rest is discarded and the program is terminated.
  int64_t max_output_bytes = 0;

  // Time between SIGTERM and SIGKILL when the program has to be stopped.
  int64_t kill_grace_millis = 500;

  // When false, the program must not be able to reach the network.
  bool network_allowed = false;

  // Standard input is read from this file, or from /dev/null if empty.
  std::string stdin_file = "";
  std::vector<std::string> args;
  // Full environment of the program, as KEY=VALUE strings.
  std::vector<std::string> env;

  // If not null, polled while the program runs: when it becomes true the
  // program is stopped as if its wall clock limit expired.
  const std::atomic<bool>* cancelled = nullptr;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  // Why the sandbox stopped the program, if it did.
  enum class Termination {
    NONE,
    WALL_LIMIT,
    MEMORY_LIMIT,
    OUTPUT_LIMIT,
    CANCELLED
  };

  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  // Peak resident memory observed for the program.
  int64_t memory_usage_kb = 0;
  // Exit code, meaningful only if exited is true.
  int32_t status_code = 0;
  int32_t signal = 0;
  bool exited = false;
  Termination killed_for = Termination::NONE;

  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create, Score and Name static functions. Create should return a pointer to a
// newly allocated instance of the given implementation, while Score should
// return a value that defines how "good" that sandbox is: negative if the
// sandbox should not/cannot be used in the current configuration, positive
// otherwise (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Name of the implementation returned by Create, or an empty string if no
  // usable sandbox is available.
  static std::string BestName();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe, but distinct
  // instances may be used concurrently.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Whether the program is cut off from the network when the options do not
  // allow it.
  virtual bool IsolatesNetwork() const { return false; }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score, T::Name()); }
  };

 private:
  struct Entry {
    create_t create;
    score_t score;
    std::string name;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static int Best_();
  static void Register_(create_t, score_t, std::string);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
