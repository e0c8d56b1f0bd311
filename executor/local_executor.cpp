#include "executor/local_executor.hpp"

#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {
// A signal death with this fraction of the memory limit in use is counted as
// an out-of-memory failure.
const constexpr double kMemoryKillRatio = 0.9;

// Only the interpreter's own installation is needed on PATH.
const constexpr char* kSandboxPath = "/usr/local/bin:/usr/bin:/bin";

std::string RealPath(const std::string& path) {
  char buf[PATH_MAX] = {};
  if (realpath(path.c_str(), buf) == nullptr) {
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  }
  return buf;
}

// Only the last line counts: a traceback may mention an out-of-memory error
// that was handled.
bool HasOomMarker(absl::string_view stderr_text,
                  const executor::Interpreter& interpreter) {
  absl::string_view last_line = absl::StripTrailingAsciiWhitespace(stderr_text);
  size_t newline = last_line.rfind('\n');
  if (newline != absl::string_view::npos) {
    last_line.remove_prefix(newline + 1);
  }
  for (const std::string& marker : interpreter.oom_markers) {
    if (absl::StartsWith(last_line, marker)) return true;
  }
  return false;
}

bool IsMemoryExceeded(const sandbox::ExecutionInfo& info,
                      const executor::Interpreter& interpreter,
                      int64_t memory_limit_kb) {
  if (info.killed_for == sandbox::ExecutionInfo::Termination::MEMORY_LIMIT) {
    return true;
  }
  if (info.exited && info.status_code == 0) return false;
  if (!info.exited && memory_limit_kb > 0 &&
      (info.signal == SIGSEGV || info.signal == SIGABRT ||
       info.signal == SIGKILL) &&
      info.memory_usage_kb >= kMemoryKillRatio * memory_limit_kb) {
    return true;
  }
  return HasOomMarker(info.stderr_data, interpreter);
}
}  // namespace

namespace executor {

std::vector<Interpreter> DefaultInterpreters() {
  Interpreter python;
  python.language = proto::GENERAL_PURPOSE;
  python.path = util::which(FLAGS_python_interpreter);
  // Isolated mode: no user site-packages, no PYTHON* variables, the working
  // directory is not added to sys.path.
  python.args = {"-I", "-u"};
  python.source_file = "main.py";
  python.oom_markers = {"MemoryError"};

  Interpreter dsl;
  dsl.language = proto::DSL;
  dsl.path = util::which(FLAGS_dsl_interpreter);
  dsl.args = {"run"};
  dsl.source_file = "main.jac";
  // The DSL runs on top of the Python runtime.
  dsl.oom_markers = {"MemoryError"};

  for (const Interpreter* interpreter : {&python, &dsl}) {
    if (interpreter->path.empty()) {
      LOG(WARNING) << "No interpreter found for "
                   << proto::Language_Name(interpreter->language)
                   << ": its executions will fail";
    } else {
      LOG(INFO) << proto::Language_Name(interpreter->language) << " runs with "
                << interpreter->path;
    }
  }
  return {python, dsl};
}

LocalExecutor::LocalExecutor(std::string temp_directory,
                             std::vector<Interpreter> interpreters,
                             bool keep_sandboxes, bool allow_unisolated)
    : interpreters_(std::move(interpreters)),
      keep_sandboxes_(keep_sandboxes),
      allow_unisolated_(allow_unisolated) {
  util::File::MakeDirs(temp_directory);
  // The working area is also used as HOME and TMPDIR, which must be
  // absolute.
  temp_directory_ = RealPath(temp_directory);
}

const Interpreter* LocalExecutor::FindInterpreter(
    proto::Language language) const {
  for (const Interpreter& interpreter : interpreters_) {
    if (interpreter.language == language) return &interpreter;
  }
  return nullptr;
}

std::unique_ptr<util::TempDir> LocalExecutor::MakeWorkingArea() const {
  try {
    return absl::make_unique<util::TempDir>(temp_directory_);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Creating a working area failed, retrying: " << e.what();
  }
  return absl::make_unique<util::TempDir>(temp_directory_);
}

proto::ExecutionResult LocalExecutor::Execute(
    const proto::ExecutionRequest& request,
    const proto::SecurityPolicy& policy, const std::atomic<bool>* cancelled) {
  const Interpreter* interpreter = FindInterpreter(request.language());
  if (interpreter == nullptr || interpreter->path.empty()) {
    throw std::runtime_error("No interpreter for " +
                             proto::Language_Name(request.language()));
  }

  std::unique_ptr<util::TempDir> tmp = MakeWorkingArea();
  if (keep_sandboxes_) tmp->Keep();
  std::string sandbox_dir = util::File::JoinPath(tmp->Path(), kBoxDir);
  util::File::MakeDirs(sandbox_dir);
  util::File::Write(
      util::File::JoinPath(sandbox_dir, interpreter->source_file),
      request.source_text());

  sandbox::ExecutionOptions exec_options =
      MakeOptions(*interpreter, sandbox_dir, policy, cancelled);
  if (!request.stdin_text().empty()) {
    // Outside of the box: the program cannot modify it.
    exec_options.stdin_file = util::File::JoinPath(tmp->Path(), "stdin");
    util::File::Write(exec_options.stdin_file, request.stdin_text());
  }

  // Spawning is retried once: fork can fail transiently under load.
  sandbox::ExecutionInfo info;
  std::string error_msg;
  for (int attempt = 0;; attempt++) {
    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    if (!sb) throw std::runtime_error("No sandbox available");
    if (!policy.network_allowed() && !sb->IsolatesNetwork() &&
        !allow_unisolated_) {
      throw std::runtime_error(
          "The sandbox cannot cut the program off from the network");
    }
    info = sandbox::ExecutionInfo();
    error_msg.clear();
    if (sb->Execute(exec_options, &info, &error_msg)) break;
    if (attempt == 1 || (cancelled != nullptr && cancelled->load())) {
      throw std::runtime_error(error_msg);
    }
    LOG(WARNING) << "Starting the interpreter failed, retrying: " << error_msg;
  }
  VLOG(1) << "Execution in " << tmp->Path() << " took "
          << info.wall_time_millis << "ms, " << info.memory_usage_kb << "KiB";
  return MakeResult(info, *interpreter, policy);
}

sandbox::ExecutionOptions LocalExecutor::MakeOptions(
    const Interpreter& interpreter, const std::string& sandbox_dir,
    const proto::SecurityPolicy& policy, const std::atomic<bool>* cancelled) {
  sandbox::ExecutionOptions exec_options(sandbox_dir, interpreter.path);
  exec_options.args = interpreter.args;
  exec_options.args.push_back(interpreter.source_file);
  exec_options.env = {
      absl::StrCat("PATH=", kSandboxPath),
      absl::StrCat("HOME=", sandbox_dir),
      absl::StrCat("TMPDIR=", sandbox_dir),
      "LANG=C.UTF-8",
      "PYTHONDONTWRITEBYTECODE=1",
  };

  // Limits.
  exec_options.wall_limit_millis = policy.max_wall_clock_seconds() * 1000;
  // The wall clock limit is the real one: this only catches programs the
  // watcher failed to stop.
  exec_options.cpu_limit_millis = exec_options.wall_limit_millis + 1000;
  exec_options.memory_limit_kb = policy.max_memory_bytes() / 1024;
  exec_options.max_output_bytes = policy.max_output_bytes();
  exec_options.kill_grace_millis = policy.kill_grace_millis();
  exec_options.max_procs = policy.max_processes();
  exec_options.max_files = policy.max_open_files();
  exec_options.max_file_size_kb = (policy.max_file_size_bytes() + 1023) / 1024;
  exec_options.network_allowed = policy.network_allowed();
  exec_options.cancelled = cancelled;
  return exec_options;
}

proto::ExecutionResult LocalExecutor::MakeResult(
    const sandbox::ExecutionInfo& info, const Interpreter& interpreter,
    const proto::SecurityPolicy& policy) {
  using Termination = sandbox::ExecutionInfo::Termination;
  proto::ExecutionResult result;
  result.set_stdout_text(info.stdout_data);
  result.set_stdout_truncated(info.stdout_truncated);
  result.set_stderr_text(info.stderr_data);
  result.set_stderr_truncated(info.stderr_truncated);
  result.set_wall_clock_ms(info.wall_time_millis);
  result.set_cpu_time_ms(info.cpu_time_millis + info.sys_time_millis);
  result.set_peak_memory_bytes(info.memory_usage_kb * 1024);
  if (info.exited) {
    result.set_exit_code(info.status_code);
  } else {
    result.set_term_signal(info.signal);
  }

  // Termination status.
  int64_t memory_limit_kb = policy.max_memory_bytes() / 1024;
  if (info.killed_for == Termination::CANCELLED) {
    result.set_status(proto::CANCELLED);
    result.set_reason("Cancelled");
  } else if (info.killed_for == Termination::WALL_LIMIT) {
    result.set_status(proto::TIMEOUT);
    result.set_reason("Wall clock limit exceeded");
  } else if (!info.exited && info.signal == SIGXCPU) {
    result.set_status(proto::TIMEOUT);
    result.set_reason("CPU limit exceeded");
  } else if (IsMemoryExceeded(info, interpreter, memory_limit_kb)) {
    result.set_status(proto::MEMORY_EXCEEDED);
    result.set_reason("Memory limit exceeded");
  } else if (info.killed_for == Termination::OUTPUT_LIMIT ||
             info.stdout_truncated || info.stderr_truncated) {
    result.set_status(proto::OUTPUT_TRUNCATED);
    result.set_reason("Output limit exceeded");
  } else if (info.exited && info.status_code == 0) {
    result.set_status(proto::SUCCESS);
  } else if (info.exited) {
    result.set_status(proto::RUNTIME_ERROR);
    result.set_reason(absl::StrCat("Exited with code ", info.status_code));
  } else {
    result.set_status(proto::RUNTIME_ERROR);
    result.set_reason(absl::StrCat("Killed by signal ", info.signal, " (",
                                   strsignal(info.signal), ")"));
  }
  return result;
}

}  // namespace executor
