#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. The program runs in a new
// session, with resource limits, a cleared environment and its standard
// output and error captured through pipes. Whatever happens, every process
// in its group is killed before Execute returns. The sandboxing process
// becomes a child subreaper, so that descendants that leave the group are
// adopted by it and killed as well.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }
  static const char* Name() { return "unix"; }
  ~Unix() override;

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Hook that is executed at the end of Setup.
  virtual bool OnSetup(std::string* error_msg) { return true; }

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed after the child has entered its own session and
  // before its resource limits are applied. Returns false if something went
  // wrong and exec should not be called. The error_msg string must not be
  // longer then buflen characters. This function must not use dynamic memory
  // allocation.
  virtual bool OnChild(char* error_msg, size_t buflen) { return true; }

  // Waits for the termination of the child while collecting its output,
  // stopping it if it exceeds one of its limits or gets cancelled.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* info) {}

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  pid_t parent_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

 private:
  // Sends SIGTERM to the process group and schedules the SIGKILL.
  void Terminate(ExecutionInfo::Termination reason, ExecutionInfo* info);
  // Kills the whole process group. The child must not have been reaped yet.
  void KillGroup();
  // Kills the process group and the adopted descendants until none of them is
  // left. The child must not have been reaped yet.
  void KillTree();
  // One pass of KillTree. Returns the number of processes that were still
  // alive.
  int Sweep();
  // Removes the reaped child from the set of live children.
  void Forget();
  // Reads what is available on the given pipe. Returns false on EOF.
  bool Drain(int fd, std::string* data, bool* truncated, ExecutionInfo* info);
  void CloseFds();

  // Arguments and environment for exec, prepared before fork.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;

  std::chrono::steady_clock::time_point program_start_;
  bool terminating_ = false;
  std::chrono::steady_clock::time_point kill_deadline_;
  bool reaped_ = true;
};

}  // namespace sandbox
#endif
