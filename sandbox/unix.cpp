#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <thread>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

#include "absl/synchronization/mutex.h"
#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Resident set size of the process, in KiB.
int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  int fd = open(("/proc/" + std::to_string(pid) + "/statm").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return fd;
  char buf[256] = {};
  int num_read = 0;
  int cur = 0;
  do {
    cur = read(fd, buf + num_read, sizeof(buf) - 1 - num_read);
    if (cur < 0) {
      close(fd);
      return -1;
    }
    num_read += cur;
  } while (cur > 0 && num_read < static_cast<int>(sizeof(buf)) - 1);
  close(fd);
  long long size = 0;
  long long resident = 0;
  if (sscanf(buf, "%lld %lld", &size, &resident) != 2) return -1;
  *memory_usage_kb = resident * (sysconf(_SC_PAGESIZE) / 1024);
  return 0;
}

// Fields of /proc/<pid>/stat needed to find the processes of a sandbox.
struct ProcStat {
  char state = 0;
  pid_t ppid = 0;
  pid_t pgrp = 0;
};

bool ReadProcStat(const char* pid, ProcStat* stat) {
  int fd = open((std::string("/proc/") + pid + "/stat").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char buf[512] = {};
  ssize_t len = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (len <= 0) return false;
  // The command name is between parentheses and may contain anything.
  const char* end = strrchr(buf, ')');
  if (end == nullptr) return false;
  int ppid = 0;
  int pgrp = 0;
  if (sscanf(end + 1, " %c %d %d", &stat->state, &ppid, &pgrp) != 3) {
    return false;
  }
  stat->ppid = ppid;
  stat->pgrp = pgrp;
  return true;
}

// Direct children of the sandboxes that have not been reaped yet. Processes
// adopted by this process are the ones that are not here.
struct LiveChildren {
  absl::Mutex mutex;
  std::multiset<pid_t> pids ABSL_GUARDED_BY(mutex);
};

LiveChildren* Children() {
  static LiveChildren* children = new LiveChildren;
  return children;
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

// How long to keep reading the pipes after the child exited. Processes that
// escaped the process group could keep them open forever.
const constexpr auto kDrainTimeout = std::chrono::milliseconds(100);
// How long KillTree keeps looking for processes to kill.
const constexpr auto kKillTreeTimeout = std::chrono::seconds(5);
const constexpr int kPollMillis = 10;
const constexpr int kMaxFdToClose = 64 * 1024;
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

Unix::~Unix() {
  if (!reaped_) {
    kill(child_pid_, SIGKILL);
    KillTree();
    while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
    Forget();
  }
  CloseFds();
}

void Unix::CloseFds() {
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    for (int i = 0; i < 2; i++) {
      if (fds[i] != -1) close(fds[i]);
      fds[i] = -1;
    }
  }
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  terminating_ = false;
  bool ok = Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
  CloseFds();
  return ok;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    if (pipe2(fds, O_CLOEXEC) == -1) {
      *error_msg = "pipe2: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }

  // The child must not allocate memory: build exec's arrays here.
  arg_storage_.clear();
  auto add = [this](const std::string& s) {
    arg_storage_.emplace_back(s.begin(), s.end());
    arg_storage_.back().push_back(0);
  };
  add(options_->executable);
  for (const std::string& arg : options_->args) add(arg);
  for (const std::string& var : options_->env) add(var);
  size_t num_args = options_->args.size() + 1;
  argv_.clear();
  envp_.clear();
  for (size_t i = 0; i < arg_storage_.size(); i++) {
    (i < num_args ? argv_ : envp_).push_back(arg_storage_[i].data());
  }
  argv_.push_back(nullptr);
  envp_.push_back(nullptr);

  parent_pid_ = getpid();
#ifdef __linux__
  // Orphans of the program are reparented here instead of to init.
  if (prctl(PR_SET_CHILD_SUBREAPER, 1) == -1) {
    *error_msg = "prctl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
#endif
  return OnSetup(error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  LiveChildren* children = Children();
  // Held across fork, so that Sweep never sees the child before it is known.
  absl::MutexLock lck(&children->mutex);
  program_start_ = std::chrono::steady_clock::now();
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    children->pids.insert(child_pid_);
    reaped_ = false;
    return true;
  } else {
    Child();
  }
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group: the whole tree can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = open(
      options_->stdin_file.empty() ? "/dev/null" : options_->stdin_file.c_str(),
      O_RDONLY);
  if (stdin_fd == -1) die("open", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }

#ifdef __linux__
  // Set after OnChild, as changing credentials may clear it.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
  // The parent may have died before prctl.
  if (getppid() != parent_pid_) _Exit(1);
#endif

  // Handle I/O redirection.
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) die("redir stderr", errno);

  // Nothing else of the parent must leak into the program.
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > kMaxFdToClose) max_fd = kMaxFdToClose;
  for (int fd = STDERR_FILENO + 1; fd < max_fd; fd++) {
    if (fd != pipe_fds_[1]) close(fd);
  }

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM

  // SIGXCPU at the soft limit, SIGKILL one second later.
  if (options_->cpu_limit_millis) {
    rlim.rlim_cur = (options_->cpu_limit_millis + 999) / 1000;
    rlim.rlim_max = rlim.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rlim) < 0) die("setrlim CPU", errno);
  }

  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  int count = 0;
  do {
    execve(options_->executable.c_str(), argv_.data(), envp_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillGroup() {
  if (killpg(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "killpg " << child_pid_;
  }
}

int Unix::Sweep() {
  LiveChildren* children = Children();
  absl::MutexLock lck(&children->mutex);
  DIR* proc = opendir("/proc");
  if (proc == nullptr) {
    PLOG(WARNING) << "opendir /proc";
    return 0;
  }
  pid_t self = getpid();
  int alive = 0;
  while (struct dirent* entry = readdir(proc)) {
    if (entry->d_name[0] < '0' || entry->d_name[0] > '9') continue;
    ProcStat stat;
    if (!ReadProcStat(entry->d_name, &stat)) continue;
    pid_t pid = atoi(entry->d_name);
    bool adopted = stat.ppid == self && children->pids.count(pid) == 0;
    if (stat.state == 'Z' || stat.state == 'X') {
      if (adopted) waitpid(pid, nullptr, WNOHANG);
      continue;
    }
    // Adopted processes still in the group of a running sandbox belong to
    // it: it kills them when its program exits.
    bool escaped = adopted && children->pids.count(stat.pgrp) == 0;
    if (stat.pgrp == child_pid_ || escaped) {
      if (kill(pid, SIGKILL) == -1 && errno != ESRCH) {
        PLOG(WARNING) << "kill " << pid;
      }
      alive++;
    }
  }
  closedir(proc);
  return alive;
}

void Unix::KillTree() {
  auto deadline = std::chrono::steady_clock::now() + kKillTreeTimeout;
  while (true) {
    KillGroup();
    int alive = Sweep();
    if (alive == 0) return;
    if (std::chrono::steady_clock::now() > deadline) {
      LOG(WARNING) << alive << " processes started by " << child_pid_
                   << " could not be killed";
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

void Unix::Forget() {
  LiveChildren* children = Children();
  absl::MutexLock lck(&children->mutex);
  auto it = children->pids.find(child_pid_);
  if (it != children->pids.end()) children->pids.erase(it);
}

void Unix::Terminate(ExecutionInfo::Termination reason, ExecutionInfo* info) {
  if (terminating_) return;
  terminating_ = true;
  info->killed_for = reason;
  kill_deadline_ = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(options_->kill_grace_millis);
  if (options_->kill_grace_millis <= 0) {
    KillGroup();
    return;
  }
  if (killpg(child_pid_, SIGTERM) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "killpg " << child_pid_;
  }
}

bool Unix::Drain(int fd, std::string* data, bool* truncated,
                 ExecutionInfo* info) {
  char buf[16 * 1024];
  ssize_t n = read(fd, buf, sizeof(buf));
  if (n == -1) {
    if (errno == EINTR || errno == EAGAIN) return true;
    PLOG(WARNING) << "read";
    return false;
  }
  if (n == 0) return false;
  int64_t limit = options_->max_output_bytes;
  if (limit <= 0) {
    data->append(buf, n);
    return true;
  }
  int64_t room = limit - static_cast<int64_t>(data->size());
  if (room > 0) data->append(buf, std::min<int64_t>(room, n));
  if (n > room) {
    *truncated = true;
    Terminate(ExecutionInfo::Termination::OUTPUT_LIMIT, info);
  }
  return true;
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  close(stdout_fds_[1]);
  stdout_fds_[1] = -1;
  close(stderr_fds_[1]);
  stderr_fds_[1] = -1;

  int error_len = 0;
  ssize_t ret = 0;
  do {
    ret = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (ret == -1 && errno == EINTR);
  if (ret == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) {
      *error_msg = "child setup failed";
    } else {
      *error_msg = error;
    }
    while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
    Forget();
    return false;
  }

  auto elapsed_millis = [this]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start_)
        .count();
  };

  bool stdout_open = true;
  bool stderr_open = true;
  bool has_exited = false;
  std::chrono::steady_clock::time_point exit_time;
  int64_t peak_memory_kb = 0;
  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (!has_exited) {
      // Do not reap the child yet: as long as it is a zombie, its process
      // group id cannot be reused and killpg is safe.
      siginfo_t si = {};
      if (waitid(P_PID, child_pid_, &si, WEXITED | WNOHANG | WNOWAIT) == -1) {
        if (errno != EINTR) {
          *error_msg = "waitid: ";
          *error_msg += strerror(errno);
          return false;
        }
      } else if (si.si_pid == child_pid_) {
        has_exited = true;
        exit_time = now;
        KillTree();
      }
    }
    if (has_exited && ((!stdout_open && !stderr_open) ||
                       now - exit_time > kDrainTimeout)) {
      break;
    }
    if (!has_exited) {
      int64_t memory_kb = 0;
      if (GetProcessMemoryUsage(child_pid_, &memory_kb) == 0) {
        peak_memory_kb = std::max(peak_memory_kb, memory_kb);
      }
      if (terminating_) {
        if (now >= kill_deadline_) KillGroup();
      } else if (options_->cancelled != nullptr && options_->cancelled->load()) {
        Terminate(ExecutionInfo::Termination::CANCELLED, info);
      } else if (options_->wall_limit_millis &&
                 elapsed_millis() >= options_->wall_limit_millis) {
        Terminate(ExecutionInfo::Termination::WALL_LIMIT, info);
      } else if (options_->memory_limit_kb &&
                 memory_kb > options_->memory_limit_kb) {
        Terminate(ExecutionInfo::Termination::MEMORY_LIMIT, info);
      }
    }

    struct pollfd fds[2];
    std::string* data[2];
    bool* truncated[2];
    bool* open_flag[2];
    int nfds = 0;
    if (stdout_open) {
      fds[nfds] = {stdout_fds_[0], POLLIN, 0};
      data[nfds] = &info->stdout_data;
      truncated[nfds] = &info->stdout_truncated;
      open_flag[nfds++] = &stdout_open;
    }
    if (stderr_open) {
      fds[nfds] = {stderr_fds_[0], POLLIN, 0};
      data[nfds] = &info->stderr_data;
      truncated[nfds] = &info->stderr_truncated;
      open_flag[nfds++] = &stderr_open;
    }
    int ready = poll(fds, nfds, kPollMillis);
    if (ready == -1) {
      if (errno == EINTR) continue;
      *error_msg = "poll: ";
      *error_msg += strerror(errno);
      return false;
    }
    for (int i = 0; i < nfds; i++) {
      if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
        if (!Drain(fds[i].fd, data[i], truncated[i], info)) {
          *open_flag[i] = false;
        }
      }
    }
  }

  // wait4 rather than waitpid: the latter does not return the resource usage
  // of the child.
  int child_status = 0;
  struct rusage rusage = {};
  while (wait4(child_pid_, &child_status, 0, &rusage) == -1) {
    if (errno != EINTR) {
      *error_msg = "wait4: ";
      *error_msg += strerror(errno);
      return false;
    }
  }
  reaped_ = true;
  Forget();

  // ru_maxrss is in KiB on Linux.
  info->memory_usage_kb = std::max<int64_t>(peak_memory_kb, rusage.ru_maxrss);
  info->exited = WIFEXITED(child_status);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(exit_time -
                                                            program_start_)
          .count();
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);

  OnFinish(info);
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
