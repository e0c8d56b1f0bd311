#include "sandbox/linux_namespace.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <sched.h>
#include <stdio.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

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

// Everything in this file until Score runs in a freshly forked child: no
// dynamic memory allocation.

bool Fail(const char* what, int err, char* error_msg, size_t buflen) {
  char buf[256] = {};
  snprintf(error_msg, buflen, "%s: %s", what, mystrerror(err, buf, sizeof(buf)));
  return false;
}

int WriteProcFile(const char* path, const char* content) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return errno;
  size_t len = strlen(content);
  int ret = 0;
  if (write(fd, content, len) != static_cast<ssize_t>(len)) ret = errno;
  close(fd);
  return ret;
}

// Bind mounts keep the flags of the underlying mount that are locked in a
// user namespace: they must be repeated when remounting.
int RemountReadOnly(const char* path) {
  struct statvfs st;
  if (statvfs(path, &st) == -1) return errno;
  unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY;
  if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  if (mount(nullptr, path, nullptr, flags, nullptr) == -1) return errno;
  return 0;
}

bool IsUnder(const char* path, const char* dir) {
  size_t len = strlen(dir);
  return strncmp(path, dir, len) == 0 &&
         (path[len] == '\0' || path[len] == '/');
}

// Decodes the \ooo escapes of /proc/self/mountinfo in place.
void Unescape(char* s) {
  char* out = s;
  for (char* in = s; *in;) {
    if (in[0] == '\\' && in[1] >= '0' && in[1] <= '7' && in[2] >= '0' &&
        in[2] <= '7' && in[3] >= '0' && in[3] <= '7') {
      *out++ = (in[1] - '0') * 64 + (in[2] - '0') * 8 + (in[3] - '0');
      in += 4;
    } else {
      *out++ = *in++;
    }
  }
  *out = '\0';
}

// Remounts read-only every mount point except "/" (handled by the caller)
// and the ones inside keep. Failures are ignored: some special filesystems
// cannot be remounted.
void RemountOthersReadOnly(const char* keep) {
  int fd = open("/proc/self/mountinfo", O_RDONLY | O_CLOEXEC);
  if (fd == -1) return;
  char info[64 * 1024];
  size_t len = 0;
  ssize_t cur = 0;
  while (len < sizeof(info) - 1 &&
         (cur = read(fd, info + len, sizeof(info) - 1 - len)) > 0) {
    len += cur;
  }
  close(fd);
  info[len] = '\0';

  char* line = info;
  while (*line) {
    char* end = strchr(line, '\n');
    if (end == nullptr) break;  // Incomplete last line.
    *end = '\0';
    // The mount point is the fifth field.
    char* field = line;
    for (int i = 0; i < 4 && field != nullptr; i++) {
      field = strchr(field, ' ');
      if (field != nullptr) field++;
    }
    if (field != nullptr) {
      char* field_end = strchr(field, ' ');
      if (field_end != nullptr) *field_end = '\0';
      Unescape(field);
      if (strcmp(field, "/") != 0 && (keep == nullptr || !IsUnder(field, keep))) {
        RemountReadOnly(field);
      }
    }
    line = end + 1;
  }
}

// Moves the calling process into new namespaces. If root is not null, it
// stays writable and becomes the working directory.
bool EnterNamespaces(const char* root, bool network_allowed, char* error_msg,
                     size_t buflen) {
  uid_t uid = getuid();
  gid_t gid = getgid();
  int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS;
  if (!network_allowed) flags |= CLONE_NEWNET;
  if (unshare(flags) == -1) return Fail("unshare", errno, error_msg, buflen);

  // Keep the same ids inside the namespace.
  int err = WriteProcFile("/proc/self/setgroups", "deny");
  if (err != 0 && err != ENOENT) {
    return Fail("setgroups", err, error_msg, buflen);
  }
  char map[64] = {};
  snprintf(map, sizeof(map), "%u %u 1\n", uid, uid);
  if ((err = WriteProcFile("/proc/self/uid_map", map)) != 0) {
    return Fail("uid_map", err, error_msg, buflen);
  }
  snprintf(map, sizeof(map), "%u %u 1\n", gid, gid);
  if ((err = WriteProcFile("/proc/self/gid_map", map)) != 0) {
    return Fail("gid_map", err, error_msg, buflen);
  }

  // Do not propagate anything back to the parent namespace.
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
    return Fail("mount private", errno, error_msg, buflen);
  }
  if (root != nullptr &&
      mount(root, root, nullptr, MS_BIND | MS_REC, nullptr) == -1) {
    return Fail("mount bind", errno, error_msg, buflen);
  }
  if ((err = RemountReadOnly("/")) != 0) {
    return Fail("remount /", err, error_msg, buflen);
  }
  RemountOthersReadOnly(root);
  // The old working directory is on the read-only mount below the bind.
  if (root != nullptr && chdir(root) == -1) {
    return Fail("chdir", errno, error_msg, buflen);
  }
  return true;
}
}  // namespace

namespace sandbox {

bool LinuxNamespace::OnChild(char* error_msg, size_t buflen) {
  char root[PATH_MAX] = {};
  if (getcwd(root, sizeof(root)) == nullptr) {
    return Fail("getcwd", errno, error_msg, buflen);
  }
  return EnterNamespaces(root, options_->network_allowed, error_msg, buflen);
}

int LinuxNamespace::Score() {
  // Namespaces can be disabled (or forbidden by seccomp filters of a
  // container): try them in a child process.
  static const int score = []() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
      PLOG(WARNING) << "pipe2";
      return -1;
    }
    pid_t pid = fork();
    if (pid == -1) {
      PLOG(WARNING) << "fork";
      close(fds[0]);
      close(fds[1]);
      return -1;
    }
    if (pid == 0) {
      close(fds[0]);
      char error_msg[512] = {};
      if (EnterNamespaces(nullptr, false, error_msg, sizeof(error_msg))) {
        _exit(0);
      }
      if (write(fds[1], error_msg, strlen(error_msg)) < 0) _exit(2);
      _exit(1);
    }
    close(fds[1]);
    char error_msg[512] = {};
    ssize_t len = read(fds[0], error_msg, sizeof(error_msg) - 1);
    close(fds[0]);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return 3;
    LOG(WARNING) << "Linux namespaces are not available ("
                 << (len > 0 ? error_msg : "unknown error")
                 << "): programs will run without filesystem and network "
                    "isolation";
    return -1;
  }();
  return score;
}

namespace {
Sandbox::Register<LinuxNamespace> r;
}  // namespace

}  // namespace sandbox
