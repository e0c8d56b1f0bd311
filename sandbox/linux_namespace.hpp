#ifndef SANDBOX_LINUX_NAMESPACE_HPP
#define SANDBOX_LINUX_NAMESPACE_HPP
#include "sandbox/unix.hpp"

namespace sandbox {

// Unix sandbox that also moves the program into new user, mount, IPC, UTS
// and (unless the network is allowed) network namespaces. Every mount is made
// read-only except the working directory of the program. Only available if
// unprivileged user namespaces are enabled.
class LinuxNamespace : public Unix {
 public:
  static Sandbox* Create() { return new LinuxNamespace(); }
  static int Score();
  static const char* Name() { return "linux_namespace"; }
  bool IsolatesNetwork() const override { return true; }

 protected:
  LinuxNamespace() = default;
  bool OnChild(char* error_msg, size_t buflen) override;
};

}  // namespace sandbox
#endif
