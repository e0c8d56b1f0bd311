#ifndef POLICY_POLICY_STORE_HPP
#define POLICY_POLICY_STORE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "proto/policy.pb.h"

namespace policy {

class invalid_policy : public std::runtime_error {
 public:
  explicit invalid_policy(const std::string& msg) : std::runtime_error(msg) {}
};

// Holds the active security policy. Readers take a snapshot that stays valid
// for as long as they hold it, even across reloads.
class PolicyStore {
 public:
  // Throws invalid_policy if initial is not valid.
  explicit PolicyStore(const proto::SecurityPolicy& initial);

  std::shared_ptr<const proto::SecurityPolicy> Current() const;

  // Replaces the policy if it is valid. Returns the list of problems found,
  // empty on success; on failure the active policy is unchanged.
  std::vector<std::string> Reload(const proto::SecurityPolicy& policy);

  // Built-in policy used when no policy file is given.
  static proto::SecurityPolicy DefaultPolicy();

  // Returns the list of violated invariants.
  static std::vector<std::string> Validate(const proto::SecurityPolicy& policy);

  // Parses a text-format policy. Zero ceilings and an empty list of enabled
  // languages are filled in from DefaultPolicy. Throws on parse errors.
  static proto::SecurityPolicy LoadFromFile(const std::string& path);

  PolicyStore(const PolicyStore&) = delete;
  PolicyStore& operator=(const PolicyStore&) = delete;

 private:
  // Accessed only through std::atomic_load and std::atomic_store.
  std::shared_ptr<const proto::SecurityPolicy> current_;
};

}  // namespace policy

#endif
