#include "policy/policy_store.hpp"

#include <ctype.h>

#include <atomic>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"

namespace {
bool IsIdentifier(absl::string_view name) {
  if (name.empty()) return false;
  if (!isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
    return false;
  }
  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

// a, a.b, a.b.c
bool IsIdentifierPath(const std::string& name) {
  for (absl::string_view part : absl::StrSplit(name, '.')) {
    if (!IsIdentifier(part)) return false;
  }
  return true;
}
}  // namespace

namespace policy {

PolicyStore::PolicyStore(const proto::SecurityPolicy& initial) {
  std::vector<std::string> errors = Validate(initial);
  if (!errors.empty()) {
    throw invalid_policy(absl::StrJoin(errors, "; "));
  }
  std::shared_ptr<const proto::SecurityPolicy> snapshot =
      std::make_shared<proto::SecurityPolicy>(initial);
  std::atomic_store(&current_, snapshot);
}

std::shared_ptr<const proto::SecurityPolicy> PolicyStore::Current() const {
  return std::atomic_load(&current_);
}

std::vector<std::string> PolicyStore::Reload(
    const proto::SecurityPolicy& policy) {
  std::vector<std::string> errors = Validate(policy);
  if (!errors.empty()) {
    LOG(WARNING) << "Rejected policy reload: " << absl::StrJoin(errors, "; ");
    return errors;
  }
  std::shared_ptr<const proto::SecurityPolicy> snapshot =
      std::make_shared<proto::SecurityPolicy>(policy);
  std::atomic_store(&current_, snapshot);
  LOG(INFO) << "Security policy reloaded";
  return errors;
}

proto::SecurityPolicy PolicyStore::DefaultPolicy() {
  proto::SecurityPolicy policy;
  policy.set_max_wall_clock_seconds(30);
  policy.set_max_memory_bytes(128LL << 20);
  policy.set_max_output_bytes(1024);
  policy.set_max_source_bytes(100 << 10);
  for (const char* name :
       {"os", "sys", "subprocess", "importlib", "shutil", "socket", "ctypes"}) {
    policy.add_forbidden_imports(name);
  }
  for (const char* name :
       {"eval", "exec", "open", "__import__", "compile", "globals", "locals"}) {
    policy.add_forbidden_calls(name);
  }
  policy.set_network_allowed(false);
  policy.add_languages_enabled(proto::GENERAL_PURPOSE);
  policy.add_languages_enabled(proto::DSL);
  policy.set_kill_grace_millis(500);
  policy.set_max_processes(0);
  policy.set_max_open_files(64);
  policy.set_max_file_size_bytes(1 << 20);
  policy.set_max_executions_per_minute(60);
  policy.set_max_executions_per_hour(1000);
  return policy;
}

std::vector<std::string> PolicyStore::Validate(
    const proto::SecurityPolicy& policy) {
  std::vector<std::string> errors;
  auto positive = [&errors](const char* name, int64_t value) {
    if (value <= 0) errors.push_back(absl::StrCat(name, " must be positive"));
  };
  positive("max_wall_clock_seconds", policy.max_wall_clock_seconds());
  positive("max_memory_bytes", policy.max_memory_bytes());
  positive("max_output_bytes", policy.max_output_bytes());
  positive("max_source_bytes", policy.max_source_bytes());
  positive("kill_grace_millis", policy.kill_grace_millis());
  positive("max_open_files", policy.max_open_files());
  positive("max_file_size_bytes", policy.max_file_size_bytes());
  auto not_negative = [&errors](const char* name, int64_t value) {
    if (value < 0) {
      errors.push_back(absl::StrCat(name, " must not be negative"));
    }
  };
  not_negative("max_processes", policy.max_processes());
  not_negative("max_executions_per_minute",
               policy.max_executions_per_minute());
  not_negative("max_executions_per_hour", policy.max_executions_per_hour());
  if (policy.languages_enabled_size() == 0) {
    errors.push_back("languages_enabled must not be empty");
  }
  for (int language : policy.languages_enabled()) {
    if (language == proto::LANGUAGE_UNSPECIFIED) {
      errors.push_back("languages_enabled contains LANGUAGE_UNSPECIFIED");
    }
  }
  for (const std::string& name : policy.forbidden_imports()) {
    if (!IsIdentifierPath(name)) {
      errors.push_back(absl::StrCat("invalid forbidden import '", name, "'"));
    }
  }
  for (const std::string& name : policy.forbidden_calls()) {
    if (!IsIdentifierPath(name)) {
      errors.push_back(absl::StrCat("invalid forbidden call '", name, "'"));
    }
  }
  return errors;
}

proto::SecurityPolicy PolicyStore::LoadFromFile(const std::string& path) {
  proto::SecurityPolicy policy;
  if (!google::protobuf::TextFormat::ParseFromString(
          util::File::ReadAll(path), &policy)) {
    throw invalid_policy("Unable to parse policy file " + path);
  }
  proto::SecurityPolicy defaults = DefaultPolicy();
#define DEFAULT_IF_ZERO(field) \
  if (policy.field() == 0) policy.set_##field(defaults.field());
  DEFAULT_IF_ZERO(max_wall_clock_seconds);
  DEFAULT_IF_ZERO(max_memory_bytes);
  DEFAULT_IF_ZERO(max_output_bytes);
  DEFAULT_IF_ZERO(max_source_bytes);
  DEFAULT_IF_ZERO(kill_grace_millis);
  DEFAULT_IF_ZERO(max_open_files);
  DEFAULT_IF_ZERO(max_file_size_bytes);
#undef DEFAULT_IF_ZERO
  if (policy.languages_enabled_size() == 0) {
    *policy.mutable_languages_enabled() = defaults.languages_enabled();
  }
  LOG(INFO) << "Loaded security policy from " << path;
  return policy;
}

}  // namespace policy
