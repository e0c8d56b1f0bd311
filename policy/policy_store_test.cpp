#include "policy/policy_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

const std::string test_tmpdir = "/tmp/execbox_testdir/policy";

// NOLINTNEXTLINE
TEST(PolicyStore, DefaultPolicyIsValid) {
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  EXPECT_THAT(policy::PolicyStore::Validate(policy), IsEmpty());
  EXPECT_EQ(policy.max_wall_clock_seconds(), 30);
  EXPECT_EQ(policy.max_memory_bytes(), 128 << 20);
  EXPECT_EQ(policy.max_output_bytes(), 1024);
  EXPECT_EQ(policy.max_source_bytes(), 100 << 10);
  EXPECT_FALSE(policy.network_allowed());
  EXPECT_THAT(policy.forbidden_imports(), Contains("subprocess"));
  EXPECT_THAT(policy.forbidden_calls(), Contains("eval"));
}

// NOLINTNEXTLINE
TEST(PolicyStore, ValidateCeilings) {
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  policy.set_max_wall_clock_seconds(0);
  policy.set_max_output_bytes(-1);
  EXPECT_THAT(policy::PolicyStore::Validate(policy),
              ElementsAre("max_wall_clock_seconds must be positive",
                          "max_output_bytes must be positive"));
}

// NOLINTNEXTLINE
TEST(PolicyStore, ValidateRateLimits) {
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  EXPECT_EQ(policy.max_executions_per_minute(), 60);
  EXPECT_EQ(policy.max_executions_per_hour(), 1000);
  policy.set_max_executions_per_minute(0);
  EXPECT_THAT(policy::PolicyStore::Validate(policy), IsEmpty());
  policy.set_max_executions_per_hour(-5);
  EXPECT_THAT(policy::PolicyStore::Validate(policy),
              ElementsAre("max_executions_per_hour must not be negative"));
}

// NOLINTNEXTLINE
TEST(PolicyStore, ValidateLanguages) {
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  policy.clear_languages_enabled();
  EXPECT_THAT(policy::PolicyStore::Validate(policy),
              ElementsAre("languages_enabled must not be empty"));
  policy.add_languages_enabled(proto::LANGUAGE_UNSPECIFIED);
  EXPECT_THAT(policy::PolicyStore::Validate(policy),
              ElementsAre("languages_enabled contains LANGUAGE_UNSPECIFIED"));
}

// NOLINTNEXTLINE
TEST(PolicyStore, ValidateNames) {
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  policy.add_forbidden_imports("os.path");
  EXPECT_THAT(policy::PolicyStore::Validate(policy), IsEmpty());
  policy.add_forbidden_imports("bad name");
  policy.add_forbidden_calls("1eval");
  policy.add_forbidden_calls("a..b");
  EXPECT_EQ(policy::PolicyStore::Validate(policy).size(), 3u);
}

// NOLINTNEXTLINE
TEST(PolicyStore, ConstructorRejectsInvalid) {
  proto::SecurityPolicy policy;
  EXPECT_THROW(policy::PolicyStore store(policy),  // NOLINT
               policy::invalid_policy);
}

// NOLINTNEXTLINE
TEST(PolicyStore, Reload) {
  policy::PolicyStore store(policy::PolicyStore::DefaultPolicy());
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  policy.set_max_output_bytes(4096);
  EXPECT_THAT(store.Reload(policy), IsEmpty());
  EXPECT_EQ(store.Current()->max_output_bytes(), 4096);
}

// NOLINTNEXTLINE
TEST(PolicyStore, InvalidReloadKeepsPolicy) {
  policy::PolicyStore store(policy::PolicyStore::DefaultPolicy());
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  policy.set_max_memory_bytes(0);
  EXPECT_THAT(store.Reload(policy),
              ElementsAre("max_memory_bytes must be positive"));
  EXPECT_EQ(store.Current()->max_memory_bytes(), 128 << 20);
}

// NOLINTNEXTLINE
TEST(PolicyStore, SnapshotSurvivesReload) {
  policy::PolicyStore store(policy::PolicyStore::DefaultPolicy());
  std::shared_ptr<const proto::SecurityPolicy> snapshot = store.Current();
  proto::SecurityPolicy policy = policy::PolicyStore::DefaultPolicy();
  policy.set_max_wall_clock_seconds(5);
  ASSERT_THAT(store.Reload(policy), IsEmpty());
  EXPECT_EQ(snapshot->max_wall_clock_seconds(), 30);
  EXPECT_EQ(store.Current()->max_wall_clock_seconds(), 5);
}

// Readers must always see one of the two policies, never a mix.
// NOLINTNEXTLINE
TEST(PolicyStore, ConcurrentReloads) {
  policy::PolicyStore store(policy::PolicyStore::DefaultPolicy());
  proto::SecurityPolicy a = policy::PolicyStore::DefaultPolicy();
  a.set_max_wall_clock_seconds(1);
  a.set_max_output_bytes(1);
  proto::SecurityPolicy b = policy::PolicyStore::DefaultPolicy();
  b.set_max_wall_clock_seconds(2);
  b.set_max_output_bytes(2);
  ASSERT_THAT(store.Reload(a), IsEmpty());

  std::atomic<bool> done{false};
  std::atomic<int> mixed{0};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; i++) {
    readers.emplace_back([&store, &done, &mixed]() {
      while (!done) {
        auto policy = store.Current();
        if (policy->max_wall_clock_seconds() != policy->max_output_bytes()) {
          mixed++;
        }
      }
    });
  }
  for (int i = 0; i < 1000; i++) {
    store.Reload(i % 2 ? a : b);
  }
  done = true;
  for (std::thread& reader : readers) reader.join();
  EXPECT_EQ(mixed, 0);
}

// NOLINTNEXTLINE
TEST(PolicyStore, LoadFromFile) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/policy.textproto";
  util::File::Write(path,
                    "max_wall_clock_seconds: 5\n"
                    "forbidden_imports: \"os\"\n"
                    "forbidden_calls: \"eval\"\n"
                    "languages_enabled: GENERAL_PURPOSE\n");
  proto::SecurityPolicy policy = policy::PolicyStore::LoadFromFile(path);
  EXPECT_EQ(policy.max_wall_clock_seconds(), 5);
  EXPECT_EQ(policy.max_memory_bytes(), 128 << 20);
  EXPECT_THAT(policy.forbidden_imports(), ElementsAre("os"));
  EXPECT_THAT(policy.languages_enabled(), ElementsAre(proto::GENERAL_PURPOSE));
  // Missing rate limits mean no limit.
  EXPECT_EQ(policy.max_executions_per_minute(), 0);
  EXPECT_THAT(policy::PolicyStore::Validate(policy), IsEmpty());
}

// NOLINTNEXTLINE
TEST(PolicyStore, LoadFromFileErrors) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/policy.textproto";
  util::File::Write(path, "max_wall_clock_seconds: \"soon\"\n");
  EXPECT_THROW(policy::PolicyStore::LoadFromFile(path),  // NOLINT
               policy::invalid_policy);
  EXPECT_THROW(policy::PolicyStore::LoadFromFile(tmp.Path() + "/missing"),
               util::file_not_found);
}

}  // namespace
