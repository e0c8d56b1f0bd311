#include "executor/local_executor.hpp"

#include <dirent.h>
#include <errno.h>
#include <signal.h>
#include <stdlib.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::EndsWith;
using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/execbox_testdir/executor";

proto::SecurityPolicy TestPolicy() {
  proto::SecurityPolicy policy;
  policy.set_max_wall_clock_seconds(2);
  policy.set_max_memory_bytes(128 << 20);
  policy.set_max_output_bytes(1024);
  policy.set_max_source_bytes(100 << 10);
  policy.set_kill_grace_millis(200);
  policy.set_max_open_files(64);
  policy.set_max_file_size_bytes(1 << 20);
  policy.add_languages_enabled(proto::GENERAL_PURPOSE);
  policy.add_languages_enabled(proto::DSL);
  return policy;
}

// The DSL slot runs shell scripts: the tests do not depend on the DSL
// toolchain being installed.
std::vector<executor::Interpreter> ShellInterpreters() {
  executor::Interpreter sh;
  sh.language = proto::DSL;
  sh.path = "/bin/sh";
  sh.source_file = "main.sh";
  sh.oom_markers = {"MemoryError"};
  return {sh};
}

proto::ExecutionRequest ShellRequest(const std::string& source) {
  proto::ExecutionRequest request;
  request.set_source_text(source);
  request.set_language(proto::DSL);
  request.set_mode(proto::QUICK);
  return request;
}

int CountEntries(const std::string& dir) {
  DIR* d = opendir(dir.c_str());
  if (d == nullptr) return -1;
  int count = 0;
  while (struct dirent* ent = readdir(d)) {
    std::string name = ent->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(d);
  return count;
}

class LocalExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::MakeDirs(test_tmpdir);
    tmp_ = absl::make_unique<util::TempDir>(test_tmpdir);
    executor_ = absl::make_unique<executor::LocalExecutor>(
        tmp_->Path(), ShellInterpreters(), false, true);
  }

  proto::ExecutionResult Run(const std::string& source) {
    return executor_->Execute(ShellRequest(source), policy_, nullptr);
  }

  proto::SecurityPolicy policy_ = TestPolicy();
  std::unique_ptr<util::TempDir> tmp_;
  std::unique_ptr<executor::LocalExecutor> executor_;
};

TEST_F(LocalExecutorTest, Success) {
  proto::ExecutionResult result = Run("echo hello\n");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout_text(), "hello\n");
  EXPECT_EQ(result.stderr_text(), "");
  ASSERT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_FALSE(result.stdout_truncated());
  EXPECT_TRUE(result.has_peak_memory_bytes());
}

TEST_F(LocalExecutorTest, NonZeroExit) {
  proto::ExecutionResult result = Run("echo oops >&2\nexit 3\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_EQ(result.stderr_text(), "oops\n");
}

TEST_F(LocalExecutorTest, Signal) {
  proto::ExecutionResult result = Run("kill -SEGV $$\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_EQ(result.term_signal(), SIGSEGV);
}

TEST_F(LocalExecutorTest, InfiniteLoop) {
  proto::ExecutionResult result = Run("while :; do :; done\n");
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_GE(result.wall_clock_ms(), 2000);
  EXPECT_LE(result.wall_clock_ms(), 2000 + 200 + 1000);
  EXPECT_GE(result.cpu_time_ms(), 500);
  EXPECT_LE(result.cpu_time_ms(), result.wall_clock_ms() + 100);
}

TEST_F(LocalExecutorTest, OutputFlood) {
  proto::ExecutionResult result = Run("while :; do echo flood; done\n");
  EXPECT_EQ(result.status(), proto::OUTPUT_TRUNCATED);
  EXPECT_TRUE(result.stdout_truncated());
  EXPECT_EQ(result.stdout_text().size(), 1024u);
  EXPECT_LT(result.wall_clock_ms(), 2000);
}

TEST_F(LocalExecutorTest, OomMarker) {
  proto::ExecutionResult result = Run("echo MemoryError >&2\nexit 1\n");
  EXPECT_EQ(result.status(), proto::MEMORY_EXCEEDED);
}

TEST_F(LocalExecutorTest, OomMarkerNotLast) {
  proto::ExecutionResult result =
      Run("echo MemoryError >&2\necho ValueError >&2\nexit 1\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
}

TEST_F(LocalExecutorTest, Stdin) {
  proto::ExecutionRequest request = ShellRequest("cat\n");
  request.set_stdin_text("line 1\nline 2\n");
  proto::ExecutionResult result =
      executor_->Execute(request, policy_, nullptr);
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout_text(), "line 1\nline 2\n");
}

TEST_F(LocalExecutorTest, Environment) {
  proto::ExecutionResult result = Run("echo \"$HOME\"\necho \"$SECRET\"\n");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_THAT(result.stdout_text(), HasSubstr("/box\n"));
  EXPECT_THAT(result.stdout_text(), EndsWith("\n\n"));
}

TEST_F(LocalExecutorTest, NoResidualFiles) {
  Run("echo data > file.txt\nmkdir -p a/b\nchmod 500 a\n");
  Run("while :; do :; done\n");
  EXPECT_EQ(CountEntries(tmp_->Path()), 0);
}

TEST_F(LocalExecutorTest, Cancel) {
  std::atomic<bool> cancelled{false};
  std::thread canceller([&cancelled]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancelled = true;
  });
  proto::ExecutionResult result =
      executor_->Execute(ShellRequest("sleep 10\n"), policy_, &cancelled);
  canceller.join();
  EXPECT_EQ(result.status(), proto::CANCELLED);
  EXPECT_LT(result.wall_clock_ms(), 2000);
}

TEST(LocalExecutor, NetworkIsolationRequired) {
  util::File::MakeDirs(test_tmpdir);
  util::TempDir tmp(test_tmpdir);
  executor::LocalExecutor strict(tmp.Path(), ShellInterpreters());
  proto::SecurityPolicy policy = TestPolicy();
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  ASSERT_TRUE(sb);
  if (sb->IsolatesNetwork()) {
    EXPECT_EQ(strict.Execute(ShellRequest("true\n"), policy, nullptr).status(),
              proto::SUCCESS);
  } else {
    EXPECT_THROW(strict.Execute(ShellRequest("true\n"), policy,  // NOLINT
                                nullptr),
                 std::runtime_error);
  }
  policy.set_network_allowed(true);
  EXPECT_EQ(strict.Execute(ShellRequest("true\n"), policy, nullptr).status(),
            proto::SUCCESS);
}

TEST_F(LocalExecutorTest, MissingInterpreter) {
  proto::ExecutionRequest request = ShellRequest("print(1)\n");
  request.set_language(proto::GENERAL_PURPOSE);
  EXPECT_THROW(executor_->Execute(request, policy_, nullptr),  // NOLINT
               std::runtime_error);
}

class PythonExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    executor::Interpreter python;
    python.language = proto::GENERAL_PURPOSE;
    python.path = util::which("python3");
    if (python.path.empty()) GTEST_SKIP() << "python3 is not installed";
    python.args = {"-I", "-u"};
    python.source_file = "main.py";
    python.oom_markers = {"MemoryError"};
    util::File::MakeDirs(test_tmpdir);
    tmp_ = absl::make_unique<util::TempDir>(test_tmpdir);
    executor_ = absl::make_unique<executor::LocalExecutor>(
        tmp_->Path(), std::vector<executor::Interpreter>{python}, false, true);
  }

  proto::ExecutionResult Run(const std::string& source) {
    proto::ExecutionRequest request;
    request.set_source_text(source);
    request.set_language(proto::GENERAL_PURPOSE);
    request.set_mode(proto::QUICK);
    return executor_->Execute(request, TestPolicy(), nullptr);
  }

  std::unique_ptr<util::TempDir> tmp_;
  std::unique_ptr<executor::LocalExecutor> executor_;
};

TEST_F(PythonExecutorTest, Success) {
  proto::ExecutionResult result = Run("print(sum(range(10)))\n");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout_text(), "45\n");
}

TEST_F(PythonExecutorTest, Exception) {
  proto::ExecutionResult result = Run("raise ValueError('bad')\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_EQ(result.exit_code(), 1);
  EXPECT_THAT(result.stderr_text(), HasSubstr("ValueError: bad"));
}

TEST_F(PythonExecutorTest, MemoryBomb) {
  proto::ExecutionResult result = Run(
      "import os\n"
      "print(os.getpid(), flush=True)\n"
      "x = bytearray(1 << 30)\n");
  EXPECT_EQ(result.status(), proto::MEMORY_EXCEEDED);
  pid_t pid = atoi(result.stdout_text().c_str());
  ASSERT_GT(pid, 0);
  // Already reaped: not even a zombie is left.
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

TEST_F(PythonExecutorTest, HandledMemoryError) {
  proto::ExecutionResult result = Run(
      "try:\n"
      "    raise MemoryError\n"
      "except MemoryError:\n"
      "    raise ValueError('not memory')\n");
  EXPECT_EQ(result.status(), proto::RUNTIME_ERROR);
  EXPECT_THAT(result.stderr_text(), HasSubstr("MemoryError"));
}

TEST_F(PythonExecutorTest, InfiniteLoop) {
  proto::ExecutionResult result = Run("while True:\n    pass\n");
  EXPECT_EQ(result.status(), proto::TIMEOUT);
}

}  // namespace
