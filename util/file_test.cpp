#include "util/file.hpp"
#include <sys/stat.h>
#include <cstdio>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/sha256.hpp"

namespace {

const std::string test_tmpdir = "/tmp/execbox_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

// NOLINTNEXTLINE
TEST(File, ReadAll) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  std::string content(3 * util::kChunkSize + 17, 'x');
  writeFile(path, content);
  EXPECT_EQ(util::File::ReadAll(path), content);
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(util::File::ReadAll(tmp.Path() + "/missing"),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, WriteCreatesDirectories) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/a/b/c/file";
  util::File::Write(path, "contents");
  EXPECT_EQ(readFile(path), "contents");
}

// NOLINTNEXTLINE
TEST(File, WriteDoesNotOverwrite) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  util::File::Write(path, "first");
  util::File::Write(path, "second");
  EXPECT_EQ(readFile(path), "first");
  EXPECT_THROW(util::File::Write(path, "third", false, false),  // NOLINT
               util::file_exists);
  util::File::Write(path, "fourth", true);
  EXPECT_EQ(readFile(path), "fourth");
}

// NOLINTNEXTLINE
TEST(File, Append) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/dir/journal";
  util::File::Append(path, "abc");
  util::File::Append(path, "def");
  EXPECT_EQ(util::File::ReadAll(path), "abcdef");
  EXPECT_EQ(util::File::Size(path), 6);
}

// NOLINTNEXTLINE
TEST(File, PathForHash) {
  util::SHA256_t hash = util::HashString("abc");
  EXPECT_EQ(util::File::PathForHash(hash),
            "ba/78/"
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
}

// NOLINTNEXTLINE
TEST(File, BaseDir) {
  EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b");
  EXPECT_EQ(util::File::BaseDir("c"), ".");
}

// NOLINTNEXTLINE
TEST(File, SizeMissing) {
  EXPECT_LT(util::File::Size(test_tmpdir + "/does/not/exist"), 0);
}

// NOLINTNEXTLINE
TEST(File, RemoveTreeReadOnlyDirs) {
  util::TempDir tmp(test_tmpdir);
  std::string dir = tmp.Path() + "/tree/locked";
  util::File::MakeDirs(dir);
  writeFile(dir + "/file", "x");
  chmod(dir.c_str(), S_IRUSR | S_IXUSR);
  util::File::RemoveTree(tmp.Path() + "/tree");
  EXPECT_LT(util::File::Size(dir + "/file"), 0);
}

// NOLINTNEXTLINE
TEST(File, Truncate) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/journal";
  writeFile(path, "0123456789");
  util::File::Truncate(path, 4);
  EXPECT_EQ(util::File::ReadAll(path), "0123");
  EXPECT_THROW(util::File::Truncate(tmp.Path() + "/missing", 0),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    writeFile(path + "/file", "x");
    EXPECT_EQ(util::File::Size(path + "/file"), 1);
  }
  EXPECT_LT(util::File::Size(path + "/file"), 0);
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    tmp.Keep();
    path = tmp.Path();
    writeFile(path + "/file", "x");
  }
  EXPECT_EQ(util::File::Size(path + "/file"), 1);
  util::File::RemoveTree(path);
}

}  // namespace
