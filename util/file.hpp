#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <functional>
#include <string>
#include <system_error>

#include "absl/strings/string_view.h"
#include "util/sha256.hpp"

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  using ChunkReceiver = std::function<void(absl::string_view)>;

  // Reads the file specified by path in chunks.
  static void Read(const std::string& path,
                   const ChunkReceiver& chunk_receiver);

  // Reads the whole file in memory.
  static std::string ReadAll(const std::string& path);

  // Atomically replaces (or creates) the file with the given contents: the
  // data is written to a temporary file that is then moved in place.
  static void Write(const std::string& path, absl::string_view contents,
                    bool overwrite = false, bool exist_ok = true);

  // Appends data to the file with a single write and flushes it to disk.
  // Creates the file if needed.
  static void Append(const std::string& path, absl::string_view data);

  // Cuts the file down to size bytes.
  static void Truncate(const std::string& path, int64_t size);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Computes the relative path for a file with the given hash.
  static std::string PathForHash(const SHA256_t& hash);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
