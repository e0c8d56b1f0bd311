#include "util/file.hpp"

#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTreeOnce(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

// Sandboxed programs may leave directories without write permission behind.
void OsMakeTreeWritable(const std::string& path) {
  nftw(path.c_str(),
       [](const char* fpath, const struct stat* sb, int typeflags,
          struct FTW* ftwbuf) {
         if (typeflags == FTW_D || typeflags == FTW_DNR) {
           chmod(fpath, S_IRWXU);
         }
         return 0;
       },
       64, FTW_PHYS | FTW_MOUNT);
}

bool OsRemoveTree(const std::string& path) {
  if (OsRemoveTreeOnce(path)) return true;
  OsMakeTreeWritable(path);
  return OsRemoveTreeOnce(path);
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
  }
  return remove(src.c_str()) != -1 ? 0 : errno;
}

// Returns errno, or 0 on success.
int WriteFully(int fd, absl::string_view data) {
  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t written = write(fd, data.data() + pos, data.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

int OsRead(const std::string& path,
           const util::File::ChunkReceiver& chunk_receiver) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  std::unique_ptr<char[]> buf(new char[util::kChunkSize]);
  ssize_t amount;
  try {
    while ((amount = read(fd, buf.get(), util::kChunkSize))) {
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      chunk_receiver(absl::string_view(buf.get(), amount));
    }
  } catch (...) {
    close(fd);
    throw;
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, absl::string_view contents,
            bool overwrite, bool exist_ok) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  int err = WriteFully(fd, contents);
  if (err == 0 && fsync(fd) == -1) err = errno;
  if (close(fd) == -1 && err == 0) err = errno;
  if (err != 0) {
    remove(temp_file.c_str());
    return err;
  }
  return OsAtomicMove(temp_file, path, overwrite, exist_ok);
}

int OsAppend(const std::string& path, absl::string_view data) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                S_IRUSR | S_IWUSR);
  if (fd == -1) return errno;
  int err = WriteFully(fd, data);
  if (err == 0 && fdatasync(fd) == -1) err = errno;
  if (close(fd) == -1 && err == 0) err = errno;
  return err;
}

}  // namespace
#endif

namespace util {

void File::Read(const std::string& path,
                const File::ChunkReceiver& chunk_receiver) {
  int err = OsRead(path, chunk_receiver);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
}

std::string File::ReadAll(const std::string& path) {
  std::string contents;
  Read(path, [&contents](absl::string_view chunk) {
    contents.append(chunk.data(), chunk.size());
  });
  return contents;
}

void File::Write(const std::string& path, absl::string_view contents,
                 bool overwrite, bool exist_ok) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return;
    throw file_exists("Write " + path);
  }
  int err = OsWrite(path, contents, overwrite, exist_ok);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::Append(const std::string& path, absl::string_view data) {
  MakeDirs(BaseDir(path));
  int err = OsAppend(path, data);
  if (err)
    throw std::system_error(err, std::system_category(), "Append " + path);
}

void File::Truncate(const std::string& path, int64_t size) {
  if (truncate(path.c_str(), size) == -1)
    throw std::system_error(errno, std::system_category(), "Truncate " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::string File::PathForHash(const SHA256_t& hash) {
  std::string path = hash.Hex();
  return JoinPath(JoinPath(path.substr(0, 2), path.substr(2, 2)), path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  return path.substr(0, pos);
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  if (!OsRemoveTree(path_)) {
    PLOG(WARNING) << "Unable to remove " << path_;
  }
}

}  // namespace util
