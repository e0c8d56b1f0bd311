#include "ledger/ledger_store.hpp"

#include <errno.h>
#include <fcntl.h>

#include <stdexcept>
#include <system_error>

#include "glog/logging.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "google/protobuf/util/delimited_message_util.h"
#include "util/file.hpp"

namespace ledger {

FileLedgerStore::FileLedgerStore(const std::string& root) : root_(root) {
  util::File::MakeDirs(util::File::JoinPath(root_, "ledger"));
  util::File::MakeDirs(util::File::JoinPath(root_, "sources"));
}

std::string FileLedgerStore::JournalPath(const std::string& caller_id) const {
  return util::File::JoinPath(
      util::File::JoinPath(root_, "ledger"),
      util::File::PathForHash(util::HashString(caller_id)));
}

void FileLedgerStore::Append(const std::string& caller_id,
                             const proto::LedgerRecord& record) {
  std::string data;
  {
    google::protobuf::io::StringOutputStream out(&data);
    if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(record,
                                                                    &out)) {
      throw std::runtime_error("Unable to serialize ledger record");
    }
  }
  // A single write, so a crash leaves at most a torn tail that Load drops.
  util::File::Append(JournalPath(caller_id), data);
}

void FileLedgerStore::Load(
    const std::string& caller_id,
    const std::function<void(const proto::LedgerRecord&)>& visit) {
  std::string path = JournalPath(caller_id);
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    if (errno == ENOENT) return;
    throw std::system_error(errno, std::system_category(), "open " + path);
  }
  google::protobuf::io::FileInputStream in(fd);
  in.SetCloseOnDelete(true);
  int64_t good_offset = 0;
  int64_t num_records = 0;
  while (true) {
    proto::LedgerRecord record;
    bool clean_eof = false;
    if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(
            &record, &in, &clean_eof)) {
      if (clean_eof) break;
      if (in.GetErrno() != 0) {
        throw std::system_error(in.GetErrno(), std::system_category(),
                                "read " + path);
      }
      LOG(WARNING) << "Dropping torn journal tail of " << path
                   << " at offset " << good_offset;
      util::File::Truncate(path, good_offset);
      break;
    }
    good_offset = in.ByteCount();
    num_records++;
    visit(record);
  }
  VLOG(1) << "Loaded " << num_records << " ledger records from " << path;
}

void FileLedgerStore::StoreSource(const util::SHA256_t& hash,
                                  absl::string_view source) {
  util::File::Write(util::File::JoinPath(util::File::JoinPath(root_, "sources"),
                                         util::File::PathForHash(hash)),
                    source);
}

std::string FileLedgerStore::LoadSource(const util::SHA256_t& hash) {
  return util::File::ReadAll(
      util::File::JoinPath(util::File::JoinPath(root_, "sources"),
                           util::File::PathForHash(hash)));
}

}  // namespace ledger
