#ifndef LEDGER_LEDGER_STORE_HPP
#define LEDGER_LEDGER_STORE_HPP

#include <functional>
#include <string>

#include "absl/strings/string_view.h"
#include "proto/ledger.pb.h"
#include "util/sha256.hpp"

namespace ledger {

// Durable storage for ledger records. Implementations throw on failure; a
// record for which Append threw must not be returned by a later Load.
class LedgerStore {
 public:
  virtual void Append(const std::string& caller_id,
                      const proto::LedgerRecord& record) = 0;

  // Calls visit on every record of the caller, oldest first.
  virtual void Load(
      const std::string& caller_id,
      const std::function<void(const proto::LedgerRecord&)>& visit) = 0;

  // Content-addressed storage for sources too large to keep inline.
  virtual void StoreSource(const util::SHA256_t& hash,
                           absl::string_view source) = 0;
  virtual std::string LoadSource(const util::SHA256_t& hash) = 0;

  virtual ~LedgerStore() = default;
};

// Keeps one append-only journal of length-delimited LedgerRecords per caller
// under root/ledger, and large sources under root/sources.
class FileLedgerStore : public LedgerStore {
 public:
  explicit FileLedgerStore(const std::string& root);

  void Append(const std::string& caller_id,
              const proto::LedgerRecord& record) override;
  void Load(const std::string& caller_id,
            const std::function<void(const proto::LedgerRecord&)>& visit)
      override;
  void StoreSource(const util::SHA256_t& hash,
                   absl::string_view source) override;
  std::string LoadSource(const util::SHA256_t& hash) override;

  std::string JournalPath(const std::string& caller_id) const;

 private:
  std::string root_;
};

}  // namespace ledger

#endif
