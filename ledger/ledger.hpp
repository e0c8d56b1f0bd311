#ifndef LEDGER_LEDGER_HPP
#define LEDGER_LEDGER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "ledger/ledger_store.hpp"
#include "proto/execution.pb.h"
#include "proto/ledger.pb.h"

namespace ledger {

// Record of tracked executions and the per-caller statistics derived from
// them. Callers are independent partitions: operations on different callers
// never wait for each other. Only the statistics of the most recently used
// callers stay in memory; entries are read back from the store on demand.
class Ledger {
 public:
  // Sources up to this size are kept inline in the entry.
  static constexpr size_t kInlineSourceBytes = 4096;
  static constexpr int kDefaultHistoryLimit = 50;
  static constexpr size_t kDefaultResidentCallers = 1024;

  explicit Ledger(LedgerStore* store,
                  size_t max_resident_callers = kDefaultResidentCallers)
      : store_(store), max_resident_callers_(max_resident_callers) {}

  // Appends an entry for the execution and updates the caller's stats. Both
  // become visible together or, if the store throws, not at all.
  proto::LedgerEntry Record(const proto::ExecutionRequest& request,
                            const proto::ExecutionResult& result);

  proto::SessionStats Stats(const std::string& caller_id);

  // Newest first.
  proto::HistoryResponse History(const proto::HistoryRequest& request);

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

 private:
  struct Partition {
    absl::Mutex mutex;
    bool loaded ABSL_GUARDED_BY(mutex) = false;
    uint64_t last_sequence ABSL_GUARDED_BY(mutex) = 0;
    proto::SessionStats stats ABSL_GUARDED_BY(mutex);
  };
  struct Slot {
    std::shared_ptr<Partition> partition;
    uint64_t last_used = 0;
  };

  // Evicts the least recently used idle partitions beyond the limit.
  std::shared_ptr<Partition> GetPartition(const std::string& caller_id);
  void EnsureLoaded(const std::string& caller_id, Partition* partition)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(partition->mutex);

  LedgerStore* store_;
  size_t max_resident_callers_;
  absl::Mutex partitions_mutex_;
  uint64_t use_counter_ ABSL_GUARDED_BY(partitions_mutex_) = 0;
  std::unordered_map<std::string, Slot> partitions_
      ABSL_GUARDED_BY(partitions_mutex_);
};

}  // namespace ledger

#endif
