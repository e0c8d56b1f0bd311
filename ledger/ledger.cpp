#include "ledger/ledger.hpp"

#include <deque>
#include <stdexcept>

#include "glog/logging.h"
#include "util/sha256.hpp"

namespace {
void AddToStats(const proto::LedgerEntry& entry, proto::SessionStats* stats) {
  const proto::ExecutionResult& result = entry.result();
  stats->set_caller_id(entry.caller_id());
  stats->set_total_attempts(stats->total_attempts() + 1);
  if (result.status() == proto::SUCCESS) {
    stats->set_total_successes(stats->total_successes() + 1);
  } else {
    stats->set_total_failures(stats->total_failures() + 1);
  }
  stats->set_total_wall_clock_ms(stats->total_wall_clock_ms() +
                                 result.wall_clock_ms());
  stats->set_average_wall_clock_ms(
      static_cast<double>(stats->total_wall_clock_ms()) /
      stats->total_attempts());
  *stats->mutable_last_execution_at() = result.created_at();

  for (proto::LanguageCount& count : *stats->mutable_language_attempts()) {
    if (count.language() == entry.language()) {
      count.set_attempts(count.attempts() + 1);
      return;
    }
  }
  proto::LanguageCount* count = stats->add_language_attempts();
  count->set_language(entry.language());
  count->set_attempts(1);
}
}  // namespace

namespace ledger {

constexpr size_t Ledger::kInlineSourceBytes;
constexpr int Ledger::kDefaultHistoryLimit;
constexpr size_t Ledger::kDefaultResidentCallers;

std::shared_ptr<Ledger::Partition> Ledger::GetPartition(
    const std::string& caller_id) {
  absl::MutexLock lck(&partitions_mutex_);
  Slot& slot = partitions_[caller_id];
  if (!slot.partition) slot.partition = std::make_shared<Partition>();
  slot.last_used = ++use_counter_;
  std::shared_ptr<Partition> partition = slot.partition;

  while (partitions_.size() > max_resident_callers_) {
    auto victim = partitions_.end();
    for (auto it = partitions_.begin(); it != partitions_.end(); ++it) {
      // Partitions in use elsewhere hold more than the map's reference.
      if (it->second.partition.use_count() > 1) continue;
      if (victim == partitions_.end() ||
          it->second.last_used < victim->second.last_used) {
        victim = it;
      }
    }
    if (victim == partitions_.end()) break;
    VLOG(2) << "Evicting ledger partition of " << victim->first;
    partitions_.erase(victim);
  }
  return partition;
}

void Ledger::EnsureLoaded(const std::string& caller_id, Partition* partition) {
  if (partition->loaded) return;
  partition->last_sequence = 0;
  partition->stats.Clear();
  partition->stats.set_caller_id(caller_id);
  store_->Load(caller_id, [partition](const proto::LedgerRecord& record) {
    partition->stats = record.stats();
    partition->last_sequence = record.entry().sequence();
  });
  partition->loaded = true;
}

proto::LedgerEntry Ledger::Record(const proto::ExecutionRequest& request,
                                  const proto::ExecutionResult& result) {
  if (request.caller_id().empty()) {
    throw std::invalid_argument("Tracked execution without caller_id");
  }
  std::shared_ptr<Partition> partition = GetPartition(request.caller_id());
  absl::MutexLock lck(&partition->mutex);
  EnsureLoaded(request.caller_id(), partition.get());

  proto::LedgerRecord record;
  proto::LedgerEntry* entry = record.mutable_entry();
  entry->set_sequence(partition->last_sequence + 1);
  entry->set_caller_id(request.caller_id());
  entry->set_language(request.language());
  entry->set_mode(request.mode());
  entry->set_template_ref(request.template_ref());
  util::SHA256_t hash = util::HashString(request.source_text());
  entry->set_source_sha256(hash.Hex());
  entry->set_source_bytes(request.source_text().size());
  if (request.source_text().size() <= kInlineSourceBytes) {
    entry->set_source_text(request.source_text());
  } else {
    store_->StoreSource(hash, request.source_text());
  }
  *entry->mutable_result() = result;

  proto::SessionStats* stats = record.mutable_stats();
  *stats = partition->stats;
  AddToStats(*entry, stats);

  try {
    store_->Append(request.caller_id(), record);
  } catch (std::exception&) {
    // The journal may hold a partial record now: reload before the next use.
    partition->loaded = false;
    throw;
  }
  partition->stats = record.stats();
  partition->last_sequence = record.entry().sequence();
  VLOG(1) << "Ledger entry " << record.entry().sequence() << " for "
          << request.caller_id();
  return record.entry();
}

proto::SessionStats Ledger::Stats(const std::string& caller_id) {
  std::shared_ptr<Partition> partition = GetPartition(caller_id);
  absl::MutexLock lck(&partition->mutex);
  EnsureLoaded(caller_id, partition.get());
  return partition->stats;
}

proto::HistoryResponse Ledger::History(const proto::HistoryRequest& request) {
  proto::HistoryResponse response;
  size_t limit = request.limit() > 0 ? request.limit() : kDefaultHistoryLimit;
  std::shared_ptr<Partition> partition = GetPartition(request.caller_id());
  // Held while reading the journal so that no Record appends concurrently.
  absl::MutexLock lck(&partition->mutex);
  std::deque<proto::LedgerEntry> newest;
  store_->Load(request.caller_id(), [&](const proto::LedgerRecord& record) {
    const proto::LedgerEntry& entry = record.entry();
    if (request.language() != proto::LANGUAGE_UNSPECIFIED &&
        entry.language() != request.language()) {
      return;
    }
    if (request.status() != proto::STATUS_UNSPECIFIED &&
        entry.result().status() != request.status()) {
      return;
    }
    newest.push_back(entry);
    if (newest.size() > limit) newest.pop_front();
  });
  for (auto it = newest.rbegin(); it != newest.rend(); ++it) {
    *response.add_entry() = std::move(*it);
  }
  return response;
}

}  // namespace ledger
