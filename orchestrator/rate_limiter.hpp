#ifndef ORCHESTRATOR_RATE_LIMITER_HPP
#define ORCHESTRATOR_RATE_LIMITER_HPP

#include <chrono>
#include <deque>
#include <string>
#include <unordered_map>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace orchestrator {

// Sliding-window count of the submissions admitted for each caller.
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  // Admits a submission of caller_id if it stays within per_minute admissions
  // in the last minute and per_hour in the last hour; 0 means unlimited.
  // Returns the reason of a refusal, or an empty string. Refused submissions
  // are not counted.
  std::string Admit(const std::string& caller_id, int per_minute, int per_hour,
                    Clock::time_point now = Clock::now());

  size_t NumTrackedCallers();

 private:
  void DropIdle(Clock::time_point now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  absl::Mutex mutex_;
  // Admission times, oldest first, no older than an hour.
  std::unordered_map<std::string, std::deque<Clock::time_point>> admitted_
      ABSL_GUARDED_BY(mutex_);
  Clock::time_point last_drop_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace orchestrator

#endif
