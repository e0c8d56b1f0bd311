#include "orchestrator/rate_limiter.hpp"

#include "absl/strings/str_cat.h"

namespace {
constexpr std::chrono::minutes kMinute{1};
constexpr std::chrono::hours kHour{1};
}  // namespace

namespace orchestrator {

void RateLimiter::DropIdle(Clock::time_point now) {
  if (now - last_drop_ < kMinute) return;
  last_drop_ = now;
  for (auto it = admitted_.begin(); it != admitted_.end();) {
    if (it->second.empty() || now - it->second.back() >= kHour) {
      it = admitted_.erase(it);
    } else {
      ++it;
    }
  }
}

std::string RateLimiter::Admit(const std::string& caller_id, int per_minute,
                               int per_hour, Clock::time_point now) {
  absl::MutexLock lck(&mutex_);
  DropIdle(now);
  if (per_minute <= 0 && per_hour <= 0) return "";

  std::deque<Clock::time_point>& times = admitted_[caller_id];
  while (!times.empty() && now - times.front() >= kHour) times.pop_front();

  if (per_hour > 0 && times.size() >= static_cast<size_t>(per_hour)) {
    return absl::StrCat("rate limit of ", per_hour,
                        " executions per hour exceeded");
  }
  if (per_minute > 0) {
    int last_minute = 0;
    for (auto it = times.rbegin();
         it != times.rend() && now - *it < kMinute; ++it) {
      last_minute++;
    }
    if (last_minute >= per_minute) {
      return absl::StrCat("rate limit of ", per_minute,
                          " executions per minute exceeded");
    }
  }
  times.push_back(now);
  return "";
}

size_t RateLimiter::NumTrackedCallers() {
  absl::MutexLock lck(&mutex_);
  return admitted_.size();
}

}  // namespace orchestrator
