#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <atomic>

#include "proto/execution.pb.h"
#include "proto/policy.pb.h"

namespace executor {

class Executor {
 public:
  // Runs the source of an already validated request within the ceilings of
  // policy. If cancelled is not null and becomes true, the program is stopped
  // and the result is CANCELLED. Infrastructure failures are reported by
  // throwing.
  virtual proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                         const proto::SecurityPolicy& policy,
                                         const std::atomic<bool>* cancelled) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
