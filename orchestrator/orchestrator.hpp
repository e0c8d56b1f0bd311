#ifndef ORCHESTRATOR_ORCHESTRATOR_HPP
#define ORCHESTRATOR_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "catalog/template_catalog.hpp"
#include "executor/executor.hpp"
#include "ledger/ledger.hpp"
#include "orchestrator/rate_limiter.hpp"
#include "orchestrator/worker_pool.hpp"
#include "policy/policy_store.hpp"
#include "proto/execution.pb.h"
#include "proto/ledger.pb.h"

namespace orchestrator {

struct OrchestratorOptions {
  // 0 means one worker per hardware thread.
  int num_workers = 0;
  size_t queue_depth = 16;
  std::chrono::milliseconds queue_timeout{2000};
};

// Entry point for submissions: validates them, runs them on the worker pool
// and records the tracked ones.
class Orchestrator {
 public:
  Orchestrator(policy::PolicyStore* policy_store,
               catalog::TemplateCatalog* catalog, executor::Executor* executor,
               ledger::Ledger* ledger, const OrchestratorOptions& options);

  // Blocks until the submission is answered. Never throws.
  proto::SubmitResponse Submit(const proto::SubmitRequest& input);

  // Stops a running or queued tracked execution on behalf of its caller.
  proto::CancelResponse Cancel(const proto::CancelRequest& request);

  proto::HistoryResponse History(const proto::HistoryRequest& request);
  proto::SessionStats Statistics(const proto::StatisticsRequest& request);

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

 private:
  struct Running {
    std::string caller_id;
    std::shared_ptr<std::atomic<bool>> cancelled;
  };

  // Fills request from input. Returns the reason the input is not a valid
  // request, or an empty string.
  std::string BuildRequest(const proto::SubmitRequest& input,
                           proto::ExecutionRequest* request);

  proto::ExecutionResult Run(const proto::ExecutionRequest& request,
                             const proto::SecurityPolicy& policy,
                             const std::atomic<bool>* cancelled);

  void Finish(const proto::ExecutionRequest& request,
              proto::ExecutionResult* result);

  std::string NewExecutionId();

  bool Register(const proto::ExecutionRequest& request,
                std::shared_ptr<std::atomic<bool>> cancelled);
  void Unregister(const proto::ExecutionRequest& request);

  policy::PolicyStore* policy_store_;
  catalog::TemplateCatalog* catalog_;
  executor::Executor* executor_;
  ledger::Ledger* ledger_;

  std::atomic<uint64_t> next_id_{0};
  uint64_t id_salt_;

  RateLimiter rate_limiter_;

  absl::Mutex running_mutex_;
  std::unordered_map<std::string, Running> running_
      ABSL_GUARDED_BY(running_mutex_);

  // Destroyed first, so that no task outlives the members above.
  WorkerPool pool_;
};

}  // namespace orchestrator

#endif
