#include "orchestrator/orchestrator.hpp"

#include <future>
#include <random>

#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "glog/logging.h"
#include "google/protobuf/util/time_util.h"
#include "validator/validator.hpp"

namespace {
proto::SubmitResponse Executed(proto::ExecutionResult result) {
  proto::SubmitResponse response;
  response.set_outcome(proto::SubmitResponse::EXECUTED);
  response.mutable_result()->Swap(&result);
  return response;
}

proto::SubmitResponse Refused(proto::SubmitResponse::Outcome outcome,
                              const std::string& reason) {
  proto::SubmitResponse response;
  response.set_outcome(outcome);
  response.set_reason(reason);
  return response;
}
}  // namespace

namespace orchestrator {

Orchestrator::Orchestrator(policy::PolicyStore* policy_store,
                           catalog::TemplateCatalog* catalog,
                           executor::Executor* executor, ledger::Ledger* ledger,
                           const OrchestratorOptions& options)
    : policy_store_(policy_store),
      catalog_(catalog),
      executor_(executor),
      ledger_(ledger),
      id_salt_(std::random_device()()),
      pool_(options.num_workers, options.queue_depth, options.queue_timeout) {}

std::string Orchestrator::NewExecutionId() {
  return absl::StrCat(absl::Hex(id_salt_, absl::kZeroPad8), "-",
                      absl::Hex(next_id_++, absl::kZeroPad8));
}

std::string Orchestrator::BuildRequest(const proto::SubmitRequest& input,
                                       proto::ExecutionRequest* request) {
  if (input.language() == proto::LANGUAGE_UNSPECIFIED ||
      !proto::Language_IsValid(input.language())) {
    return "language is required";
  }
  if (input.mode() == proto::MODE_UNSPECIFIED ||
      !proto::Mode_IsValid(input.mode())) {
    return "mode is required";
  }
  if (input.mode() == proto::TRACKED && input.caller_id().empty()) {
    return "caller_id is required for tracked executions";
  }
  request->set_source_text(input.source_text());
  request->set_stdin_text(input.stdin_text());
  request->set_language(input.language());
  request->set_mode(input.mode());
  request->set_caller_id(input.caller_id());
  request->set_template_ref(input.template_ref());

  if (input.source_text().empty() && !input.template_ref().empty()) {
    proto::FetchTemplateResponse fetched =
        catalog_->Fetch(input.template_ref(), input.caller_id());
    switch (fetched.outcome()) {
      case proto::FetchTemplateResponse::FOUND:
        break;
      case proto::FetchTemplateResponse::FORBIDDEN:
        return "template " + input.template_ref() + " is not accessible";
      default:
        return "template " + input.template_ref() + " not found";
    }
    if (fetched.found().language() != input.language()) {
      return "template " + input.template_ref() +
             " is written in another language";
    }
    request->set_source_text(fetched.found().source_text());
    if (input.stdin_text().empty()) {
      request->set_stdin_text(fetched.found().stdin_text());
    }
  }
  if (request->source_text().empty()) return "source_text is empty";

  request->set_execution_id(input.execution_id().empty()
                                ? NewExecutionId()
                                : input.execution_id());
  return "";
}

proto::ExecutionResult Orchestrator::Run(const proto::ExecutionRequest& request,
                                         const proto::SecurityPolicy& policy,
                                         const std::atomic<bool>* cancelled) {
  proto::ExecutionResult result;
  if (*cancelled) {
    result.set_status(proto::CANCELLED);
    result.set_reason("Cancelled");
    return result;
  }
  try {
    VLOG(1) << "Running " << request.execution_id();
    result = executor_->Execute(request, policy, cancelled);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execution " << request.execution_id()
               << " failed: " << e.what();
    result.Clear();
    result.set_status(proto::INTERNAL_ERROR);
    result.set_reason("internal error");
  }
  return result;
}

void Orchestrator::Finish(const proto::ExecutionRequest& request,
                          proto::ExecutionResult* result) {
  result->set_execution_id(request.execution_id());
  *result->mutable_created_at() =
      google::protobuf::util::TimeUtil::GetCurrentTime();
  if (request.mode() != proto::TRACKED) return;
  try {
    ledger_->Record(request, *result);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Unable to record execution " << request.execution_id()
               << " of " << request.caller_id() << ": " << e.what();
  }
}

bool Orchestrator::Register(const proto::ExecutionRequest& request,
                            std::shared_ptr<std::atomic<bool>> cancelled) {
  if (request.mode() != proto::TRACKED) return true;
  absl::MutexLock lck(&running_mutex_);
  return running_
      .emplace(request.execution_id(),
               Running{request.caller_id(), std::move(cancelled)})
      .second;
}

void Orchestrator::Unregister(const proto::ExecutionRequest& request) {
  if (request.mode() != proto::TRACKED) return;
  absl::MutexLock lck(&running_mutex_);
  running_.erase(request.execution_id());
}

proto::SubmitResponse Orchestrator::Submit(const proto::SubmitRequest& input) {
  proto::ExecutionRequest request;
  std::string error = BuildRequest(input, &request);
  if (!error.empty()) {
    VLOG(1) << "Invalid request: " << error;
    return Refused(proto::SubmitResponse::INVALID_REQUEST, error);
  }

  // The same policy applies from validation to the end of the execution.
  std::shared_ptr<const proto::SecurityPolicy> policy =
      policy_store_->Current();

  if (!request.caller_id().empty()) {
    std::string limited = rate_limiter_.Admit(
        request.caller_id(), policy->max_executions_per_minute(),
        policy->max_executions_per_hour());
    if (!limited.empty()) {
      LOG(WARNING) << "Refusing " << request.execution_id() << " of "
                   << request.caller_id() << ": " << limited;
      return Refused(proto::SubmitResponse::RATE_LIMITED, limited);
    }
  }

  validator::ValidationOutcome validation =
      validator::Validate(request, *policy);
  if (!validation.accepted) {
    VLOG(1) << "Rejected " << request.execution_id() << ": "
            << validation.reason;
    proto::ExecutionResult result;
    result.set_status(proto::REJECTED_BY_VALIDATOR);
    result.set_reason(validation.reason);
    Finish(request, &result);
    return Executed(std::move(result));
  }

  auto cancelled = std::make_shared<std::atomic<bool>>(false);
  if (!Register(request, cancelled)) {
    return Refused(proto::SubmitResponse::INVALID_REQUEST,
                   "execution_id " + request.execution_id() +
                       " is already running");
  }

  // Empty if the submission expired in the queue.
  using Answer = absl::optional<proto::ExecutionResult>;
  auto answer = std::make_shared<std::promise<Answer>>();
  std::future<Answer> future = answer->get_future();
  bool queued = pool_.TryEnqueue(
      [this, request, policy, cancelled, answer]() {
        answer->set_value(Run(request, *policy, cancelled.get()));
      },
      [answer]() { answer->set_value(absl::nullopt); });
  if (!queued) {
    Unregister(request);
    LOG(WARNING) << "Queue full, refusing " << request.execution_id();
    return Refused(proto::SubmitResponse::CAPACITY_EXCEEDED, "queue full");
  }

  Answer result = future.get();
  Unregister(request);
  if (!result) {
    LOG(WARNING) << "Queue timeout, refusing " << request.execution_id();
    return Refused(proto::SubmitResponse::CAPACITY_EXCEEDED, "queue timeout");
  }
  Finish(request, &result.value());
  return Executed(std::move(result.value()));
}

proto::CancelResponse Orchestrator::Cancel(
    const proto::CancelRequest& request) {
  proto::CancelResponse response;
  absl::MutexLock lck(&running_mutex_);
  auto it = running_.find(request.execution_id());
  if (it == running_.end()) {
    response.set_outcome(proto::CancelResponse::NOT_RUNNING);
  } else if (it->second.caller_id != request.caller_id()) {
    response.set_outcome(proto::CancelResponse::FORBIDDEN);
  } else {
    *it->second.cancelled = true;
    response.set_outcome(proto::CancelResponse::CANCEL_ACCEPTED);
    LOG(INFO) << "Cancelling " << request.execution_id();
  }
  return response;
}

proto::HistoryResponse Orchestrator::History(
    const proto::HistoryRequest& request) {
  return ledger_->History(request);
}

proto::SessionStats Orchestrator::Statistics(
    const proto::StatisticsRequest& request) {
  return ledger_->Stats(request.caller_id());
}

}  // namespace orchestrator
