#include "server/exec_box_service.hpp"

#include <exception>
#include <string>
#include <vector>

#include "glog/logging.h"

namespace {
template <typename Handler>
grpc::Status Guard(const char* method, const Handler& handler) {
  try {
    handler();
    return grpc::Status::OK;
  } catch (const std::exception& e) {
    LOG(ERROR) << method << ": " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}
}  // namespace

namespace server {

grpc::Status ExecBoxService::Submit(grpc::ServerContext* context,
                                    const proto::SubmitRequest* request,
                                    proto::SubmitResponse* response) {
  return Guard("Submit",
               [&]() { *response = orchestrator_->Submit(*request); });
}

grpc::Status ExecBoxService::Cancel(grpc::ServerContext* context,
                                    const proto::CancelRequest* request,
                                    proto::CancelResponse* response) {
  return Guard("Cancel",
               [&]() { *response = orchestrator_->Cancel(*request); });
}

grpc::Status ExecBoxService::FetchTemplate(
    grpc::ServerContext* context, const proto::FetchTemplateRequest* request,
    proto::FetchTemplateResponse* response) {
  return Guard("FetchTemplate", [&]() {
    *response = catalog_->Fetch(request->template_id(), request->requester());
  });
}

grpc::Status ExecBoxService::ListTemplates(
    grpc::ServerContext* context, const proto::ListTemplatesRequest* request,
    proto::ListTemplatesResponse* response) {
  return Guard("ListTemplates", [&]() {
    for (proto::Template& tmpl :
         catalog_->List(request->requester(), request->language(),
                        request->category())) {
      response->add_templates()->Swap(&tmpl);
    }
  });
}

grpc::Status ExecBoxService::GetPolicy(grpc::ServerContext* context,
                                       const proto::GetPolicyRequest* request,
                                       proto::SecurityPolicy* response) {
  return Guard("GetPolicy", [&]() { *response = *policy_store_->Current(); });
}

grpc::Status ExecBoxService::ReloadPolicy(
    grpc::ServerContext* context, const proto::SecurityPolicy* request,
    proto::ReloadPolicyResponse* response) {
  return Guard("ReloadPolicy", [&]() {
    std::vector<std::string> errors = policy_store_->Reload(*request);
    response->set_ok(errors.empty());
    for (const std::string& error : errors) response->add_errors(error);
  });
}

grpc::Status ExecBoxService::History(grpc::ServerContext* context,
                                     const proto::HistoryRequest* request,
                                     proto::HistoryResponse* response) {
  return Guard("History",
               [&]() { *response = orchestrator_->History(*request); });
}

grpc::Status ExecBoxService::Statistics(grpc::ServerContext* context,
                                        const proto::StatisticsRequest* request,
                                        proto::SessionStats* response) {
  return Guard("Statistics",
               [&]() { *response = orchestrator_->Statistics(*request); });
}

}  // namespace server
