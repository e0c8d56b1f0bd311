#ifndef SERVER_EXEC_BOX_SERVICE_HPP
#define SERVER_EXEC_BOX_SERVICE_HPP

#include "catalog/template_catalog.hpp"
#include "grpc++/server_context.h"
#include "orchestrator/orchestrator.hpp"
#include "policy/policy_store.hpp"
#include "proto/service.grpc.pb.h"

namespace server {

// Domain outcomes are always reported in the response with an OK status;
// INTERNAL is returned only when a handler throws.
class ExecBoxService : public proto::ExecBox::Service {
 public:
  ExecBoxService(orchestrator::Orchestrator* orchestrator,
                 policy::PolicyStore* policy_store,
                 catalog::TemplateCatalog* catalog)
      : orchestrator_(orchestrator),
        policy_store_(policy_store),
        catalog_(catalog) {}

  grpc::Status Submit(grpc::ServerContext* context,
                      const proto::SubmitRequest* request,
                      proto::SubmitResponse* response) override;
  grpc::Status Cancel(grpc::ServerContext* context,
                      const proto::CancelRequest* request,
                      proto::CancelResponse* response) override;
  grpc::Status FetchTemplate(grpc::ServerContext* context,
                             const proto::FetchTemplateRequest* request,
                             proto::FetchTemplateResponse* response) override;
  grpc::Status ListTemplates(grpc::ServerContext* context,
                             const proto::ListTemplatesRequest* request,
                             proto::ListTemplatesResponse* response) override;
  grpc::Status GetPolicy(grpc::ServerContext* context,
                         const proto::GetPolicyRequest* request,
                         proto::SecurityPolicy* response) override;
  grpc::Status ReloadPolicy(grpc::ServerContext* context,
                            const proto::SecurityPolicy* request,
                            proto::ReloadPolicyResponse* response) override;
  grpc::Status History(grpc::ServerContext* context,
                       const proto::HistoryRequest* request,
                       proto::HistoryResponse* response) override;
  grpc::Status Statistics(grpc::ServerContext* context,
                          const proto::StatisticsRequest* request,
                          proto::SessionStats* response) override;

 private:
  orchestrator::Orchestrator* orchestrator_;
  policy::PolicyStore* policy_store_;
  catalog::TemplateCatalog* catalog_;
};

}  // namespace server

#endif
