#include <chrono>
#include <memory>
#include <string>

#include "catalog/template_catalog.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "ledger/ledger.hpp"
#include "ledger/ledger_store.hpp"
#include "orchestrator/orchestrator.hpp"
#include "policy/policy_store.hpp"
#include "sandbox/sandbox.hpp"
#include "server/exec_box_service.hpp"
#include "util/flags.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");
DEFINE_int32(port, 7070, "port to listen on");

namespace {
proto::SecurityPolicy InitialPolicy() {
  if (FLAGS_policy_file.empty()) {
    LOG(INFO) << "Using the built-in security policy";
    return policy::PolicyStore::DefaultPolicy();
  }
  return policy::PolicyStore::LoadFromFile(FLAGS_policy_file);
}

int Serve() {
  policy::PolicyStore policy_store(InitialPolicy());
  catalog::TemplateCatalog catalog;
  if (!FLAGS_templates_file.empty()) catalog.LoadFromFile(FLAGS_templates_file);

  LOG(INFO) << "Using the " << sandbox::Sandbox::BestName() << " sandbox";
  std::unique_ptr<sandbox::Sandbox> best = sandbox::Sandbox::Create();
  if (best && !best->IsolatesNetwork()) {
    if (FLAGS_allow_unisolated) {
      LOG(WARNING) << "Programs will be able to reach the network";
    } else {
      LOG(WARNING) << "Executions that are not allowed to reach the network "
                      "will fail: set --allow_unisolated to run them anyway";
    }
  }
  executor::LocalExecutor executor(FLAGS_temp_directory,
                                   executor::DefaultInterpreters(),
                                   FLAGS_keep_sandboxes,
                                   FLAGS_allow_unisolated);
  ledger::FileLedgerStore ledger_store(FLAGS_store_directory);
  ledger::Ledger ledger(&ledger_store);

  orchestrator::OrchestratorOptions options;
  options.num_workers = FLAGS_num_workers;
  options.queue_depth = FLAGS_queue_depth;
  options.queue_timeout = std::chrono::milliseconds(FLAGS_queue_timeout_millis);
  orchestrator::Orchestrator orchestrator(&policy_store, &catalog, &executor,
                                          &ledger, options);

  server::ExecBoxService service(&orchestrator, &policy_store, &catalog);
  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Unable to listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  try {
    return Serve();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Startup failed: " << e.what();
    return 1;
  }
}
