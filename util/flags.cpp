#include "util/flags.hpp"

DEFINE_string(store_directory, "files",
              "Where the execution ledger and large sources are stored");
DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the working area after an execution");

DEFINE_bool(allow_unisolated, false,
            "Run programs that must not reach the network even if the "
            "sandbox cannot cut them off from it");

DEFINE_int32(
    num_workers, 0,
    "Number of concurrent sandboxed executions. If unset, autodetect");
DEFINE_int32(queue_depth, 16,
             "Maximum number of submissions waiting for a free worker");
DEFINE_int32(queue_timeout_millis, 2000,
             "Submissions waiting longer than this for a worker are rejected");

DEFINE_string(python_interpreter, "python3",
              "Interpreter for general purpose code, looked up in PATH");
DEFINE_string(dsl_interpreter, "jac",
              "Interpreter for DSL code, looked up in PATH");

DEFINE_string(policy_file, "",
              "Security policy in protobuf text format. If unset, use the "
              "built-in defaults");
DEFINE_string(templates_file, "",
              "Template catalog in protobuf text format");
