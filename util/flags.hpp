#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Storage.
DECLARE_string(store_directory);
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);

// Isolation.
DECLARE_bool(allow_unisolated);

// Scheduling.
DECLARE_int32(num_workers);
DECLARE_int32(queue_depth);
DECLARE_int32(queue_timeout_millis);

// Interpreters.
DECLARE_string(python_interpreter);
DECLARE_string(dsl_interpreter);

// Startup configuration files.
DECLARE_string(policy_file);
DECLARE_string(templates_file);

#endif
