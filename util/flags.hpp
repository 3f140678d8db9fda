#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Sandbox backend
DECLARE_string(image);
DECLARE_string(docker_binary);
DECLARE_string(memory_limit);
DECLARE_double(cpu_limit);
DECLARE_int32(pids_limit);
DECLARE_string(sandbox_user);

// Execution engine
DECLARE_double(default_timeout);
DECLARE_double(max_timeout);
DECLARE_string(workspace_dir);
DECLARE_string(allowed_modules);
DECLARE_int32(max_concurrent_units);
DECLARE_bool(keep_workspaces);

// Request pool
DECLARE_int32(num_cores);

#endif
