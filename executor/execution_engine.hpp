#ifndef EXECUTOR_EXECUTION_ENGINE_HPP
#define EXECUTOR_EXECUTION_ENGINE_HPP

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include "proto/execution.pb.h"
#include "runtime/isolation_runtime.hpp"
#include "validator/import_validator.hpp"
#include "workspace/workspace_manager.hpp"

namespace executor {

struct EngineConfig {
  // Timeouts, in seconds.
  double default_timeout = 30;
  double max_timeout = 90;

  std::string workspace_dir = "/tmp/codebox_workspace";
  std::vector<std::string> allowed_modules;
  runtime::ResourceLimits limits;

  // Maximum number of units provisioned at the same time, 0 for no limit.
  int32_t max_concurrent_units = 0;
  bool keep_workspaces = false;

  static EngineConfig FromFlags();
};

// Runs requests end to end: checks them, prepares a workspace, runs the code
// in an isolated unit bounded by the timeout, and collects the results.
// Every resource allocated for a request is released before Execute
// returns, whatever happens. Execute may be called from multiple threads.
class ExecutionEngine {
 public:
  // The runtime must outlive the engine.
  ExecutionEngine(EngineConfig config, runtime::IsolationRuntime* runtime);

  // Never throws: failures are reported in the result.
  proto::ExecutionResult Execute(const proto::ExecutionRequest& request);

  const validator::ImportValidator& Validator() const { return validator_; }
  const EngineConfig& Config() const { return config_; }

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;
  ExecutionEngine(ExecutionEngine&&) = delete;
  ExecutionEngine& operator=(ExecutionEngine&&) = delete;

 private:
  // Holds one of the max_concurrent_units slots, waiting for a free one if
  // needed.
  class UnitSlot {
   public:
    explicit UnitSlot(ExecutionEngine* engine);
    ~UnitSlot();
    UnitSlot(const UnitSlot&) = delete;
    UnitSlot& operator=(const UnitSlot&) = delete;
    UnitSlot(UnitSlot&&) = delete;
    UnitSlot& operator=(UnitSlot&&) = delete;

   private:
    ExecutionEngine* engine_;
  };

  // Checks the parts of the request that do not depend on the code.
  bool CheckRequest(const proto::ExecutionRequest& request,
                    std::string* error_msg) const;

  // Runs an accepted request. May throw.
  void Run(const proto::ExecutionRequest& request, double timeout,
           proto::ExecutionResult* result);

  EngineConfig config_;
  runtime::IsolationRuntime* runtime_;
  validator::ImportValidator validator_;
  workspace::WorkspaceManager workspaces_;

  std::mutex slots_mutex_;
  std::condition_variable slot_freed_;
  int32_t busy_slots_ = 0;
};

}  // namespace executor

#endif
