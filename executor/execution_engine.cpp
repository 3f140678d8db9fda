#include "executor/execution_engine.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <set>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace {

// Destroys the unit when going out of scope.
class UnitGuard {
 public:
  UnitGuard(runtime::IsolationRuntime* runtime, runtime::IsolatedUnit* unit)
      : runtime_(runtime), unit_(unit) {}
  ~UnitGuard() { runtime_->Destroy(unit_); }
  UnitGuard(const UnitGuard&) = delete;
  UnitGuard& operator=(const UnitGuard&) = delete;

 private:
  runtime::IsolationRuntime* runtime_;
  runtime::IsolatedUnit* unit_;
};

}  // namespace

namespace executor {

EngineConfig EngineConfig::FromFlags() {
  EngineConfig config;
  config.default_timeout = FLAGS_default_timeout;
  config.max_timeout = FLAGS_max_timeout;
  config.workspace_dir = FLAGS_workspace_dir;
  for (absl::string_view module :
       absl::StrSplit(FLAGS_allowed_modules, ',', absl::SkipWhitespace())) {
    config.allowed_modules.emplace_back(absl::StripAsciiWhitespace(module));
  }
  config.limits.memory = FLAGS_memory_limit;
  config.limits.cpus = FLAGS_cpu_limit;
  config.limits.pids = FLAGS_pids_limit;
  config.limits.user = FLAGS_sandbox_user;
  config.max_concurrent_units = FLAGS_max_concurrent_units;
  config.keep_workspaces = FLAGS_keep_workspaces;
  return config;
}

ExecutionEngine::ExecutionEngine(EngineConfig config,
                                 runtime::IsolationRuntime* runtime)
    : config_(std::move(config)),
      runtime_(runtime),
      validator_(config_.allowed_modules),
      workspaces_(config_.workspace_dir, config_.keep_workspaces) {}

ExecutionEngine::UnitSlot::UnitSlot(ExecutionEngine* engine)
    : engine_(engine) {
  std::unique_lock<std::mutex> lck(engine_->slots_mutex_);
  int32_t max_slots = engine_->config_.max_concurrent_units;
  if (max_slots > 0 && engine_->busy_slots_ >= max_slots) {
    VLOG(1) << "Waiting for a free unit slot";
    engine_->slot_freed_.wait(
        lck, [this, max_slots] { return engine_->busy_slots_ < max_slots; });
  }
  engine_->busy_slots_++;
}

ExecutionEngine::UnitSlot::~UnitSlot() {
  std::lock_guard<std::mutex> lck(engine_->slots_mutex_);
  engine_->busy_slots_--;
  engine_->slot_freed_.notify_one();
}

bool ExecutionEngine::CheckRequest(const proto::ExecutionRequest& request,
                                   std::string* error_msg) const {
  if (!(request.timeout() >= 0)) {
    *error_msg = "Timeout must not be negative";
    return false;
  }
  if (request.timeout() > config_.max_timeout) {
    *error_msg =
        absl::StrCat("Timeout exceeds max allowed: ", config_.max_timeout, "s");
    return false;
  }
  if (request.code().empty()) {
    *error_msg = "No code to execute";
    return false;
  }
  std::set<std::string> names;
  for (const proto::InputFile& file : request.input_file()) {
    if (!workspace::WorkspaceManager::IsPlainFileName(file.name())) {
      *error_msg = "Invalid input file name: " + file.name();
      return false;
    }
    if (file.name() == workspace::kCodeFileName) {
      *error_msg = "Input file name is reserved: " + file.name();
      return false;
    }
    if (!names.insert(file.name()).second) {
      *error_msg = "Duplicate input file name: " + file.name();
      return false;
    }
  }
  return true;
}

proto::ExecutionResult ExecutionEngine::Execute(
    const proto::ExecutionRequest& request) {
  proto::ExecutionResult result;
  std::string error_msg;
  if (!CheckRequest(request, &error_msg) ||
      !validator_.Validate(request.code(), &error_msg)) {
    LOG(INFO) << "Request rejected: " << error_msg;
    result.set_outcome(proto::Outcome::REJECTED);
    result.set_error(error_msg);
    return result;
  }
  double timeout =
      request.timeout() == 0 ? config_.default_timeout : request.timeout();
  try {
    Run(request, timeout, &result);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Execution failed: " << exc.what();
    result.Clear();
    result.set_outcome(proto::Outcome::INTERNAL_ERROR);
    result.set_error(exc.what());
  }
  return result;
}

void ExecutionEngine::Run(const proto::ExecutionRequest& request,
                          double timeout, proto::ExecutionResult* result) {
  UnitSlot slot(this);
  workspace::Workspace workspace =
      workspaces_.Acquire(workspace::WorkspaceManager::NewId());
  LOG(INFO) << "Running request in workspace " << workspace.Id();
  workspaces_.Populate(workspace, request.code(), request.input_file());

  std::string error_msg;
  std::unique_ptr<runtime::IsolatedUnit> unit =
      runtime_->Start(workspace.Path(), config_.limits, &error_msg);
  if (!unit) {
    LOG(ERROR) << "Failed to start a unit for workspace " << workspace.Id()
               << ": " << error_msg;
    result->set_outcome(proto::Outcome::PROVISIONING_ERROR);
    result->set_error(error_msg);
    return;
  }
  // Declared after the workspace, so the unit is gone before the workspace
  // is removed.
  UnitGuard unit_guard(runtime_, unit.get());

  runtime::Completion completion;
  auto start = std::chrono::steady_clock::now();
  bool awaited = runtime_->AwaitCompletion(
      unit.get(), std::chrono::milliseconds(std::llround(timeout * 1000)),
      &completion, &error_msg);
  result->set_wall_time(std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - start)
                            .count());
  if (!awaited) throw std::runtime_error(error_msg);

  std::string logs;
  if (!runtime_->FetchLogs(unit.get(), &logs, &error_msg)) {
    // A unit that could not be killed was removed, along with its logs.
    if (!completion.timed_out) throw std::runtime_error(error_msg);
    LOG(WARNING) << "No logs for unit " << unit->Id() << ": " << error_msg;
    logs.clear();
  }
  result->set_output(logs);
  for (const std::string& name : workspaces_.Harvest(workspace)) {
    result->add_output_file(name);
  }

  if (completion.timed_out) {
    LOG(INFO) << "Unit " << unit->Id() << " timed out";
    result->set_outcome(proto::Outcome::TIMEOUT);
    result->set_error(absl::StrCat("Execution timed out after ", timeout, "s"));
    return;
  }
  result->set_exit_code(completion.exit_code);
  result->set_outcome(completion.exit_code == 0 ? proto::Outcome::SUCCESS
                                                : proto::Outcome::NONZERO);
}

}  // namespace executor
