#ifndef RUNTIME_ISOLATION_RUNTIME_HPP
#define RUNTIME_ISOLATION_RUNTIME_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace runtime {

// Limits every unit is started with. Network access is always disabled and
// only the workspace is mounted, so those are not configurable.
struct ResourceLimits {
  // Memory ceiling, in the backend's syntax (e.g. "512m"). Swap is not
  // allowed to exceed it.
  std::string memory = "512m";
  // CPU share, in cores.
  double cpus = 1.0;
  // Maximum number of processes.
  int32_t pids = 10;
  // Unprivileged identity, as uid:gid.
  std::string user = "1000:1000";
};

// A running (or finished) instance of the sandbox, backed by a workspace.
class IsolatedUnit {
 public:
  enum class State { CREATED, RUNNING, COMPLETED, KILLED, REMOVED };

  IsolatedUnit(std::string id, std::string workspace_path,
               ResourceLimits limits)
      : id_(std::move(id)),
        workspace_path_(std::move(workspace_path)),
        limits_(std::move(limits)) {}

  const std::string& Id() const { return id_; }
  const std::string& WorkspacePath() const { return workspace_path_; }
  const ResourceLimits& Limits() const { return limits_; }

  State GetState() const {
    std::lock_guard<std::mutex> lck(mutex_);
    return state_;
  }
  void SetState(State state) {
    std::lock_guard<std::mutex> lck(mutex_);
    state_ = state;
  }

  // Returns true only the first time it is called.
  bool MarkRemovalIssued() {
    std::lock_guard<std::mutex> lck(mutex_);
    if (removal_issued_) return false;
    removal_issued_ = true;
    return true;
  }

  IsolatedUnit(const IsolatedUnit&) = delete;
  IsolatedUnit& operator=(const IsolatedUnit&) = delete;

 private:
  const std::string id_;
  const std::string workspace_path_;
  const ResourceLimits limits_;
  mutable std::mutex mutex_;
  State state_ = State::CREATED;
  bool removal_issued_ = false;
};

const char* StateName(IsolatedUnit::State state);

// How AwaitCompletion ended.
struct Completion {
  bool timed_out = false;
  // Only meaningful if timed_out is false.
  int32_t exit_code = 0;
};

// Client of an isolation backend. Implementations provide the primitive
// operations; the timeout and removal policies are implemented here, in
// terms of them. All the methods may be called concurrently on different
// units.
class IsolationRuntime {
 public:
  // Creates and starts a unit that runs the code in workspace_path with the
  // given limits. Returns nullptr and sets error_msg on failure; in that case
  // nothing is left behind in the backend.
  virtual std::unique_ptr<IsolatedUnit> Start(
      const std::string& workspace_path, const ResourceLimits& limits,
      std::string* error_msg) = 0;

  // Waits for the unit to terminate. If it is still running after timeout,
  // it is killed (or removed, if killing it fails) and completion->timed_out
  // is set. A unit that terminates on its own while the deadline passes is
  // reported as completed. Returns false and sets error_msg if the backend
  // could not be queried.
  bool AwaitCompletion(IsolatedUnit* unit, std::chrono::milliseconds timeout,
                       Completion* completion, std::string* error_msg);

  // Retrieves everything the unit wrote on its standard output and error,
  // interleaved.
  virtual bool FetchLogs(IsolatedUnit* unit, std::string* logs,
                         std::string* error_msg) = 0;

  // Force-removes the unit from the backend, even if it is running. Only the
  // first call has an effect; failures are logged.
  void Destroy(IsolatedUnit* unit);

  virtual ~IsolationRuntime() = default;
  IsolationRuntime() = default;
  IsolationRuntime(const IsolationRuntime&) = delete;
  IsolationRuntime(IsolationRuntime&&) = delete;
  IsolationRuntime& operator=(const IsolationRuntime&) = delete;
  IsolationRuntime& operator=(IsolationRuntime&&) = delete;

 protected:
  // Blocks until the unit terminates, and sets its exit code.
  virtual bool Wait(IsolatedUnit* unit, int32_t* exit_code,
                    std::string* error_msg) = 0;

  // Terminates a running unit.
  virtual bool Kill(IsolatedUnit* unit, std::string* error_msg) = 0;

  // Removes the unit. A unit that does not exist anymore counts as removed.
  virtual bool Remove(IsolatedUnit* unit, std::string* error_msg) = 0;
};

}  // namespace runtime

#endif
