#include "runtime/isolation_runtime.hpp"

#include <atomic>

#include "glog/logging.h"
#include "util/watchdog.hpp"

namespace runtime {

const char* StateName(IsolatedUnit::State state) {
  switch (state) {
    case IsolatedUnit::State::CREATED:
      return "CREATED";
    case IsolatedUnit::State::RUNNING:
      return "RUNNING";
    case IsolatedUnit::State::COMPLETED:
      return "COMPLETED";
    case IsolatedUnit::State::KILLED:
      return "KILLED";
    case IsolatedUnit::State::REMOVED:
      return "REMOVED";
  }
  return "UNKNOWN";
}

bool IsolationRuntime::AwaitCompletion(IsolatedUnit* unit,
                                       std::chrono::milliseconds timeout,
                                       Completion* completion,
                                       std::string* error_msg) {
  *completion = Completion();
  int32_t exit_code = 0;
  std::string wait_error;
  std::atomic<bool> wait_returned{false};
  // Set when the deadline passed after the unit had already terminated.
  bool exited_first = false;
  bool waited = false;
  bool fired = false;
  {
    util::Watchdog watchdog(timeout, [this, unit, &wait_returned,
                                      &exited_first]() {
      if (wait_returned) {
        exited_first = true;
        return;
      }
      LOG(INFO) << "Unit " << unit->Id() << " timed out, killing it";
      std::string kill_error;
      if (Kill(unit, &kill_error)) return;
      if (wait_returned) {
        exited_first = true;
        return;
      }
      LOG(WARNING) << "Failed to kill unit " << unit->Id() << ": "
                   << kill_error << ", removing it";
      // Removal stops the unit too, so that Wait returns.
      std::string remove_error;
      if (!Remove(unit, &remove_error)) {
        LOG(ERROR) << "Failed to remove unit " << unit->Id() << ": "
                   << remove_error;
      }
    });
    waited = Wait(unit, &exit_code, &wait_error);
    wait_returned = true;
    // Once disarmed, a kill that was already started has completed.
    fired = watchdog.Disarm();
  }
  if (fired && !exited_first) {
    unit->SetState(IsolatedUnit::State::KILLED);
    completion->timed_out = true;
    return true;
  }
  if (!waited) {
    *error_msg = wait_error;
    return false;
  }
  unit->SetState(IsolatedUnit::State::COMPLETED);
  completion->exit_code = exit_code;
  return true;
}

void IsolationRuntime::Destroy(IsolatedUnit* unit) {
  if (!unit->MarkRemovalIssued()) return;
  std::string error_msg;
  if (!Remove(unit, &error_msg)) {
    LOG(WARNING) << "Failed to remove unit " << unit->Id() << " ("
                 << StateName(unit->GetState()) << "): " << error_msg;
    return;
  }
  unit->SetState(IsolatedUnit::State::REMOVED);
}

}  // namespace runtime
