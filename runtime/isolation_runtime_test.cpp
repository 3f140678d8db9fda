#include "runtime/isolation_runtime.hpp"
#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

using namespace runtime;

// Backend whose unit runs for run_time, or until it is stopped. Kill takes
// kill_time and fails if kill_fails is set; Remove always stops the unit.
class ScriptedRuntime : public IsolationRuntime {
 public:
  std::chrono::milliseconds run_time{std::chrono::seconds(60)};
  std::chrono::milliseconds kill_time{0};
  bool kill_fails = false;
  int32_t exit_code = 0;

  std::unique_ptr<IsolatedUnit> Start(const std::string& workspace_path,
                                      const ResourceLimits& limits,
                                      std::string* error_msg) override {
    auto unit = absl::make_unique<IsolatedUnit>("u1", workspace_path, limits);
    unit->SetState(IsolatedUnit::State::RUNNING);
    return unit;
  }

  bool FetchLogs(IsolatedUnit* unit, std::string* logs,
                 std::string* error_msg) override {
    return true;
  }

  int Kills() const { return kills_; }
  int Removals() const { return removals_; }

 protected:
  bool Wait(IsolatedUnit* unit, int32_t* code,
            std::string* error_msg) override {
    std::unique_lock<std::mutex> lck(mutex_);
    bool ended = !stopped_cv_.wait_for(lck, run_time, [this] {
      return stopped_;
    });
    *code = ended ? exit_code : 137;
    return true;
  }

  bool Kill(IsolatedUnit* unit, std::string* error_msg) override {
    kills_++;
    std::this_thread::sleep_for(kill_time);
    if (kill_fails) {
      *error_msg = "Cannot kill container";
      return false;
    }
    Stop();
    return true;
  }

  bool Remove(IsolatedUnit* unit, std::string* error_msg) override {
    removals_++;
    Stop();
    return true;
  }

 private:
  void Stop() {
    std::lock_guard<std::mutex> lck(mutex_);
    stopped_ = true;
    stopped_cv_.notify_all();
  }

  std::mutex mutex_;
  std::condition_variable stopped_cv_;
  bool stopped_ = false;
  std::atomic<int> kills_{0};
  std::atomic<int> removals_{0};
};

TEST(IsolationRuntimeTest, TestCompletesBeforeDeadline) {
  ScriptedRuntime runtime;
  runtime.run_time = std::chrono::milliseconds(10);
  runtime.exit_code = 2;
  std::string error_msg;
  auto unit = runtime.Start("/tmp/ws", ResourceLimits(), &error_msg);
  Completion completion;
  ASSERT_TRUE(runtime.AwaitCompletion(unit.get(), std::chrono::seconds(10),
                                      &completion, &error_msg));
  EXPECT_FALSE(completion.timed_out);
  EXPECT_EQ(completion.exit_code, 2);
  EXPECT_EQ(runtime.Kills(), 0);
}

TEST(IsolationRuntimeTest, TestKilledAtDeadline) {
  ScriptedRuntime runtime;
  std::string error_msg;
  auto unit = runtime.Start("/tmp/ws", ResourceLimits(), &error_msg);
  Completion completion;
  ASSERT_TRUE(runtime.AwaitCompletion(unit.get(),
                                      std::chrono::milliseconds(50),
                                      &completion, &error_msg));
  EXPECT_TRUE(completion.timed_out);
  EXPECT_EQ(unit->GetState(), IsolatedUnit::State::KILLED);
  EXPECT_EQ(runtime.Kills(), 1);
  EXPECT_EQ(runtime.Removals(), 0);
}

TEST(IsolationRuntimeTest, TestRemovedWhenKillFails) {
  ScriptedRuntime runtime;
  runtime.kill_fails = true;
  std::string error_msg;
  auto unit = runtime.Start("/tmp/ws", ResourceLimits(), &error_msg);
  Completion completion;
  auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(runtime.AwaitCompletion(unit.get(),
                                      std::chrono::milliseconds(50),
                                      &completion, &error_msg));
  EXPECT_LE(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_TRUE(completion.timed_out);
  EXPECT_EQ(unit->GetState(), IsolatedUnit::State::KILLED);
  EXPECT_EQ(runtime.Removals(), 1);
}

TEST(IsolationRuntimeTest, TestExitDuringFailedKillIsCompletion) {
  ScriptedRuntime runtime;
  // The deadline passes at 20ms; the unit exits on its own at 100ms, while
  // the kill is still in progress, and the kill then fails.
  runtime.run_time = std::chrono::milliseconds(100);
  runtime.kill_time = std::chrono::milliseconds(300);
  runtime.kill_fails = true;
  runtime.exit_code = 0;
  std::string error_msg;
  auto unit = runtime.Start("/tmp/ws", ResourceLimits(), &error_msg);
  Completion completion;
  ASSERT_TRUE(runtime.AwaitCompletion(unit.get(),
                                      std::chrono::milliseconds(20),
                                      &completion, &error_msg));
  EXPECT_FALSE(completion.timed_out);
  EXPECT_EQ(completion.exit_code, 0);
  EXPECT_EQ(unit->GetState(), IsolatedUnit::State::COMPLETED);
  EXPECT_EQ(runtime.Kills(), 1);
  EXPECT_EQ(runtime.Removals(), 0);
}

TEST(IsolationRuntimeTest, TestDestroyOnce) {
  ScriptedRuntime runtime;
  std::string error_msg;
  auto unit = runtime.Start("/tmp/ws", ResourceLimits(), &error_msg);
  runtime.Destroy(unit.get());
  runtime.Destroy(unit.get());
  EXPECT_EQ(runtime.Removals(), 1);
  EXPECT_EQ(unit->GetState(), IsolatedUnit::State::REMOVED);
}

}  // namespace
