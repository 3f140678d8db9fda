#include "core/core.hpp"
#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

#include <atomic>

namespace {

using namespace core;
using runtime::IsolatedUnit;
using runtime::ResourceLimits;

// Runtime whose units print their own code.
class EchoRuntime : public runtime::IsolationRuntime {
 public:
  std::unique_ptr<IsolatedUnit> Start(const std::string& workspace_path,
                                      const ResourceLimits& limits,
                                      std::string* error_msg) override {
    started_++;
    return absl::make_unique<IsolatedUnit>("echo", workspace_path, limits);
  }

  bool FetchLogs(IsolatedUnit* unit, std::string* logs,
                 std::string* error_msg) override {
    *logs = util::File::Read(unit->WorkspacePath() + "/user_code.py");
    return true;
  }

  int Started() const { return started_; }

 protected:
  bool Wait(IsolatedUnit* unit, int32_t* exit_code,
            std::string* error_msg) override {
    *exit_code = 0;
    return true;
  }
  bool Kill(IsolatedUnit* unit, std::string* error_msg) override {
    return true;
  }
  bool Remove(IsolatedUnit* unit, std::string* error_msg) override {
    return true;
  }

 private:
  std::atomic<int> started_{0};
};

class CoreTest : public ::testing::Test {
 protected:
  CoreTest() : tmp_("/tmp/codebox_testdir"), engine_(Config(), &runtime_) {}

  executor::EngineConfig Config() const {
    executor::EngineConfig config;
    config.workspace_dir = tmp_.Path() + "/ws";
    config.allowed_modules = {"json"};
    return config;
  }

  static proto::ExecutionRequest Request(const std::string& code) {
    proto::ExecutionRequest request;
    request.set_code(code);
    request.set_timeout(5);
    return request;
  }

  util::TempDir tmp_;
  EchoRuntime runtime_;
  executor::ExecutionEngine engine_;
};

TEST_F(CoreTest, TestResultsMatchRequests) {
  Core core(&engine_, 4);
  EXPECT_EQ(core.NumCores(), 4);
  std::vector<std::future<proto::ExecutionResult>> results;
  for (int i = 0; i < 20; i++) {
    std::string code = "x = " + std::to_string(i) + "\n";
    results.push_back(core.Enqueue(Request(code)));
  }
  for (int i = 0; i < 20; i++) {
    proto::ExecutionResult result = results[i].get();
    EXPECT_EQ(result.outcome(), proto::Outcome::SUCCESS) << result.error();
    EXPECT_EQ(result.output(), "x = " + std::to_string(i) + "\n");
  }
  EXPECT_EQ(runtime_.Started(), 20);
}

TEST_F(CoreTest, TestRejectedRequest) {
  Core core(&engine_, 1);
  proto::ExecutionResult result = core.Enqueue(Request("import os\n")).get();
  EXPECT_EQ(result.outcome(), proto::Outcome::REJECTED);
  EXPECT_EQ(result.error(), "disallowed import: os");
  EXPECT_EQ(runtime_.Started(), 0);
}

TEST_F(CoreTest, TestDestructionDrainsQueue) {
  std::vector<std::future<proto::ExecutionResult>> results;
  {
    Core core(&engine_, 1);
    for (int i = 0; i < 5; i++) results.push_back(core.Enqueue(Request("1\n")));
  }
  for (auto& result : results) {
    ASSERT_EQ(result.wait_for(std::chrono::seconds(0)),
              std::future_status::ready);
    EXPECT_EQ(result.get().outcome(), proto::Outcome::SUCCESS);
  }
}

TEST_F(CoreTest, TestAutodetectCores) {
  Core core(&engine_, 0);
  EXPECT_GE(core.NumCores(), 1);
}

}  // namespace
