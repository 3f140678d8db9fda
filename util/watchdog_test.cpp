#include "util/watchdog.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <stdexcept>

namespace {

using namespace util;

TEST(WatchdogTest, TestFires) {
  std::atomic<int> calls{0};
  Watchdog watchdog(std::chrono::milliseconds(50), [&calls] { calls++; });
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(watchdog.Fired());
  EXPECT_TRUE(watchdog.Disarm());
  EXPECT_EQ(calls.load(), 1);
}

TEST(WatchdogTest, TestDisarmBeforeDeadline) {
  std::atomic<int> calls{0};
  auto start = std::chrono::steady_clock::now();
  {
    Watchdog watchdog(std::chrono::seconds(10), [&calls] { calls++; });
    EXPECT_FALSE(watchdog.Disarm());
    EXPECT_FALSE(watchdog.Fired());
    // Disarming twice is harmless.
    EXPECT_FALSE(watchdog.Disarm());
  }
  EXPECT_EQ(calls.load(), 0);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(WatchdogTest, TestDestructorDisarms) {
  std::atomic<int> calls{0};
  {
    Watchdog watchdog(std::chrono::milliseconds(200), [&calls] { calls++; });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_EQ(calls.load(), 0);
}

TEST(WatchdogTest, TestDisarmWaitsForCallback) {
  std::atomic<bool> done{false};
  Watchdog watchdog(std::chrono::milliseconds(10), [&done] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    done = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_TRUE(watchdog.Disarm());
  EXPECT_TRUE(done.load());
}

TEST(WatchdogTest, TestThrowingCallback) {
  Watchdog watchdog(std::chrono::milliseconds(10),
                    [] { throw std::runtime_error("kill failed"); });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_TRUE(watchdog.Disarm());
}

}  // namespace
