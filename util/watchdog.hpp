#ifndef UTIL_WATCHDOG_HPP
#define UTIL_WATCHDOG_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace util {

// Runs a callback on a separate thread once a deadline has passed, unless it
// is disarmed first. Disarming and firing are mutually exclusive: Disarm
// waits for a callback that is already running, so once Disarm returns the
// callback has either completed or will never run.
class Watchdog {
 public:
  using Clock = std::chrono::steady_clock;

  Watchdog(std::chrono::milliseconds timeout, std::function<void()> on_expire);
  ~Watchdog();

  // Stops the watchdog. Returns true if the callback was run.
  bool Disarm();

  // Returns true if the callback was run.
  bool Fired() const;

  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;
  Watchdog(Watchdog&&) = delete;
  Watchdog& operator=(Watchdog&&) = delete;

 private:
  enum class State { ARMED, DISARMED, FIRED };

  void ThreadBody();

  const Clock::time_point deadline_;
  std::function<void()> on_expire_;
  mutable std::mutex mutex_;
  std::condition_variable disarmed_;
  State state_ = State::ARMED;
  std::thread thread_;
};

}  // namespace util

#endif
