#include "util/watchdog.hpp"

#include "glog/logging.h"

namespace util {

Watchdog::Watchdog(std::chrono::milliseconds timeout,
                   std::function<void()> on_expire)
    : deadline_(Clock::now() + timeout), on_expire_(std::move(on_expire)) {
  thread_ = std::thread(&Watchdog::ThreadBody, this);
}

Watchdog::~Watchdog() {
  Disarm();
  if (thread_.joinable()) thread_.join();
}

void Watchdog::ThreadBody() {
  std::unique_lock<std::mutex> lck(mutex_);
  while (state_ == State::ARMED) {
    if (disarmed_.wait_until(lck, deadline_) == std::cv_status::timeout &&
        state_ == State::ARMED) {
      state_ = State::FIRED;
      // The lock is kept while the callback runs, so that Disarm cannot
      // return in the middle of it.
      try {
        on_expire_();
      } catch (const std::exception& exc) {
        LOG(ERROR) << "Watchdog callback failed: " << exc.what();
      }
    }
  }
}

bool Watchdog::Disarm() {
  std::lock_guard<std::mutex> lck(mutex_);
  if (state_ == State::ARMED) {
    state_ = State::DISARMED;
    disarmed_.notify_all();
  }
  return state_ == State::FIRED;
}

bool Watchdog::Fired() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return state_ == State::FIRED;
}

}  // namespace util
