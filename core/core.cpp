#include "core/core.hpp"

#include <functional>

#include "glog/logging.h"

namespace core {

Core::Core(executor::ExecutionEngine* engine, int32_t num_cores)
    : engine_(engine) {
  if (num_cores <= 0) {
    num_cores = std::thread::hardware_concurrency();
    if (num_cores <= 0) num_cores = 1;
  }
  VLOG(1) << "Starting " << num_cores << " workers";
  for (int32_t i = 0; i < num_cores; i++)
    threads_.emplace_back(std::bind(&Core::ThreadBody, this));
}

Core::~Core() {
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    quitting_ = true;
  }
  task_ready_.notify_all();
  for (std::thread& thread : threads_) thread.join();
}

std::future<proto::ExecutionResult> Core::Enqueue(
    proto::ExecutionRequest request) {
  std::packaged_task<proto::ExecutionResult()> task(
      [this, request = std::move(request)]() {
        return engine_->Execute(request);
      });
  std::future<proto::ExecutionResult> result = task.get_future();
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    tasks_.push(std::move(task));
  }
  task_ready_.notify_one();
  return result;
}

void Core::ThreadBody() {
  while (true) {
    std::unique_lock<std::mutex> lck(task_mutex_);
    while (!quitting_ && tasks_.empty()) {
      task_ready_.wait(lck);
    }
    // Queued requests are still executed when quitting.
    if (tasks_.empty()) break;
    std::packaged_task<proto::ExecutionResult()> task =
        std::move(tasks_.front());
    tasks_.pop();
    lck.unlock();
    task();
  }
}

}  // namespace core
