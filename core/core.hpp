#ifndef CORE_CORE_HPP
#define CORE_CORE_HPP

#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "executor/execution_engine.hpp"
#include "proto/execution.pb.h"

namespace core {

// Runs independent requests on a fixed pool of threads. On destruction, the
// requests that are still queued are executed before the threads are joined.
class Core {
 public:
  // If num_cores is 0, one thread per hardware thread is used. The engine
  // must outlive the pool.
  Core(executor::ExecutionEngine* engine, int32_t num_cores);
  ~Core();

  // Schedules the request. The future becomes ready when it has been
  // executed.
  std::future<proto::ExecutionResult> Enqueue(proto::ExecutionRequest request);

  int32_t NumCores() const { return static_cast<int32_t>(threads_.size()); }

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;
  Core(Core&&) = delete;
  Core& operator=(Core&&) = delete;

 private:
  void ThreadBody();

  executor::ExecutionEngine* engine_;
  std::queue<std::packaged_task<proto::ExecutionResult()>> tasks_;
  std::mutex task_mutex_;
  std::condition_variable task_ready_;
  bool quitting_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace core

#endif
