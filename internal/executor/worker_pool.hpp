#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "internal/executor/task_queue.hpp"

namespace chainweave::executor {

/*
  Fixed-size pool of threads draining a TaskQueue.

  The pool bounds how many plugin invocations run at once across every
  chain using it. Tasks already queued when Stop() is called still run.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // Throws util::InvalidState when the pool is not running.
  void Submit(Task task);

  std::size_t Threads() const {
    return thread_count_;
  }

 private:
  void Run();

  std::size_t                thread_count_;
  std::shared_ptr<TaskQueue> queue_ = std::make_shared<TaskQueue>();
  std::vector<std::thread>   threads_;
  std::atomic<bool>          running_{false};
};

} // namespace chainweave::executor
