#include "internal/executor/worker_pool.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chainweave::executor {

WorkerPool::WorkerPool(std::size_t threads) : thread_count_(threads) {
  if (thread_count_ == 0) {
    throw util::InvalidArgument("worker pool requires at least one thread");
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  queue_ = std::make_shared<TaskQueue>();
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
  CHAINWEAVE_LOG_DEBUG("Worker pool started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void WorkerPool::Stop() {
  if (!running_.exchange(false)) return;
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Submit(Task task) {
  if (!running_ || !queue_->Enqueue(std::move(task))) {
    throw util::InvalidState("worker pool is not running");
  }
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      CHAINWEAVE_LOG_ERROR("Worker task failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace chainweave::executor
