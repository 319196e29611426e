#include "recollect/common/worker_pool.hpp"

#include <exception>
#include <iostream>

namespace recollect::common {

WorkerPool::WorkerPool(const std::size_t threads, const std::size_t max_queued)
    : max_queued_(max_queued) {
  const std::size_t count = threads == 0 ? 1 : threads;
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || (max_queued_ > 0 && queue_.size() >= max_queued_)) {
      return false;
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop();
    }
    try {
      task();
    } catch (const std::exception &ex) {
      std::cerr << "[worker] task failed: " << ex.what() << "\n";
    }
  }
}

} // namespace recollect::common
