#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace recollect::common {

/// Fixed set of threads draining one FIFO task queue, optionally bounded.
class WorkerPool {
public:
  using Task = std::function<void()>;

  /// `max_queued` of 0 leaves the queue unbounded.
  explicit WorkerPool(std::size_t threads, std::size_t max_queued = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Queue a task. Returns false once the pool is stopping or the queue is full.
  bool submit(Task task);

  /// Drain queued tasks, then join all workers. Idempotent.
  void stop();

  [[nodiscard]] std::size_t size() const { return workers_.size(); }
  [[nodiscard]] std::size_t pending() const;

private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Task> queue_;
  std::vector<std::thread> workers_;
  std::size_t max_queued_;
  bool stopping_ = false;
};

} // namespace recollect::common
