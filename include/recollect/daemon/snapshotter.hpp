#pragma once

#include "recollect/runtime/app.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace recollect::daemon {

/// Background thread writing the similarity index snapshot every `interval`.
/// An interval of zero disables periodic snapshots.
class IndexSnapshotter {
public:
  IndexSnapshotter(runtime::MemoryRuntime &runtime, std::chrono::seconds interval);
  ~IndexSnapshotter();

  IndexSnapshotter(const IndexSnapshotter &) = delete;
  IndexSnapshotter &operator=(const IndexSnapshotter &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t snapshots_written() const { return written_.load(); }

private:
  void snapshot_loop();

  runtime::MemoryRuntime &runtime_;
  std::chrono::seconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> written_{0};
};

} // namespace recollect::daemon
