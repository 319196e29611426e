#include "recollect/daemon/snapshotter.hpp"

#include "recollect/health/health.hpp"

#include <iostream>

namespace recollect::daemon {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};

} // namespace

IndexSnapshotter::IndexSnapshotter(runtime::MemoryRuntime &runtime,
                                   const std::chrono::seconds interval)
    : runtime_(runtime), interval_(interval) {}

IndexSnapshotter::~IndexSnapshotter() { stop(); }

void IndexSnapshotter::start() {
  if (running_ || interval_.count() <= 0) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { snapshot_loop(); });
}

void IndexSnapshotter::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool IndexSnapshotter::is_running() const { return running_; }

void IndexSnapshotter::snapshot_loop() {
  while (running_) {
    const auto deadline = std::chrono::steady_clock::now() + interval_;
    while (running_ && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kPollSlice);
    }
    if (!running_) {
      break;
    }

    const auto status = runtime_.save_snapshot();
    if (!status.ok()) {
      health::mark_component_error("snapshotter", status.error());
      std::cerr << "[daemon] index snapshot failed: " << status.error() << "\n";
      continue;
    }
    health::mark_component_ok("snapshotter");
    ++written_;
  }
}

} // namespace recollect::daemon
