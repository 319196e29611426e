#include "recollect/daemon/daemon.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/health/health.hpp"
#include "recollect/observability/global.hpp"

#include <chrono>
#include <iostream>

namespace recollect::daemon {

Daemon::Daemon(config::Config config, std::unique_ptr<memory::IEmbedder> embedder)
    : config_(std::move(config)) {
  if (embedder != nullptr) {
    runtime_ = std::make_unique<runtime::MemoryRuntime>(config_, std::move(embedder));
  } else {
    runtime_ = std::make_unique<runtime::MemoryRuntime>(config_);
  }
}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error("daemon already running");
  }

  std::cerr << "[daemon] starting, data dir " << runtime_->data_dir().string() << "\n";
  if (options.write_pid_file) {
    if (auto dir = common::ensure_dir(runtime_->data_dir()); !dir.ok()) {
      std::cerr << "[daemon] " << dir.error() << "\n";
      return dir.status();
    }
    // A refused instance must leave the store and index snapshot untouched.
    pid_file_ = std::make_unique<PidFile>(runtime_->pid_path());
    if (auto status = pid_file_->acquire(); !status.ok()) {
      std::cerr << "[daemon] " << status.error() << "\n";
      pid_file_.reset();
      return status;
    }
  }

  if (auto status = runtime_->open(); !status.ok()) {
    std::cerr << "[daemon] failed to open memory runtime: " << status.error() << "\n";
    pid_file_.reset();
    return status;
  }

  auto gateway_options = gateway::GatewayOptions::from_config(config_.server);
  if (options.host.has_value()) {
    gateway_options.host = *options.host;
  }
  if (options.port.has_value()) {
    gateway_options.port = *options.port;
  }

  health::mark_component_starting("gateway");
  gateway_ = std::make_unique<gateway::GatewayServer>(*runtime_);
  if (auto status = gateway_->start(gateway_options); !status.ok()) {
    health::mark_component_error("gateway", status.error());
    std::cerr << "[daemon] gateway failed to start: " << status.error() << "\n";
    gateway_.reset();
    pid_file_.reset();
    runtime_->close();
    return status;
  }
  health::mark_component_ok("gateway");

  snapshotter_ = std::make_unique<IndexSnapshotter>(
      *runtime_, std::chrono::seconds(config_.index.snapshot_interval_secs));
  snapshotter_->start();

  running_ = true;
  std::cerr << "[daemon] listening on " << gateway_options.host << ":" << gateway_->port()
            << " (embedder " << runtime_->embedder_name() << ", " << runtime_->indexed()
            << " indexed)\n";
  return common::Status::success();
}

void Daemon::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  std::cerr << "[daemon] stopping\n";
  if (gateway_ != nullptr) {
    gateway_->stop();
    gateway_.reset();
  }
  if (snapshotter_ != nullptr) {
    snapshotter_->stop();
    snapshotter_.reset();
  }
  runtime_->close();
  if (pid_file_ != nullptr) {
    pid_file_->release();
    pid_file_.reset();
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  std::cerr << "[daemon] stopped\n";
}

bool Daemon::is_running() const { return running_; }

std::uint16_t Daemon::port() const { return gateway_ == nullptr ? 0 : gateway_->port(); }

} // namespace recollect::daemon
