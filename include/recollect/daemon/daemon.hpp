#pragma once

#include "recollect/common/result.hpp"
#include "recollect/config/schema.hpp"
#include "recollect/daemon/pid_file.hpp"
#include "recollect/daemon/snapshotter.hpp"
#include "recollect/gateway/server.hpp"
#include "recollect/memory/embedder.hpp"
#include "recollect/runtime/app.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace recollect::daemon {

struct DaemonOptions {
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
  /// Write `recollect.pid` into the data directory.
  bool write_pid_file = true;
};

/// Owns the memory runtime, gateway and index snapshotter for one process.
/// start(): open runtime, take pid file, bind gateway, start snapshotter.
/// stop(): the reverse, ending with a final snapshot.
class Daemon {
public:
  explicit Daemon(config::Config config, std::unique_ptr<memory::IEmbedder> embedder = nullptr);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start(const DaemonOptions &options = {});
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] runtime::MemoryRuntime &runtime() { return *runtime_; }

private:
  config::Config config_;
  std::unique_ptr<runtime::MemoryRuntime> runtime_;
  std::unique_ptr<PidFile> pid_file_;
  std::unique_ptr<gateway::GatewayServer> gateway_;
  std::unique_ptr<IndexSnapshotter> snapshotter_;
  std::atomic<bool> running_{false};
};

} // namespace recollect::daemon
