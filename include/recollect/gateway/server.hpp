#pragma once

#include "recollect/common/result.hpp"
#include "recollect/common/worker_pool.hpp"
#include "recollect/config/schema.hpp"
#include "recollect/gateway/http.hpp"
#include "recollect/runtime/app.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace recollect::gateway {

struct GatewayOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8741;
  std::size_t worker_threads = 8;
  std::size_t max_body_bytes = 1024 * 1024;

  [[nodiscard]] static GatewayOptions from_config(const config::ServerConfig &server);
};

/// HTTP/1.1 front door of the memory runtime. One accept thread hands each
/// connection to a fixed worker pool; every handler runs behind a catch-all
/// that turns exceptions into 500 responses.
class GatewayServer {
public:
  explicit GatewayServer(runtime::MemoryRuntime &runtime);
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  /// Route a parsed request. Used by the connection handler and by tests.
  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse route(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_health(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_store(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_store_batch(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_query(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_stats(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_list(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_get(const std::string &id);
  [[nodiscard]] HttpResponse handle_delete_one(const std::string &id);
  [[nodiscard]] HttpResponse handle_delete(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_purge(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_reindex(const HttpRequest &request);

  void accept_loop();
  void handle_client(int client_fd);

  runtime::MemoryRuntime &runtime_;
  GatewayOptions options_;
  std::unique_ptr<common::WorkerPool> workers_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
};

} // namespace recollect::gateway
