#include "recollect/gateway/server.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/common/json_util.hpp"
#include "recollect/gateway/protocol.hpp"
#include "recollect/health/health.hpp"
#include "recollect/observability/global.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <optional>
#include <sstream>
#include <string_view>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace recollect::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr int kClientTimeoutSecs = 5;
constexpr std::size_t kQueuedClientsPerWorker = 16;
constexpr std::string_view kRecordsPrefix = "/records/";

HttpResponse method_not_allowed() {
  return make_error_response(405, "method_not_allowed", "method not allowed for this path");
}

std::string bind_address(const std::string &host) {
  return host == "localhost" ? "127.0.0.1" : host;
}

std::optional<std::size_t> parse_content_length(const std::string &value) {
  const std::string trimmed = common::trim(value);
  std::size_t length = 0;
  const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), length);
  if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
    return std::nullopt;
  }
  return length;
}

#ifndef _WIN32
void send_all(const int fd, const std::string &text) {
  std::size_t sent = 0;
  while (sent < text.size()) {
    const ssize_t n = send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}
#endif

} // namespace

GatewayOptions GatewayOptions::from_config(const config::ServerConfig &server) {
  return GatewayOptions{.host = server.host,
                        .port = server.port,
                        .worker_threads = server.worker_threads,
                        .max_body_bytes = server.max_body_bytes};
}

GatewayServer::GatewayServer(runtime::MemoryRuntime &runtime) : runtime_(runtime) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
#ifdef _WIN32
  return common::Status::error("gateway server is not implemented on Windows");
#else
  if (running_) {
    return common::Status::error("gateway already running");
  }
  options_ = options;

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, bind_address(options.host).c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorCode::Validation,
                                 "invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  const std::size_t worker_count = options.worker_threads == 0 ? 1 : options.worker_threads;
  workers_ =
      std::make_unique<common::WorkerPool>(worker_count, worker_count * kQueuedClientsPerWorker);
  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
#endif
}

void GatewayServer::stop() {
#ifndef _WIN32
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (workers_ != nullptr) {
    workers_->stop();
    workers_.reset();
  }
#endif
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

HttpResponse GatewayServer::dispatch(const HttpRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  HttpResponse response;
  try {
    response = route(request);
  } catch (const std::exception &ex) {
    observability::record_error("gateway", request.method + " " + request.path + ": " + ex.what());
    response = make_error_response(500, "internal_error", ex.what());
  } catch (...) {
    observability::record_error("gateway", request.method + " " + request.path + ": unknown");
    response = make_error_response(500, "internal_error", "unexpected failure");
  }
  observability::record_request(request.method, request.path, response.status,
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));
  return response;
}

HttpResponse GatewayServer::route(const HttpRequest &request) {
  const std::string &path = request.path;
  const std::string &method = request.method;

  if (path == "/health") {
    return method == "GET" ? handle_health(request) : method_not_allowed();
  }
  if (path == "/store") {
    return method == "POST" ? handle_store(request) : method_not_allowed();
  }
  if (path == "/store/batch") {
    return method == "POST" ? handle_store_batch(request) : method_not_allowed();
  }
  if (path == "/query") {
    return method == "POST" ? handle_query(request) : method_not_allowed();
  }
  if (path == "/stats") {
    return method == "GET" ? handle_stats(request) : method_not_allowed();
  }
  if (path == "/records") {
    return method == "GET" ? handle_list(request) : method_not_allowed();
  }
  if (path.size() > kRecordsPrefix.size() &&
      path.compare(0, kRecordsPrefix.size(), kRecordsPrefix) == 0) {
    const std::string id = url_decode(std::string_view(path).substr(kRecordsPrefix.size()));
    if (method == "GET") {
      return handle_get(id);
    }
    if (method == "DELETE") {
      return handle_delete_one(id);
    }
    return method_not_allowed();
  }
  if (path == "/delete") {
    return method == "POST" ? handle_delete(request) : method_not_allowed();
  }
  if (path == "/purge") {
    return method == "POST" ? handle_purge(request) : method_not_allowed();
  }
  if (path == "/reindex") {
    return method == "POST" ? handle_reindex(request) : method_not_allowed();
  }
  return make_error_response(404, "not_found", "no route for " + method + " " + path);
}

HttpResponse GatewayServer::handle_health(const HttpRequest &) {
  const std::string components = health::snapshot_json();
  if (!runtime_.healthy()) {
    return make_json_response(503, "{\"status\":\"unhealthy\",\"components\":" + components + "}");
  }
  auto stats = runtime_.stats();
  if (!stats.ok()) {
    return make_json_response(503, "{\"status\":\"unhealthy\",\"error\":\"" +
                                       common::json_escape(stats.error()) +
                                       "\",\"components\":" + components + "}");
  }

  std::ostringstream body;
  body << "{";
  body << "\"status\":\"ok\",";
  body << "\"records\":" << stats.value().total << ",";
  body << "\"indexed\":" << runtime_.indexed() << ",";
  body << "\"embedder\":\"" << common::json_escape(runtime_.embedder_name()) << "\",";
  body << "\"components\":" << components;
  body << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_store(const HttpRequest &request) {
  auto draft = parse_draft(request.body);
  if (!draft.ok()) {
    return make_error_response(draft.status());
  }
  auto outcome = runtime_.store(draft.value());
  if (!outcome.ok()) {
    return make_error_response(outcome.status());
  }
  return make_json_response(200, outcome_to_json(outcome.value()));
}

HttpResponse GatewayServer::handle_store_batch(const HttpRequest &request) {
  auto parsed = parse_draft_batch(request.body);
  if (!parsed.ok()) {
    return make_error_response(parsed.status());
  }

  const auto &items = parsed.value();
  std::vector<memory::LearningDraft> drafts;
  std::vector<std::size_t> positions;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (items[i].ok()) {
      drafts.push_back(items[i].value());
      positions.push_back(i);
    }
  }
  const auto outcomes = runtime_.store_batch(drafts);

  std::vector<std::optional<common::Result<memory::StoreOutcome>>> results(items.size());
  for (std::size_t j = 0; j < positions.size() && j < outcomes.size(); ++j) {
    results[positions[j]] = outcomes[j];
  }

  std::size_t stored = 0;
  std::size_t duplicates = 0;
  std::size_t errors = 0;
  std::ostringstream body;
  body << "{\"results\":[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << "{\"index\":" << i << ",";
    const common::Status failure = !items[i].ok()
                                       ? items[i].status()
                                       : (results[i].has_value() ? results[i]->status()
                                                                 : common::Status::error(
                                                                       "item was not processed"));
    if (!failure.ok()) {
      ++errors;
      body << "\"ok\":false,\"error\":{\"code\":\""
           << common::error_code_name(failure.code()) << "\",\"message\":\""
           << common::json_escape(failure.error()) << "\"}}";
      continue;
    }
    const auto &outcome = results[i]->value();
    if (outcome.created) {
      ++stored;
    } else {
      ++duplicates;
    }
    body << "\"ok\":true,\"id\":\"" << common::json_escape(outcome.id) << "\",";
    body << "\"created\":" << (outcome.created ? "true" : "false") << ",";
    body << "\"status\":\"" << (outcome.created ? "stored" : "duplicate") << "\",";
    if (outcome.similarity.has_value()) {
      body << "\"similarity\":" << format_number(*outcome.similarity) << ",";
    }
    body << "\"merge_count\":" << outcome.merge_count << "}";
  }
  body << "],\"stored\":" << stored << ",\"duplicates\":" << duplicates
       << ",\"errors\":" << errors << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_query(const HttpRequest &request) {
  auto parsed = parse_query_request(request.body);
  if (!parsed.ok()) {
    return make_error_response(parsed.status());
  }
  auto response = runtime_.query(parsed.value());
  if (!response.ok()) {
    return make_error_response(response.status());
  }

  std::ostringstream body;
  body << "{\"results\":[";
  const auto &results = response.value().results;
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << ranked_to_json(results[i]);
  }
  body << "]}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_stats(const HttpRequest &) {
  auto stats = runtime_.stats();
  if (!stats.ok()) {
    return make_error_response(stats.status());
  }
  return make_json_response(200, stats_to_json(stats.value(), runtime_.indexed()));
}

HttpResponse GatewayServer::handle_list(const HttpRequest &request) {
  auto parsed = parse_list_request(request.query);
  if (!parsed.ok()) {
    return make_error_response(parsed.status());
  }
  auto page = runtime_.list(parsed.value().filter, parsed.value().limit, parsed.value().cursor);
  if (!page.ok()) {
    return make_error_response(page.status());
  }
  return make_json_response(200, page_to_json(page.value()));
}

HttpResponse GatewayServer::handle_get(const std::string &id) {
  auto record = runtime_.get(id);
  if (!record.ok()) {
    return make_error_response(record.status());
  }
  return make_json_response(200, record_to_json(record.value()));
}

HttpResponse GatewayServer::handle_delete_one(const std::string &id) {
  auto removed = runtime_.forget(id);
  if (!removed.ok()) {
    return make_error_response(removed.status());
  }
  return make_json_response(200, std::string("{\"deleted\":") +
                                     (removed.value() ? "true" : "false") + "}");
}

HttpResponse GatewayServer::handle_delete(const HttpRequest &request) {
  if (!common::json_is_object(request.body)) {
    return make_error_response(400, "validation_error", "request body must be a JSON object");
  }
  const std::string id = common::json_get_string(request.body, "id");
  if (!id.empty()) {
    return handle_delete_one(id);
  }
  if (common::json_get_array(request.body, "ids").empty()) {
    return make_error_response(400, "validation_error", "id or ids is required");
  }

  std::size_t deleted = 0;
  std::ostringstream body;
  body << "{\"results\":[";
  bool first = true;
  for (const auto &item : common::json_get_string_array(request.body, "ids")) {
    if (!first) {
      body << ",";
    }
    first = false;
    body << "{\"id\":\"" << common::json_escape(item) << "\",";
    auto removed = runtime_.forget(item);
    if (!removed.ok()) {
      body << "\"deleted\":false,\"error\":{\"code\":\"" << common::error_code_name(removed.code())
           << "\",\"message\":\"" << common::json_escape(removed.error()) << "\"}}";
      continue;
    }
    if (removed.value()) {
      ++deleted;
    }
    body << "\"deleted\":" << (removed.value() ? "true" : "false") << "}";
  }
  body << "],\"deleted\":" << deleted << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_purge(const HttpRequest &) {
  auto purged = runtime_.purge();
  if (!purged.ok()) {
    return make_error_response(purged.status());
  }
  return make_json_response(200, "{\"purged\":" + std::to_string(purged.value()) + "}");
}

HttpResponse GatewayServer::handle_reindex(const HttpRequest &) {
  auto indexed = runtime_.reindex();
  if (!indexed.ok()) {
    return make_error_response(indexed.status());
  }
  return make_json_response(200, "{\"indexed\":" + std::to_string(indexed.value()) + "}");
}

void GatewayServer::accept_loop() {
#ifndef _WIN32
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    timeval timeout{};
    timeout.tv_sec = kClientTimeoutSecs;
    setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    const bool queued = workers_->submit([this, client]() {
      handle_client(client);
      close(client);
    });
    if (!queued) {
      send_all(client, render_http_response(make_error_response(
                           503, "server_busy", "too many requests in flight")));
      close(client);
    }
  }
#endif
}

void GatewayServer::handle_client(const int client_fd) {
#ifndef _WIN32
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  std::optional<std::size_t> header_end;
  while (true) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (!header_end.has_value()) {
      const auto found = raw.find("\r\n\r\n");
      if (found == std::string::npos) {
        if (raw.size() > kMaxHeaderBytes) {
          send_all(client_fd, render_http_response(make_error_response(
                                  413, "payload_too_large", "request headers too large")));
          return;
        }
        continue;
      }
      header_end = found;
      auto parsed = parse_http_request(raw.substr(0, found + 4));
      if (parsed.ok()) {
        const std::string cl = header_lookup(parsed.value(), "content-length");
        if (!cl.empty()) {
          const auto length = parse_content_length(cl);
          if (!length.has_value()) {
            send_all(client_fd, render_http_response(make_error_response(
                                    400, "validation_error", "invalid Content-Length")));
            return;
          }
          content_length = *length;
        }
      }
      if (content_length > options_.max_body_bytes) {
        send_all(client_fd,
                 render_http_response(make_error_response(
                     413, "payload_too_large",
                     "request body exceeds " + std::to_string(options_.max_body_bytes) +
                         " bytes")));
        return;
      }
    }

    if (header_end.has_value() && raw.size() >= *header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    response = make_error_response(400, "validation_error", parsed.error());
  } else {
    if (parsed.value().body.size() > content_length) {
      parsed.value().body.resize(content_length);
    }
    response = dispatch(parsed.value());
  }
  send_all(client_fd, render_http_response(response));
#endif
}

} // namespace recollect::gateway
