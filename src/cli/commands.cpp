#include "recollect/cli/commands.hpp"

#include "recollect/client/daemon_client.hpp"
#include "recollect/common/fs.hpp"
#include "recollect/common/json_util.hpp"
#include "recollect/config/config.hpp"
#include "recollect/daemon/daemon.hpp"
#include "recollect/memory/learning.hpp"
#include "recollect/observability/factory.hpp"
#include "recollect/observability/global.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace recollect::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef RECOLLECT_VERSION
  std::string version = RECOLLECT_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef RECOLLECT_GIT_COMMIT
  const std::string commit = RECOLLECT_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "recollect " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

template <typename T> bool parse_integer(const std::string &raw, T &out) {
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), out);
  return ec == std::errc() && ptr == raw.data() + raw.size();
}

bool parse_double(const std::string &raw, double &out) {
  char *end = nullptr;
  out = std::strtod(raw.c_str(), &end);
  return !raw.empty() && end == raw.c_str() + raw.size();
}

common::Result<config::Config> load_config_or_report() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "config error: " << loaded.error() << "\n";
    return loaded;
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    std::cerr << "config error: " << warnings.error() << "\n";
    return common::Result<config::Config>::failure(warnings.status());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "config warning: " << warning << "\n";
  }
  return loaded;
}

/// Client aimed at the configured daemon, honouring --host / --port.
common::Result<client::DaemonClient> make_client(std::vector<std::string> &args) {
  using R = common::Result<client::DaemonClient>;
  auto cfg = load_config_or_report();
  if (!cfg.ok()) {
    return R::failure(cfg.status());
  }
  std::string host = cfg.value().server.host;
  std::uint16_t port = cfg.value().server.port;
  std::string host_raw;
  std::string port_raw;
  if (take_option(args, "--host", "", host_raw)) {
    host = host_raw;
  }
  if (take_option(args, "--port", "-p", port_raw) && !parse_integer(port_raw, port)) {
    return R::failure(common::ErrorCode::Validation, "invalid port: " + port_raw);
  }
  if (host == "0.0.0.0") {
    host = "127.0.0.1";
  }
  return R::success(client::DaemonClient(host, port));
}

int report_failure(const common::Status &status) {
  std::cerr << "error";
  if (status.code() != common::ErrorCode::Internal) {
    std::cerr << " (" << common::error_code_name(status.code()) << ")";
  }
  std::cerr << ": " << status.error() << "\n";
  return 1;
}

void print_results(const std::string &body) {
  const auto results =
      common::json_split_top_level_objects(common::json_get_array(body, "results"));
  if (results.empty()) {
    std::cout << "No matching learnings.\n";
    return;
  }
  std::size_t rank = 1;
  for (const auto &item : results) {
    std::cout << rank++ << ". [" << common::json_get_string(item, "type") << "] "
              << common::json_get_string(item, "content") << "\n";
    const std::string context = common::json_get_string(item, "context");
    if (!context.empty()) {
      std::cout << "   context: " << context << "\n";
    }
    std::cout << "   score " << common::json_get_number(item, "score") << ", final "
              << common::json_get_number(item, "final_score") << ", confidence "
              << common::json_get_number(item, "confidence") << ", merged "
              << common::json_get_number(item, "merge_count") << "x, id "
              << common::json_get_string(item, "id") << "\n";
  }
}

void print_stats(const std::string &body) {
  std::cout << "Total learnings: " << common::json_get_number(body, "total_learnings") << "\n";
  std::cout << "Archived:        " << common::json_get_number(body, "archived") << "\n";
  std::cout << "Indexed:         " << common::json_get_number(body, "indexed") << "\n";
  const std::string by_type = common::json_get_object(body, "by_type");
  for (const auto type : memory::kAllLearningTypes) {
    const std::string name = memory::type_to_string(type);
    std::cout << "  " << name << ": " << common::json_get_number(by_type, name) << "\n";
  }
}

int run_serve(std::vector<std::string> args) {
  auto cfg = load_config_or_report();
  if (!cfg.ok()) {
    return 1;
  }

  daemon::DaemonOptions options;
  std::string host;
  std::string port_raw;
  std::string duration_raw;
  if (take_option(args, "--host", "", host)) {
    options.host = host;
  }
  if (take_option(args, "--port", "-p", port_raw)) {
    std::uint16_t port = 0;
    if (!parse_integer(port_raw, port)) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    options.port = port;
  }
  (void)take_option(args, "--duration-secs", "", duration_raw);
  std::uint64_t duration = 0;
  if (!duration_raw.empty() && !parse_integer(duration_raw, duration)) {
    std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(cfg.value()));

  daemon::Daemon daemon(cfg.value());
  auto started = daemon.start(options);
  if (!started.ok()) {
    return report_failure(started);
  }

  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (!g_stop_requested) {
    if (duration > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  daemon.stop();
  return 0;
}

int run_health(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  auto body = client.value().health();
  if (!body.ok()) {
    if (common::starts_with(body.error(), "cannot reach")) {
      std::cerr << "recollect daemon is not running (" << body.error() << ")\n";
      return 1;
    }
    return report_failure(body.status());
  }
  std::cout << "status: " << common::json_get_string(body.value(), "status") << "\n";
  std::cout << "records: " << common::json_get_number(body.value(), "records") << "\n";
  std::cout << "indexed: " << common::json_get_number(body.value(), "indexed") << "\n";
  std::cout << "embedder: " << common::json_get_string(body.value(), "embedder") << "\n";
  return 0;
}

int run_store(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }

  std::string payload;
  if (take_flag(args, "--stdin")) {
    payload = common::trim(read_stdin_all());
  } else {
    std::string type;
    std::string content;
    std::string context;
    std::string confidence_raw = "0.8";
    std::string session;
    (void)take_option(args, "--type", "-t", type);
    (void)take_option(args, "--content", "-c", content);
    (void)take_option(args, "--context", "", context);
    (void)take_option(args, "--confidence", "", confidence_raw);
    (void)take_option(args, "--session", "-s", session);
    if (content.empty()) {
      content = join_tokens(args);
    }
    double confidence = 0.0;
    if (!parse_double(confidence_raw, confidence)) {
      std::cerr << "invalid --confidence: " << confidence_raw << "\n";
      return 1;
    }
    if (type.empty() || content.empty()) {
      std::cerr << "usage: recollect store --type TYPE [--confidence F] [--context TEXT] "
                   "[--session ID] CONTENT\n";
      return 1;
    }
    std::ostringstream json;
    json << "{\"type\":\"" << common::json_escape(type) << "\",";
    json << "\"content\":\"" << common::json_escape(content) << "\",";
    json << "\"context\":\"" << common::json_escape(context) << "\",";
    json << "\"confidence\":" << confidence << ",";
    json << "\"session_source\":\"" << common::json_escape(session) << "\"}";
    payload = json.str();
  }

  auto body = client.value().store(payload);
  if (!body.ok()) {
    return report_failure(body.status());
  }
  const std::string status = common::json_get_string(body.value(), "status");
  std::cout << status << " " << common::json_get_string(body.value(), "id");
  if (status == "duplicate") {
    std::cout << " (similarity " << common::json_get_number(body.value(), "similarity")
              << ", merged " << common::json_get_number(body.value(), "merge_count") << "x)";
  }
  std::cout << "\n";
  return 0;
}

int run_query(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  const bool raw = take_flag(args, "--json");
  std::string k_raw;
  std::string type;
  std::string min_confidence;
  std::string min_score;
  (void)take_option(args, "--k", "-k", k_raw);
  (void)take_option(args, "--type", "-t", type);
  (void)take_option(args, "--min-confidence", "", min_confidence);
  (void)take_option(args, "--min-score", "", min_score);

  const std::string probe = join_tokens(args);
  if (common::trim(probe).empty()) {
    std::cerr << "usage: recollect query [-k N] [--type TYPE] [--min-confidence F] "
                 "[--min-score F] TEXT\n";
    return 1;
  }

  std::ostringstream json;
  json << "{\"probe_text\":\"" << common::json_escape(probe) << "\"";
  double number = 0.0;
  if (!k_raw.empty()) {
    std::size_t k = 0;
    if (!parse_integer(k_raw, k)) {
      std::cerr << "invalid -k: " << k_raw << "\n";
      return 1;
    }
    json << ",\"k\":" << k;
  }
  if (!type.empty()) {
    json << ",\"type_filter\":\"" << common::json_escape(type) << "\"";
  }
  if (!min_confidence.empty()) {
    if (!parse_double(min_confidence, number)) {
      std::cerr << "invalid --min-confidence: " << min_confidence << "\n";
      return 1;
    }
    json << ",\"min_confidence\":" << number;
  }
  if (!min_score.empty()) {
    if (!parse_double(min_score, number)) {
      std::cerr << "invalid --min-score: " << min_score << "\n";
      return 1;
    }
    json << ",\"min_score\":" << number;
  }
  json << "}";

  auto body = client.value().query(json.str());
  if (!body.ok()) {
    return report_failure(body.status());
  }
  if (raw) {
    std::cout << body.value() << "\n";
  } else {
    print_results(body.value());
  }
  return 0;
}

int run_import(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  const bool quiet = take_flag(args, "--quiet");
  if (args.size() != 1) {
    std::cerr << "usage: recollect import FILE.jsonl\n";
    return 1;
  }

  auto summary = client.value().import_jsonl(common::expand_path(args[0]),
                                             quiet ? nullptr : &std::cerr);
  if (!summary.ok()) {
    return report_failure(summary.status());
  }
  std::cout << "Imported: " << summary.value().imported << "\n";
  std::cout << "Duplicates merged: " << summary.value().duplicates << "\n";
  std::cout << "Errors: " << summary.value().errors << "\n";

  auto stats = client.value().stats();
  if (stats.ok()) {
    std::cout << "\n";
    print_stats(stats.value());
  }
  return summary.value().errors == 0 ? 0 : 2;
}

int run_stats(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  const bool raw = take_flag(args, "--json");
  auto body = client.value().stats();
  if (!body.ok()) {
    return report_failure(body.status());
  }
  if (raw) {
    std::cout << body.value() << "\n";
  } else {
    print_stats(body.value());
  }
  return 0;
}

int run_list(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  std::vector<std::string> params;
  std::string value;
  if (take_option(args, "--type", "-t", value)) {
    params.push_back("type=" + value);
  }
  if (take_option(args, "--session", "-s", value)) {
    params.push_back("session_source=" + value);
  }
  if (take_option(args, "--min-confidence", "", value)) {
    params.push_back("min_confidence=" + value);
  }
  if (take_option(args, "--limit", "-n", value)) {
    params.push_back("limit=" + value);
  }
  if (take_option(args, "--cursor", "", value)) {
    params.push_back("cursor=" + value);
  }
  if (take_flag(args, "--include-archived")) {
    params.push_back("include_archived=true");
  }

  std::string query;
  for (const auto &param : params) {
    query += (query.empty() ? "" : "&") + param;
  }
  auto body = client.value().list(query);
  if (!body.ok()) {
    return report_failure(body.status());
  }
  std::cout << body.value() << "\n";
  return 0;
}

int run_forget(std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  if (args.empty()) {
    std::cerr << "usage: recollect forget ID [ID...]\n";
    return 1;
  }
  int exit_code = 0;
  for (const auto &id : args) {
    auto body = client.value().forget(id);
    if (!body.ok()) {
      exit_code = report_failure(body.status());
      continue;
    }
    const bool deleted = body.value().find("\"deleted\":true") != std::string::npos;
    std::cout << id << ": " << (deleted ? "archived" : "not found or already archived") << "\n";
  }
  return exit_code;
}

int run_admin(const std::string &command, std::vector<std::string> args) {
  auto client = make_client(args);
  if (!client.ok()) {
    return report_failure(client.status());
  }
  auto body = command == "purge" ? client.value().purge() : client.value().reindex();
  if (!body.ok()) {
    return report_failure(body.status());
  }
  if (command == "purge") {
    std::cout << "Purged " << common::json_get_number(body.value(), "purged")
              << " archived learnings\n";
  } else {
    std::cout << "Indexed " << common::json_get_number(body.value(), "indexed")
              << " learnings\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  recollect [--config PATH] <command> [options]\n\n";
  std::cout << "DAEMON\n";
  std::cout << "  serve [--host H] [--port P]     Run the memory daemon in the foreground\n";
  std::cout << "  health                          Check whether the daemon is up\n\n";
  std::cout << "LEARNINGS\n";
  std::cout << "  store --type T [--confidence F] [--context C] [--session S] TEXT\n";
  std::cout << "  store --stdin                   Store one JSON learning read from stdin\n";
  std::cout << "  query [-k N] [--type T] TEXT    Retrieve similar learnings\n";
  std::cout << "  import FILE.jsonl               Store one learning per line\n";
  std::cout << "  list [--type T] [--limit N]     Page through stored learnings\n";
  std::cout << "  forget ID...                    Archive learnings\n";
  std::cout << "  stats                           Totals by type\n\n";
  std::cout << "MAINTENANCE\n";
  std::cout << "  reindex                         Rebuild the similarity index\n";
  std::cout << "  purge                           Delete archived learnings for good\n";
  std::cout << "  config-path                     Print the config file location\n";
  std::cout << "  version                         Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "health") {
    return run_health(std::move(args));
  }
  if (subcommand == "store") {
    return run_store(std::move(args));
  }
  if (subcommand == "query") {
    return run_query(std::move(args));
  }
  if (subcommand == "import") {
    return run_import(std::move(args));
  }
  if (subcommand == "stats") {
    return run_stats(std::move(args));
  }
  if (subcommand == "list") {
    return run_list(std::move(args));
  }
  if (subcommand == "forget") {
    return run_forget(std::move(args));
  }
  if (subcommand == "reindex" || subcommand == "purge") {
    return run_admin(subcommand, std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace recollect::cli
