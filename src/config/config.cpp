#include "recollect/config/config.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/common/toml.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace recollect::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".recollect";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("RECOLLECT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("RECOLLECT_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  for (const char ch : host) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '.' || ch == '-' || ch == ':')) {
      return false;
    }
  }
  return true;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path data_dir(const Config &config) {
  return std::filesystem::path(common::expand_path(config.store.data_dir));
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *host = env_value("RECOLLECT_HOST")) {
    config.server.host = host;
  }
  if (const char *port = env_value("RECOLLECT_PORT")) {
    char *end = nullptr;
    const long parsed = std::strtol(port, &end, 10);
    if (end != port && *end == '\0' && parsed > 0 && parsed <= 65535) {
      config.server.port = static_cast<std::uint16_t>(parsed);
    }
  }
  if (const char *dir = env_value("RECOLLECT_DATA_DIR")) {
    config.store.data_dir = dir;
  }
  if (const char *provider = env_value("RECOLLECT_EMBEDDING_PROVIDER")) {
    config.embedding.provider = common::to_lower(provider);
  }
  if (const char *url = env_value("RECOLLECT_EMBEDDING_URL")) {
    config.embedding.url = url;
  }
  if (const char *model = env_value("RECOLLECT_EMBEDDING_MODEL")) {
    config.embedding.model = model;
  }

  if (const char *api_key = env_value("RECOLLECT_API_KEY")) {
    config.embedding.api_key = std::string(api_key);
    return;
  }
  if (config.embedding.api_key.has_value() && !common::trim(*config.embedding.api_key).empty()) {
    return;
  }
  if (common::to_lower(config.embedding.provider) == "openai") {
    if (const char *openai_key = env_value("OPENAI_API_KEY")) {
      config.embedding.api_key = std::string(openai_key);
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Validation, parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  config.server.host = doc.get_string("server.host", config.server.host);
  const int port = doc.get_int("server.port", config.server.port);
  if (port <= 0 || port > 65535) {
    return common::Result<Config>::failure(common::ErrorCode::Validation,
                                           "server.port must be 1-65535");
  }
  config.server.port = static_cast<std::uint16_t>(port);
  config.server.worker_threads = static_cast<std::size_t>(
      doc.get_u64("server.worker_threads", config.server.worker_threads));
  config.server.max_body_bytes = static_cast<std::size_t>(
      doc.get_u64("server.max_body_bytes", config.server.max_body_bytes));

  config.store.data_dir = expand_config_value(doc.get_string("store.data_dir", config.store.data_dir));
  config.store.admission_threshold =
      doc.get_double("store.admission_threshold", config.store.admission_threshold);
  config.store.unhealthy_after_failures = static_cast<std::uint32_t>(
      doc.get_u64("store.unhealthy_after_failures", config.store.unhealthy_after_failures));

  config.embedding.provider =
      common::to_lower(doc.get_string("embedding.provider", config.embedding.provider));
  config.embedding.model = doc.get_string("embedding.model", config.embedding.model);
  config.embedding.url = expand_config_value(doc.get_string("embedding.url", config.embedding.url));
  if (doc.has("embedding.api_key")) {
    config.embedding.api_key = expand_config_value(doc.get_string("embedding.api_key"));
  }
  config.embedding.dimensions = static_cast<std::size_t>(
      doc.get_u64("embedding.dimensions", config.embedding.dimensions));
  config.embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", config.embedding.timeout_ms);
  config.embedding.include_context =
      doc.get_bool("embedding.include_context", config.embedding.include_context);
  config.embedding.cache_enabled =
      doc.get_bool("embedding.cache_enabled", config.embedding.cache_enabled);
  config.embedding.cache_size = static_cast<std::size_t>(
      doc.get_u64("embedding.cache_size", config.embedding.cache_size));

  config.dedup.similarity_threshold =
      doc.get_double("dedup.similarity_threshold", config.dedup.similarity_threshold);
  config.dedup.merge_context = doc.get_bool("dedup.merge_context", config.dedup.merge_context);
  config.dedup.refresh_session_source =
      doc.get_bool("dedup.refresh_session_source", config.dedup.refresh_session_source);
  config.dedup.lock_timeout_ms = doc.get_u64("dedup.lock_timeout_ms", config.dedup.lock_timeout_ms);

  config.query.default_k =
      static_cast<std::size_t>(doc.get_u64("query.default_k", config.query.default_k));
  config.query.max_k = static_cast<std::size_t>(doc.get_u64("query.max_k", config.query.max_k));
  config.query.oversample =
      static_cast<std::size_t>(doc.get_u64("query.oversample", config.query.oversample));
  config.query.similarity_weight =
      doc.get_double("query.similarity_weight", config.query.similarity_weight);
  config.query.confidence_weight =
      doc.get_double("query.confidence_weight", config.query.confidence_weight);

  config.index.snapshot_interval_secs =
      doc.get_u64("index.snapshot_interval_secs", config.index.snapshot_interval_secs);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(),
                                           path.string() + ": " + parsed.error());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using R = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_valid_host(config.server.host)) {
    return R::failure(common::ErrorCode::Validation,
                      "server.host is invalid: " + config.server.host);
  }
  if (config.server.port == 0) {
    return R::failure(common::ErrorCode::Validation, "server.port must be 1-65535");
  }
  if (config.server.worker_threads == 0 || config.server.worker_threads > 256) {
    return R::failure(common::ErrorCode::Validation, "server.worker_threads must be 1-256");
  }
  if (config.server.max_body_bytes < 1024) {
    return R::failure(common::ErrorCode::Validation, "server.max_body_bytes must be >= 1024");
  }

  if (common::trim(config.store.data_dir).empty()) {
    return R::failure(common::ErrorCode::Validation, "store.data_dir must not be empty");
  }
  if (config.store.admission_threshold < 0.0 || config.store.admission_threshold > 1.0) {
    return R::failure(common::ErrorCode::Validation,
                      "store.admission_threshold must be between 0.0 and 1.0");
  }
  if (config.store.unhealthy_after_failures == 0) {
    return R::failure(common::ErrorCode::Validation,
                      "store.unhealthy_after_failures must be >= 1");
  }

  const std::string provider = common::to_lower(config.embedding.provider);
  if (provider != "local" && provider != "openai" && provider != "ollama") {
    return R::failure(common::ErrorCode::Validation,
                      "Invalid embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.dimensions == 0 || config.embedding.dimensions > 16384) {
    return R::failure(common::ErrorCode::Validation, "embedding.dimensions must be 1-16384");
  }
  if (config.embedding.timeout_ms == 0) {
    return R::failure(common::ErrorCode::Validation, "embedding.timeout_ms must be > 0");
  }
  if (provider == "openai" &&
      (!config.embedding.api_key.has_value() || common::trim(*config.embedding.api_key).empty())) {
    warnings.push_back("embedding.provider is openai but no API key is configured");
  }

  if (config.dedup.similarity_threshold < -1.0 || config.dedup.similarity_threshold > 1.0) {
    return R::failure(common::ErrorCode::Validation,
                      "dedup.similarity_threshold must be between -1.0 and 1.0");
  }
  if (config.dedup.similarity_threshold < 0.8) {
    warnings.push_back("dedup.similarity_threshold below 0.8 may merge unrelated learnings");
  }
  if (config.dedup.lock_timeout_ms == 0) {
    return R::failure(common::ErrorCode::Validation, "dedup.lock_timeout_ms must be > 0");
  }

  if (config.query.max_k == 0) {
    return R::failure(common::ErrorCode::Validation, "query.max_k must be >= 1");
  }
  if (config.query.default_k == 0 || config.query.default_k > config.query.max_k) {
    return R::failure(common::ErrorCode::Validation, "query.default_k must be 1..query.max_k");
  }
  if (config.query.oversample == 0) {
    return R::failure(common::ErrorCode::Validation, "query.oversample must be >= 1");
  }
  if (config.query.similarity_weight < 0.0 || config.query.confidence_weight < 0.0) {
    return R::failure(common::ErrorCode::Validation, "query weights must be non-negative");
  }
  const double weight_sum = config.query.similarity_weight + config.query.confidence_weight;
  if (std::abs(weight_sum - 1.0) > 0.001) {
    warnings.push_back("query.similarity_weight + query.confidence_weight should equal 1.0");
  }

  if (config.index.snapshot_interval_secs == 0) {
    warnings.push_back("index.snapshot_interval_secs is 0; periodic snapshots are disabled");
  }

  return R::success(std::move(warnings));
}

} // namespace recollect::config
