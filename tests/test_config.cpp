#include "test_framework.hpp"

#include "recollect/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = recollect::config::config_path_override();
    if (next.has_value()) {
      recollect::config::set_config_path_override(*next);
    } else {
      recollect::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      recollect::config::set_config_path_override(*old_override);
    } else {
      recollect::config::clear_config_path_override();
    }
  }
};

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &warning) {
    return warning.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<recollect::tests::TestCase> &tests) {
  using recollect::tests::require;
  using recollect::testing::EnvGuard;
  using recollect::testing::TempWorkspace;
  namespace cfg = recollect::config;

  tests.push_back({"config_defaults_validate_cleanly", [] {
                     cfg::Config config;
                     require(config.server.port == 8741, "default port");
                     require(config.dedup.similarity_threshold == 0.92, "default dedup threshold");
                     require(config.store.admission_threshold == 0.70, "default admission");
                     require(config.query.default_k == 5, "default k");
                     auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"config_parse_full_document", [] {
                     auto parsed = cfg::parse_config(R"(
[server]
host = "0.0.0.0"
port = 9100
worker_threads = 2

[store]
data_dir = "/var/lib/recollect"
admission_threshold = 0.5

[embedding]
provider = "OpenAI"
model = "text-embedding-3-large"
dimensions = 1536
api_key = "sk-test"
include_context = true

[dedup]
similarity_threshold = 0.95
merge_context = false
lock_timeout_ms = 750

[query]
default_k = 10
max_k = 50
similarity_weight = 0.6
confidence_weight = 0.4

[index]
snapshot_interval_secs = 15
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.server.host == "0.0.0.0", "host");
                     require(config.server.port == 9100, "port");
                     require(config.server.worker_threads == 2, "workers");
                     require(config.store.data_dir == "/var/lib/recollect", "data dir");
                     require(config.store.admission_threshold == 0.5, "admission");
                     require(config.embedding.provider == "openai", "provider lower-cased");
                     require(config.embedding.dimensions == 1536, "dimensions");
                     require(config.embedding.api_key.value_or("") == "sk-test", "api key");
                     require(config.embedding.include_context, "include_context");
                     require(config.dedup.similarity_threshold == 0.95, "dedup threshold");
                     require(!config.dedup.merge_context, "merge_context");
                     require(config.dedup.lock_timeout_ms == 750, "lock timeout");
                     require(config.query.default_k == 10 && config.query.max_k == 50, "k bounds");
                     require(config.query.similarity_weight == 0.6, "weights");
                     require(config.index.snapshot_interval_secs == 15, "snapshot interval");
                   }});

  tests.push_back({"config_partial_document_fills_defaults", [] {
                     auto parsed = cfg::parse_config("[query]\nmax_k = 20\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().query.max_k == 20, "override applied");
                     require(parsed.value().server.port == 8741, "port default kept");
                     require(parsed.value().embedding.provider == "local", "provider default");
                   }});

  tests.push_back({"config_rejects_bad_port_and_syntax", [] {
                     auto bad_port = cfg::parse_config("[server]\nport = 70000\n");
                     require(!bad_port.ok(), "port out of range should fail");
                     require(bad_port.code() == recollect::common::ErrorCode::Validation,
                             "validation code expected");
                     require(!cfg::parse_config("[server]\nthis is not toml\n").ok(),
                             "garbage line should fail");
                   }});

  tests.push_back({"config_validation_errors", [] {
                     cfg::Config config;
                     config.embedding.provider = "word2vec";
                     require(!cfg::validate_config(config).ok(), "unknown provider rejected");

                     config = cfg::Config{};
                     config.dedup.similarity_threshold = 1.5;
                     require(!cfg::validate_config(config).ok(), "threshold > 1 rejected");

                     config = cfg::Config{};
                     config.query.default_k = 200;
                     require(!cfg::validate_config(config).ok(), "default_k > max_k rejected");

                     config = cfg::Config{};
                     config.store.admission_threshold = -0.1;
                     require(!cfg::validate_config(config).ok(), "negative admission rejected");

                     config = cfg::Config{};
                     config.embedding.dimensions = 0;
                     require(!cfg::validate_config(config).ok(), "zero dimensions rejected");
                   }});

  tests.push_back({"config_validation_warnings", [] {
                     cfg::Config config;
                     config.dedup.similarity_threshold = 0.5;
                     config.query.similarity_weight = 0.9;
                     config.embedding.provider = "openai";
                     config.embedding.api_key.reset();
                     auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(has_warning(warnings.value(), "similarity_threshold"),
                             "low threshold should warn");
                     require(has_warning(warnings.value(), "confidence_weight"),
                             "weights not summing to one should warn");
                     require(has_warning(warnings.value(), "API key"),
                             "missing openai key should warn");
                   }});

  tests.push_back({"config_load_missing_file_returns_defaults", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     EnvGuard port("RECOLLECT_PORT", std::nullopt);
                     EnvGuard host("RECOLLECT_HOST", std::nullopt);
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().server.port == 8741, "default port expected");
                   }});

  tests.push_back({"config_load_reads_override_path", [] {
                     TempWorkspace workspace;
                     workspace.create_file("custom.toml", "[server]\nport = 9911\n");
                     ConfigOverrideGuard guard(workspace.path() / "custom.toml");
                     EnvGuard port("RECOLLECT_PORT", std::nullopt);
                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "custom.toml",
                             "override should be used verbatim");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().server.port == 9911, "port from file");
                   }});

  tests.push_back({"config_directory_override_appends_filename", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path());
                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "config.toml",
                             "directory override should resolve config.toml");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     cfg::Config config;
                     EnvGuard port("RECOLLECT_PORT", "9333");
                     EnvGuard dir("RECOLLECT_DATA_DIR", "/tmp/recollect-env");
                     EnvGuard provider("RECOLLECT_EMBEDDING_PROVIDER", "OLLAMA");
                     EnvGuard key("RECOLLECT_API_KEY", std::nullopt);
                     cfg::apply_env_overrides(config);
                     require(config.server.port == 9333, "port override");
                     require(config.store.data_dir == "/tmp/recollect-env", "data dir override");
                     require(config.embedding.provider == "ollama", "provider lower-cased");
                   }});

  tests.push_back({"config_ignores_invalid_env_port", [] {
                     cfg::Config config;
                     EnvGuard port("RECOLLECT_PORT", "not-a-port");
                     cfg::apply_env_overrides(config);
                     require(config.server.port == 8741, "invalid port should be ignored");
                   }});

  tests.push_back({"config_openai_key_falls_back_to_openai_env", [] {
                     cfg::Config config;
                     config.embedding.provider = "openai";
                     EnvGuard recollect_key("RECOLLECT_API_KEY", std::nullopt);
                     EnvGuard openai_key("OPENAI_API_KEY", "sk-from-env");
                     cfg::apply_env_overrides(config);
                     require(config.embedding.api_key.value_or("") == "sk-from-env",
                             "OPENAI_API_KEY should be used");
                   }});

  tests.push_back({"config_data_dir_expands_home", [] {
                     EnvGuard home("HOME", "/home/tester");
                     cfg::Config config;
                     config.store.data_dir = "~/.recollect/data";
                     require(cfg::data_dir(config) == std::filesystem::path("/home/tester/.recollect/data"),
                             "tilde should expand");
                   }});
}
