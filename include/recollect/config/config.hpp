#pragma once

#include "recollect/common/result.hpp"
#include "recollect/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace recollect::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// `store.data_dir` with `~` and `$VARS` expanded.
[[nodiscard]] std::filesystem::path data_dir(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Returns warnings on success; fails on out-of-range values.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace recollect::config
