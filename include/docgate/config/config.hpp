#pragma once

#include "docgate/common/result.hpp"
#include "docgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace docgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults, then the TOML file (if present), then DOCGATE_* environment variables.
[[nodiscard]] common::Result<Config> load_config();

[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Database path with `~` and `$VAR` expanded.
[[nodiscard]] std::filesystem::path resolved_db_path(const Config &config);

} // namespace docgate::config
