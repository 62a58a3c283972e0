#include "docgate/config/config.hpp"

#include "docgate/common/fs.hpp"
#include "docgate/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace docgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".docgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("DOCGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::string> env_string(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return common::trim(raw);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::ensure_dir(override_path->parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const auto tokens = env_u64("DOCGATE_CHUNK_TOKENS"); tokens.has_value()) {
    config.chunking.chunk_tokens = static_cast<std::size_t>(*tokens);
  }
  if (const auto ttl = env_u64("DOCGATE_CONTINUATION_TTL"); ttl.has_value()) {
    config.chunking.continuation_ttl_secs = *ttl;
  }
  if (const auto backend = env_string("DOCGATE_CHUNK_BACKEND"); backend.has_value()) {
    config.chunking.backend = common::to_lower(*backend);
  }
  if (const auto db_path = env_string("DOCGATE_CHUNK_DB_PATH"); db_path.has_value()) {
    config.chunking.db_path = *db_path;
  }
  if (const auto interval = env_u64("DOCGATE_SWEEP_INTERVAL"); interval.has_value()) {
    config.chunking.sweep_interval_secs = *interval;
  }
  if (const auto max_bytes = env_u64("DOCGATE_MAX_BYTES"); max_bytes.has_value()) {
    config.content.default_max_bytes = static_cast<std::size_t>(*max_bytes);
  }
  if (const auto backend = env_string("DOCGATE_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();

  config.chunking.chunk_tokens = static_cast<std::size_t>(
      doc.get_u64("chunking.chunk_tokens", config.chunking.chunk_tokens));
  config.chunking.continuation_ttl_secs =
      doc.get_u64("chunking.continuation_ttl_secs", config.chunking.continuation_ttl_secs);
  config.chunking.backend =
      common::to_lower(doc.get_string("chunking.backend", config.chunking.backend));
  config.chunking.db_path = doc.get_string("chunking.db_path", config.chunking.db_path);
  config.chunking.sweep_interval_secs =
      doc.get_u64("chunking.sweep_interval_secs", config.chunking.sweep_interval_secs);

  config.content.default_max_bytes = static_cast<std::size_t>(
      doc.get_u64("content.default_max_bytes", config.content.default_max_bytes));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> issues;

  if (config.chunking.continuation_ttl_secs == 0) {
    issues.emplace_back("chunking.continuation_ttl_secs must be greater than zero");
  }
  if (config.chunking.continuation_ttl_secs > MAX_DURATION_SECS) {
    issues.push_back("chunking.continuation_ttl_secs must be at most " +
                     std::to_string(MAX_DURATION_SECS));
  }
  if (config.chunking.sweep_interval_secs > MAX_DURATION_SECS) {
    issues.push_back("chunking.sweep_interval_secs must be at most " +
                     std::to_string(MAX_DURATION_SECS));
  }
  const std::string backend = common::to_lower(common::trim(config.chunking.backend));
  if (backend != "sqlite" && backend != "memory") {
    issues.push_back("chunking.backend must be 'sqlite' or 'memory' (got '" +
                     config.chunking.backend + "')");
  }
  if (backend == "sqlite" && common::trim(config.chunking.db_path).empty()) {
    issues.emplace_back("chunking.db_path is required for the sqlite backend");
  }
  if (config.content.default_max_bytes == 0) {
    issues.emplace_back("content.default_max_bytes must be greater than zero");
  }

  return issues;
}

std::filesystem::path resolved_db_path(const Config &config) {
  return std::filesystem::path(common::expand_path(config.chunking.db_path));
}

} // namespace docgate::config
