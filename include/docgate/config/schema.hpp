#pragma once

#include <cstdint>
#include <string>

namespace docgate::config {

/// Longest duration, in seconds, whose nanosecond count fits in int64.
inline constexpr std::uint64_t MAX_DURATION_SECS = 9'223'372'036;

struct ChunkingConfig {
  std::size_t chunk_tokens = 2000;
  std::uint64_t continuation_ttl_secs = 600;
  std::string backend = "sqlite";
  std::string db_path = "~/.docgate/chunking.db";
  std::uint64_t sweep_interval_secs = 0;
};

struct ContentConfig {
  std::size_t default_max_bytes = 20'480;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ChunkingConfig chunking;
  ContentConfig content;
  ObservabilityConfig observability;
};

} // namespace docgate::config
