#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docgate::chunking {

/// One slice of a chunked response.
struct ChunkResponse {
  std::string content;
  std::uint32_t chunk_number = 1;
  bool has_more = false;
  std::optional<std::string> continuation_token;
  std::uint64_t tokens_in_chunk = 0;
  std::uint64_t remaining_tokens = 0;
};

[[nodiscard]] std::string to_json(const ChunkResponse &response);

using FieldValue = std::variant<std::string, std::int64_t, bool>;

/// Ordered response object handed to `chunk_and_deliver`.
struct DeliveryPayload {
  std::vector<std::pair<std::string, FieldValue>> fields;

  [[nodiscard]] const FieldValue *find(std::string_view key) const;
  /// Overwrite in place, or append when the key is new.
  void set(std::string key, FieldValue value);
};

struct ChunkingInfo {
  bool is_chunked = false;
  std::optional<std::uint32_t> chunk_number;
  std::optional<bool> has_more;
  std::optional<std::string> continuation_token;
  std::optional<std::uint64_t> tokens_in_chunk;
  std::optional<std::uint64_t> remaining_tokens;
};

struct DeliveryResult {
  DeliveryPayload payload;
  ChunkingInfo chunking;

  /// `{...fields, "chunking": {...}}`
  [[nodiscard]] std::string to_json() const;
};

} // namespace docgate::chunking
