#pragma once

#include "docgate/common/result.hpp"
#include "docgate/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace docgate::chunking {

using Metadata = std::map<std::string, std::string>;
using TimePoint = std::chrono::system_clock::time_point;

inline constexpr std::string_view CHUNK_NUMBER_KEY = "chunk_number";
inline constexpr std::string_view TOTAL_TOKENS_KEY = "total_tokens";

/// Undelivered tail of a chunked response, addressed by an opaque token.
struct ContinuationRecord {
  std::string token;
  std::string remaining_content;
  Metadata metadata;
  TimePoint created_at;
};

/// `chunk_number` from metadata, 1 when absent or unparseable.
[[nodiscard]] std::uint32_t chunk_number_of(const Metadata &metadata);

inline constexpr std::chrono::seconds MAX_TTL{
    static_cast<std::chrono::seconds::rep>(config::MAX_DURATION_SECS)};

/// Expired when strictly older than ttl. A ttl above MAX_TTL never expires.
[[nodiscard]] bool is_expired(const ContinuationRecord &record, std::chrono::seconds ttl,
                              TimePoint now);

/// Random (version 4) UUID string.
[[nodiscard]] common::Result<std::string> generate_token();

struct StoreStats {
  std::size_t entry_count = 0;
  std::string location;
  std::uintmax_t size_bytes = 0;
};

/// Persistent, TTL-bounded key-value store for continuation records.
///
/// `remove` and `replace` consume the token atomically: of any number of
/// concurrent callers naming the same token, at most one sees `true`.
class IContinuationStore {
public:
  virtual ~IContinuationStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status put(const ContinuationRecord &record) = 0;
  [[nodiscard]] virtual common::Result<std::optional<ContinuationRecord>>
  get(const std::string &token) = 0;
  [[nodiscard]] virtual common::Result<bool> remove(const std::string &token) = 0;
  /// Delete `token` and insert `successor` in one step; false if `token` was already gone.
  [[nodiscard]] virtual common::Result<bool> replace(const std::string &token,
                                                     const ContinuationRecord &successor) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> sweep_expired(std::chrono::seconds ttl,
                                                                  TimePoint now) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count() = 0;
  [[nodiscard]] virtual StoreStats stats() = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<IContinuationStore>>
create_continuation_store(const config::Config &config);

} // namespace docgate::chunking
