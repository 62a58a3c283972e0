#include "docgate/chunking/continuation.hpp"

#include "docgate/chunking/memory_store.hpp"
#include "docgate/chunking/sqlite_store.hpp"
#include "docgate/common/fs.hpp"
#include "docgate/config/config.hpp"

#include <openssl/rand.h>

#include <array>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace docgate::chunking {

std::uint32_t chunk_number_of(const Metadata &metadata) {
  const auto it = metadata.find(std::string(CHUNK_NUMBER_KEY));
  if (it == metadata.end()) {
    return 1;
  }
  std::uint32_t parsed = 0;
  const auto *first = it->second.data();
  const auto *last = first + it->second.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || parsed == 0) {
    return 1;
  }
  return parsed;
}

bool is_expired(const ContinuationRecord &record, const std::chrono::seconds ttl,
                const TimePoint now) {
  if (ttl > MAX_TTL) {
    return false;
  }
  return now - record.created_at > ttl;
}

common::Result<std::string> generate_token() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("failed to gather random bytes for token");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

common::Result<std::unique_ptr<IContinuationStore>>
create_continuation_store(const config::Config &config) {
  using StoreResult = common::Result<std::unique_ptr<IContinuationStore>>;

  const std::string backend = common::to_lower(common::trim(config.chunking.backend));
  if (backend == "memory") {
    return StoreResult::success(std::make_unique<MemoryContinuationStore>());
  }
  if (backend != "sqlite") {
    return StoreResult::failure("unknown continuation store backend: " + config.chunking.backend);
  }

  auto store = std::make_unique<SqliteContinuationStore>(config::resolved_db_path(config));
  if (!store->open_status().ok()) {
    return StoreResult::failure(store->open_status().error());
  }
  return StoreResult::success(std::move(store));
}

} // namespace docgate::chunking
