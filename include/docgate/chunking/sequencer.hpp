#pragma once

#include "docgate/chunking/continuation.hpp"
#include "docgate/chunking/delivery.hpp"
#include "docgate/common/result.hpp"
#include "docgate/tokenizer/tokenizer.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace docgate::chunking {

struct ChunkingOptions {
  /// Tokens per delivered chunk; 0 disables chunking.
  std::size_t chunk_size = 2000;
  std::chrono::seconds ttl{600};
};

using Clock = std::function<TimePoint()>;

/// Splits content into token-budgeted chunks and hands out the tail one
/// continuation token at a time.
///
/// Write failures propagate as failed results. Misses, expiry, read failures
/// and lost races all surface as an empty optional from get_next_chunk().
class ChunkSequencer {
public:
  ChunkSequencer(IContinuationStore &store, tokenizer::ITokenizer &tokenizer,
                 ChunkingOptions options, Clock clock = {});

  /// First chunk of `content`, storing a continuation when more remains.
  [[nodiscard]] common::Result<ChunkResponse> chunk_content(const std::string &content,
                                                            Metadata metadata = {});

  /// Replace `payload[content_key]` by its first chunk and describe the split.
  [[nodiscard]] common::Result<DeliveryResult> chunk_and_deliver(DeliveryPayload payload,
                                                                 const std::string &content_key);

  [[nodiscard]] common::Result<std::optional<ChunkResponse>>
  get_next_chunk(const std::string &token, std::size_t chunk_size);

  [[nodiscard]] common::Result<std::optional<ChunkResponse>>
  get_next_chunk(const std::string &token) {
    return get_next_chunk(token, options_.chunk_size);
  }

  /// Persist `remaining` under a fresh token.
  [[nodiscard]] common::Result<std::string> store_continuation(const std::string &remaining,
                                                               const Metadata &metadata);

  /// Drop expired continuations, returning how many were removed.
  std::size_t sweep_expired();

  [[nodiscard]] const ChunkingOptions &options() const { return options_; }

private:
  struct Split {
    std::string head;
    std::string tail;
    std::size_t tail_tokens = 0;
  };

  [[nodiscard]] Split split_at(const std::vector<tokenizer::TokenId> &tokens,
                               std::size_t chunk_size);
  [[nodiscard]] TimePoint now() const;

  IContinuationStore &store_;
  tokenizer::ITokenizer &tokenizer_;
  ChunkingOptions options_;
  Clock clock_;
};

} // namespace docgate::chunking
