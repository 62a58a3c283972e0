#include "docgate/chunking/sequencer.hpp"

#include "docgate/observability/global.hpp"

#include <span>

namespace docgate::chunking {

namespace {

constexpr const char *COMPONENT = "chunking";

using NextChunk = common::Result<std::optional<ChunkResponse>>;

NextChunk miss(const observability::MissReason reason) {
  observability::record_continuation_miss(reason);
  return NextChunk::success(std::nullopt);
}

} // namespace

ChunkSequencer::ChunkSequencer(IContinuationStore &store, tokenizer::ITokenizer &tokenizer,
                               ChunkingOptions options, Clock clock)
    : store_(store), tokenizer_(tokenizer), options_(options), clock_(std::move(clock)) {}

TimePoint ChunkSequencer::now() const {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

ChunkSequencer::Split ChunkSequencer::split_at(const std::vector<tokenizer::TokenId> &tokens,
                                               const std::size_t chunk_size) {
  const std::span<const tokenizer::TokenId> all(tokens);
  Split split;
  split.head = tokenizer_.decode(all.first(chunk_size));
  split.tail = tokenizer_.decode(all.subspan(chunk_size));
  split.tail_tokens = tokens.size() - chunk_size;
  return split;
}

common::Result<std::string> ChunkSequencer::store_continuation(const std::string &remaining,
                                                               const Metadata &metadata) {
  auto token = generate_token();
  if (!token.ok()) {
    return token;
  }

  ContinuationRecord record;
  record.token = token.value();
  record.remaining_content = remaining;
  record.metadata = metadata;
  record.created_at = now();

  const auto status = store_.put(record);
  if (!status.ok()) {
    observability::record_error(COMPONENT, "failed to store continuation: " + status.error());
    return common::Result<std::string>::failure(status.error());
  }
  return token;
}

common::Result<ChunkResponse> ChunkSequencer::chunk_content(const std::string &content,
                                                            Metadata metadata) {
  ChunkResponse response;
  response.content = content;

  if (options_.chunk_size == 0 || content.empty()) {
    return common::Result<ChunkResponse>::success(std::move(response));
  }

  const auto tokens = tokenizer_.encode(content);
  if (tokens.size() <= options_.chunk_size) {
    response.tokens_in_chunk = tokens.size();
    return common::Result<ChunkResponse>::success(std::move(response));
  }

  auto split = split_at(tokens, options_.chunk_size);
  metadata[std::string(CHUNK_NUMBER_KEY)] = "1";

  auto token = store_continuation(split.tail, metadata);
  if (!token.ok()) {
    return common::Result<ChunkResponse>::failure(token.error());
  }

  response.content = std::move(split.head);
  response.has_more = true;
  response.continuation_token = token.value();
  response.tokens_in_chunk = tokenizer_.count(response.content);
  response.remaining_tokens = split.tail_tokens;

  observability::record_continuation_created(token.value(), 1, split.tail_tokens);
  observability::record_chunk_delivered(1, response.tokens_in_chunk, true);
  return common::Result<ChunkResponse>::success(std::move(response));
}

common::Result<DeliveryResult> ChunkSequencer::chunk_and_deliver(DeliveryPayload payload,
                                                                 const std::string &content_key) {
  DeliveryResult result;
  const FieldValue *field = payload.find(content_key);
  const auto *content = field == nullptr ? nullptr : std::get_if<std::string>(field);

  if (options_.chunk_size == 0 || content == nullptr || content->empty()) {
    result.payload = std::move(payload);
    return common::Result<DeliveryResult>::success(std::move(result));
  }

  const std::size_t total_tokens = tokenizer_.count(*content);
  if (total_tokens <= options_.chunk_size) {
    result.payload = std::move(payload);
    return common::Result<DeliveryResult>::success(std::move(result));
  }

  Metadata metadata;
  metadata[std::string(TOTAL_TOKENS_KEY)] = std::to_string(total_tokens);
  auto chunk = chunk_content(*content, std::move(metadata));
  if (!chunk.ok()) {
    return common::Result<DeliveryResult>::failure(chunk.error());
  }

  auto &response = chunk.value();
  result.chunking.is_chunked = response.has_more;
  result.chunking.chunk_number = response.chunk_number;
  result.chunking.has_more = response.has_more;
  result.chunking.continuation_token = response.continuation_token;
  result.chunking.tokens_in_chunk = response.tokens_in_chunk;
  result.chunking.remaining_tokens = response.remaining_tokens;

  payload.set(content_key, std::move(response.content));
  result.payload = std::move(payload);
  return common::Result<DeliveryResult>::success(std::move(result));
}

NextChunk ChunkSequencer::get_next_chunk(const std::string &token, const std::size_t chunk_size) {
  (void)sweep_expired();

  auto lookup = store_.get(token);
  if (!lookup.ok()) {
    observability::record_error(COMPONENT, "continuation lookup failed: " + lookup.error());
    return miss(observability::MissReason::StorageError);
  }
  if (!lookup.value().has_value()) {
    return miss(observability::MissReason::NotFound);
  }

  const ContinuationRecord &record = *lookup.value();
  if (is_expired(record, options_.ttl, now())) {
    const auto removed = store_.remove(token);
    if (!removed.ok()) {
      observability::record_error(COMPONENT, "failed to drop expired continuation: " +
                                                 removed.error());
    }
    return miss(observability::MissReason::Expired);
  }

  const std::uint32_t previous = chunk_number_of(record.metadata);
  ChunkResponse response;
  response.chunk_number = previous + 1;

  const auto tokens = tokenizer_.encode(record.remaining_content);
  if (chunk_size == 0 || tokens.size() <= chunk_size) {
    const auto removed = store_.remove(token);
    if (!removed.ok()) {
      observability::record_error(COMPONENT, "failed to consume continuation: " +
                                                 removed.error());
      return NextChunk::failure(removed.error());
    }
    if (!removed.value()) {
      return miss(observability::MissReason::Consumed);
    }

    response.content = record.remaining_content;
    response.tokens_in_chunk = tokens.size();
    observability::record_chunk_delivered(response.chunk_number, response.tokens_in_chunk, false);
    return NextChunk::success(std::move(response));
  }

  auto split = split_at(tokens, chunk_size);
  auto successor_token = generate_token();
  if (!successor_token.ok()) {
    return NextChunk::failure(successor_token.error());
  }

  ContinuationRecord successor;
  successor.token = successor_token.value();
  successor.remaining_content = std::move(split.tail);
  successor.metadata = record.metadata;
  successor.metadata[std::string(CHUNK_NUMBER_KEY)] = std::to_string(response.chunk_number);
  successor.created_at = now();

  const auto replaced = store_.replace(token, successor);
  if (!replaced.ok()) {
    observability::record_error(COMPONENT, "failed to replace continuation: " + replaced.error());
    return NextChunk::failure(replaced.error());
  }
  if (!replaced.value()) {
    return miss(observability::MissReason::Consumed);
  }

  response.content = std::move(split.head);
  response.has_more = true;
  response.continuation_token = successor.token;
  response.tokens_in_chunk = tokenizer_.count(response.content);
  response.remaining_tokens = split.tail_tokens;

  observability::record_continuation_created(successor.token, response.chunk_number,
                                             split.tail_tokens);
  observability::record_chunk_delivered(response.chunk_number, response.tokens_in_chunk, true);
  return NextChunk::success(std::move(response));
}

std::size_t ChunkSequencer::sweep_expired() {
  const auto removed = store_.sweep_expired(options_.ttl, now());
  if (!removed.ok()) {
    observability::record_error(COMPONENT, "expiry sweep failed: " + removed.error());
    return 0;
  }
  if (removed.value() > 0) {
    observability::record_sweep(removed.value());
  }

  const auto live = store_.count();
  if (live.ok()) {
    observability::record_metric(observability::ActiveContinuationsMetric{live.value()});
  }
  return removed.value();
}

} // namespace docgate::chunking
