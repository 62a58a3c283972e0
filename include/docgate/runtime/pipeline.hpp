#pragma once

#include "docgate/chunking/continuation.hpp"
#include "docgate/chunking/sequencer.hpp"
#include "docgate/chunking/sweeper.hpp"
#include "docgate/common/result.hpp"
#include "docgate/config/schema.hpp"
#include "docgate/content/document.hpp"
#include "docgate/tokenizer/tokenizer.hpp"

#include <memory>
#include <optional>

namespace docgate::runtime {

/// Owns the continuation store, tokenizer, sequencer and sweeper for one
/// process. Opened at startup, closed at shutdown.
class ContentPipeline {
public:
  ~ContentPipeline();

  ContentPipeline(const ContentPipeline &) = delete;
  ContentPipeline &operator=(const ContentPipeline &) = delete;

  [[nodiscard]] static common::Result<std::unique_ptr<ContentPipeline>>
  open(config::Config config, chunking::Clock clock = {});

  /// open() with the configuration from load_config().
  [[nodiscard]] static common::Result<std::unique_ptr<ContentPipeline>> from_disk();

  void close();
  [[nodiscard]] bool is_open() const { return store_ != nullptr; }

  /// Byte-budget shaping; `max_bytes` of nullopt or 0 uses content.default_max_bytes.
  [[nodiscard]] content::ShapedDocument shape(std::string_view markdown,
                                              std::optional<std::size_t> max_bytes = std::nullopt) const;

  [[nodiscard]] common::Result<chunking::DeliveryResult>
  deliver(chunking::DeliveryPayload payload, const std::string &content_key = "content");

  [[nodiscard]] common::Result<std::optional<chunking::ChunkResponse>>
  next_chunk(const std::string &token, std::optional<std::size_t> chunk_size = std::nullopt);

  std::size_t sweep();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] chunking::ChunkSequencer *sequencer() { return sequencer_.get(); }
  [[nodiscard]] chunking::IContinuationStore *store() { return store_.get(); }
  [[nodiscard]] bool sweeper_running() const;

private:
  explicit ContentPipeline(config::Config config);

  config::Config config_;
  std::unique_ptr<chunking::IContinuationStore> store_;
  std::unique_ptr<tokenizer::ITokenizer> tokenizer_;
  std::unique_ptr<chunking::ChunkSequencer> sequencer_;
  std::unique_ptr<chunking::ContinuationSweeper> sweeper_;
};

} // namespace docgate::runtime
