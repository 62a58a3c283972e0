#include "docgate/runtime/pipeline.hpp"

#include "docgate/config/config.hpp"
#include "docgate/observability/factory.hpp"
#include "docgate/observability/global.hpp"
#include "docgate/tokenizer/piece_tokenizer.hpp"

namespace docgate::runtime {

namespace {

constexpr const char *CLOSED = "content pipeline is closed";

} // namespace

ContentPipeline::ContentPipeline(config::Config config) : config_(std::move(config)) {}

ContentPipeline::~ContentPipeline() { close(); }

common::Result<std::unique_ptr<ContentPipeline>> ContentPipeline::open(config::Config config,
                                                                       chunking::Clock clock) {
  using OpenResult = common::Result<std::unique_ptr<ContentPipeline>>;

  const auto issues = config::validate_config(config);
  if (!issues.empty()) {
    std::string message = "invalid configuration:";
    for (const auto &issue : issues) {
      message += " " + issue + ";";
    }
    return OpenResult::failure(message);
  }

  // An observer installed by the embedding process wins over the configured one.
  (void)observability::set_global_observer_if_absent(observability::create_observer(config));

  auto store = chunking::create_continuation_store(config);
  if (!store.ok()) {
    observability::record_error("runtime", store.error());
    return OpenResult::failure(store.error());
  }

  std::unique_ptr<ContentPipeline> pipeline(new ContentPipeline(std::move(config)));
  pipeline->store_ = std::move(store.value());
  pipeline->tokenizer_ = std::make_unique<tokenizer::PieceTokenizer>();

  chunking::ChunkingOptions options;
  options.chunk_size = pipeline->config_.chunking.chunk_tokens;
  options.ttl = std::chrono::seconds(pipeline->config_.chunking.continuation_ttl_secs);
  pipeline->sequencer_ = std::make_unique<chunking::ChunkSequencer>(
      *pipeline->store_, *pipeline->tokenizer_, options, std::move(clock));

  if (pipeline->config_.chunking.sweep_interval_secs > 0) {
    pipeline->sweeper_ = std::make_unique<chunking::ContinuationSweeper>(
        *pipeline->sequencer_,
        std::chrono::seconds(pipeline->config_.chunking.sweep_interval_secs));
    pipeline->sweeper_->start();
  }

  return OpenResult::success(std::move(pipeline));
}

common::Result<std::unique_ptr<ContentPipeline>> ContentPipeline::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<ContentPipeline>>::failure(loaded.error());
  }
  return open(std::move(loaded.value()));
}

void ContentPipeline::close() {
  if (sweeper_ != nullptr) {
    sweeper_->stop();
    sweeper_.reset();
  }
  sequencer_.reset();
  tokenizer_.reset();
  store_.reset();
}

content::ShapedDocument ContentPipeline::shape(const std::string_view markdown,
                                               const std::optional<std::size_t> max_bytes) const {
  const std::size_t budget = max_bytes.value_or(0) == 0 ? config_.content.default_max_bytes
                                                        : *max_bytes;
  return content::shape_document(markdown, budget);
}

common::Result<chunking::DeliveryResult>
ContentPipeline::deliver(chunking::DeliveryPayload payload, const std::string &content_key) {
  if (!is_open()) {
    return common::Result<chunking::DeliveryResult>::failure(CLOSED);
  }
  return sequencer_->chunk_and_deliver(std::move(payload), content_key);
}

common::Result<std::optional<chunking::ChunkResponse>>
ContentPipeline::next_chunk(const std::string &token, const std::optional<std::size_t> chunk_size) {
  if (!is_open()) {
    return common::Result<std::optional<chunking::ChunkResponse>>::failure(CLOSED);
  }
  return sequencer_->get_next_chunk(token, chunk_size.value_or(config_.chunking.chunk_tokens));
}

std::size_t ContentPipeline::sweep() {
  if (!is_open()) {
    return 0;
  }
  return sequencer_->sweep_expired();
}

bool ContentPipeline::sweeper_running() const {
  return sweeper_ != nullptr && sweeper_->is_running();
}

} // namespace docgate::runtime
