#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace docgate::observability {

struct ContinuationCreatedEvent {
  std::string token;
  std::uint32_t chunk_number = 0;
  std::uint64_t remaining_tokens = 0;
};

struct ChunkDeliveredEvent {
  std::uint32_t chunk_number = 0;
  std::uint64_t tokens = 0;
  bool has_more = false;
};

enum class MissReason {
  NotFound,
  Expired,
  StorageError,
  Consumed,
};

struct ContinuationMissEvent {
  MissReason reason = MissReason::NotFound;
};

struct SweepEvent {
  std::uint64_t removed = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ContinuationCreatedEvent, ChunkDeliveredEvent,
                                   ContinuationMissEvent, SweepEvent, ErrorEvent>;

struct TokensDeliveredMetric {
  std::uint64_t tokens = 0;
};

struct ActiveContinuationsMetric {
  std::uint64_t count = 0;
};

struct SectionsSelectedMetric {
  std::uint64_t selected = 0;
  std::uint64_t total = 0;
  std::uint64_t bytes = 0;
};

using ObserverMetric =
    std::variant<TokensDeliveredMetric, ActiveContinuationsMetric, SectionsSelectedMetric>;

[[nodiscard]] std::string_view miss_reason_to_string(MissReason reason);

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace docgate::observability
