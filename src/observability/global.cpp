#include "docgate/observability/global.hpp"

#include <mutex>

namespace docgate::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

std::string_view miss_reason_to_string(const MissReason reason) {
  switch (reason) {
  case MissReason::NotFound:
    return "not_found";
  case MissReason::Expired:
    return "expired";
  case MissReason::StorageError:
    return "storage_error";
  case MissReason::Consumed:
    return "consumed";
  }
  return "not_found";
}

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

bool set_global_observer_if_absent(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    return false;
  }
  g_observer = std::move(observer);
  return true;
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_continuation_created(const std::string &token, const std::uint32_t chunk_number,
                                 const std::uint64_t remaining_tokens) {
  record_event(ContinuationCreatedEvent{
      .token = token, .chunk_number = chunk_number, .remaining_tokens = remaining_tokens});
}

void record_chunk_delivered(const std::uint32_t chunk_number, const std::uint64_t tokens,
                            const bool has_more) {
  record_event(
      ChunkDeliveredEvent{.chunk_number = chunk_number, .tokens = tokens, .has_more = has_more});
  record_metric(TokensDeliveredMetric{.tokens = tokens});
}

void record_continuation_miss(const MissReason reason) {
  record_event(ContinuationMissEvent{.reason = reason});
}

void record_sweep(const std::uint64_t removed) { record_event(SweepEvent{.removed = removed}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace docgate::observability
