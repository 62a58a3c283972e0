#include "docgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace docgate::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_string(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ContinuationCreatedEvent>) {
          log_line("DEBUG", "continuation.created token=" + evt.token +
                                " chunk=" + std::to_string(evt.chunk_number) +
                                " remaining_tokens=" + std::to_string(evt.remaining_tokens));
        } else if constexpr (std::is_same_v<T, ChunkDeliveredEvent>) {
          log_line("INFO", "chunk.delivered chunk=" + std::to_string(evt.chunk_number) +
                               " tokens=" + std::to_string(evt.tokens) +
                               " has_more=" + bool_string(evt.has_more));
        } else if constexpr (std::is_same_v<T, ContinuationMissEvent>) {
          log_line("INFO", "continuation.miss reason=" +
                               std::string(miss_reason_to_string(evt.reason)));
        } else if constexpr (std::is_same_v<T, SweepEvent>) {
          log_line("DEBUG", "continuation.sweep removed=" + std::to_string(evt.removed));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, TokensDeliveredMetric>) {
          log_line("DEBUG", "metric.tokens_delivered=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, ActiveContinuationsMetric>) {
          log_line("DEBUG", "metric.active_continuations=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, SectionsSelectedMetric>) {
          log_line("DEBUG", "metric.sections_selected=" + std::to_string(m.selected) + "/" +
                                std::to_string(m.total) + " bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

} // namespace docgate::observability
