#pragma once

#include "docgate/observability/observer.hpp"

namespace docgate::observability {

/// Writes one `[LEVEL] name key=value` line per record to stderr.
///
/// Deliveries and continuation misses log at INFO, storage errors at ERROR,
/// continuation creation, sweeps and metrics at DEBUG.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace docgate::observability
