#pragma once

#include "docgate/observability/observer.hpp"

#include <memory>
#include <vector>

namespace docgate::observability {

/// Fans continuation, delivery, sweep and section-selection records out to
/// every child, in the order the children were added. Built by the factory
/// for a comma-separated `observability.backend` such as "log,noop".
class MultiObserver final : public IObserver {
public:
  /// Null children are ignored.
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  template <typename Fn> void each(Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace docgate::observability
