#pragma once

#include "docgate/observability/observer.hpp"

#include <memory>

namespace docgate::observability {

/// Replaces the process-wide observer. Recorders already holding the old one
/// finish with it before it is destroyed.
void set_global_observer(std::unique_ptr<IObserver> observer);
/// Installs `observer` only when no observer is set; returns whether it did.
bool set_global_observer_if_absent(std::unique_ptr<IObserver> observer);
std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_continuation_created(const std::string &token, std::uint32_t chunk_number,
                                 std::uint64_t remaining_tokens);
void record_chunk_delivered(std::uint32_t chunk_number, std::uint64_t tokens, bool has_more);
void record_continuation_miss(MissReason reason);
void record_sweep(std::uint64_t removed);
void record_error(const std::string &component, const std::string &message);

} // namespace docgate::observability
