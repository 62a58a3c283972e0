#pragma once

#include "docgate/config/schema.hpp"
#include "docgate/observability/observer.hpp"

#include <memory>

namespace docgate::observability {

/// Observer for `config.observability.backend`: "none"/"noop", "log", or a
/// comma-separated list of those. Unknown names fall back to logging.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace docgate::observability
