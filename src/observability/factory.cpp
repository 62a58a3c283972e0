#include "docgate/observability/factory.hpp"

#include "docgate/common/fs.hpp"
#include "docgate/observability/log_observer.hpp"
#include "docgate/observability/multi_observer.hpp"
#include "docgate/observability/noop_observer.hpp"

#include <sstream>
#include <vector>

namespace docgate::observability {

namespace {

std::unique_ptr<IObserver> make_single(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  // Unknown names log so that delivery misses stay visible.
  return std::make_unique<LogObserver>();
}

std::vector<std::string> split_backends(const std::string &backend) {
  std::vector<std::string> names;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    names.push_back(common::trim(part));
  }
  return names;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return make_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : split_backends(backend)) {
    if (!name.empty()) {
      multi->add(make_single(name));
    }
  }
  return multi;
}

} // namespace docgate::observability
