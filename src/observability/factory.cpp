#include "tgassist/observability/factory.hpp"

#include "tgassist/common/strings.hpp"
#include "tgassist/observability/log_observer.hpp"
#include "tgassist/observability/noop_observer.hpp"

namespace tgassist::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(config.observability.verbose);
}

} // namespace tgassist::observability
