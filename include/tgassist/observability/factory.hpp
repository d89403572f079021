#pragma once

#include "tgassist/config/schema.hpp"
#include "tgassist/observability/observer.hpp"

#include <memory>

namespace tgassist::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tgassist::observability
