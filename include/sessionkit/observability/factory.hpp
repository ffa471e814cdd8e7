#pragma once

#include "sessionkit/config/schema.hpp"
#include "sessionkit/observability/observer.hpp"

#include <memory>

namespace sessionkit::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sessionkit::observability
