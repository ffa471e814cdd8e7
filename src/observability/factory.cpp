#include "sessionkit/observability/factory.hpp"

#include "sessionkit/common/fs.hpp"
#include "sessionkit/observability/log_observer.hpp"
#include "sessionkit/observability/multi_observer.hpp"
#include "sessionkit/observability/noop_observer.hpp"

#include <sstream>

namespace sessionkit::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const bool verbose = config.observability.verbose;
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(verbose);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>(verbose));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(verbose);
}

} // namespace sessionkit::observability
