#pragma once

#include "sessionkit/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace sessionkit::observability {

/// Writes `[LEVEL] message` lines. Debug lines (metrics, lookups) are dropped
/// unless `verbose` is set.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false);
  LogObserver(std::ostream &out, bool verbose);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_ = false;
  std::mutex mutex_;
};

} // namespace sessionkit::observability
