#include "sessionkit/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace sessionkit::observability {

LogObserver::LogObserver(const bool verbose) : LogObserver(std::cerr, verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionCreatedEvent>) {
          log_line("INFO", "session.created backend=" + evt.backend +
                               " id_bytes=" + std::to_string(evt.id_bytes) +
                               " attempts=" + std::to_string(evt.attempts));
        } else if constexpr (std::is_same_v<T, SessionCollisionEvent>) {
          log_line("WARN", "session.collision backend=" + evt.backend +
                               " attempt=" + std::to_string(evt.attempt));
        } else if constexpr (std::is_same_v<T, SessionLookupEvent>) {
          log_line("DEBUG", "session.lookup backend=" + evt.backend +
                                " found=" + (evt.found ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CreateLatencyMetric>) {
          log_line("DEBUG", "metric.create_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CreateAttemptsMetric>) {
          log_line("DEBUG", "metric.create_attempts=" + std::to_string(m.attempts));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace sessionkit::observability
