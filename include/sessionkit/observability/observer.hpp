#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sessionkit::observability {

struct SessionCreatedEvent {
  std::string backend;
  std::size_t id_bytes = 0;
  std::uint32_t attempts = 0;
};

struct SessionCollisionEvent {
  std::string backend;
  std::uint32_t attempt = 0;
};

struct SessionLookupEvent {
  std::string backend;
  bool found = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SessionCreatedEvent, SessionCollisionEvent, SessionLookupEvent, ErrorEvent>;

struct CreateLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct CreateAttemptsMetric {
  std::uint32_t attempts = 0;
};

using ObserverMetric = std::variant<CreateLatencyMetric, CreateAttemptsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sessionkit::observability
