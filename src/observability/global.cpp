#include "sessionkit/observability/global.hpp"

#include <mutex>

namespace sessionkit::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session_created(const std::string &backend, const std::size_t id_bytes,
                            const std::uint32_t attempts) {
  record_event(SessionCreatedEvent{.backend = backend, .id_bytes = id_bytes, .attempts = attempts});
}

void record_session_collision(const std::string &backend, const std::uint32_t attempt) {
  record_event(SessionCollisionEvent{.backend = backend, .attempt = attempt});
}

void record_session_lookup(const std::string &backend, const bool found) {
  record_event(SessionLookupEvent{.backend = backend, .found = found});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sessionkit::observability
