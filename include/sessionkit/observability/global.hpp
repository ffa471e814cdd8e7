#pragma once

#include "sessionkit/observability/observer.hpp"

#include <memory>

namespace sessionkit::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_created(const std::string &backend, std::size_t id_bytes,
                            std::uint32_t attempts);
void record_session_collision(const std::string &backend, std::uint32_t attempt);
void record_session_lookup(const std::string &backend, bool found);
void record_error(const std::string &component, const std::string &message);

} // namespace sessionkit::observability
