#pragma once

#include "gembridge/observability/observer.hpp"

#include <memory>

namespace gembridge::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_invocation_start(const std::string &binary, const std::string &model,
                             std::chrono::seconds timeout, bool sandbox, bool resume);
void record_invocation_end(std::chrono::milliseconds duration, bool success,
                           const std::string &session_id);
void record_timeout(std::chrono::seconds timeout);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace gembridge::observability
