#include "gembridge/observability/global.hpp"

#include <mutex>

namespace gembridge::observability {

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

void record_invocation_start(const std::string &binary, const std::string &model,
                             const std::chrono::seconds timeout, const bool sandbox,
                             const bool resume) {
  record_event(InvocationStartEvent{
      .binary = binary, .model = model, .timeout = timeout, .sandbox = sandbox, .resume = resume});
}

void record_invocation_end(const std::chrono::milliseconds duration, const bool success,
                           const std::string &session_id) {
  record_event(
      InvocationEndEvent{.duration = duration, .success = success, .session_id = session_id});
  record_metric(InvocationLatencyMetric{.latency = duration});
}

void record_timeout(const std::chrono::seconds timeout) {
  record_event(TimeoutEvent{.timeout = timeout});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace gembridge::observability
