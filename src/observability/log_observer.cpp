#include "gembridge/observability/log_observer.hpp"

#include <type_traits>

namespace gembridge::observability {

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, InvocationStartEvent>) {
          log_line("INFO", "gemini.start binary=" + evt.binary +
                               " model=" + (evt.model.empty() ? "default" : evt.model) +
                               " timeout_s=" + std::to_string(evt.timeout.count()) +
                               " sandbox=" + (evt.sandbox ? "true" : "false") +
                               " resume=" + (evt.resume ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, InvocationEndEvent>) {
          log_line("INFO", "gemini.end duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + (evt.success ? "true" : "false") +
                               " session=" + (evt.session_id.empty() ? "-" : evt.session_id));
        } else if constexpr (std::is_same_v<T, TimeoutEvent>) {
          log_line("WARN", "gemini.timeout after_s=" + std::to_string(evt.timeout.count()));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
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
        if constexpr (std::is_same_v<T, InvocationLatencyMetric>) {
          log_line("DEBUG", "metric.invocation_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CapturedEventsMetric>) {
          log_line("DEBUG", "metric.captured_events=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, NonJsonLinesMetric>) {
          log_line("DEBUG", "metric.non_json_lines=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace gembridge::observability
