#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace gembridge::observability {

struct InvocationStartEvent {
  std::string binary;
  std::string model;
  std::chrono::seconds timeout{0};
  bool sandbox = false;
  bool resume = false;
};

struct InvocationEndEvent {
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string session_id;
};

struct TimeoutEvent {
  std::chrono::seconds timeout{0};
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<InvocationStartEvent, InvocationEndEvent, TimeoutEvent, WarningEvent, ErrorEvent>;

struct InvocationLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CapturedEventsMetric {
  std::uint64_t count = 0;
};

struct NonJsonLinesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<InvocationLatencyMetric, CapturedEventsMetric, NonJsonLinesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace gembridge::observability
