#pragma once

#include "gembridge/observability/observer.hpp"

#include <iostream>
#include <mutex>

namespace gembridge::observability {

/// Writes "[LEVEL] message" lines. Defaults to stderr because stdout carries
/// the MCP channel.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace gembridge::observability
