#pragma once

#include "gembridge/config/config.hpp"
#include "gembridge/observability/observer.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gembridge::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;
  /// Writes an executable /bin/sh script and returns its absolute path.
  std::filesystem::path create_script(const std::string &name, const std::string &body) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Environment lookup backed by a fixed map.
[[nodiscard]] config::EnvLookup fixed_env(std::map<std::string, std::string> values);

/// Keeps every event and metric for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::size_t count_events() const {
    std::size_t count = 0;
    for (const auto &event : events()) {
      if (std::holds_alternative<T>(event)) {
        ++count;
      }
    }
    return count;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for its lifetime.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_ = nullptr;
};

} // namespace gembridge::testing
