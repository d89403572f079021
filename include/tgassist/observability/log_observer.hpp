#pragma once

#include "tgassist/observability/observer.hpp"

#include <mutex>

namespace tgassist::observability {

/// Writes "[LEVEL] ..." lines to stderr. DEBUG lines (traces, metrics, message
/// flow) only appear when verbose.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false) : verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] bool traces_enabled() const override { return verbose_; }
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const char *level, const std::string &message);

  bool verbose_;
  std::mutex mutex_;
};

} // namespace tgassist::observability
