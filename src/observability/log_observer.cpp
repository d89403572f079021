#include "tgassist/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace tgassist::observability {

void LogObserver::log_line(const char *level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AssistTurnEvent>) {
          log_line("INFO", "assist.turn outcome=" + evt.outcome +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ChannelMessageEvent>) {
          if (verbose_) {
            log_line("DEBUG", "channel.message channel=" + evt.channel +
                                  " direction=" + evt.direction +
                                  " chat=" + std::to_string(evt.chat_id));
          }
        } else if constexpr (std::is_same_v<T, AuthorizationDeniedEvent>) {
          log_line("WARN", "auth.denied chat=" + std::to_string(evt.chat_id) +
                               " user=" + std::to_string(evt.user_id) + " kind=" + evt.chat_kind);
        } else if constexpr (std::is_same_v<T, ChatLeftEvent>) {
          log_line("INFO", "chat.left chat=" + std::to_string(evt.chat_id));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, TraceEvent>) {
          if (verbose_) {
            log_line("DEBUG", evt.component + ": " + evt.message);
          }
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (!verbose_) {
    return;
  }
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, TurnLatencyMetric>) {
          log_line("DEBUG", "metric.turn_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, DispatchQueueDepthMetric>) {
          log_line("DEBUG", "metric.dispatch_queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace tgassist::observability
