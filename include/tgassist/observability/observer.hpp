#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tgassist::observability {

struct AssistTurnEvent {
  std::chrono::milliseconds duration{0};
  /// "reply", "no_reply" or the failure kind.
  std::string outcome;
};

struct ChannelMessageEvent {
  std::string channel;
  std::string direction;
  std::int64_t chat_id = 0;
};

struct AuthorizationDeniedEvent {
  std::int64_t chat_id = 0;
  std::int64_t user_id = 0;
  std::string chat_kind;
};

struct ChatLeftEvent {
  std::int64_t chat_id = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

/// Debug-level detail, only printed by verbose observers.
struct TraceEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<AssistTurnEvent, ChannelMessageEvent, AuthorizationDeniedEvent,
                                   ChatLeftEvent, ErrorEvent, TraceEvent>;

struct TurnLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct DispatchQueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<TurnLatencyMetric, DispatchQueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual bool traces_enabled() const { return false; }
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tgassist::observability
