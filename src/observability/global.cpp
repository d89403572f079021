#include "tgassist/observability/global.hpp"

#include <mutex>

namespace tgassist::observability {

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

void record_assist_turn(std::chrono::milliseconds duration, const std::string &outcome) {
  record_event(AssistTurnEvent{.duration = duration, .outcome = outcome});
  record_metric(TurnLatencyMetric{.latency = duration});
}

void record_channel_message(const std::string &channel, const std::string &direction,
                            const std::int64_t chat_id) {
  record_event(ChannelMessageEvent{.channel = channel, .direction = direction, .chat_id = chat_id});
}

void record_authorization_denied(const std::int64_t chat_id, const std::int64_t user_id,
                                 const std::string &chat_kind) {
  record_event(
      AuthorizationDeniedEvent{.chat_id = chat_id, .user_id = user_id, .chat_kind = chat_kind});
}

void record_chat_left(const std::int64_t chat_id) { record_event(ChatLeftEvent{.chat_id = chat_id}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_trace(const std::string &component, const std::string &message) {
  record_event(TraceEvent{.component = component, .message = message});
}

bool trace_enabled() {
  const auto *observer = get_global_observer();
  return observer != nullptr && observer->traces_enabled();
}

} // namespace tgassist::observability
