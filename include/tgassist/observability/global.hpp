#pragma once

#include "tgassist/observability/observer.hpp"

#include <memory>

namespace tgassist::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_assist_turn(std::chrono::milliseconds duration, const std::string &outcome);
void record_channel_message(const std::string &channel, const std::string &direction,
                            std::int64_t chat_id);
void record_authorization_denied(std::int64_t chat_id, std::int64_t user_id,
                                 const std::string &chat_kind);
void record_chat_left(std::int64_t chat_id);
void record_error(const std::string &component, const std::string &message);
void record_trace(const std::string &component, const std::string &message);

/// Skip building trace strings nobody will print.
[[nodiscard]] bool trace_enabled();

} // namespace tgassist::observability
