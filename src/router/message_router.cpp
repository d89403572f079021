#include "tgassist/router/message_router.hpp"

#include "tgassist/common/strings.hpp"
#include "tgassist/observability/global.hpp"

#include <chrono>

namespace tgassist::router {

const char *route_outcome_name(const RouteOutcome outcome) {
  switch (outcome) {
  case RouteOutcome::Replied:
    return "replied";
  case RouteOutcome::NoReply:
    return "no_reply";
  case RouteOutcome::Ignored:
    return "ignored";
  case RouteOutcome::Unauthorized:
    return "unauthorized";
  case RouteOutcome::UnauthorizedLeft:
    return "unauthorized_left";
  case RouteOutcome::AssistantFailed:
    return "assistant_failed";
  case RouteOutcome::DeliveryFailed:
    return "delivery_failed";
  }
  return "unknown";
}

RouterOptions RouterOptions::from_config(const config::RouterConfig &config) {
  RouterOptions options;
  options.unauthorized_reply = config.unauthorized_reply;
  options.failure_reply = config.failure_reply;
  options.leave_unauthorized_groups = config.leave_unauthorized_groups;
  return options;
}

MessageRouter::MessageRouter(RouterOptions options,
                             std::shared_ptr<assistant::ConversationSession> session,
                             std::shared_ptr<const AuthorizationPolicy> policy,
                             std::shared_ptr<channels::ChatGateway> gateway)
    : options_(std::move(options)), session_(std::move(session)), policy_(std::move(policy)),
      gateway_(std::move(gateway)) {}

std::optional<std::string> MessageRouter::extract_group_query(const std::string &text,
                                                              const std::string &bot_handle) {
  if (bot_handle.empty()) {
    return std::nullopt;
  }
  auto [mention, rest] = common::split_first_word(text);
  while (!mention.empty() && (mention.back() == ',' || mention.back() == ':')) {
    mention.pop_back();
  }
  if (common::to_lower(mention) != "@" + common::to_lower(bot_handle)) {
    return std::nullopt;
  }
  return rest;
}

RouteOutcome MessageRouter::handle(const channels::ChatEvent &event) {
  const RouteOutcome outcome = event.chat_kind == channels::ChatKind::Private
                                   ? handle_private(event)
                                   : handle_group(event);
  if (observability::trace_enabled()) {
    observability::record_trace("router", "chat=" + std::to_string(event.chat_id) +
                                              " user=" + std::to_string(event.sender_id) +
                                              " outcome=" + route_outcome_name(outcome));
  }
  return outcome;
}

RouteOutcome MessageRouter::handle_private(const channels::ChatEvent &event) {
  if (!policy_->is_authorized_user(event.sender_id)) {
    reject(event);
    return RouteOutcome::Unauthorized;
  }
  const std::string query = common::trim(event.text);
  if (query.empty()) {
    return RouteOutcome::Ignored;
  }
  return answer(event, query);
}

RouteOutcome MessageRouter::handle_group(const channels::ChatEvent &event) {
  const auto query = extract_group_query(event.text, gateway_->bot_handle());
  if (!query.has_value() || query->empty()) {
    return RouteOutcome::Ignored;
  }

  if (!policy_->is_allowed_chat(event.chat_id) && !policy_->is_authorized_user(event.sender_id)) {
    reject(event);
    if (!options_.leave_unauthorized_groups || authorized_member_present(event.chat_id)) {
      return RouteOutcome::Unauthorized;
    }
    if (auto status = gateway_->leave_chat(event.chat_id); !status.ok()) {
      observability::record_error("router", "leave chat " + std::to_string(event.chat_id) +
                                                " failed: " + status.error());
      return RouteOutcome::Unauthorized;
    }
    observability::record_chat_left(event.chat_id);
    return RouteOutcome::UnauthorizedLeft;
  }

  return answer(event, *query);
}

RouteOutcome MessageRouter::answer(const channels::ChatEvent &event, const std::string &query) {
  const auto started = std::chrono::steady_clock::now();
  const auto result = session_->ask(query);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!result.ok()) {
    const auto &error = result.error();
    observability::record_assist_turn(elapsed, assistant::error_kind_name(error.kind));
    observability::record_error("assistant", error.to_string());
    if (!options_.failure_reply.empty()) {
      (void)reply(event, options_.failure_reply);
    }
    return RouteOutcome::AssistantFailed;
  }

  const auto &text = result.value();
  if (!text.has_value()) {
    observability::record_assist_turn(elapsed, "no_reply");
    return RouteOutcome::NoReply;
  }
  observability::record_assist_turn(elapsed, "reply");
  return reply(event, *text) ? RouteOutcome::Replied : RouteOutcome::DeliveryFailed;
}

void MessageRouter::reject(const channels::ChatEvent &event) {
  observability::record_authorization_denied(event.chat_id, event.sender_id,
                                             channels::chat_kind_name(event.chat_kind));
  if (!options_.unauthorized_reply.empty()) {
    (void)reply(event, options_.unauthorized_reply);
  }
}

bool MessageRouter::authorized_member_present(const std::int64_t chat_id) {
  bool unknown = false;
  for (const auto user_id : policy_->authorized_users()) {
    auto member = gateway_->is_member(chat_id, user_id);
    if (!member.ok()) {
      // An unanswered lookup counts as present.
      observability::record_error("router", "membership lookup chat=" + std::to_string(chat_id) +
                                                " user=" + std::to_string(user_id) +
                                                " failed: " + member.error());
      unknown = true;
      continue;
    }
    if (member.value()) {
      return true;
    }
  }
  return unknown;
}

bool MessageRouter::reply(const channels::ChatEvent &event, const std::string &text) {
  std::optional<std::int64_t> reply_to;
  if (event.message_id > 0) {
    reply_to = event.message_id;
  }
  auto status = gateway_->send_reply(event.chat_id, text, reply_to);
  if (!status.ok()) {
    observability::record_error("router", "reply to chat " + std::to_string(event.chat_id) +
                                              " failed: " + status.error());
    return false;
  }
  return true;
}

} // namespace tgassist::router
