#pragma once

#include "tgassist/assistant/conversation.hpp"
#include "tgassist/channels/chat.hpp"
#include "tgassist/config/schema.hpp"
#include "tgassist/router/authorization.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tgassist::router {

enum class RouteOutcome {
  Replied,
  NoReply,
  Ignored,
  Unauthorized,
  UnauthorizedLeft,
  AssistantFailed,
  DeliveryFailed,
};

[[nodiscard]] const char *route_outcome_name(RouteOutcome outcome);

struct RouterOptions {
  std::string unauthorized_reply = "Unauthorized";
  /// Empty: failed turns produce no chat message.
  std::string failure_reply;
  bool leave_unauthorized_groups = true;

  [[nodiscard]] static RouterOptions from_config(const config::RouterConfig &config);
};

/// Decides what to do with each inbound chat message.
///
/// Private chats: only authorized users are answered; everyone else gets the
/// unauthorized reply. Groups: only messages that start with "@<bot handle>"
/// are considered. If neither the group nor the sender is authorized the bot
/// says so and, when no authorized user is left in the group, leaves it.
///
/// handle() may be called from several threads at once.
class MessageRouter {
public:
  MessageRouter(RouterOptions options, std::shared_ptr<assistant::ConversationSession> session,
                std::shared_ptr<const AuthorizationPolicy> policy,
                std::shared_ptr<channels::ChatGateway> gateway);

  RouteOutcome handle(const channels::ChatEvent &event);

  /// Query addressed to `bot_handle` in a group message ("@bot what time is
  /// it" -> "what time is it"); nullopt when the message is not addressed to
  /// the bot. The result may be empty.
  [[nodiscard]] static std::optional<std::string> extract_group_query(const std::string &text,
                                                                      const std::string &bot_handle);

private:
  RouteOutcome handle_private(const channels::ChatEvent &event);
  RouteOutcome handle_group(const channels::ChatEvent &event);
  RouteOutcome answer(const channels::ChatEvent &event, const std::string &query);
  void reject(const channels::ChatEvent &event);
  /// true when some authorized user is (or might be) still in the chat.
  [[nodiscard]] bool authorized_member_present(std::int64_t chat_id);
  [[nodiscard]] bool reply(const channels::ChatEvent &event, const std::string &text);

  RouterOptions options_;
  std::shared_ptr<assistant::ConversationSession> session_;
  std::shared_ptr<const AuthorizationPolicy> policy_;
  std::shared_ptr<channels::ChatGateway> gateway_;
};

} // namespace tgassist::router
