#pragma once

#include "tgassist/common/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tgassist::channels {

enum class ChatKind { Private, Group };

[[nodiscard]] const char *chat_kind_name(ChatKind kind);

struct ChannelConfig {
  std::string id;
  std::unordered_map<std::string, std::string> settings;
};

/// An inbound text message, reduced to what routing needs.
struct ChatEvent {
  std::int64_t update_id = 0;
  std::int64_t message_id = 0;
  std::int64_t chat_id = 0;
  ChatKind chat_kind = ChatKind::Private;
  std::int64_t sender_id = 0;
  std::string sender_username;
  std::string text;
  std::uint64_t timestamp = 0;
};

using ChatEventCallback = std::function<void(const ChatEvent &)>;

/// Outbound operations the router needs from a chat platform.
class ChatGateway {
public:
  virtual ~ChatGateway() = default;

  /// The bot's own username, without '@'.
  [[nodiscard]] virtual std::string bot_handle() const = 0;

  [[nodiscard]] virtual common::Status
  send_reply(std::int64_t chat_id, const std::string &text,
             std::optional<std::int64_t> reply_to_message_id) = 0;

  /// true/false when the platform gave a definite answer; failure when it
  /// could not be asked.
  [[nodiscard]] virtual common::Result<bool> is_member(std::int64_t chat_id,
                                                       std::int64_t user_id) = 0;

  [[nodiscard]] virtual common::Status leave_chat(std::int64_t chat_id) = 0;
};

class ChatChannel : public ChatGateway {
public:
  [[nodiscard]] virtual std::string_view id() const = 0;

  [[nodiscard]] virtual common::Status start(const ChannelConfig &config) = 0;
  virtual void stop() = 0;

  virtual void on_event(ChatEventCallback callback) = 0;

  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace tgassist::channels
