#pragma once

#include "tgassist/assistant/conversation.hpp"
#include "tgassist/assistant/transport.hpp"
#include "tgassist/channels/chat.hpp"
#include "tgassist/channels/dispatcher.hpp"
#include "tgassist/common/result.hpp"
#include "tgassist/config/schema.hpp"
#include "tgassist/router/message_router.hpp"

#include <atomic>
#include <memory>

namespace tgassist::runtime {

/// Builds the long-lived objects from a loaded configuration.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Loads the OAuth credentials, proves they work with one refresh, and opens
  /// the authorized gRPC channel.
  [[nodiscard]] common::Result<std::shared_ptr<assistant::AssistTransport>>
  create_assist_transport() const;

  [[nodiscard]] std::shared_ptr<assistant::ConversationSession>
  create_session(std::shared_ptr<assistant::AssistTransport> transport) const;

private:
  config::Config config_;
};

[[nodiscard]] assistant::ConversationOptions conversation_options(const config::Config &config);
[[nodiscard]] channels::ChannelConfig telegram_channel_config(const config::Config &config);

/// The running bot: channel -> dispatcher -> router -> session.
///
/// One ConversationSession serves every chat. stop() stops polling first,
/// then lets in-flight turns finish.
class BotService {
public:
  BotService(config::Config config, std::shared_ptr<assistant::AssistTransport> transport,
             std::shared_ptr<channels::ChatChannel> channel);
  ~BotService();

  BotService(const BotService &) = delete;
  BotService &operator=(const BotService &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] std::shared_ptr<assistant::ConversationSession> session() const { return session_; }

private:
  config::Config config_;
  std::shared_ptr<assistant::AssistTransport> transport_;
  std::shared_ptr<channels::ChatChannel> channel_;

  std::shared_ptr<assistant::ConversationSession> session_;
  std::shared_ptr<router::MessageRouter> router_;
  std::unique_ptr<channels::UpdateDispatcher> dispatcher_;
  std::atomic<bool> running_{false};
};

} // namespace tgassist::runtime
