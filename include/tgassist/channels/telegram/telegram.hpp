#pragma once

#include "tgassist/channels/chat.hpp"
#include "tgassist/http/http_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tgassist::channels::telegram {

/// One element of a getUpdates result. `event` is empty for updates the bot
/// does not act on (no text, channel posts, service messages); `skip_reason`
/// says why.
struct ParsedUpdate {
  std::int64_t update_id = 0;
  std::optional<ChatEvent> event;
  std::string skip_reason;
};

/// Fails only when the update has no usable update_id.
[[nodiscard]] common::Result<ParsedUpdate> parse_update(const std::string &update_json);

/// Telegram Bot API over long polling.
///
/// Settings: bot_token (required), api_base, poll_timeout_seconds,
/// idle_sleep_ms, polling_enabled, bot_username (skips getMe).
class TelegramChannel final : public ChatChannel {
public:
  explicit TelegramChannel(
      std::shared_ptr<http::HttpClient> http_client = std::make_shared<http::CurlHttpClient>());
  ~TelegramChannel() override;

  [[nodiscard]] std::string_view id() const override;

  [[nodiscard]] common::Status start(const ChannelConfig &config) override;
  void stop() override;

  void on_event(ChatEventCallback callback) override;
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] std::string bot_handle() const override;
  [[nodiscard]] common::Status send_reply(std::int64_t chat_id, const std::string &text,
                                          std::optional<std::int64_t> reply_to_message_id) override;
  [[nodiscard]] common::Result<bool> is_member(std::int64_t chat_id,
                                               std::int64_t user_id) override;
  [[nodiscard]] common::Status leave_chat(std::int64_t chat_id) override;

private:
  [[nodiscard]] common::Status fetch_bot_handle();
  [[nodiscard]] common::Status poll_once();
  void run_loop();
  [[nodiscard]] common::Status parse_and_dispatch_updates(const std::string &response_body);
  [[nodiscard]] http::HttpResponse call(const std::string &method, const std::string &body,
                                        std::uint64_t timeout_ms) const;
  [[nodiscard]] common::Status check_api_response(const http::HttpResponse &response,
                                                  std::string_view operation) const;

  std::shared_ptr<http::HttpClient> http_client_;
  std::atomic<bool> running_{false};
  std::atomic<bool> healthy_{true};
  std::thread worker_;

  mutable std::mutex callback_mutex_;
  ChatEventCallback event_callback_;

  mutable std::mutex state_mutex_;
  std::string base_url_;
  std::string bot_handle_;
  std::int64_t next_update_offset_ = 0;
  std::uint64_t poll_timeout_seconds_ = 10;
  std::chrono::milliseconds idle_sleep_{std::chrono::milliseconds(150)};
  bool polling_enabled_ = true;
  std::string last_error_;
};

} // namespace tgassist::channels::telegram
