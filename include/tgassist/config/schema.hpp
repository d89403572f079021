#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tgassist::config {

inline constexpr const char *DEFAULT_API_ENDPOINT = "embeddedassistant.googleapis.com";
inline constexpr std::uint32_t DEFAULT_DEADLINE_SECONDS = 60 * 3 + 5;

struct AssistantConfig {
  std::string api_endpoint = DEFAULT_API_ENDPOINT;
  std::string credentials_path = "~/.config/google-oauthlib-tool/credentials.json";
  std::string language_code = "en-US";
  std::string device_model_id;
  std::string device_id;
  std::uint32_t deadline_seconds = DEFAULT_DEADLINE_SECONDS;
};

struct TelegramConfig {
  std::string bot_token;
  std::string api_base = "https://api.telegram.org";
  std::vector<std::int64_t> allowed_chat_ids;
  std::vector<std::int64_t> authorized_user_ids;
  int poll_timeout_seconds = 10;
  int idle_sleep_ms = 150;
};

struct RouterConfig {
  std::string unauthorized_reply = "Unauthorized";
  /// Sent when a turn fails. Empty keeps failures silent in the chat.
  std::string failure_reply;
  bool leave_unauthorized_groups = true;
  std::uint32_t dispatch_workers = 4;
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool verbose = false;
};

struct Config {
  AssistantConfig assistant;
  TelegramConfig telegram;
  RouterConfig router;
  ObservabilityConfig observability;
};

} // namespace tgassist::config
