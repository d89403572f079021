#include "tgassist/channels/telegram/telegram.hpp"

#include "tgassist/common/json_util.hpp"
#include "tgassist/common/strings.hpp"
#include "tgassist/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

namespace tgassist::channels::telegram {

namespace {

constexpr std::uint64_t SEND_TIMEOUT_MS = 15000;
constexpr std::uint64_t LOOKUP_TIMEOUT_MS = 10000;

std::string field(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? std::string() : it->second;
}

std::optional<std::int64_t> int_field(const common::JsonFlatMap &fields, const std::string &key) {
  auto parsed = common::parse_i64(field(fields, key));
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return parsed.value();
}

std::uint64_t parse_u64_setting(const ChannelConfig &config, const std::string &key,
                                const std::uint64_t fallback) {
  const auto it = config.settings.find(key);
  if (it == config.settings.end()) {
    return fallback;
  }
  auto parsed = common::parse_i64(it->second);
  if (!parsed.ok() || parsed.value() < 0) {
    return fallback;
  }
  return static_cast<std::uint64_t>(parsed.value());
}

bool parse_bool_setting(const ChannelConfig &config, const std::string &key, const bool fallback) {
  const auto it = config.settings.find(key);
  if (it == config.settings.end()) {
    return fallback;
  }
  const std::string normalized = common::to_lower(common::trim(it->second));
  if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
    return false;
  }
  return fallback;
}

} // namespace

common::Result<ParsedUpdate> parse_update(const std::string &update_json) {
  // Flat parses at every level, so a quoted reply_to_message or a forwarded
  // chat can never shadow the fields of the message itself.
  const auto update = common::json_parse_flat(update_json);
  const auto update_id = int_field(update, "update_id");
  if (!update_id.has_value()) {
    return common::Result<ParsedUpdate>::failure("missing update_id");
  }

  ParsedUpdate parsed;
  parsed.update_id = *update_id;

  const std::string message_json = field(update, "message");
  if (message_json.empty()) {
    parsed.skip_reason = "not a new message";
    return common::Result<ParsedUpdate>::success(std::move(parsed));
  }
  const auto message = common::json_parse_flat(message_json);

  const std::string text = field(message, "text");
  if (common::trim(text).empty()) {
    parsed.skip_reason = "no text";
    return common::Result<ParsedUpdate>::success(std::move(parsed));
  }

  const auto chat = common::json_parse_flat(field(message, "chat"));
  const auto chat_id = int_field(chat, "id");
  if (!chat_id.has_value()) {
    parsed.skip_reason = "chat id missing";
    return common::Result<ParsedUpdate>::success(std::move(parsed));
  }

  ChatEvent event;
  const std::string chat_type = field(chat, "type");
  if (chat_type == "private") {
    event.chat_kind = ChatKind::Private;
  } else if (chat_type == "group" || chat_type == "supergroup") {
    event.chat_kind = ChatKind::Group;
  } else {
    parsed.skip_reason = "unsupported chat type '" + chat_type + "'";
    return common::Result<ParsedUpdate>::success(std::move(parsed));
  }

  const auto from = common::json_parse_flat(field(message, "from"));
  const auto sender_id = int_field(from, "id");
  if (!sender_id.has_value()) {
    parsed.skip_reason = "sender missing";
    return common::Result<ParsedUpdate>::success(std::move(parsed));
  }

  event.update_id = *update_id;
  event.message_id = int_field(message, "message_id").value_or(0);
  event.chat_id = *chat_id;
  event.sender_id = *sender_id;
  event.sender_username = field(from, "username");
  event.text = text;
  event.timestamp = static_cast<std::uint64_t>(std::max<std::int64_t>(
      0, int_field(message, "date").value_or(0)));
  parsed.event = std::move(event);
  return common::Result<ParsedUpdate>::success(std::move(parsed));
}

TelegramChannel::TelegramChannel(std::shared_ptr<http::HttpClient> http_client)
    : http_client_(std::move(http_client)) {}

TelegramChannel::~TelegramChannel() { stop(); }

std::string_view TelegramChannel::id() const { return "telegram"; }

common::Status TelegramChannel::start(const ChannelConfig &config) {
  if (running_.load()) {
    return common::Status::success();
  }
  if (http_client_ == nullptr) {
    return common::Status::error("telegram http client unavailable");
  }

  const auto token_it = config.settings.find("bot_token");
  if (token_it == config.settings.end() || common::trim(token_it->second).empty()) {
    return common::Status::error("telegram bot_token is required");
  }

  std::string api_base = "https://api.telegram.org";
  if (const auto it = config.settings.find("api_base"); it != config.settings.end()) {
    api_base = common::trim(it->second);
    while (!api_base.empty() && api_base.back() == '/') {
      api_base.pop_back();
    }
  }

  std::string configured_handle;
  if (const auto it = config.settings.find("bot_username"); it != config.settings.end()) {
    configured_handle = common::trim(it->second);
    if (!configured_handle.empty() && configured_handle.front() == '@') {
      configured_handle.erase(configured_handle.begin());
    }
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    base_url_ = api_base + "/bot" + common::trim(token_it->second);
    bot_handle_ = configured_handle;
    next_update_offset_ = 0;
    poll_timeout_seconds_ = parse_u64_setting(config, "poll_timeout_seconds", 10);
    idle_sleep_ = std::chrono::milliseconds(parse_u64_setting(config, "idle_sleep_ms", 150));
    polling_enabled_ = parse_bool_setting(config, "polling_enabled", true);
  }

  if (configured_handle.empty()) {
    if (auto status = fetch_bot_handle(); !status.ok()) {
      return status;
    }
  }

  healthy_.store(true);
  running_.store(true);
  if (polling_enabled_) {
    worker_ = std::thread([this]() { run_loop(); });
  }
  return common::Status::success();
}

void TelegramChannel::stop() {
  running_.store(false);
  if (worker_.joinable()) {
    try {
      worker_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[telegram] join failed: " << err.what() << "\n";
    }
  }
}

void TelegramChannel::on_event(ChatEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

bool TelegramChannel::health_check() {
  if (!running_.load()) {
    return true;
  }
  return healthy_.load();
}

std::string TelegramChannel::bot_handle() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return bot_handle_;
}

common::Status TelegramChannel::send_reply(const std::int64_t chat_id, const std::string &text,
                                           const std::optional<std::int64_t> reply_to_message_id) {
  if (common::trim(text).empty()) {
    return common::Status::error("text is required");
  }

  std::ostringstream body;
  body << "{";
  body << "\"chat_id\":" << chat_id << ",";
  body << "\"text\":\"" << common::json_escape(text) << "\"";
  if (reply_to_message_id.has_value() && *reply_to_message_id > 0) {
    body << ",\"reply_to_message_id\":" << *reply_to_message_id;
    body << ",\"allow_sending_without_reply\":true";
  }
  body << "}";

  const auto response = call("sendMessage", body.str(), SEND_TIMEOUT_MS);
  auto status = check_api_response(response, "sendMessage");
  if (status.ok()) {
    observability::record_channel_message("telegram", "outbound", chat_id);
  }
  return status;
}

common::Result<bool> TelegramChannel::is_member(const std::int64_t chat_id,
                                                const std::int64_t user_id) {
  std::ostringstream body;
  body << "{\"chat_id\":" << chat_id << ",\"user_id\":" << user_id << "}";
  const auto response = call("getChatMember", body.str(), LOOKUP_TIMEOUT_MS);

  // Telegram answers 400 "user not found" (and 403 for chats the bot can no
  // longer see) when the user is not a participant.
  if (!response.network_error && (response.status == 400 || response.status == 403)) {
    return common::Result<bool>::success(false);
  }
  if (auto status = check_api_response(response, "getChatMember"); !status.ok()) {
    return common::Result<bool>::failure(status.error());
  }

  const auto envelope = common::json_parse_flat(response.body);
  const auto member = common::json_parse_flat(field(envelope, "result"));
  const std::string state = field(member, "status");
  if (state == "creator" || state == "administrator" || state == "member") {
    return common::Result<bool>::success(true);
  }
  if (state == "restricted") {
    return common::Result<bool>::success(field(member, "is_member") == "true");
  }
  if (state == "left" || state == "kicked") {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure("getChatMember returned unknown status '" + state + "'");
}

common::Status TelegramChannel::leave_chat(const std::int64_t chat_id) {
  const auto response =
      call("leaveChat", "{\"chat_id\":" + std::to_string(chat_id) + "}", SEND_TIMEOUT_MS);
  return check_api_response(response, "leaveChat");
}

common::Status TelegramChannel::fetch_bot_handle() {
  const auto response = call("getMe", "{}", SEND_TIMEOUT_MS);
  if (auto status = check_api_response(response, "getMe"); !status.ok()) {
    return status;
  }
  const auto envelope = common::json_parse_flat(response.body);
  const auto me = common::json_parse_flat(field(envelope, "result"));
  const std::string username = field(me, "username");
  if (username.empty()) {
    return common::Status::error("getMe returned no username");
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  bot_handle_ = username;
  return common::Status::success();
}

http::HttpResponse TelegramChannel::call(const std::string &method, const std::string &body,
                                         const std::uint64_t timeout_ms) const {
  std::string base_url;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    base_url = base_url_;
  }
  if (base_url.empty()) {
    http::HttpResponse response;
    response.network_error = true;
    response.network_error_message = "telegram channel not configured";
    return response;
  }
  return http_client_->post_json(base_url + "/" + method, {{"Content-Type", "application/json"}},
                                 body, timeout_ms);
}

void TelegramChannel::run_loop() {
  while (running_.load()) {
    const auto status = poll_once();
    if (!status.ok()) {
      healthy_.store(false);
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = status.error();
      }
      std::cerr << "[telegram] poll error: " << status.error() << "\n";
      std::this_thread::sleep_for(std::chrono::milliseconds(350));
    } else {
      healthy_.store(true);
      std::this_thread::sleep_for(idle_sleep_);
    }
  }
}

common::Status TelegramChannel::poll_once() {
  std::int64_t offset = 0;
  std::uint64_t timeout_seconds = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    offset = next_update_offset_;
    timeout_seconds = poll_timeout_seconds_;
  }

  std::ostringstream body;
  body << "{";
  body << "\"offset\":" << offset << ",";
  body << "\"timeout\":" << timeout_seconds << ",";
  body << "\"allowed_updates\":[\"message\"]";
  body << "}";

  const auto response = call("getUpdates", body.str(), (timeout_seconds + 5) * 1000);
  const auto status = check_api_response(response, "getUpdates");
  if (!status.ok()) {
    return status;
  }
  return parse_and_dispatch_updates(response.body);
}

common::Status TelegramChannel::parse_and_dispatch_updates(const std::string &response_body) {
  const auto envelope = common::json_parse_flat(response_body);
  const std::string result_array = field(envelope, "result");
  if (result_array.empty() || result_array.front() != '[') {
    return common::Status::error("telegram getUpdates response missing result array");
  }

  const auto updates = common::json_split_top_level_objects(result_array);
  std::size_t dispatched = 0;
  std::int64_t max_seen_update = -1;
  for (const auto &update_json : updates) {
    const auto parsed = parse_update(update_json);
    if (!parsed.ok()) {
      std::cerr << "[telegram] skip update parse error: " << parsed.error() << "\n";
      continue;
    }
    const auto &update = parsed.value();
    max_seen_update = std::max(max_seen_update, update.update_id);
    if (!update.event.has_value()) {
      observability::record_trace("telegram", "skip update_id=" +
                                                  std::to_string(update.update_id) + ": " +
                                                  update.skip_reason);
      continue;
    }

    ChatEventCallback callback_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback_copy = event_callback_;
    }
    if (!callback_copy) {
      std::cerr << "[telegram] skip update without callback update_id=" << update.update_id
                << "\n";
      continue;
    }

    observability::record_channel_message("telegram", "inbound", update.event->chat_id);
    callback_copy(*update.event);
    ++dispatched;
  }

  std::int64_t next_offset = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (max_seen_update >= 0) {
      next_update_offset_ = std::max(next_update_offset_, max_seen_update + 1);
    }
    next_offset = next_update_offset_;
  }
  if (!updates.empty()) {
    observability::record_trace("telegram", "polled updates=" + std::to_string(updates.size()) +
                                                " dispatched=" + std::to_string(dispatched) +
                                                " next_offset=" + std::to_string(next_offset));
  }
  return common::Status::success();
}

common::Status TelegramChannel::check_api_response(const http::HttpResponse &response,
                                                   const std::string_view operation) const {
  if (response.timeout) {
    return common::Status::error(std::string(operation) + " timeout");
  }
  if (response.network_error) {
    return common::Status::error(std::string(operation) + " network error: " +
                                 response.network_error_message);
  }
  if (response.status >= 400) {
    std::string snippet = common::trim(response.body);
    if (snippet.size() > 240) {
      snippet.resize(240);
    }
    return common::Status::error(std::string(operation) + " failed status=" +
                                 std::to_string(response.status) + " body=" + snippet);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(std::string(operation) + " unexpected status=" +
                                 std::to_string(response.status));
  }
  const auto envelope = common::json_parse_flat(response.body);
  if (field(envelope, "ok") != "true") {
    return common::Status::error(std::string(operation) + " response missing ok=true");
  }
  return common::Status::success();
}

} // namespace tgassist::channels::telegram
