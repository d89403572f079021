#pragma once

#include "tgassist/assistant/transport.hpp"
#include "tgassist/channels/chat.hpp"
#include "tgassist/config/schema.hpp"
#include "tgassist/http/http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tgassist::testing {

namespace proto = assistant::proto;

/// A config that passes validation without touching the environment.
config::Config mock_config();

proto::AssistResponse make_response(const std::string &state, const std::string &text = "");

/// Plays back one scripted turn per assist() call. With the script exhausted a
/// call succeeds with no responses.
class FakeAssistTransport final : public assistant::AssistTransport {
public:
  struct Turn {
    std::vector<proto::AssistResponse> responses;
    grpc::Status status = grpc::Status::OK;
    std::chrono::milliseconds delay{0};
  };

  void push_turn(Turn turn);
  void push_reply(const std::string &state, const std::string &text);
  void push_error(grpc::StatusCode code, const std::string &message);

  [[nodiscard]] grpc::Status assist(const proto::AssistRequest &request,
                                    std::chrono::milliseconds deadline,
                                    const assistant::ResponseHandler &on_response) override;

  [[nodiscard]] std::vector<proto::AssistRequest> requests() const;
  [[nodiscard]] std::size_t call_count() const;
  [[nodiscard]] int max_concurrent_calls() const;
  [[nodiscard]] std::chrono::milliseconds last_deadline() const;

private:
  mutable std::mutex mutex_;
  std::deque<Turn> script_;
  std::vector<proto::AssistRequest> requests_;
  std::chrono::milliseconds last_deadline_{0};
  int in_flight_ = 0;
  int max_in_flight_ = 0;
};

/// Records everything the router asks of the chat platform.
class FakeChatGateway : public channels::ChatGateway {
public:
  struct SentReply {
    std::int64_t chat_id = 0;
    std::string text;
    std::optional<std::int64_t> reply_to;
  };

  explicit FakeChatGateway(std::string handle = "assistbot") : handle_(std::move(handle)) {}

  [[nodiscard]] std::string bot_handle() const override { return handle_; }
  [[nodiscard]] common::Status send_reply(std::int64_t chat_id, const std::string &text,
                                          std::optional<std::int64_t> reply_to) override;
  [[nodiscard]] common::Result<bool> is_member(std::int64_t chat_id,
                                               std::int64_t user_id) override;
  [[nodiscard]] common::Status leave_chat(std::int64_t chat_id) override;

  void set_member(std::int64_t chat_id, std::int64_t user_id, bool member);
  void fail_membership_lookups(bool fail);
  void fail_sends(bool fail);

  [[nodiscard]] std::vector<SentReply> sent() const;
  [[nodiscard]] std::vector<std::int64_t> left_chats() const;
  [[nodiscard]] std::size_t membership_lookups() const;
  bool wait_for_sent(std::size_t count, std::chrono::milliseconds timeout);

private:
  std::string handle_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<SentReply> sent_;
  std::vector<std::int64_t> left_;
  std::set<std::pair<std::int64_t, std::int64_t>> members_;
  std::size_t lookups_ = 0;
  bool fail_lookups_ = false;
  bool fail_sends_ = false;
};

/// Gateway that can also be started and fed events, standing in for Telegram.
class FakeChatChannel final : public channels::ChatChannel {
public:
  explicit FakeChatChannel(std::shared_ptr<FakeChatGateway> gateway)
      : gateway_(std::move(gateway)) {}

  [[nodiscard]] std::string_view id() const override { return "fake"; }
  [[nodiscard]] common::Status start(const channels::ChannelConfig &config) override;
  void stop() override;
  void on_event(channels::ChatEventCallback callback) override;
  [[nodiscard]] bool health_check() override { return started_; }

  [[nodiscard]] std::string bot_handle() const override { return gateway_->bot_handle(); }
  [[nodiscard]] common::Status send_reply(std::int64_t chat_id, const std::string &text,
                                          std::optional<std::int64_t> reply_to) override {
    return gateway_->send_reply(chat_id, text, reply_to);
  }
  [[nodiscard]] common::Result<bool> is_member(std::int64_t chat_id,
                                               std::int64_t user_id) override {
    return gateway_->is_member(chat_id, user_id);
  }
  [[nodiscard]] common::Status leave_chat(std::int64_t chat_id) override {
    return gateway_->leave_chat(chat_id);
  }

  void emit(const channels::ChatEvent &event);
  void fail_start(std::string error) { start_error_ = std::move(error); }
  [[nodiscard]] const channels::ChannelConfig &last_config() const { return last_config_; }
  [[nodiscard]] bool started() const { return started_; }

private:
  std::shared_ptr<FakeChatGateway> gateway_;
  std::mutex mutex_;
  channels::ChatEventCallback callback_;
  channels::ChannelConfig last_config_;
  std::string start_error_;
  std::atomic<bool> started_{false};
};

/// Queued HTTP responses; unqueued requests get `default_response`.
class MockHttpClient final : public http::HttpClient {
public:
  struct Request {
    std::string url;
    http::HeaderMap headers;
    std::string body;
    std::uint64_t timeout_ms = 0;
  };

  void push_response(std::uint16_t status, std::string body);
  void push_network_error(std::string message);
  void set_default_response(std::uint16_t status, std::string body);

  [[nodiscard]] http::HttpResponse post_json(const std::string &url, const http::HeaderMap &headers,
                                             const std::string &body,
                                             std::uint64_t timeout_ms) override;

  [[nodiscard]] std::vector<Request> requests() const;
  bool wait_for_requests(std::size_t count, std::chrono::milliseconds timeout);

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<http::HttpResponse> responses_;
  http::HttpResponse default_response_{.status = 200, .body = R"({"ok":true,"result":[]})"};
  std::vector<Request> requests_;
};

channels::ChatEvent private_message(std::int64_t user_id, const std::string &text,
                                    std::int64_t message_id = 1);
channels::ChatEvent group_message(std::int64_t chat_id, std::int64_t user_id,
                                  const std::string &text, std::int64_t message_id = 1);

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Points the config loader at `path` for the guard's lifetime.
struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;
};

/// Clears every variable the config loader reads so the host environment
/// cannot leak into a test.
struct CleanEnvironment {
  CleanEnvironment();

  EnvGuard bot_token{"BOT_TOKEN", std::nullopt};
  EnvGuard device_model{"DEVICE_MODEL_ID", std::nullopt};
  EnvGuard device_id{"DEVICE_ID", std::nullopt};
  EnvGuard chats{"ALLOWED_CHAT_IDS", std::nullopt};
  EnvGuard users{"AUTHORIZED_USER_IDS", std::nullopt};
  EnvGuard env_file{"TGASSIST_ENV_FILE", std::nullopt};
  EnvGuard config_path{"TGASSIST_CONFIG_PATH", std::nullopt};
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

} // namespace tgassist::testing
