#include "tgassist/runtime/app.hpp"

#include "tgassist/assistant/grpc_transport.hpp"
#include "tgassist/auth/google_credentials.hpp"
#include "tgassist/config/config.hpp"
#include "tgassist/http/http_client.hpp"
#include "tgassist/observability/global.hpp"
#include "tgassist/router/authorization.hpp"

#include <iostream>

namespace tgassist::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::shared_ptr<assistant::AssistTransport>>
RuntimeContext::create_assist_transport() const {
  using TransportResult = common::Result<std::shared_ptr<assistant::AssistTransport>>;

  auto credentials = auth::load_credentials(config_.assistant.credentials_path);
  if (!credentials.ok()) {
    return TransportResult::failure(credentials.error());
  }

  auto tokens = std::make_shared<auth::RefreshingTokenSource>(
      std::move(credentials.value()), std::make_shared<http::CurlHttpClient>());
  if (auto refreshed = tokens->refresh(); !refreshed.ok()) {
    return TransportResult::failure("cannot obtain Google access token: " + refreshed.error());
  }

  auto channel = assistant::create_authorized_channel(config_.assistant.api_endpoint, tokens);
  if (channel == nullptr) {
    return TransportResult::failure("failed to create channel to " +
                                    config_.assistant.api_endpoint);
  }
  std::cerr << "[runtime] connecting to " << config_.assistant.api_endpoint << "\n";
  return TransportResult::success(
      std::make_shared<assistant::GrpcAssistTransport>(std::move(channel)));
}

std::shared_ptr<assistant::ConversationSession>
RuntimeContext::create_session(std::shared_ptr<assistant::AssistTransport> transport) const {
  return std::make_shared<assistant::ConversationSession>(conversation_options(config_),
                                                          std::move(transport));
}

assistant::ConversationOptions conversation_options(const config::Config &config) {
  assistant::ConversationOptions options;
  options.language_code = config.assistant.language_code;
  options.device_model_id = config.assistant.device_model_id;
  options.device_id = config.assistant.device_id;
  options.deadline = std::chrono::seconds(config.assistant.deadline_seconds);
  return options;
}

channels::ChannelConfig telegram_channel_config(const config::Config &config) {
  channels::ChannelConfig channel_config;
  channel_config.id = "telegram";
  channel_config.settings["bot_token"] = config.telegram.bot_token;
  channel_config.settings["api_base"] = config.telegram.api_base;
  channel_config.settings["poll_timeout_seconds"] =
      std::to_string(config.telegram.poll_timeout_seconds);
  channel_config.settings["idle_sleep_ms"] = std::to_string(config.telegram.idle_sleep_ms);
  return channel_config;
}

BotService::BotService(config::Config config, std::shared_ptr<assistant::AssistTransport> transport,
                       std::shared_ptr<channels::ChatChannel> channel)
    : config_(std::move(config)), transport_(std::move(transport)), channel_(std::move(channel)) {}

BotService::~BotService() { stop(); }

common::Status BotService::start() {
  if (running_) {
    return common::Status::error("bot already running");
  }
  if (transport_ == nullptr || channel_ == nullptr) {
    return common::Status::error("bot requires an assistant transport and a chat channel");
  }

  session_ = RuntimeContext(config_).create_session(transport_);
  router_ = std::make_shared<router::MessageRouter>(
      router::RouterOptions::from_config(config_.router), session_,
      router::StaticAuthorizationPolicy::from_config(config_.telegram), channel_);

  auto routing = router_;
  dispatcher_ = std::make_unique<channels::UpdateDispatcher>(
      config_.router.dispatch_workers,
      [routing](const channels::ChatEvent &event) { (void)routing->handle(event); });
  dispatcher_->start();

  channels::UpdateDispatcher *dispatcher = dispatcher_.get();
  channel_->on_event([dispatcher](const channels::ChatEvent &event) {
    if (!dispatcher->submit(event)) {
      std::cerr << "[runtime] dropped update " << event.update_id << " during shutdown\n";
    }
  });

  if (auto started = channel_->start(telegram_channel_config(config_)); !started.ok()) {
    dispatcher_->stop();
    observability::record_error("runtime", "channel start failed: " + started.error());
    return started;
  }

  running_ = true;
  std::cerr << "[runtime] bot @" << channel_->bot_handle() << " running with "
            << config_.router.dispatch_workers << " workers\n";
  return common::Status::success();
}

void BotService::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  channel_->stop();
  if (dispatcher_ != nullptr) {
    dispatcher_->stop();
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  std::cerr << "[runtime] bot stopped\n";
}

bool BotService::is_running() const { return running_; }

} // namespace tgassist::runtime
