#pragma once

#include "tgassist/assistant/errors.hpp"
#include "tgassist/assistant/transport.hpp"
#include "tgassist/common/result.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tgassist::assistant {

inline constexpr std::int32_t AUDIO_OUT_SAMPLE_RATE_HZ = 16000;

struct ConversationOptions {
  std::string language_code = "en-US";
  std::string device_model_id;
  std::string device_id;
  std::chrono::milliseconds deadline{std::chrono::seconds(185)};
};

/// Display text of a finished turn; nullopt when the assistant said nothing.
using AskResult = common::Result<std::optional<std::string>, AssistError>;

/// One conversation with the assistant, shared by every chat.
///
/// Each ask() is a full Assist exchange: one request carrying the current
/// conversation state, then the whole response stream is drained. Turns are
/// serialized, so the state a turn sends is always the state the previous turn
/// left behind. A failed turn leaves the state exactly as it was before it.
class ConversationSession {
public:
  ConversationSession(ConversationOptions options, std::shared_ptr<AssistTransport> transport);

  /// Blocks for at most the configured deadline (plus time spent waiting for
  /// an earlier turn). Blank queries fail with ErrorKind::InvalidQuery.
  [[nodiscard]] AskResult ask(const std::string &query);

  [[nodiscard]] std::string conversation_state() const;
  [[nodiscard]] const ConversationOptions &options() const { return options_; }

private:
  [[nodiscard]] proto::AssistRequest build_request(const std::string &query) const;

  const ConversationOptions options_;
  std::shared_ptr<AssistTransport> transport_;

  std::mutex turn_mutex_;
  mutable std::mutex state_mutex_;
  std::string conversation_state_;
};

} // namespace tgassist::assistant
