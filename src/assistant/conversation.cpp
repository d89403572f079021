#include "tgassist/assistant/conversation.hpp"

#include "tgassist/common/strings.hpp"

namespace tgassist::assistant {

ConversationSession::ConversationSession(ConversationOptions options,
                                         std::shared_ptr<AssistTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {}

proto::AssistRequest ConversationSession::build_request(const std::string &query) const {
  proto::AssistRequest request;
  auto *config = request.mutable_config();

  // Audio is requested because the API insists on an output format; it is
  // never played back, hence zero volume.
  auto *audio_out = config->mutable_audio_out_config();
  audio_out->set_encoding(proto::AudioOutConfig::LINEAR16);
  audio_out->set_sample_rate_hertz(AUDIO_OUT_SAMPLE_RATE_HZ);
  audio_out->set_volume_percentage(0);

  auto *dialog = config->mutable_dialog_state_in();
  dialog->set_language_code(options_.language_code);
  dialog->set_conversation_state(conversation_state());

  auto *device = config->mutable_device_config();
  device->set_device_id(options_.device_id);
  device->set_device_model_id(options_.device_model_id);

  config->set_text_query(query);
  return request;
}

AskResult ConversationSession::ask(const std::string &query) {
  if (common::trim(query).empty()) {
    return AskResult::failure(AssistError{.kind = ErrorKind::InvalidQuery,
                                          .message = "query text is empty",
                                          .grpc_code = grpc::StatusCode::INVALID_ARGUMENT});
  }
  if (!transport_) {
    return AskResult::failure(AssistError{.kind = ErrorKind::Transport,
                                          .message = "no transport configured",
                                          .grpc_code = grpc::StatusCode::UNAVAILABLE});
  }

  std::lock_guard<std::mutex> turn(turn_mutex_);
  const proto::AssistRequest request = build_request(query);

  std::string latest_state;
  std::optional<std::string> display_text;
  const auto fold = [&latest_state, &display_text](const proto::AssistResponse &response) {
    const auto &dialog = response.dialog_state_out();
    if (!dialog.conversation_state().empty()) {
      latest_state = dialog.conversation_state();
    }
    if (!dialog.supplemental_display_text().empty()) {
      display_text = dialog.supplemental_display_text();
    }
  };
  const grpc::Status status = transport_->assist(request, options_.deadline, fold);

  if (!status.ok()) {
    return AskResult::failure(classify_status(status));
  }

  if (!latest_state.empty()) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    conversation_state_ = std::move(latest_state);
  }
  return AskResult::success(std::move(display_text));
}

std::string ConversationSession::conversation_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return conversation_state_;
}

} // namespace tgassist::assistant
