#include "tgassist/assistant/request_log.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace tgassist::assistant {

namespace {

constexpr std::size_t FINGERPRINT_BYTES = 6;

std::string quoted(const std::string &text) {
  std::string out = "\"";
  for (const char ch : text) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch == '\n' ? ' ' : ch);
  }
  out.push_back('"');
  return out;
}

} // namespace

std::string state_fingerprint(const std::string &state) {
  if (state.empty()) {
    return "-";
  }
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(state.data()), state.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < FINGERPRINT_BYTES; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  out << std::dec << "/" << state.size() << "B";
  return out.str();
}

std::string describe_request(const proto::AssistRequest &request) {
  std::ostringstream out;
  if (!request.has_config()) {
    out << "AssistRequest{audio_in=" << request.audio_in().size() << "B}";
    return out.str();
  }
  const auto &config = request.config();
  out << "AssistRequest{lang=" << config.dialog_state_in().language_code()
      << " state=" << state_fingerprint(config.dialog_state_in().conversation_state())
      << " device=" << config.device_config().device_id() << "/"
      << config.device_config().device_model_id()
      << " audio_out=" << proto::AudioOutConfig::Encoding_Name(config.audio_out_config().encoding())
      << "@" << config.audio_out_config().sample_rate_hertz();
  if (config.type_case() == proto::AssistConfig::kTextQuery) {
    out << " text=" << quoted(config.text_query());
  }
  out << "}";
  return out.str();
}

std::string describe_response(const proto::AssistResponse &response) {
  std::ostringstream out;
  out << "AssistResponse{";
  bool first = true;
  const auto field = [&out, &first](const char *name) -> std::ostringstream & {
    if (!first) {
      out << " ";
    }
    first = false;
    out << name << "=";
    return out;
  };

  if (response.event_type() != proto::AssistResponse::EVENT_TYPE_UNSPECIFIED) {
    field("event") << proto::AssistResponse::EventType_Name(response.event_type());
  }
  if (response.has_audio_out()) {
    field("audio_out") << response.audio_out().audio_data().size() << "B";
  }
  for (const auto &result : response.speech_results()) {
    field("transcript") << quoted(result.transcript());
  }
  if (response.has_dialog_state_out()) {
    const auto &dialog = response.dialog_state_out();
    if (!dialog.supplemental_display_text().empty()) {
      field("text") << quoted(dialog.supplemental_display_text());
    }
    if (!dialog.conversation_state().empty()) {
      field("state") << state_fingerprint(dialog.conversation_state());
    }
  }
  if (response.has_device_action()) {
    field("device_action") << response.device_action().device_request_json().size() << "B";
  }
  out << "}";
  return out.str();
}

} // namespace tgassist::assistant
