#pragma once

#include "tgassist/assistant/transport.hpp"

#include <string>

namespace tgassist::assistant {

/// Short, stable fingerprint of an opaque conversation state ("-" when empty).
/// The raw token is never logged.
[[nodiscard]] std::string state_fingerprint(const std::string &state);

/// One-line descriptions for debug traces. Audio payloads are omitted.
[[nodiscard]] std::string describe_request(const proto::AssistRequest &request);
[[nodiscard]] std::string describe_response(const proto::AssistResponse &response);

} // namespace tgassist::assistant
