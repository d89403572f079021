#pragma once

#include "google/assistant/embedded/v1alpha2/embedded_assistant.pb.h"

#include <grpcpp/support/status.h>

#include <chrono>
#include <functional>

namespace tgassist::assistant {

namespace proto = google::assistant::embedded::v1alpha2;

using ResponseHandler = std::function<void(const proto::AssistResponse &)>;

/// One Assist exchange: send `request` as the only outbound message, half-close,
/// and call `on_response` for every inbound message until the stream ends.
/// Returns the final call status; the call is cancelled once `deadline` elapses.
class AssistTransport {
public:
  virtual ~AssistTransport() = default;

  [[nodiscard]] virtual grpc::Status assist(const proto::AssistRequest &request,
                                            std::chrono::milliseconds deadline,
                                            const ResponseHandler &on_response) = 0;
};

} // namespace tgassist::assistant
