#pragma once

#include "tgassist/assistant/transport.hpp"
#include "tgassist/auth/google_credentials.hpp"

#include <grpcpp/channel.h>
#include <grpcpp/generic/generic_stub.h>

#include <memory>
#include <string>

namespace tgassist::assistant {

inline constexpr const char *ASSIST_METHOD =
    "/google.assistant.embedded.v1alpha2.EmbeddedAssistant/Assist";

/// Runs Assist over a shared channel using the callback bidi-streaming API.
/// Safe to call from several threads; each call gets its own context.
class GrpcAssistTransport final : public AssistTransport {
public:
  explicit GrpcAssistTransport(std::shared_ptr<grpc::Channel> channel);

  [[nodiscard]] grpc::Status assist(const proto::AssistRequest &request,
                                    std::chrono::milliseconds deadline,
                                    const ResponseHandler &on_response) override;

private:
  std::shared_ptr<grpc::Channel> channel_;
  grpc::TemplatedGenericStub<proto::AssistRequest, proto::AssistResponse> stub_;
};

/// TLS channel to `endpoint` that attaches "authorization: Bearer <token>" to
/// every call, refreshing through `tokens` as needed. A token failure fails the
/// call with UNAVAILABLE.
[[nodiscard]] std::shared_ptr<grpc::Channel>
create_authorized_channel(const std::string &endpoint,
                          std::shared_ptr<auth::TokenSource> tokens);

} // namespace tgassist::assistant
