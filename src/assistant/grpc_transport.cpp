#include "tgassist/assistant/grpc_transport.hpp"

#include "tgassist/assistant/request_log.hpp"
#include "tgassist/observability/global.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/client_callback.h>

#include <condition_variable>
#include <map>
#include <mutex>

namespace tgassist::assistant {

namespace {

using AssistStub = grpc::TemplatedGenericStub<proto::AssistRequest, proto::AssistResponse>;

/// A single Assist call. Lives on the caller's stack; run() does not return
/// before OnDone, so gRPC never touches it afterwards.
class AssistCall final
    : public grpc::ClientBidiReactor<proto::AssistRequest, proto::AssistResponse> {
public:
  AssistCall(const proto::AssistRequest &request, const ResponseHandler &on_response)
      : request_(request), on_response_(on_response) {}

  grpc::Status run(AssistStub &stub, const std::chrono::milliseconds deadline) {
    context_.set_deadline(std::chrono::system_clock::now() + deadline);
    stub.PrepareBidiStreamingCall(&context_, ASSIST_METHOD, grpc::StubOptions(), this);
    StartWriteLast(&request_, grpc::WriteOptions());
    StartRead(&response_);
    StartCall();

    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return done_; });
    return status_;
  }

  void OnReadDone(const bool ok) override {
    if (!ok) {
      // End of stream or a failed call; OnDone reports which.
      return;
    }
    if (observability::trace_enabled()) {
      observability::record_trace("assistant", describe_response(response_));
    }
    on_response_(response_);
    response_.Clear();
    StartRead(&response_);
  }

  void OnDone(const grpc::Status &status) override {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
    done_ = true;
    done_cv_.notify_one();
  }

private:
  grpc::ClientContext context_;
  const proto::AssistRequest &request_;
  const ResponseHandler &on_response_;
  proto::AssistResponse response_;

  std::mutex mutex_;
  std::condition_variable done_cv_;
  bool done_ = false;
  grpc::Status status_;
};

class BearerTokenPlugin final : public grpc::MetadataCredentialsPlugin {
public:
  explicit BearerTokenPlugin(std::shared_ptr<auth::TokenSource> tokens)
      : tokens_(std::move(tokens)) {}

  bool IsBlocking() const override { return true; }
  const char *GetType() const override { return "tgassist.oauth2"; }

  grpc::Status GetMetadata(grpc::string_ref, grpc::string_ref, const grpc::AuthContext &,
                           std::multimap<std::string, std::string> *metadata) override {
    auto token = tokens_->access_token();
    if (!token.ok()) {
      return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                          "unable to obtain access token: " + token.error());
    }
    metadata->insert(std::make_pair("authorization", "Bearer " + token.value()));
    return grpc::Status::OK;
  }

private:
  std::shared_ptr<auth::TokenSource> tokens_;
};

} // namespace

GrpcAssistTransport::GrpcAssistTransport(std::shared_ptr<grpc::Channel> channel)
    : channel_(std::move(channel)), stub_(channel_) {}

grpc::Status GrpcAssistTransport::assist(const proto::AssistRequest &request,
                                         const std::chrono::milliseconds deadline,
                                         const ResponseHandler &on_response) {
  if (observability::trace_enabled()) {
    observability::record_trace("assistant", describe_request(request));
  }
  AssistCall call(request, on_response);
  return call.run(stub_, deadline);
}

std::shared_ptr<grpc::Channel>
create_authorized_channel(const std::string &endpoint,
                          std::shared_ptr<auth::TokenSource> tokens) {
  auto call_credentials =
      grpc::MetadataCredentialsFromPlugin(std::make_unique<BearerTokenPlugin>(std::move(tokens)));
  auto channel_credentials = grpc::CompositeChannelCredentials(
      grpc::SslCredentials(grpc::SslCredentialsOptions()), call_credentials);
  return grpc::CreateChannel(endpoint, channel_credentials);
}

} // namespace tgassist::assistant
