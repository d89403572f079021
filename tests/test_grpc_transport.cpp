#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tgassist/assistant/conversation.hpp"
#include "tgassist/assistant/grpc_transport.hpp"

#include <grpcpp/generic/async_generic_service.h>
#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/support/channel_arguments.h>

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace proto = tgassist::assistant::proto;

/// What the fake Assist endpoint does with one call.
struct ServerTurn {
  std::vector<proto::AssistResponse> responses;
  grpc::Status status = grpc::Status::OK;
  /// Never answer; the call ends when the client gives up.
  bool hang = false;
};

class ScriptedAssistService;

class AssistReactor final : public grpc::ServerGenericBidiReactor {
public:
  AssistReactor(ScriptedAssistService *service, grpc::GenericCallbackServerContext *context,
                ServerTurn turn);

  void OnReadDone(bool ok) override;
  void OnWriteDone(bool ok) override;
  void OnCancel() override;
  void OnDone() override { delete this; }

private:
  void write_next();
  void finish(const grpc::Status &status);

  ScriptedAssistService *service_;
  std::string method_;
  ServerTurn turn_;
  grpc::ByteBuffer request_buffer_;
  std::vector<grpc::ByteBuffer> outgoing_;
  std::size_t next_write_ = 0;

  std::mutex mutex_;
  bool finished_ = false;
};

/// Callback generic service standing in for the Embedded Assistant API.
class ScriptedAssistService final : public grpc::CallbackGenericService {
public:
  void push(ServerTurn turn) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(std::move(turn));
  }

  void record(const std::string &method, const proto::AssistRequest &request) {
    std::lock_guard<std::mutex> lock(mutex_);
    methods_.push_back(method);
    requests_.push_back(request);
  }

  std::vector<std::string> methods() {
    std::lock_guard<std::mutex> lock(mutex_);
    return methods_;
  }

  std::vector<proto::AssistRequest> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  grpc::ServerGenericBidiReactor *
  CreateReactor(grpc::GenericCallbackServerContext *context) override {
    ServerTurn turn;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!script_.empty()) {
        turn = std::move(script_.front());
        script_.pop_front();
      }
    }
    return new AssistReactor(this, context, std::move(turn));
  }

private:
  std::mutex mutex_;
  std::deque<ServerTurn> script_;
  std::vector<std::string> methods_;
  std::vector<proto::AssistRequest> requests_;
};

AssistReactor::AssistReactor(ScriptedAssistService *service,
                             grpc::GenericCallbackServerContext *context, ServerTurn turn)
    : service_(service), method_(context->method()), turn_(std::move(turn)) {
  StartRead(&request_buffer_);
}

void AssistReactor::OnReadDone(const bool ok) {
  if (!ok) {
    finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "no AssistRequest received"));
    return;
  }
  proto::AssistRequest request;
  if (!grpc::SerializationTraits<proto::AssistRequest>::Deserialize(&request_buffer_, &request)
           .ok()) {
    finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "unparseable AssistRequest"));
    return;
  }
  service_->record(method_, request);

  if (turn_.hang) {
    return;
  }
  for (const auto &response : turn_.responses) {
    grpc::ByteBuffer buffer;
    bool own_buffer = false;
    (void)grpc::SerializationTraits<proto::AssistResponse>::Serialize(response, &buffer,
                                                                      &own_buffer);
    outgoing_.push_back(std::move(buffer));
  }
  write_next();
}

void AssistReactor::write_next() {
  if (next_write_ >= outgoing_.size()) {
    finish(turn_.status);
    return;
  }
  StartWrite(&outgoing_[next_write_++]);
}

void AssistReactor::OnWriteDone(const bool ok) {
  if (!ok) {
    finish(grpc::Status(grpc::StatusCode::CANCELLED, "write failed"));
    return;
  }
  write_next();
}

void AssistReactor::OnCancel() {
  if (turn_.hang) {
    finish(grpc::Status::CANCELLED);
  }
}

void AssistReactor::finish(const grpc::Status &status) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      return;
    }
    finished_ = true;
  }
  Finish(status);
}

/// In-process server; no ports are opened.
struct AssistServerFixture {
  ScriptedAssistService service;
  std::unique_ptr<grpc::Server> server;
  std::shared_ptr<grpc::Channel> channel;

  AssistServerFixture() {
    grpc::ServerBuilder builder;
    builder.RegisterCallbackGenericService(&service);
    server = builder.BuildAndStart();
    if (!server) {
      throw std::runtime_error("in-process gRPC server failed to start");
    }
    channel = server->InProcessChannel(grpc::ChannelArguments());
  }

  ~AssistServerFixture() {
    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  }

  AssistServerFixture(const AssistServerFixture &) = delete;
  AssistServerFixture &operator=(const AssistServerFixture &) = delete;
};

tgassist::assistant::ConversationOptions wire_options(std::chrono::milliseconds deadline) {
  tgassist::assistant::ConversationOptions options;
  options.device_model_id = "wire-model";
  options.device_id = "wire-device";
  options.deadline = deadline;
  return options;
}

} // namespace

void register_grpc_transport_tests(std::vector<tgassist::tests::TestCase> &tests) {
  using tgassist::tests::require;
  namespace assistant = tgassist::assistant;
  namespace t = tgassist::testing;

  tests.push_back({"grpc_transport_calls_assist_method", [] {
                     AssistServerFixture fixture;
                     fixture.service.push({.responses = {t::make_response("W1", "hi")}});
                     assistant::GrpcAssistTransport transport(fixture.channel);

                     proto::AssistRequest request;
                     request.mutable_config()->set_text_query("ping");
                     std::vector<proto::AssistResponse> received;
                     const auto status = transport.assist(
                         request, std::chrono::seconds(5),
                         [&received](const proto::AssistResponse &r) { received.push_back(r); });

                     require(status.ok(), "call should succeed: " + status.error_message());
                     const auto methods = fixture.service.methods();
                     require(methods.size() == 1 && methods[0] == assistant::ASSIST_METHOD,
                             "unexpected method path");
                     require(fixture.service.requests()[0].config().text_query() == "ping",
                             "request should arrive intact");
                     require(received.size() == 1 &&
                                 received[0].dialog_state_out().supplemental_display_text() == "hi",
                             "response should arrive intact");
                   }});

  tests.push_back({"grpc_transport_threads_state_over_the_wire", [] {
                     AssistServerFixture fixture;
                     fixture.service.push({.responses = {t::make_response("WIRE-A", "first")}});
                     fixture.service.push({.responses = {t::make_response("WIRE-B", "second")}});
                     auto transport = std::make_shared<assistant::GrpcAssistTransport>(fixture.channel);
                     assistant::ConversationSession session(wire_options(std::chrono::seconds(5)),
                                                            transport);

                     auto first = session.ask("one");
                     require(first.ok(), first.ok() ? "" : first.error().to_string());
                     auto second = session.ask("two");
                     require(second.ok() && second.value() == std::optional<std::string>("second"),
                             "second reply mismatch");

                     const auto requests = fixture.service.requests();
                     require(requests.size() == 2, "two calls expected");
                     require(requests[0].config().dialog_state_in().conversation_state().empty(),
                             "first call has no state");
                     require(requests[1].config().dialog_state_in().conversation_state() == "WIRE-A",
                             "second call carries the first call's state");
                     require(requests[1].config().device_config().device_id() == "wire-device",
                             "device id should be sent");
                   }});

  tests.push_back({"grpc_transport_drains_multiple_responses", [] {
                     AssistServerFixture fixture;
                     fixture.service.push({.responses = {t::make_response(""),
                                                         t::make_response("", "display"),
                                                         t::make_response("LAST")}});
                     auto transport = std::make_shared<assistant::GrpcAssistTransport>(fixture.channel);
                     assistant::ConversationSession session(wire_options(std::chrono::seconds(5)),
                                                            transport);

                     auto reply = session.ask("many");
                     require(reply.ok(), reply.ok() ? "" : reply.error().to_string());
                     require(reply.value() == std::optional<std::string>("display"),
                             "display text mismatch");
                     require(session.conversation_state() == "LAST",
                             "state from the final message expected");
                   }});

  tests.push_back({"grpc_transport_remote_error_is_remote_service", [] {
                     AssistServerFixture fixture;
                     fixture.service.push({.responses = {t::make_response("GOOD")}});
                     fixture.service.push(
                         {.responses = {t::make_response("BAD", "partial")},
                          .status = grpc::Status(grpc::StatusCode::INTERNAL, "assistant broke")});
                     auto transport = std::make_shared<assistant::GrpcAssistTransport>(fixture.channel);
                     assistant::ConversationSession session(wire_options(std::chrono::seconds(5)),
                                                            transport);

                     require(session.ask("one").ok(), "first call should succeed");
                     auto failed = session.ask("two");
                     require(!failed.ok(), "second call should fail");
                     require(failed.error().kind == assistant::ErrorKind::RemoteService,
                             "kind should be RemoteService");
                     require(failed.error().message == "assistant broke", "message mismatch");
                     require(session.conversation_state() == "GOOD", "state must be untouched");
                   }});

  tests.push_back({"grpc_transport_deadline_cancels_hung_call", [] {
                     AssistServerFixture fixture;
                     fixture.service.push({.hang = true});
                     auto transport = std::make_shared<assistant::GrpcAssistTransport>(fixture.channel);
                     assistant::ConversationSession session(
                         wire_options(std::chrono::milliseconds(200)), transport);

                     const auto started = std::chrono::steady_clock::now();
                     auto failed = session.ask("are you there");
                     const auto elapsed = std::chrono::steady_clock::now() - started;

                     require(!failed.ok(), "hung call should fail");
                     require(failed.error().kind == assistant::ErrorKind::DeadlineExceeded,
                             "kind should be DeadlineExceeded, got " + failed.error().to_string());
                     require(elapsed < std::chrono::seconds(5), "deadline should bound the call");
                     require(session.conversation_state().empty(), "state must stay empty");
                   }});
}
