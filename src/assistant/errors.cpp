#include "tgassist/assistant/errors.hpp"

#include <sstream>

namespace tgassist::assistant {

const char *error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidQuery:
    return "invalid_query";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::DeadlineExceeded:
    return "deadline_exceeded";
  case ErrorKind::RemoteService:
    return "remote_service";
  }
  return "unknown";
}

std::string AssistError::to_string() const {
  std::ostringstream stream;
  stream << "Assist error [" << error_kind_name(kind) << "]";
  if (kind != ErrorKind::InvalidQuery) {
    stream << " grpc=" << static_cast<int>(grpc_code);
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

AssistError classify_status(const grpc::Status &status) {
  AssistError error;
  error.grpc_code = status.error_code();
  error.message = status.error_message();

  switch (status.error_code()) {
  case grpc::StatusCode::DEADLINE_EXCEEDED:
    error.kind = ErrorKind::DeadlineExceeded;
    break;
  case grpc::StatusCode::UNAVAILABLE:
  case grpc::StatusCode::CANCELLED:
    // Connection refused, TLS handshake failures and dropped streams all
    // surface as UNAVAILABLE; CANCELLED means the channel tore the call down.
    error.kind = ErrorKind::Transport;
    break;
  default:
    error.kind = ErrorKind::RemoteService;
    break;
  }
  return error;
}

} // namespace tgassist::assistant
