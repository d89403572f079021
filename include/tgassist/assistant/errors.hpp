#pragma once

#include <grpcpp/support/status.h>

#include <string>

namespace tgassist::assistant {

enum class ErrorKind {
  InvalidQuery,
  Transport,
  DeadlineExceeded,
  RemoteService,
};

/// Why a turn failed. The session is still usable after any of these.
struct AssistError {
  ErrorKind kind = ErrorKind::RemoteService;
  std::string message;
  grpc::StatusCode grpc_code = grpc::StatusCode::UNKNOWN;

  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] const char *error_kind_name(ErrorKind kind);

/// Map a finished call's status onto the turn failure taxonomy. `status` must
/// not be OK.
[[nodiscard]] AssistError classify_status(const grpc::Status &status);

} // namespace tgassist::assistant
