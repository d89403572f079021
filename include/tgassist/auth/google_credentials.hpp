#pragma once

#include "tgassist/common/result.hpp"
#include "tgassist/http/http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tgassist::auth {

inline constexpr const char *GOOGLE_TOKEN_URI = "https://oauth2.googleapis.com/token";
inline constexpr const char *ASSISTANT_SCOPE = "https://www.googleapis.com/auth/assistant-sdk-prototype";

/// Authorized-user credentials as written by google-oauthlib-tool.
struct GoogleCredentials {
  std::string client_id;
  std::string client_secret;
  std::string refresh_token;
  std::string token_uri = GOOGLE_TOKEN_URI;
  std::vector<std::string> scopes;
  /// Access token cached in the file, if any. Never trusted without an expiry.
  std::string token;
};

struct AccessToken {
  std::string value;
  std::int64_t expires_at = 0; // Unix timestamp (seconds), 0 when unknown
};

[[nodiscard]] common::Result<GoogleCredentials> parse_credentials(const std::string &json);
[[nodiscard]] common::Result<GoogleCredentials>
load_credentials(const std::filesystem::path &path);

/// Exchange the refresh token for a new access token at `credentials.token_uri`.
[[nodiscard]] common::Result<AccessToken>
refresh_access_token(http::HttpClient &http, const GoogleCredentials &credentials,
                     std::int64_t now_unix);

/// Supplies bearer tokens to the assistant channel. Called from gRPC threads.
class TokenSource {
public:
  virtual ~TokenSource() = default;
  [[nodiscard]] virtual common::Result<std::string> access_token() = 0;
};

class RefreshingTokenSource final : public TokenSource {
public:
  using Clock = std::function<std::int64_t()>;

  RefreshingTokenSource(GoogleCredentials credentials, std::shared_ptr<http::HttpClient> http,
                        Clock clock = {});

  /// Cached token unless it expires within the next minute; refreshes otherwise.
  [[nodiscard]] common::Result<std::string> access_token() override;

  /// Unconditional refresh; used at startup to fail fast on bad credentials.
  [[nodiscard]] common::Status refresh();

private:
  [[nodiscard]] common::Status refresh_locked();

  GoogleCredentials credentials_;
  std::shared_ptr<http::HttpClient> http_;
  Clock clock_;
  std::mutex mutex_;
  AccessToken current_;
};

} // namespace tgassist::auth
