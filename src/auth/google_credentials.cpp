#include "tgassist/auth/google_credentials.hpp"

#include "tgassist/common/json_util.hpp"
#include "tgassist/common/strings.hpp"

#include <chrono>
#include <fstream>
#include <sstream>

namespace tgassist::auth {

namespace {

constexpr std::uint64_t HTTP_TIMEOUT_MS = 30000;
constexpr std::int64_t EXPIRY_BUFFER_SECS = 60; // refresh 60s before actual expiry

std::int64_t system_now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string describe_token_error(const http::HttpResponse &response) {
  const auto fields = common::json_parse_flat(response.body);
  std::string message = "HTTP " + std::to_string(response.status);
  if (const auto it = fields.find("error"); it != fields.end()) {
    message += " " + it->second;
  }
  if (const auto it = fields.find("error_description"); it != fields.end()) {
    message += ": " + it->second;
  }
  return message;
}

} // namespace

common::Result<GoogleCredentials> parse_credentials(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  if (fields.empty()) {
    return common::Result<GoogleCredentials>::failure("credentials are not a JSON object");
  }

  GoogleCredentials credentials;
  const auto read = [&fields](const char *key) -> std::string {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };
  credentials.client_id = read("client_id");
  credentials.client_secret = read("client_secret");
  credentials.refresh_token = read("refresh_token");
  credentials.token = read("token");
  if (const std::string uri = read("token_uri"); !uri.empty()) {
    credentials.token_uri = uri;
  }
  if (const auto it = fields.find("scopes"); it != fields.end()) {
    credentials.scopes = common::json_split_string_array(it->second);
  }

  if (credentials.refresh_token.empty()) {
    return common::Result<GoogleCredentials>::failure("credentials have no refresh_token");
  }
  if (credentials.client_id.empty() || credentials.client_secret.empty()) {
    return common::Result<GoogleCredentials>::failure(
        "credentials need client_id and client_secret");
  }
  return common::Result<GoogleCredentials>::success(std::move(credentials));
}

common::Result<GoogleCredentials> load_credentials(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<GoogleCredentials>::failure(
        "unable to open credentials file " + path.string() +
        " (create it with google-oauthlib-tool --save)");
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_credentials(buffer.str());
  if (!parsed.ok()) {
    return common::Result<GoogleCredentials>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Result<AccessToken> refresh_access_token(http::HttpClient &http,
                                                 const GoogleCredentials &credentials,
                                                 const std::int64_t now_unix) {
  std::string body = "grant_type=refresh_token";
  body += "&refresh_token=" + http::url_encode_component(credentials.refresh_token);
  body += "&client_id=" + http::url_encode_component(credentials.client_id);
  body += "&client_secret=" + http::url_encode_component(credentials.client_secret);

  const http::HeaderMap headers = {
      {"Content-Type", "application/x-www-form-urlencoded"},
  };
  auto response = http.post_json(credentials.token_uri, headers, body, HTTP_TIMEOUT_MS);

  if (response.network_error) {
    return common::Result<AccessToken>::failure("network error refreshing token: " +
                                                response.network_error_message);
  }
  if (response.status != 200) {
    return common::Result<AccessToken>::failure("token refresh failed (" +
                                                describe_token_error(response) + ")");
  }

  const auto fields = common::json_parse_flat(response.body);
  const auto field = [&fields](const char *key) -> std::string {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };

  AccessToken token;
  token.value = field("access_token");
  if (token.value.empty()) {
    return common::Result<AccessToken>::failure("refresh returned no access_token");
  }

  if (auto expires_in = common::parse_i64(field("expires_in"));
      expires_in.ok() && expires_in.value() > 0) {
    token.expires_at = now_unix + expires_in.value();
  }
  return common::Result<AccessToken>::success(std::move(token));
}

RefreshingTokenSource::RefreshingTokenSource(GoogleCredentials credentials,
                                             std::shared_ptr<http::HttpClient> http, Clock clock)
    : credentials_(std::move(credentials)), http_(std::move(http)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = system_now_unix;
  }
}

common::Result<std::string> RefreshingTokenSource::access_token() {
  std::lock_guard<std::mutex> lock(mutex_);

  // A token without a known expiry is treated as stale.
  const bool fresh = !current_.value.empty() && current_.expires_at > 0 &&
                     clock_() < current_.expires_at - EXPIRY_BUFFER_SECS;
  if (!fresh) {
    if (auto status = refresh_locked(); !status.ok()) {
      return common::Result<std::string>::failure(status.error());
    }
  }
  return common::Result<std::string>::success(current_.value);
}

common::Status RefreshingTokenSource::refresh() {
  std::lock_guard<std::mutex> lock(mutex_);
  return refresh_locked();
}

common::Status RefreshingTokenSource::refresh_locked() {
  if (!http_) {
    return common::Status::error("no HTTP client for token refresh");
  }
  auto refreshed = refresh_access_token(*http_, credentials_, clock_());
  if (!refreshed.ok()) {
    return common::Status::error(refreshed.error());
  }
  current_ = std::move(refreshed.value());
  return common::Status::success();
}

} // namespace tgassist::auth
