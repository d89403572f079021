#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace tgassist::http {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// POST `body` as-is; the caller sets Content-Type in `headers`.
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
};

/// Percent-encode for application/x-www-form-urlencoded bodies.
[[nodiscard]] std::string url_encode_component(const std::string &value);

} // namespace tgassist::http
