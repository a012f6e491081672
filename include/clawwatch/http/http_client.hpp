#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace clawwatch::http {

using Headers = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool responded() const { return !network_error && status != 0; }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post(const std::string &url, const Headers &headers,
                                          const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post(const std::string &url, const Headers &headers,
                                  const std::string &body, std::uint64_t timeout_ms) override;
};

} // namespace clawwatch::http
