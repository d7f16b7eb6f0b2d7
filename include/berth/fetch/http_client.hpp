#pragma once

#include "berth/common/cancellation.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace berth::fetch {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool cancelled = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool ok() const { return !network_error && status >= 200 && status < 300; }
};

/// Describes a failed response as "<what>: <reason>".
[[nodiscard]] std::string describe_failure(const std::string &what, const HttpResponse &response);

class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms,
                                         const common::CancellationToken &cancel) = 0;

  /// Streams the body into `destination`; `body` stays empty. Redirects are followed.
  [[nodiscard]] virtual HttpResponse download(const std::string &url, const HttpHeaders &headers,
                                              const std::filesystem::path &destination,
                                              std::uint64_t timeout_ms,
                                              const common::CancellationToken &cancel) = 0;
};

class CurlHttpClient final : public IHttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms,
                                 const common::CancellationToken &cancel) override;
  [[nodiscard]] HttpResponse download(const std::string &url, const HttpHeaders &headers,
                                      const std::filesystem::path &destination,
                                      std::uint64_t timeout_ms,
                                      const common::CancellationToken &cancel) override;
};

} // namespace berth::fetch
