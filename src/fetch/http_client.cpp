#include "berth/fetch/http_client.hpp"

#include "berth/common/fs.hpp"

#include <curl/curl.h>

#include <cstdio>

namespace berth::fetch {

namespace {

constexpr const char *USER_AGENT = "berth/0.1";

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t file_write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *file = static_cast<std::FILE *>(userdata);
  return std::fwrite(ptr, size, nmemb, file) * size;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *cancel = static_cast<const common::CancellationToken *>(userdata);
  return cancel->cancelled() ? 1 : 0;
}

HttpResponse execute_request(const std::string &url, const HttpHeaders &headers,
                             std::FILE *sink, const std::uint64_t timeout_ms,
                             const common::CancellationToken &cancel) {
  HttpResponse response;
  if (cancel.cancelled()) {
    response.cancelled = true;
    response.network_error = true;
    response.network_error_message = "cancelled";
    return response;
  }

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);
  if (sink != nullptr) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, sink);
  } else {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.cancelled = code == CURLE_ABORTED_BY_CALLBACK;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

std::string describe_failure(const std::string &what, const HttpResponse &response) {
  if (response.cancelled) {
    return what + ": cancelled";
  }
  if (response.timeout) {
    return what + ": timed out";
  }
  if (response.network_error) {
    return what + ": " + response.network_error_message;
  }
  std::string message = what + ": HTTP " + std::to_string(response.status);
  const std::string body = common::trim(response.body);
  if (!body.empty()) {
    message += " " + body.substr(0, 200);
  }
  return message;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms,
                                 const common::CancellationToken &cancel) {
  return execute_request(url, headers, nullptr, timeout_ms, cancel);
}

HttpResponse CurlHttpClient::download(const std::string &url, const HttpHeaders &headers,
                                      const std::filesystem::path &destination,
                                      const std::uint64_t timeout_ms,
                                      const common::CancellationToken &cancel) {
  std::FILE *file = std::fopen(destination.c_str(), "wb");
  if (file == nullptr) {
    HttpResponse response;
    response.network_error = true;
    response.network_error_message = "cannot open " + destination.string() + " for writing";
    return response;
  }

  HttpResponse response = execute_request(url, headers, file, timeout_ms, cancel);
  if (std::fclose(file) != 0 && !response.network_error) {
    response.network_error = true;
    response.network_error_message = "failed to flush " + destination.string();
  }
  return response;
}

} // namespace berth::fetch
