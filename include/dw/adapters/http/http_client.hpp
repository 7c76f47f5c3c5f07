// File: include/dw/adapters/http/http_client.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "dw/core/status.hpp"

namespace dw {

// Process-wide libcurl init/cleanup. Construct once in main before any client is used.
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;

  [[nodiscard]] bool ok() const noexcept { return ok_; }

 private:
  bool ok_{false};
};

struct CurlEasyDeleter {
  void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Appends to an owned list; returns false if libcurl could not allocate.
bool slist_append(CurlSlist& list, const std::string& line);

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::string> headers;  // "Name: value"
  std::string body;
  double timeout_s = 30.0;
};

struct HttpResponse {
  long status = 0;
  std::string body;

  [[nodiscard]] bool success() const noexcept { return status >= 200 && status < 300; }
};

// Blocking one-shot HTTP over libcurl. Each call uses its own easy handle, so one client may be
// shared between threads.
//
// Transport failures map to kTimeout (operation timed out) or kUnavailable; an HTTP status
// outside 2xx is NOT an error here, callers inspect HttpResponse::status.
class HttpClient {
 public:
  explicit HttpClient(std::string user_agent);

  Result<HttpResponse> perform(const HttpRequest& req) const;

  const std::string& user_agent() const { return user_agent_; }

 private:
  std::string user_agent_;
};

// "HTTP 401: <first 200 bytes of body>"
std::string describe_http_failure(const HttpResponse& resp);

}  // namespace dw
