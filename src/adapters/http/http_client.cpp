// File: src/adapters/http/http_client.cpp
#include "dw/adapters/http/http_client.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace dw {
namespace {

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

}  // namespace

CurlGlobal::CurlGlobal() {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  ok_ = rc == CURLE_OK;
  if (!ok_) spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
}

CurlGlobal::~CurlGlobal() {
  if (ok_) curl_global_cleanup();
}

bool slist_append(CurlSlist& list, const std::string& line) {
  curl_slist* next = curl_slist_append(list.get(), line.c_str());
  if (!next) return false;
  (void)list.release();
  list.reset(next);
  return true;
}

std::string describe_http_failure(const HttpResponse& resp) {
  constexpr std::size_t kMaxBody = 200;
  std::string body = resp.body.substr(0, kMaxBody);
  if (resp.body.size() > kMaxBody) body += "...";
  return "HTTP " + std::to_string(resp.status) + ": " + body;
}

HttpClient::HttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {}

Result<HttpResponse> HttpClient::perform(const HttpRequest& req) const {
  CurlEasy curl(curl_easy_init());
  if (!curl) return Result<HttpResponse>::err(Status::internal("curl_easy_init failed"));

  CurlSlist headers;
  for (const auto& h : req.headers) {
    if (!slist_append(headers, h)) {
      return Result<HttpResponse>::err(Status::internal("curl_slist_append failed"));
    }
  }

  HttpResponse resp;
  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  // 0 would mean "no timeout" to curl.
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, std::max(1L, static_cast<long>(req.timeout_s * 1000.0)));
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_to_string);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
  if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

  if (req.method == "POST" || req.method == "PUT" || req.method == "PATCH") {
    if (req.method != "POST") curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
  } else if (req.method != "GET") {
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
  }

  const CURLcode rc = curl_easy_perform(h);
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    return Result<HttpResponse>::err(Status::timeout(req.method + " " + req.url + " timed out"));
  }
  if (rc != CURLE_OK) {
    return Result<HttpResponse>::err(
        Status::unavailable(req.method + " " + req.url + ": " + curl_easy_strerror(rc)));
  }

  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
  spdlog::trace("HttpClient: {} {} -> {}", req.method, req.url, resp.status);
  return Result<HttpResponse>::ok(std::move(resp));
}

}  // namespace dw
