// File: src/adapters/drive/drive_uploader.cpp
#include "dw/adapters/drive/drive_uploader.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dw {
namespace {

using json = nlohmann::json;

constexpr const char* kBoundary = "doorwatch_drive_boundary_7f3a";

}  // namespace

Result<std::string> parse_drive_token(const std::string& token_json) {
  const json j = json::parse(token_json, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return Result<std::string>::err(Status::parse_error("drive token file: not a JSON object"));
  }
  for (const char* key : {"token", "access_token"}) {
    const auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
      return Result<std::string>::ok(it->get<std::string>());
    }
  }
  return Result<std::string>::err(Status::parse_error("drive token file: no token"));
}

std::string build_drive_multipart(const std::string& boundary,
                                  const std::string& folder_id,
                                  const std::string& filename,
                                  const std::string& metadata_json,
                                  const std::vector<std::uint8_t>& jpeg) {
  json meta = {
      {"name", filename},
      {"description", metadata_json},
      {"mimeType", "image/jpeg"},
  };
  if (!folder_id.empty()) meta["parents"] = json::array({folder_id});

  std::string body;
  body.reserve(jpeg.size() + metadata_json.size() + 512);
  body += "--" + boundary + "\r\n";
  body += "Content-Type: application/json; charset=UTF-8\r\n\r\n";
  body += meta.dump();
  body += "\r\n--" + boundary + "\r\n";
  body += "Content-Type: image/jpeg\r\n\r\n";
  body.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
  body += "\r\n--" + boundary + "--\r\n";
  return body;
}

Result<std::string> parse_drive_file_id(const std::string& body) {
  const json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object() || !j.contains("id") || !j["id"].is_string()) {
    return Result<std::string>::err(Status::parse_error("drive upload: response has no file id"));
  }
  return Result<std::string>::ok(j["id"].get<std::string>());
}

DriveUploader::DriveUploader(StorageConfig cfg, std::shared_ptr<HttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {}

Result<std::string> DriveUploader::read_token_() const {
  std::ifstream f(cfg_.drive_token_file);
  if (!f.is_open()) {
    return Result<std::string>::err(
        Status::not_found("drive token file not found: " + cfg_.drive_token_file));
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_drive_token(ss.str());
}

Result<std::string> DriveUploader::upload(const std::vector<std::uint8_t>& jpeg,
                                          const std::string& filename,
                                          const std::string& metadata_json) {
  using R = Result<std::string>;
  if (jpeg.empty()) return R::err(Status::invalid_argument("refusing to upload an empty image"));

  auto token = read_token_();
  if (!token.ok()) return R::err(token.status());

  HttpRequest req;
  req.method = "POST";
  req.url = cfg_.drive_upload_url;
  req.headers = {
      "Authorization: Bearer " + token.value(),
      std::string("Content-Type: multipart/related; boundary=") + kBoundary,
  };
  req.body = build_drive_multipart(kBoundary, cfg_.drive_folder_id, filename, metadata_json, jpeg);

  auto resp = http_->perform(req);
  if (!resp.ok()) return R::err(resp.status());
  if (resp->status == 401 || resp->status == 403) {
    return R::err(Status::permission_denied("drive upload: " + describe_http_failure(resp.value())));
  }
  if (!resp->success()) {
    return R::err(Status::unavailable("drive upload: " + describe_http_failure(resp.value())));
  }

  auto id = parse_drive_file_id(resp->body);
  if (!id.ok()) return id;
  spdlog::info("DriveUploader: uploaded {} as {}", filename, id.value());
  return id;
}

}  // namespace dw
