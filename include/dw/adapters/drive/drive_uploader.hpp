// File: include/dw/adapters/drive/drive_uploader.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "dw/adapters/http/http_client.hpp"
#include "dw/core/config.hpp"
#include "dw/core/sinks/image_sink.hpp"

namespace dw {

// Bearer token from the OAuth token file ("token" or "access_token").
Result<std::string> parse_drive_token(const std::string& token_json);

// multipart/related body for a Drive v3 multipart upload: JSON metadata part, then the JPEG.
std::string build_drive_multipart(const std::string& boundary,
                                  const std::string& folder_id,
                                  const std::string& filename,
                                  const std::string& metadata_json,
                                  const std::vector<std::uint8_t>& jpeg);

// "id" from the upload response.
Result<std::string> parse_drive_file_id(const std::string& body);

// Uploads flagged stills into one Drive folder. The token is re-read on every upload so an
// external refresher can rotate it while the service runs.
class DriveUploader final : public ImageUploader {
 public:
  DriveUploader(StorageConfig cfg, std::shared_ptr<HttpClient> http);

  Result<std::string> upload(const std::vector<std::uint8_t>& jpeg,
                             const std::string& filename,
                             const std::string& metadata_json) override;

 private:
  Result<std::string> read_token_() const;

  StorageConfig cfg_;
  std::shared_ptr<HttpClient> http_;
};

}  // namespace dw
