// File: include/dw/core/sinks/image_sink.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dw/core/io/frame.hpp"
#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Remote storage for flagged stills. Best-effort; only wired up when a destination is
// configured. Returns the remote file id.
class ImageUploader {
 public:
  virtual ~ImageUploader() = default;

  virtual Result<std::string> upload(const std::vector<std::uint8_t>& jpeg,
                                     const std::string& filename,
                                     const std::string& metadata_json) = 0;
};

// Hands every captured still to an outside automation (webhook) before classification.
class FrameForwarder {
 public:
  virtual ~FrameForwarder() = default;

  virtual Status forward(const Device& device, const Frame& frame) = 0;
};

// Durable local fallback: <dir>/<filename> plus <dir>/<filename>.json with the metadata.
class LocalImageStore {
 public:
  explicit LocalImageStore(std::string dir);

  // Returns the image path.
  Result<std::string> save_local(const std::vector<std::uint8_t>& jpeg,
                                 const std::string& filename,
                                 const std::string& metadata_json);

  const std::string& dir() const { return dir_; }

 private:
  std::string dir_;
};

}  // namespace dw
