// File: src/core/sinks/local_image_store.cpp
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "dw/core/sinks/image_sink.hpp"

namespace dw {
namespace {

Status write_file(const std::filesystem::path& path, const char* data, std::size_t n) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) return Status::io_error("failed opening '" + path.string() + "'");
  f.write(data, static_cast<std::streamsize>(n));
  f.flush();
  if (!f.good()) return Status::io_error("failed writing '" + path.string() + "'");
  return Status::ok_status();
}

}  // namespace

LocalImageStore::LocalImageStore(std::string dir) : dir_(std::move(dir)) {}

Result<std::string> LocalImageStore::save_local(const std::vector<std::uint8_t>& jpeg,
                                                const std::string& filename,
                                                const std::string& metadata_json) {
  namespace fs = std::filesystem;

  if (filename.empty() || fs::path(filename).has_parent_path()) {
    return Result<std::string>::err(Status::invalid_argument("bad image filename: '" + filename + "'"));
  }

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    return Result<std::string>::err(
        Status::io_error("failed creating '" + dir_ + "': " + ec.message()));
  }

  const fs::path image_path = fs::path(dir_) / filename;
  const fs::path meta_path = fs::path(dir_) / (filename + ".json");

  const Status img = write_file(image_path, reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
  if (!img.ok()) return Result<std::string>::err(img);

  const Status meta = write_file(meta_path, metadata_json.data(), metadata_json.size());
  if (!meta.ok()) return Result<std::string>::err(meta);

  spdlog::info("LocalImageStore: saved {}", image_path.string());
  return Result<std::string>::ok(image_path.string());
}

}  // namespace dw
