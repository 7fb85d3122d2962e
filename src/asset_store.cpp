/**
 * @file asset_store.cpp
 * @brief Directory-backed asset store and output path allocation
 */

#include "keyout/asset_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "keyout/logging.hpp"
#include "keyout/media_probe.hpp"
#include "keyout/system.hpp"

namespace keyout {

namespace fs = std::filesystem;

namespace {

const char *const VIDEO_EXTENSIONS[] = {".mp4", ".mov",  ".avi",
                                        ".mkv", ".webm", ".m4v"};
const char *const IMAGE_EXTENSIONS[] = {".png", ".jpg",  ".jpeg",
                                        ".bmp", ".webp", ".gif"};

bool ensure_dir(const fs::path &dir, Error &err) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return err.set(ErrorKind::Io,
                   fmt::format("Failed to create directory '{}': {}",
                               dir.string(), ec.message()));
  }
  return true;
}

bool check_id(const std::string &id, Error &err) {
  if (!is_valid_id(id)) {
    return err.set(ErrorKind::InvalidParameter,
                   fmt::format("Invalid ID format: {}", id));
  }
  return true;
}

} // anonymous namespace

bool classify_extension(const std::string &extension, AssetKind &kind) {
  std::string ext = extension;
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  for (const char *v : VIDEO_EXTENSIONS) {
    if (ext == v) {
      kind = AssetKind::Video;
      return true;
    }
  }
  for (const char *i : IMAGE_EXTENSIONS) {
    if (ext == i) {
      kind = AssetKind::Image;
      return true;
    }
  }
  return false;
}

// **---- DirectoryAssetStore ----**

DirectoryAssetStore::DirectoryAssetStore(std::string data_dir)
    : assets_dir_((fs::path(data_dir) / "assets").string()) {}

bool DirectoryAssetStore::resolve(const std::string &asset_id, Asset &asset,
                                  Error &err) const {
  if (!check_id(asset_id, err))
    return false;

  fs::path dir = fs::path(assets_dir_) / asset_id;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return err.set(ErrorKind::AssetNotFound,
                   fmt::format("Asset not found: {}", asset_id));
  }

  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec))
      continue;
    const fs::path &p = entry.path();
    if (p.stem() != "input")
      continue;

    AssetKind kind;
    if (!classify_extension(p.extension().string(), kind))
      continue;

    Asset found;
    found.id = asset_id;
    found.kind = kind;
    found.path = fs::absolute(p, ec).string();
    if (!probe_media(found.path, kind, found.metadata, err))
      return false;
    asset = std::move(found);
    return true;
  }

  return err.set(ErrorKind::AssetNotFound,
                 fmt::format("Asset has no input file: {}", asset_id));
}

bool DirectoryAssetStore::import_file(const std::string &source, Asset &asset,
                                      Error &err) {
  fs::path src(source);
  AssetKind kind;
  if (!classify_extension(src.extension().string(), kind)) {
    return err.set(ErrorKind::InvalidParameter,
                   fmt::format("Unsupported file extension: '{}'",
                               src.extension().string()));
  }

  std::error_code ec;
  if (!fs::is_regular_file(src, ec)) {
    return err.set(ErrorKind::AssetNotFound,
                   fmt::format("File not found: {}", source));
  }

  std::string id = generate_id();
  fs::path dir = fs::path(assets_dir_) / id;
  if (!ensure_dir(dir, err))
    return false;

  std::string ext = src.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  fs::path dest = dir / ("input" + ext);
  if (!fs::copy_file(src, dest, ec)) {
    return err.set(ErrorKind::Io, fmt::format("Failed to copy '{}': {}",
                                              source, ec.message()));
  }

  LOG_INFO("Imported {} as asset {}", src.filename().string(), id);
  return resolve(id, asset, err);
}

// **---- OutputStore ----**

OutputStore::OutputStore(std::string data_dir) : root_(std::move(data_dir)) {}

bool OutputStore::output_path(const std::string &job_id,
                              const std::string &extension, std::string &path,
                              Error &err) const {
  if (!check_id(job_id, err))
    return false;
  fs::path dir = fs::path(root_) / "outputs" / job_id;
  if (!ensure_dir(dir, err))
    return false;
  path = (dir / ("out." + extension)).string();
  return true;
}

bool OutputStore::log_path(const std::string &job_id, std::string &path,
                           Error &err) const {
  if (!check_id(job_id, err))
    return false;
  fs::path dir = fs::path(root_) / "logs";
  if (!ensure_dir(dir, err))
    return false;
  path = (dir / (job_id + ".log")).string();
  return true;
}

bool OutputStore::preview_path(const std::string &preview_id,
                               std::string &path, Error &err) const {
  if (!check_id(preview_id, err))
    return false;
  fs::path dir = fs::path(root_) / "previews" / preview_id;
  if (!ensure_dir(dir, err))
    return false;
  path = (dir / "preview.png").string();
  return true;
}

} // namespace keyout
