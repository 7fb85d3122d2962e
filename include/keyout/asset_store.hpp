/**
 * @file asset_store.hpp
 * @brief Asset lookup and per-job output locations
 *
 * @details The keying core only reads assets and only writes to paths the
 *          OutputStore hands out. Layout under the data directory:
 *
 *          - assets/<asset_id>/input.<ext>
 *
 *          - outputs/<job_id>/out.<webm|png>
 *
 *          - previews/<preview_id>/preview.png
 *
 *          - logs/<job_id>.log
 *
 * @note All ids are validated as UUID4 before they become path components.
 */

#ifndef KEYOUT_ASSET_STORE_HPP
#define KEYOUT_ASSET_STORE_HPP

#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace keyout {

/**
 * @class AssetStore
 * @brief Resolves asset ids to files and metadata.
 */
class AssetStore {
public:
  virtual ~AssetStore() = default;

  /**
   * @brief Look up an asset.
   * @param asset_id Asset identifier
   * @param asset Output asset
   * @param err AssetNotFound (or Probe) on failure
   */
  virtual bool resolve(const std::string &asset_id, Asset &asset,
                       Error &err) const = 0;
};

/**
 * @brief Classify a file extension (".mp4", ".PNG", ...).
 * @return false if the extension is neither a known video nor image type
 */
bool classify_extension(const std::string &extension, AssetKind &kind);

/**
 * @class DirectoryAssetStore
 * @brief Assets stored as <root>/assets/<id>/input.<ext>, probed on resolve.
 */
class DirectoryAssetStore : public AssetStore {
public:
  explicit DirectoryAssetStore(std::string data_dir);

  bool resolve(const std::string &asset_id, Asset &asset,
               Error &err) const override;

  /**
   * @brief Copy a local media file into the store under a fresh id.
   * @param source File to import
   * @param asset Output: the stored asset with probed metadata
   */
  bool import_file(const std::string &source, Asset &asset, Error &err);

private:
  std::string assets_dir_;
};

/**
 * @class OutputStore
 * @brief Allocates writable, id-derived paths for outputs, previews and logs.
 */
class OutputStore {
public:
  explicit OutputStore(std::string data_dir);

  /// outputs/<job_id>/out.<extension>, directory created
  bool output_path(const std::string &job_id, const std::string &extension,
                   std::string &path, Error &err) const;

  /// logs/<job_id>.log, directory created
  bool log_path(const std::string &job_id, std::string &path,
                Error &err) const;

  /// previews/<preview_id>/preview.png, directory created
  bool preview_path(const std::string &preview_id, std::string &path,
                    Error &err) const;

  const std::string &root() const { return root_; }

private:
  std::string root_;
};

} // namespace keyout

#endif // KEYOUT_ASSET_STORE_HPP
