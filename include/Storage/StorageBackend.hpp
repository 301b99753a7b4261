/*****************************************************************
 * File:      StorageBackend.hpp
 * Category:  include/Storage
 * Author:    Bugg Project
 *
 * Purpose:
 *    Chooses between the SD card and onboard storage at startup
 *    and gives the rest of the daemon one write/list/delete
 *    surface whichever medium is active. It is the only component
 *    that creates or removes files on the medium.
 *
 * Layout (below the active medium's root):
 *    .working/                             in-progress captures
 *    audio/proj_<p>/bugg_<serial>/conf_<c>/  finalized segments
 *    rejected/                             segments the server refused
 *****************************************************************/

#ifndef BUGG_INCLUDE_STORAGE_STORAGE_BACKEND_HPP_
#define BUGG_INCLUDE_STORAGE_STORAGE_BACKEND_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalStorage.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace bugg::storage{

/** Marker files on the SD card root that request a factory test */
constexpr const char* FACTORY_TEST_FULL_MARKER = "factory-test-full.txt";
constexpr const char* FACTORY_TEST_BARE_MARKER = "factory-test-bare.txt";

/** Identity used to build the data directory */
struct DataLayout{
  std::string project_id = "na";
  std::string config_id = "na";
  std::string serial = "UNKNOWN";
};

class StorageBackend{
public:
  static constexpr const char* TAG = "STORAGE";

  StorageBackend(hal::IHalStorage* sd, hal::IHalStorage* onboard, hal::IHalLog* log = nullptr)
    : sd_(sd), onboard_(onboard), log_(log){}

  /** Select the medium and prepare the directory layout.
   * SD card failure (mount or write probe) falls back to onboard
   * storage for the rest of the run. Files stranded on onboard
   * storage by an earlier fallback are moved to the SD card.
   * @return HalResult::NOT_MOUNTED if no medium is usable
   */
  hal::HalResult init(const DataLayout& layout);

  hal::StorageType activeType() const;
  bool usingFallback() const{ return fallback_; }

  const std::string& workingDir() const{ return working_dir_; }
  const std::string& uploadRoot() const{ return upload_root_; }
  const std::string& dataDir() const{ return data_dir_; }
  const std::string& rejectedDir() const{ return rejected_dir_; }

  /** Path for a new working file */
  std::string workingPath(const std::string& file_name) const;

  /** Move a finished file into the data directory
   * @param src Source path (any medium)
   * @param final_path Destination path
   */
  hal::HalResult commit(const std::string& src, std::string* final_path);

  /** Delete a file on the active medium */
  hal::HalResult remove(const std::string& path);

  /** Move a file the server refused out of the upload tree. It is
   * kept for inspection but never listed as pending again.
   * @param path File below the upload root
   * @param rejected_path Destination path
   */
  hal::HalResult reject(const std::string& path, std::string* rejected_path);

  /** Make a file read-only */
  hal::HalResult protect(const std::string& path);

  /** Finalized audio files waiting below the upload root, oldest first */
  hal::HalResult listPending(std::vector<std::string>& out);

  /** Remove leftovers from an interrupted capture */
  hal::HalResult cleanWorkingDir();

  /** Check for a marker file on the SD card root (mounts if needed) */
  bool markerExists(const char* name);

private:
  hal::HalResult probeWritable(hal::IHalStorage* storage);
  hal::HalResult migrateOnboardToSd();

  hal::IHalStorage* sd_ = nullptr;
  hal::IHalStorage* onboard_ = nullptr;
  hal::IHalStorage* active_ = nullptr;
  hal::IHalLog* log_ = nullptr;
  bool fallback_ = false;
  std::string working_dir_;
  std::string upload_root_;
  std::string data_dir_;
  std::string rejected_dir_;
  mutable std::mutex mutex_;
};

} // namespace bugg::storage

#endif // BUGG_INCLUDE_STORAGE_STORAGE_BACKEND_HPP_
