/*****************************************************************
 * File:      IHalStorage.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Storage Hardware Abstraction Layer interface.
 *    Provides mount control and file system operations for one
 *    storage medium (SD card or onboard eMMC). All paths are
 *    absolute.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_STORAGE_HPP_
#define BUGG_INCLUDE_HAL_IHAL_STORAGE_HPP_

#include "HalTypes.hpp"
#include <string>
#include <vector>

namespace bugg::hal{

// ============================================================
// Storage Types
// ============================================================

/** Storage medium type */
enum class StorageType : uint8_t{
  SD_CARD,
  ONBOARD
};

inline const char* storageTypeToString(StorageType type){
  return type == StorageType::SD_CARD ? "SD card" : "onboard";
}

// ============================================================
// Storage Interface
// ============================================================

/** Storage Hardware Abstraction Interface */
class IHalStorage{
public:
  virtual ~IHalStorage() = default;

  /** Get medium type */
  virtual StorageType getType() const = 0;

  /** Check if storage is mounted
   * @return true if mounted
   */
  virtual bool isMounted() const = 0;

  /** Mount the medium
   * @return HalResult::NOT_MOUNTED if the medium could not be mounted
   */
  virtual HalResult mount() = 0;

  /** Unmount the medium
   * @return HalResult::OK on success
   */
  virtual HalResult unmount() = 0;

  /** Get mount point (root of this medium) */
  virtual const char* getMountPoint() const = 0;

  /** Get free space in bytes */
  virtual uint64_t getFreeSpace() const = 0;

  /** Check if file exists
   * @param path File path
   * @return true if exists
   */
  virtual bool fileExists(const char* path) = 0;

  /** Check if directory exists */
  virtual bool dirExists(const char* path) = 0;

  /** Create directory and any missing parents */
  virtual HalResult createDir(const char* path) = 0;

  /** Delete file */
  virtual HalResult deleteFile(const char* path) = 0;

  /** Rename or move a file, across media if needed */
  virtual HalResult rename(const char* old_path, const char* new_path) = 0;

  /** Get file size in bytes, 0 if missing */
  virtual uint64_t getFileSize(const char* path) = 0;

  /** List regular files below a directory, sorted by path
   * @param path Directory to scan
   * @param recursive Descend into subdirectories
   * @param out Output file paths
   * @return HalResult::OK on success
   */
  virtual HalResult listFiles(const char* path, bool recursive,
                              std::vector<std::string>& out) = 0;

  /** Make a file read-only */
  virtual HalResult setReadOnly(const char* path) = 0;

  /** Write a whole file, replacing existing content */
  virtual HalResult writeFile(const char* path, const std::string& content) = 0;

  /** Read a whole file
   * @return HalResult::KEY_NOT_FOUND if the file does not exist
   */
  virtual HalResult readFile(const char* path, std::string& out) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_STORAGE_HPP_
