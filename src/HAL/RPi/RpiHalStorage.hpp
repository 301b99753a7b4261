/*****************************************************************
 * File:      RpiHalStorage.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Filesystem-backed storage medium. The SD card is a block
 *    device mounted on demand; onboard storage is a directory on
 *    the root filesystem and is always mounted.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_STORAGE_HPP_
#define BUGG_SRC_HAL_RPI_HAL_STORAGE_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalStorage.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/mount.h>

namespace bugg::hal::rpi{

namespace fs = std::filesystem;

class RpiHalStorage : public IHalStorage{
private:
  static constexpr const char* TAG = "STORAGE";

  StorageType type_;
  std::string mount_point_;
  std::string device_;
  IHalLog* log_ = nullptr;
  bool mounted_ = false;

  /** True if something is already mounted at our mount point */
  bool mountedBySystem() const{
    std::ifstream in("/proc/mounts");
    std::string dev, dir, rest;
    while(in >> dev >> dir){
      std::getline(in, rest);
      if(dir == mount_point_) return true;
    }
    return false;
  }

public:
  /** @param device Block device to mount; empty for a plain directory */
  RpiHalStorage(StorageType type, std::string mount_point, std::string device = "",
                IHalLog* log = nullptr)
    : type_(type), mount_point_(std::move(mount_point)), device_(std::move(device)), log_(log){}

  StorageType getType() const override{ return type_; }

  bool isMounted() const override{ return mounted_; }

  HalResult mount() override{
    if(mounted_) return HalResult::OK;
    std::error_code ec;
    fs::create_directories(mount_point_, ec);

    if(device_.empty() || mountedBySystem()){
      mounted_ = fs::is_directory(mount_point_, ec);
      return mounted_ ? HalResult::OK : HalResult::NOT_MOUNTED;
    }

    static const char* const FS_TYPES[] = {"vfat", "exfat", "ext4"};
    for(const char* fs_type : FS_TYPES){
      if(::mount(device_.c_str(), mount_point_.c_str(), fs_type, MS_NOATIME, nullptr) == 0){
        mounted_ = true;
        if(log_) log_->info(TAG, "Mounted %s (%s) at %s", device_.c_str(), fs_type, mount_point_.c_str());
        return HalResult::OK;
      }
    }
    if(log_) log_->warn(TAG, "Could not mount %s at %s (errno %d)", device_.c_str(), mount_point_.c_str(), errno);
    return HalResult::NOT_MOUNTED;
  }

  HalResult unmount() override{
    if(!mounted_) return HalResult::OK;
    if(!device_.empty() && ::umount(mount_point_.c_str()) != 0) return HalResult::BUSY;
    mounted_ = false;
    return HalResult::OK;
  }

  const char* getMountPoint() const override{ return mount_point_.c_str(); }

  uint64_t getFreeSpace() const override{
    std::error_code ec;
    fs::space_info info = fs::space(mount_point_, ec);
    return ec ? 0 : static_cast<uint64_t>(info.available);
  }

  bool fileExists(const char* path) override{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
  }

  bool dirExists(const char* path) override{
    std::error_code ec;
    return fs::is_directory(path, ec);
  }

  HalResult createDir(const char* path) override{
    std::error_code ec;
    fs::create_directories(path, ec);
    if(ec && !fs::is_directory(path)) return HalResult::WRITE_FAILED;
    return HalResult::OK;
  }

  HalResult deleteFile(const char* path) override{
    std::error_code ec;
    if(!fs::exists(path, ec)) return HalResult::KEY_NOT_FOUND;
    // Read-only segments still have to be deletable
    fs::permissions(path, fs::perms::owner_write, fs::perm_options::add, ec);
    if(!fs::remove(path, ec) || ec) return HalResult::WRITE_FAILED;
    return HalResult::OK;
  }

  HalResult rename(const char* old_path, const char* new_path) override{
    std::error_code ec;
    if(!fs::exists(old_path, ec)) return HalResult::KEY_NOT_FOUND;
    fs::rename(old_path, new_path, ec);
    if(!ec) return HalResult::OK;
    if(ec.value() != EXDEV) return HalResult::WRITE_FAILED;

    // Different media: copy then delete
    fs::copy_file(old_path, new_path, fs::copy_options::overwrite_existing, ec);
    if(ec) return HalResult::WRITE_FAILED;
    fs::permissions(old_path, fs::perms::owner_write, fs::perm_options::add, ec);
    fs::remove(old_path, ec);
    return HalResult::OK;
  }

  uint64_t getFileSize(const char* path) override{
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
  }

  HalResult listFiles(const char* path, bool recursive, std::vector<std::string>& out) override{
    out.clear();
    std::error_code ec;
    if(!fs::is_directory(path, ec)) return HalResult::KEY_NOT_FOUND;

    if(recursive){
      for(fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)){
        if(it->is_regular_file(ec)) out.push_back(it->path().string());
      }
    }else{
      for(fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)){
        if(it->is_regular_file(ec)) out.push_back(it->path().string());
      }
    }
    if(ec) return HalResult::READ_FAILED;
    std::sort(out.begin(), out.end());
    return HalResult::OK;
  }

  HalResult setReadOnly(const char* path) override{
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    return ec ? HalResult::WRITE_FAILED : HalResult::OK;
  }

  HalResult writeFile(const char* path, const std::string& content) override{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) return HalResult::WRITE_FAILED;
    out << content;
    out.flush();
    return out ? HalResult::OK : HalResult::WRITE_FAILED;
  }

  HalResult readFile(const char* path, std::string& out) override{
    std::ifstream in(path, std::ios::binary);
    if(!in) return HalResult::KEY_NOT_FOUND;
    out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_STORAGE_HPP_
