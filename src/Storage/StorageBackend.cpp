/*****************************************************************
 * File:      StorageBackend.cpp
 * Category:  src/Storage
 * Author:    Bugg Project
 *****************************************************************/

#include "Storage/StorageBackend.hpp"

#include <algorithm>

namespace bugg::storage{

using hal::HalResult;

namespace{

bool isAudioFile(const std::string& path){
  auto endsWith = [&](const char* ext){
    std::string e(ext);
    return path.size() > e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0;
  };
  if(path.find(".tmp.") != std::string::npos) return false;
  return endsWith(".mp3") || endsWith(".wav");
}

std::string baseName(const std::string& path){
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

HalResult StorageBackend::probeWritable(hal::IHalStorage* storage){
  std::string probe = std::string(storage->getMountPoint()) + "/.write_probe";
  HalResult result = storage->writeFile(probe.c_str(), "probe");
  if(result != HalResult::OK) return result;
  return storage->deleteFile(probe.c_str());
}

HalResult StorageBackend::init(const DataLayout& layout){
  std::lock_guard<std::mutex> lock(mutex_);

  active_ = nullptr;
  fallback_ = false;

  if(sd_){
    HalResult result = sd_->isMounted() ? HalResult::OK : sd_->mount();
    if(result == HalResult::OK) result = probeWritable(sd_);
    if(result == HalResult::OK){
      active_ = sd_;
    }else{
      // Logged once; never retried for the rest of the run
      if(log_) log_->error(TAG, "SD card unusable (%s), falling back to onboard storage",
                           hal::halResultToString(result));
      fallback_ = true;
    }
  }

  if(!active_){
    if(!onboard_) return HalResult::NOT_MOUNTED;
    HalResult result = onboard_->isMounted() ? HalResult::OK : onboard_->mount();
    if(result != HalResult::OK){
      if(log_) log_->error(TAG, "Onboard storage unusable (%s)", hal::halResultToString(result));
      return HalResult::NOT_MOUNTED;
    }
    active_ = onboard_;
    fallback_ = sd_ != nullptr;
  }

  const std::string root = active_->getMountPoint();
  working_dir_ = root + "/.working";
  upload_root_ = root + "/audio";
  data_dir_ = upload_root_ + "/proj_" + layout.project_id + "/bugg_" + layout.serial +
              "/conf_" + layout.config_id;
  rejected_dir_ = root + "/rejected";

  HalResult result = active_->createDir(working_dir_.c_str());
  if(result == HalResult::OK) result = active_->createDir(data_dir_.c_str());
  if(result == HalResult::OK) result = active_->createDir(rejected_dir_.c_str());
  if(result != HalResult::OK){
    if(log_) log_->logResult(result, TAG, "create data directories");
    return result;
  }

  if(log_) log_->info(TAG, "Using %s storage, data dir %s",
                      hal::storageTypeToString(active_->getType()), data_dir_.c_str());

  if(active_ == sd_ && onboard_ && onboard_->isMounted()){
    migrateOnboardToSd();
  }
  return HalResult::OK;
}

HalResult StorageBackend::migrateOnboardToSd(){
  const std::string src_root = std::string(onboard_->getMountPoint()) + "/audio";
  if(!onboard_->dirExists(src_root.c_str())) return HalResult::OK;

  std::vector<std::string> files;
  HalResult result = onboard_->listFiles(src_root.c_str(), true, files);
  if(result != HalResult::OK) return result;

  size_t moved = 0;
  for(const std::string& src : files){
    std::string dst = upload_root_ + src.substr(src_root.size());
    std::string dst_dir = dst.substr(0, dst.find_last_of('/'));
    if(active_->createDir(dst_dir.c_str()) != HalResult::OK) continue;
    if(onboard_->rename(src.c_str(), dst.c_str()) == HalResult::OK){
      moved++;
    }else if(log_){
      log_->warn(TAG, "Could not move %s to SD card", src.c_str());
    }
  }
  if(moved > 0 && log_) log_->info(TAG, "Moved %zu files from onboard storage to SD card", moved);
  return HalResult::OK;
}

hal::StorageType StorageBackend::activeType() const{
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ ? active_->getType() : hal::StorageType::ONBOARD;
}

std::string StorageBackend::workingPath(const std::string& file_name) const{
  return working_dir_ + "/" + file_name;
}

HalResult StorageBackend::commit(const std::string& src, std::string* final_path){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!active_) return HalResult::NOT_INITIALIZED;
  std::string dst = data_dir_ + "/" + baseName(src);
  HalResult result = active_->rename(src.c_str(), dst.c_str());
  if(result != HalResult::OK){
    if(log_) log_->error(TAG, "Commit %s failed (%s)", src.c_str(), hal::halResultToString(result));
    return result;
  }
  *final_path = dst;
  return HalResult::OK;
}

HalResult StorageBackend::remove(const std::string& path){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!active_) return HalResult::NOT_INITIALIZED;
  return active_->deleteFile(path.c_str());
}

HalResult StorageBackend::reject(const std::string& path, std::string* rejected_path){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!active_) return HalResult::NOT_INITIALIZED;
  std::string dst = rejected_dir_ + "/" + baseName(path);
  HalResult result = active_->rename(path.c_str(), dst.c_str());
  if(result != HalResult::OK){
    if(log_) log_->error(TAG, "Cannot move rejected %s (%s)", path.c_str(), hal::halResultToString(result));
    return result;
  }
  *rejected_path = dst;
  return HalResult::OK;
}

HalResult StorageBackend::protect(const std::string& path){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!active_) return HalResult::NOT_INITIALIZED;
  return active_->setReadOnly(path.c_str());
}

HalResult StorageBackend::listPending(std::vector<std::string>& out){
  std::lock_guard<std::mutex> lock(mutex_);
  out.clear();
  if(!active_) return HalResult::NOT_INITIALIZED;
  if(!active_->dirExists(upload_root_.c_str())) return HalResult::OK;

  std::vector<std::string> files;
  HalResult result = active_->listFiles(upload_root_.c_str(), true, files);
  if(result != HalResult::OK) return result;

  for(const std::string& f : files){
    if(isAudioFile(f)) out.push_back(f);
  }
  // Names are UTC timestamps, so name order is capture order
  std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b){
    return baseName(a) < baseName(b);
  });
  return HalResult::OK;
}

HalResult StorageBackend::cleanWorkingDir(){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!active_) return HalResult::NOT_INITIALIZED;
  std::vector<std::string> files;
  HalResult result = active_->listFiles(working_dir_.c_str(), false, files);
  if(result != HalResult::OK) return result;
  for(const std::string& f : files){
    HalResult r = active_->deleteFile(f.c_str());
    if(r != HalResult::OK && log_) log_->warn(TAG, "Cannot remove stale %s", f.c_str());
  }
  if(!files.empty() && log_) log_->info(TAG, "Removed %zu stale working files", files.size());
  return HalResult::OK;
}

bool StorageBackend::markerExists(const char* name){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!sd_) return false;
  if(!sd_->isMounted() && sd_->mount() != HalResult::OK) return false;
  std::string path = std::string(sd_->getMountPoint()) + "/" + name;
  return sd_->fileExists(path.c_str());
}

} // namespace bugg::storage
