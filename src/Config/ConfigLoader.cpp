/*****************************************************************
 * File:      ConfigLoader.cpp
 * Category:  src/Config
 * Author:    Bugg Project
 *
 * Purpose:
 *    cJSON based implementation of ConfigLoader.
 *****************************************************************/

#include "Config/ConfigLoader.hpp"
#include "cJSON.h"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace bugg::config{

using hal::HalResult;

namespace{

// Helpers return false only when the key is present with the wrong type.

bool readInt(const cJSON* parent, const char* key, int64_t* out){
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(parent, key);
  if(!item) return true;
  if(!cJSON_IsNumber(item)) return false;
  *out = static_cast<int64_t>(item->valuedouble);
  return true;
}

bool readBool(const cJSON* parent, const char* key, bool* out){
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(parent, key);
  if(!item) return true;
  if(cJSON_IsBool(item)){
    *out = cJSON_IsTrue(item);
    return true;
  }
  // Older config files store flags as 0/1
  if(cJSON_IsNumber(item)){
    *out = item->valueint != 0;
    return true;
  }
  return false;
}

bool readString(const cJSON* parent, const char* key, std::string* out){
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(parent, key);
  if(!item) return true;
  if(cJSON_IsString(item) && item->valuestring){
    *out = item->valuestring;
    return true;
  }
  // IDs are sometimes written as bare numbers
  if(cJSON_IsNumber(item)){
    char buf[32];
    snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(item->valuedouble));
    *out = buf;
    return true;
  }
  return false;
}

bool parsePhantom(const std::string& text, hal::PhantomPower* out){
  if(text == "NONE"){ *out = hal::PhantomPower::NONE; return true; }
  if(text == "PIP"){ *out = hal::PhantomPower::PIP; return true; }
  if(text == "P3V3"){ *out = hal::PhantomPower::P3V3; return true; }
  if(text == "P48"){ *out = hal::PhantomPower::P48; return true; }
  return false;
}

} // namespace

bool ConfigLoader::parseTimeOfDay(const std::string& text, uint8_t* hour, uint8_t* minute){
  unsigned h = 0;
  unsigned m = 0;
  char tail = 0;
  if(sscanf(text.c_str(), "%u:%u%c", &h, &m, &tail) != 2) return false;
  if(h > 23 || m > 59) return false;
  *hour = static_cast<uint8_t>(h);
  *minute = static_cast<uint8_t>(m);
  return true;
}

HalResult ConfigLoader::parse(const std::string& json, DeviceConfig& out) const{
  cJSON* root = cJSON_Parse(json.c_str());
  if(!root){
    if(log_) log_->error(TAG, "Malformed JSON near: %.32s", cJSON_GetErrorPtr() ? cJSON_GetErrorPtr() : "?");
    return HalResult::INVALID_PARAM;
  }

  DeviceConfig cfg;
  bool ok = true;
  std::string bad_key;

  auto fail = [&](const char* key){
    if(ok) bad_key = key;
    ok = false;
  };

  // ---- device ----
  const cJSON* device = cJSON_GetObjectItemCaseSensitive(root, "device");
  if(device){
    int64_t mode = static_cast<int64_t>(cfg.mode);
    if(!readInt(device, "mode", &mode)) fail("device.mode");
    if(mode < 0 || mode > 3) fail("device.mode");
    else cfg.mode = static_cast<RecordingMode>(mode);

    if(!readString(device, "server_url", &cfg.server_url)) fail("device.server_url");
    while(!cfg.server_url.empty() && cfg.server_url.back() == '/') cfg.server_url.pop_back();

    if(!readBool(device, "offline_mode", &cfg.offline_mode)) fail("device.offline_mode");
    if(!readString(device, "project_id", &cfg.project_id)) fail("device.project_id");
    if(!readString(device, "config_id", &cfg.config_id)) fail("device.config_id");
    if(!readString(device, "upload_password", &cfg.upload_password)) fail("device.upload_password");

    std::string reboot_time;
    if(!readString(device, "reboot_time_utc", &reboot_time)) fail("device.reboot_time_utc");
    if(!reboot_time.empty() &&
       !parseTimeOfDay(reboot_time, &cfg.reboot_hour_utc, &cfg.reboot_minute_utc)){
      fail("device.reboot_time_utc");
    }

    int64_t attempts = cfg.upload.max_attempts;
    int64_t backoff = cfg.upload.initial_backoff_ms;
    int64_t grace = cfg.upload.shutdown_grace_s;
    if(!readInt(device, "upload_max_attempts", &attempts) || attempts < 1) fail("device.upload_max_attempts");
    if(!readInt(device, "upload_initial_backoff_ms", &backoff) || backoff < 0) fail("device.upload_initial_backoff_ms");
    if(!readInt(device, "shutdown_grace_s", &grace) || grace < 0) fail("device.shutdown_grace_s");
    cfg.upload.max_attempts = static_cast<uint32_t>(attempts);
    cfg.upload.initial_backoff_ms = static_cast<uint32_t>(backoff);
    cfg.upload.shutdown_grace_s = static_cast<uint32_t>(grace);
  }

  // ---- mobile_network ----
  const cJSON* mobile = cJSON_GetObjectItemCaseSensitive(root, "mobile_network");
  if(mobile){
    if(!readString(mobile, "apn", &cfg.mobile_network.apn)) fail("mobile_network.apn");
    if(!readString(mobile, "username", &cfg.mobile_network.username)) fail("mobile_network.username");
    if(!readString(mobile, "password", &cfg.mobile_network.password)) fail("mobile_network.password");
  }

  // ---- sensor ----
  const cJSON* sensor = cJSON_GetObjectItemCaseSensitive(root, "sensor");
  if(sensor){
    std::string type = "I2SMic";
    if(!readString(sensor, "sensor_type", &type)) fail("sensor.sensor_type");
    if(type == "I2SMic"){
      cfg.sensor.type = SensorType::INTERNAL_MIC;
    }else if(type == "ExternalMic"){
      cfg.sensor.type = SensorType::EXTERNAL_MIC;
      cfg.sensor.amplification = 1;
    }else{
      fail("sensor.sensor_type");
    }

    int64_t record_length = cfg.sensor.record_length_s;
    int64_t rate = cfg.sensor.sample_rate;
    int64_t amplification = cfg.sensor.amplification;
    int64_t delay = cfg.sensor.capture_delay_s;
    int64_t card = cfg.sensor.capture_card;
    int64_t gain = cfg.sensor.gain;
    if(!readInt(sensor, "record_length", &record_length) || record_length < 1) fail("sensor.record_length");
    if(!readInt(sensor, "record_freq", &rate) || rate < 1) fail("sensor.record_freq");
    if(!readInt(sensor, "amplification", &amplification) || amplification < 1) fail("sensor.amplification");
    if(!readInt(sensor, "capture_delay", &delay) || delay < 0) fail("sensor.capture_delay");
    if(!readInt(sensor, "capture_card", &card) || card < 0 || card > 31) fail("sensor.capture_card");
    if(!readInt(sensor, "gain", &gain) || gain < 0 || gain > hal::SOUNDCARD_MAX_GAIN) fail("sensor.gain");
    if(!readBool(sensor, "compress_data", &cfg.sensor.compress)) fail("sensor.compress_data");
    if(!readBool(sensor, "enable_internal_mic", &cfg.sensor.enable_internal_mic)) fail("sensor.enable_internal_mic");

    std::string phantom = "NONE";
    if(!readString(sensor, "phantom_power", &phantom) || !parsePhantom(phantom, &cfg.sensor.phantom)){
      fail("sensor.phantom_power");
    }

    cfg.sensor.record_length_s = static_cast<uint32_t>(record_length);
    cfg.sensor.sample_rate = static_cast<uint32_t>(rate);
    cfg.sensor.amplification = static_cast<int32_t>(amplification);
    cfg.sensor.capture_delay_s = static_cast<uint32_t>(delay);
    cfg.sensor.capture_card = static_cast<uint8_t>(card);
    cfg.sensor.gain = static_cast<uint8_t>(gain);
  }

  cJSON_Delete(root);

  if(!ok){
    if(log_) log_->error(TAG, "Invalid value for %s", bad_key.c_str());
    return HalResult::INVALID_PARAM;
  }

  if(!cfg.offline_mode && cfg.server_url.empty()){
    if(log_) log_->error(TAG, "device.server_url is required unless offline_mode is set");
    return HalResult::INVALID_PARAM;
  }

  out = cfg;
  if(log_){
    log_->info(TAG, "Mode %d (%s), record_length %us, compress %s, offline %s",
               static_cast<int>(out.mode), recordingModeToString(out.mode),
               out.sensor.record_length_s, out.sensor.compress ? "yes" : "no",
               out.offline_mode ? "yes" : "no");
  }
  return HalResult::OK;
}

HalResult ConfigLoader::loadFile(const std::string& path, DeviceConfig& out) const{
  std::ifstream in(path);
  if(!in.is_open()){
    if(log_) log_->error(TAG, "Config file not found: %s", path.c_str());
    return HalResult::KEY_NOT_FOUND;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse(ss.str(), out);
}

HalResult ConfigLoader::refreshFromCard(hal::IHalStorage* sd, const std::string& working_path) const{
  if(!sd || !sd->isMounted()) return HalResult::NOT_MOUNTED;

  std::string source = std::string(sd->getMountPoint()) + "/config.json";
  std::string content;
  HalResult result = sd->readFile(source.c_str(), content);
  if(result == HalResult::KEY_NOT_FOUND){
    if(log_) log_->info(TAG, "No config.json on SD card, keeping %s", working_path.c_str());
    return HalResult::OK;
  }
  if(result != HalResult::OK) return result;

  std::ofstream out(working_path, std::ios::trunc);
  if(!out.is_open()) return HalResult::WRITE_FAILED;
  out << content;
  if(!out.good()) return HalResult::WRITE_FAILED;

  if(log_) log_->info(TAG, "Copied %s to %s", source.c_str(), working_path.c_str());
  return HalResult::OK;
}

} // namespace bugg::config
