/*****************************************************************
 * File:      DeviceConfig.hpp
 * Category:  include/Config
 * Author:    Bugg Project
 *
 * Purpose:
 *    Validated configuration value object for one daemon run.
 *    Built once by ConfigLoader and shared read-only with every
 *    component afterwards.
 *****************************************************************/

#ifndef BUGG_INCLUDE_CONFIG_DEVICE_CONFIG_HPP_
#define BUGG_INCLUDE_CONFIG_DEVICE_CONFIG_HPP_

#include "HAL/HalTypes.hpp"
#include <cstdint>
#include <string>

namespace bugg::config{

// ============================================================
// Enumerations
// ============================================================

/** Recording/upload operating mode (config value device.mode) */
enum class RecordingMode : uint8_t{
  DEFAULT = 0,            ///< Batch HTTP, modem powered down between batches
  HTTP = 1,               ///< Persistent HTTP, uploads on enqueue
  WEBSOCKET_SAFE = 2,     ///< File over WebSocket, ack-gated deletion
  CONTINUOUS_STREAM = 3   ///< Raw chunks over WebSocket, no files
};

inline const char* recordingModeToString(RecordingMode mode){
  switch(mode){
    case RecordingMode::DEFAULT:           return "DEFAULT";
    case RecordingMode::HTTP:              return "HTTP";
    case RecordingMode::WEBSOCKET_SAFE:    return "WEBSOCKET_SAFE";
    case RecordingMode::CONTINUOUS_STREAM: return "CONTINUOUS_STREAM";
    default:                               return "UNKNOWN";
  }
}

/** Microphone front-end selected by sensor.sensor_type */
enum class SensorType : uint8_t{
  INTERNAL_MIC = 0,   ///< "I2SMic"
  EXTERNAL_MIC        ///< "ExternalMic"
};

// ============================================================
// Configuration Sections
// ============================================================

/** Cellular connection credentials (passed through, not interpreted) */
struct MobileNetworkConfig{
  std::string apn;
  std::string username;
  std::string password;
};

/** Audio sensor settings */
struct SensorConfig{
  SensorType type = SensorType::INTERNAL_MIC;
  uint32_t record_length_s = 1200;      ///< Usable seconds per segment
  uint32_t sample_rate = 44100;         ///< Hz
  bool compress = true;                 ///< MP3 when true, WAV otherwise
  int32_t amplification = 5;            ///< Linear factor applied in postprocess
  uint32_t capture_delay_s = 0;         ///< Sleep between captures
  uint8_t capture_card = 0;             ///< ALSA card index
  uint8_t gain = 0;                     ///< External PGA gain 0..20
  hal::PhantomPower phantom = hal::PhantomPower::NONE;
  bool enable_internal_mic = false;     ///< External mic: record internal as 2nd channel
};

/** Upload retry and shutdown tuning */
struct UploadConfig{
  uint32_t max_attempts = 5;            ///< Attempts per job before giving up
  uint32_t initial_backoff_ms = 2000;   ///< Delay after the first failure
  uint32_t backoff_multiplier = 2;
  uint32_t max_backoff_ms = 60000;
  uint32_t shutdown_grace_s = 120;      ///< Upload drain budget on shutdown
};

/** Complete device configuration */
struct DeviceConfig{
  RecordingMode mode = RecordingMode::HTTP;
  std::string server_url;
  bool offline_mode = false;
  std::string project_id = "na";
  std::string config_id = "na";
  std::string upload_password;
  uint8_t reboot_hour_utc = 2;
  uint8_t reboot_minute_utc = 0;
  MobileNetworkConfig mobile_network;
  SensorConfig sensor;
  UploadConfig upload;
};

// ============================================================
// Derived Endpoints
// ============================================================

/** HTTP upload endpoint for the configured server */
inline std::string uploadUrl(const DeviceConfig& config){
  return config.server_url + "/api/bugg/upload";
}

/** WebSocket endpoint: http becomes ws and https becomes wss */
inline std::string websocketUri(const DeviceConfig& config){
  std::string uri = config.server_url;
  if(uri.compare(0, 8, "https://") == 0){
    uri = "wss://" + uri.substr(8);
  }else if(uri.compare(0, 7, "http://") == 0){
    uri = "ws://" + uri.substr(7);
  }
  return uri + "/ws/audio/";
}

} // namespace bugg::config

#endif // BUGG_INCLUDE_CONFIG_DEVICE_CONFIG_HPP_
