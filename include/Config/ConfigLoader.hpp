/*****************************************************************
 * File:      ConfigLoader.hpp
 * Category:  include/Config
 * Author:    Bugg Project
 *
 * Purpose:
 *    Parses config.json into a DeviceConfig, applying defaults
 *    for missing keys and rejecting out-of-range values.
 *
 * Format:
 *    {
 *      "device": { "mode": 1, "server_url": "...", ... },
 *      "mobile_network": { "apn": "...", ... },
 *      "sensor": { "sensor_type": "I2SMic", "record_length": 1200, ... }
 *    }
 *****************************************************************/

#ifndef BUGG_INCLUDE_CONFIG_CONFIG_LOADER_HPP_
#define BUGG_INCLUDE_CONFIG_CONFIG_LOADER_HPP_

#include "Config/DeviceConfig.hpp"
#include "HAL/IHalLog.hpp"
#include "HAL/IHalStorage.hpp"
#include <string>

namespace bugg::config{

class ConfigLoader{
public:
  static constexpr const char* TAG = "CONFIG";

  explicit ConfigLoader(hal::IHalLog* log = nullptr) : log_(log){}

  /** Parse a JSON document
   * @param json Document text
   * @param out Parsed configuration (defaults kept for absent keys)
   * @return HalResult::INVALID_PARAM on malformed or out-of-range values
   */
  hal::HalResult parse(const std::string& json, DeviceConfig& out) const;

  /** Read and parse a config file
   * @return HalResult::KEY_NOT_FOUND if the file does not exist
   */
  hal::HalResult loadFile(const std::string& path, DeviceConfig& out) const;

  /** Copy config.json from the SD card root over the working copy
   * when the card carries one. Missing source is not an error.
   */
  hal::HalResult refreshFromCard(hal::IHalStorage* sd, const std::string& working_path) const;

  /** Parse "HH:MM"
   * @return false on malformed text
   */
  static bool parseTimeOfDay(const std::string& text, uint8_t* hour, uint8_t* minute);

private:
  hal::IHalLog* log_ = nullptr;
};

} // namespace bugg::config

#endif // BUGG_INCLUDE_CONFIG_CONFIG_LOADER_HPP_
