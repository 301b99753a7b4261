/*****************************************************************
 * File:      RpiHalSystem.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Board identity from /proc/cpuinfo and system reboot.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_SYSTEM_HPP_
#define BUGG_SRC_HAL_RPI_HAL_SYSTEM_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalSystem.hpp"
#include "Utils/ChildProcess.hpp"

#include <fstream>
#include <string>
#include <unistd.h>

namespace bugg::hal::rpi{

class RpiHalSystem : public IHalSystem{
private:
  static constexpr const char* TAG = "SYSTEM";

  IHalLog* log_ = nullptr;

public:
  RpiHalSystem(IHalLog* log = nullptr) : log_(log){}

  std::string getDeviceSerial() override{
    std::ifstream in("/proc/cpuinfo");
    std::string line;
    while(std::getline(in, line)){
      if(line.compare(0, 6, "Serial") != 0) continue;
      size_t colon = line.find(':');
      if(colon == std::string::npos) break;
      size_t start = line.find_first_not_of(" \t", colon + 1);
      if(start == std::string::npos) break;
      return "RPiID-" + line.substr(start);
    }
    if(log_) log_->warn(TAG, "No serial number in /proc/cpuinfo");
    return "UNKNOWN";
  }

  HalResult reboot() override{
    ::sync();
    HalResult result = utils::runCommand({"systemctl", "reboot"});
    if(result != HalResult::OK && log_) log_->error(TAG, "Reboot request failed");
    return result;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_SYSTEM_HPP_
