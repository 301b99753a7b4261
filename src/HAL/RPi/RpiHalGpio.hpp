/*****************************************************************
 * File:      RpiHalGpio.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Raspberry Pi implementation of the HAL GPIO interface using
 *    the sysfs GPIO class. Pins use BCM numbering; the offset of
 *    the SoC gpiochip is found at init.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_GPIO_HPP_
#define BUGG_SRC_HAL_RPI_HAL_GPIO_HPP_

#include "HAL/IHalGpio.hpp"
#include "HAL/IHalLog.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace bugg::hal::rpi{

class RpiHalGpio : public IHalGpio{
private:
  static constexpr const char* TAG = "GPIO";
  static constexpr const char* SYSFS_ROOT = "/sys/class/gpio";

  IHalLog* log_ = nullptr;
  bool initialized_ = false;
  int base_ = 0;
  std::set<gpio_pin_t> exported_;
  std::mutex mutex_;

  std::string pinDir(gpio_pin_t pin) const{
    return std::string(SYSFS_ROOT) + "/gpio" + std::to_string(base_ + pin);
  }

  static bool writeText(const std::string& path, const std::string& text){
    std::ofstream out(path);
    if(!out) return false;
    out << text;
    out.flush();
    return static_cast<bool>(out);
  }

  /** Find the base of the BCM pin controller (0 on old kernels, 512 on new) */
  int findBase(){
    std::error_code ec;
    for(const auto& entry : std::filesystem::directory_iterator(SYSFS_ROOT, ec)){
      const std::string name = entry.path().filename().string();
      if(name.compare(0, 8, "gpiochip") != 0) continue;
      std::ifstream label_in(entry.path() / "label");
      std::string label;
      std::getline(label_in, label);
      if(label.find("pinctrl-bcm") != 0 && label.find("pinctrl-rp1") != 0) continue;
      std::ifstream base_in(entry.path() / "base");
      int base = 0;
      if(base_in >> base) return base;
    }
    return 0;
  }

  HalResult exportPin(gpio_pin_t pin){
    if(exported_.count(pin)) return HalResult::OK;
    if(!std::filesystem::exists(pinDir(pin))){
      if(!writeText(std::string(SYSFS_ROOT) + "/export", std::to_string(base_ + pin))){
        if(log_) log_->error(TAG, "Cannot export GPIO%d", pin);
        return HalResult::WRITE_FAILED;
      }
      // udev needs a moment to fix the permissions of the new node
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    exported_.insert(pin);
    return HalResult::OK;
  }

public:
  RpiHalGpio(IHalLog* log = nullptr) : log_(log){}

  HalResult init() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(initialized_) return HalResult::OK;
    if(!std::filesystem::exists(SYSFS_ROOT)){
      if(log_) log_->error(TAG, "%s not available", SYSFS_ROOT);
      return HalResult::DEVICE_NOT_FOUND;
    }
    base_ = findBase();
    initialized_ = true;
    if(log_) log_->info(TAG, "GPIO initialized (base %d)", base_);
    return HalResult::OK;
  }

  HalResult pinMode(gpio_pin_t pin, GpioMode mode) override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(!initialized_) return HalResult::NOT_INITIALIZED;

    HalResult result = exportPin(pin);
    if(result != HalResult::OK) return result;

    // "low"/"high" set the direction and the initial level in one write
    const char* dir = mode == GpioMode::GPIO_OUTPUT ? "out" : "in";
    if(!writeText(pinDir(pin) + "/direction", dir)){
      if(log_) log_->error(TAG, "Cannot set GPIO%d direction", pin);
      return HalResult::WRITE_FAILED;
    }
    if(log_) log_->debug(TAG, "Pin %d mode set to %s", pin, dir);
    return HalResult::OK;
  }

  GpioState digitalRead(gpio_pin_t pin) override{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(pinDir(pin) + "/value");
    char c = '0';
    in >> c;
    return c == '1' ? GpioState::GPIO_HIGH : GpioState::GPIO_LOW;
  }

  HalResult digitalWrite(gpio_pin_t pin, GpioState state) override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(!exported_.count(pin)) return HalResult::INVALID_STATE;
    if(!writeText(pinDir(pin) + "/value", state == GpioState::GPIO_HIGH ? "1" : "0")){
      return HalResult::WRITE_FAILED;
    }
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_GPIO_HPP_
