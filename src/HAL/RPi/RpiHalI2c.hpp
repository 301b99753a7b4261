/*****************************************************************
 * File:      RpiHalI2c.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Linux implementation of the HAL I2C interface on top of the
 *    i2c-dev character device.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_I2C_HPP_
#define BUGG_SRC_HAL_RPI_HAL_I2C_HPP_

#include "HAL/IHalI2c.hpp"
#include "HAL/IHalLog.hpp"

#include <cerrno>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <mutex>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace bugg::hal::rpi{

class RpiHalI2c : public IHalI2c{
private:
  static constexpr const char* TAG = "I2C";

  IHalLog* log_ = nullptr;
  I2cConfig config_;
  int fd_ = -1;
  std::mutex mutex_;

  /** Point the adapter at a device.
   * EBUSY means a kernel driver owns the address (e.g. the RTC).
   */
  HalResult select(i2c_addr_t address){
    if(fd_ < 0) return HalResult::NOT_INITIALIZED;
    if(ioctl(fd_, I2C_SLAVE, static_cast<long>(address)) < 0){
      return errno == EBUSY ? HalResult::BUSY : HalResult::ERROR;
    }
    return HalResult::OK;
  }

public:
  RpiHalI2c(IHalLog* log = nullptr) : log_(log){}

  ~RpiHalI2c() override{
    if(fd_ >= 0) ::close(fd_);
  }

  RpiHalI2c(const RpiHalI2c&) = delete;
  RpiHalI2c& operator=(const RpiHalI2c&) = delete;

  HalResult init(const I2cConfig& config) override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(fd_ >= 0) return HalResult::OK;
    config_ = config;

    std::string dev = "/dev/i2c-" + std::to_string(config.bus);
    fd_ = ::open(dev.c_str(), O_RDWR | O_CLOEXEC);
    if(fd_ < 0){
      if(log_) log_->error(TAG, "Cannot open %s", dev.c_str());
      return HalResult::DEVICE_NOT_FOUND;
    }
    if(log_) log_->info(TAG, "I2C%d init", config.bus);
    return HalResult::OK;
  }

  bool isInitialized() const override{
    return fd_ >= 0;
  }

  HalResult probe(i2c_addr_t address) override{
    std::lock_guard<std::mutex> lock(mutex_);
    HalResult result = select(address);
    if(result != HalResult::OK) return result;

    uint8_t byte = 0;
    if(::read(fd_, &byte, 1) != 1){
      if(log_) log_->debug(TAG, "No device at 0x%02X", address);
      return HalResult::DEVICE_NOT_FOUND;
    }
    if(log_) log_->debug(TAG, "Device found at 0x%02X", address);
    return HalResult::OK;
  }

  HalResult write(i2c_addr_t address, const uint8_t* data, size_t length) override{
    if(!data || length == 0) return HalResult::INVALID_PARAM;
    std::lock_guard<std::mutex> lock(mutex_);
    HalResult result = select(address);
    if(result != HalResult::OK) return result;

    if(::write(fd_, data, length) != static_cast<ssize_t>(length)){
      if(log_) log_->error(TAG, "I2C write to 0x%02X failed: errno %d", address, errno);
      return HalResult::WRITE_FAILED;
    }
    return HalResult::OK;
  }

  HalResult read(i2c_addr_t address, uint8_t* buffer, size_t length) override{
    if(!buffer || length == 0) return HalResult::INVALID_PARAM;
    std::lock_guard<std::mutex> lock(mutex_);
    HalResult result = select(address);
    if(result != HalResult::OK) return result;

    if(::read(fd_, buffer, length) != static_cast<ssize_t>(length)){
      if(log_) log_->error(TAG, "I2C read from 0x%02X failed: errno %d", address, errno);
      return HalResult::READ_FAILED;
    }
    return HalResult::OK;
  }

  HalResult writeRegister(i2c_addr_t address, uint8_t reg, uint8_t value) override{
    uint8_t data[2] = {reg, value};
    return write(address, data, sizeof(data));
  }

  HalResult readRegister(i2c_addr_t address, uint8_t reg, uint8_t* value) override{
    if(!value) return HalResult::INVALID_PARAM;
    std::lock_guard<std::mutex> lock(mutex_);
    HalResult result = select(address);
    if(result != HalResult::OK) return result;

    if(::write(fd_, &reg, 1) != 1) return HalResult::WRITE_FAILED;
    if(::read(fd_, value, 1) != 1) return HalResult::READ_FAILED;
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_I2C_HPP_
