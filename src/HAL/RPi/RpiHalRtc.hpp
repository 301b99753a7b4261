/*****************************************************************
 * File:      RpiHalRtc.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    DS3231 access through the kernel RTC class device. The
 *    kernel driver owns the chip's I2C address, so the clock is
 *    read and set with the rtc ioctls instead of raw I2C.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_RTC_HPP_
#define BUGG_SRC_HAL_RPI_HAL_RTC_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalRtc.hpp"

#include <ctime>
#include <fcntl.h>
#include <linux/rtc.h>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace bugg::hal::rpi{

class RpiHalRtc : public IHalRtc{
private:
  static constexpr const char* TAG = "RTC";

  std::string device_;
  IHalLog* log_ = nullptr;

public:
  RpiHalRtc(IHalLog* log = nullptr, std::string device = "/dev/rtc0")
    : device_(std::move(device)), log_(log){}

  HalResult getTime(epoch_ms_t* utc_ms) override{
    if(!utc_ms) return HalResult::INVALID_PARAM;
    int fd = ::open(device_.c_str(), O_RDONLY | O_CLOEXEC);
    if(fd < 0) return HalResult::DEVICE_NOT_FOUND;

    struct rtc_time rt{};
    int rc = ioctl(fd, RTC_RD_TIME, &rt);
    ::close(fd);
    if(rc < 0) return HalResult::READ_FAILED;

    struct tm tm_utc{};
    tm_utc.tm_sec = rt.tm_sec;
    tm_utc.tm_min = rt.tm_min;
    tm_utc.tm_hour = rt.tm_hour;
    tm_utc.tm_mday = rt.tm_mday;
    tm_utc.tm_mon = rt.tm_mon;
    tm_utc.tm_year = rt.tm_year;
    *utc_ms = static_cast<epoch_ms_t>(timegm(&tm_utc)) * 1000;
    return HalResult::OK;
  }

  HalResult setTime(epoch_ms_t utc_ms) override{
    time_t secs = static_cast<time_t>(utc_ms / 1000);
    struct tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    struct rtc_time rt{};
    rt.tm_sec = tm_utc.tm_sec;
    rt.tm_min = tm_utc.tm_min;
    rt.tm_hour = tm_utc.tm_hour;
    rt.tm_mday = tm_utc.tm_mday;
    rt.tm_mon = tm_utc.tm_mon;
    rt.tm_year = tm_utc.tm_year;

    int fd = ::open(device_.c_str(), O_RDWR | O_CLOEXEC);
    if(fd < 0) return HalResult::DEVICE_NOT_FOUND;
    int rc = ioctl(fd, RTC_SET_TIME, &rt);
    ::close(fd);
    if(rc < 0){
      if(log_) log_->error(TAG, "RTC_SET_TIME failed");
      return HalResult::WRITE_FAILED;
    }
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_RTC_HPP_
