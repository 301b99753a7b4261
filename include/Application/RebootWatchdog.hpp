/*****************************************************************
 * File:      RebootWatchdog.hpp
 * Category:  include/Application
 * Author:    Bugg Project
 *
 * Purpose:
 *    Daily reboot deadline. Armed at start of run, due at the
 *    first occurrence of the configured UTC time of day after
 *    arming, so a run started just after the reboot time lasts
 *    a full day.
 *****************************************************************/

#ifndef BUGG_INCLUDE_APPLICATION_REBOOT_WATCHDOG_HPP_
#define BUGG_INCLUDE_APPLICATION_REBOOT_WATCHDOG_HPP_

#include "HAL/HalTypes.hpp"

namespace bugg::app{

class RebootWatchdog{
public:
  static constexpr hal::epoch_ms_t DAY_MS = 24LL * 60 * 60 * 1000;

  RebootWatchdog(uint8_t hour_utc, uint8_t minute_utc)
    : hour_(hour_utc), minute_(minute_utc){}

  /** Compute the deadline from the current wall clock */
  void arm(hal::epoch_ms_t now_utc_ms){
    const hal::epoch_ms_t offset = (static_cast<hal::epoch_ms_t>(hour_) * 60 + minute_) * 60 * 1000;
    hal::epoch_ms_t day_start = now_utc_ms - (((now_utc_ms % DAY_MS) + DAY_MS) % DAY_MS);
    due_ms_ = day_start + offset;
    if(due_ms_ <= now_utc_ms) due_ms_ += DAY_MS;
    armed_ = true;
  }

  bool isArmed() const{ return armed_; }
  bool isDue(hal::epoch_ms_t now_utc_ms) const{ return armed_ && now_utc_ms >= due_ms_; }
  hal::epoch_ms_t dueAt() const{ return due_ms_; }

private:
  uint8_t hour_;
  uint8_t minute_;
  bool armed_ = false;
  hal::epoch_ms_t due_ms_ = 0;
};

} // namespace bugg::app

#endif // BUGG_INCLUDE_APPLICATION_REBOOT_WATCHDOG_HPP_
