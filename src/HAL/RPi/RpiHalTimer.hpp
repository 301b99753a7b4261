/*****************************************************************
 * File:      RpiHalTimer.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Linux implementation of the HAL system timer using
 *    std::chrono clocks.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_TIMER_HPP_
#define BUGG_SRC_HAL_RPI_HAL_TIMER_HPP_

#include "HAL/IHalTimer.hpp"

#include <chrono>
#include <thread>

namespace bugg::hal::rpi{

class RpiHalSystemTimer : public IHalSystemTimer{
private:
  std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

public:
  RpiHalSystemTimer() = default;

  timestamp_ms_t millis() const override{
    return static_cast<timestamp_ms_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_).count());
  }

  epoch_ms_t utcNowMs() const override{
    return static_cast<epoch_ms_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
  }

  void delayMs(uint32_t ms) override{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_TIMER_HPP_
