/*****************************************************************
 * File:      RpiHalStatusLeds.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Enclosure LEDs behind a PCF8574 I/O expander plus the user
 *    LED on the main PCB.
 *
 * Expander wiring (outputs are active low):
 *    P7 P6 P5   top     R G B
 *    P4 P3 P2   middle  R G B
 *    P1 P0      bottom  G B  (red hard-wired on as power light)
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_STATUS_LEDS_HPP_
#define BUGG_SRC_HAL_RPI_HAL_STATUS_LEDS_HPP_

#include "HAL/Hal.hpp"

#include <mutex>

namespace bugg::hal::rpi{

class RpiHalStatusLeds : public IHalStatusLeds{
private:
  static constexpr const char* TAG = "LEDS";
  static constexpr int NO_CHANNEL = -1;

  struct LedChannels{
    int r;
    int g;
    int b;
  };

  static LedChannels channelsFor(LedPosition position){
    switch(position){
      case LedPosition::TOP:    return LedChannels{7, 6, 5};
      case LedPosition::MIDDLE: return LedChannels{4, 3, 2};
      default:                  return LedChannels{NO_CHANNEL, 1, 0};
    }
  }

  IHalI2c* i2c_ = nullptr;
  IHalGpio* gpio_ = nullptr;
  IHalLog* log_ = nullptr;
  uint8_t port_ = 0xFF;  // All channels off
  bool initialized_ = false;
  std::mutex mutex_;

  void setChannel(int channel, bool on){
    if(channel == NO_CHANNEL) return;
    if(on){
      port_ = static_cast<uint8_t>(port_ & ~(1u << channel));
    }else{
      port_ = static_cast<uint8_t>(port_ | (1u << channel));
    }
  }

public:
  RpiHalStatusLeds(IHalI2c* i2c, IHalGpio* gpio, IHalLog* log = nullptr)
    : i2c_(i2c), gpio_(gpio), log_(log){}

  HalResult init() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(!i2c_->isInitialized()){
      HalResult result = i2c_->init(I2cConfig());
      if(result != HalResult::OK) return result;
    }
    HalResult result = i2c_->write(board::LED_CONTROLLER_ADDR, &port_, 1);
    if(result != HalResult::OK){
      if(log_) log_->error(TAG, "LED controller not responding (%s)", halResultToString(result));
      return result;
    }

    if(gpio_){
      result = gpio_->pinMode(board::USER_LED, GpioMode::GPIO_OUTPUT);
      if(result == HalResult::OK) result = gpio_->digitalWrite(board::USER_LED, GpioState::GPIO_HIGH);
      if(result != HalResult::OK && log_) log_->warn(TAG, "User LED unavailable");
    }
    initialized_ = true;
    return HalResult::OK;
  }

  HalResult setColour(LedPosition position, LedColour colour) override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(!initialized_) return HalResult::NOT_INITIALIZED;

    LedChannels ch = channelsFor(position);
    RgbBits bits = colourToBits(colour);
    if(ch.r == NO_CHANNEL && !bits.r){
      if(log_) log_->warn(TAG, "%s cannot be shown on the power LED", ledColourToString(colour));
      return HalResult::INVALID_PARAM;
    }

    setChannel(ch.r, bits.r);
    setChannel(ch.g, bits.g);
    setChannel(ch.b, bits.b);
    return i2c_->write(board::LED_CONTROLLER_ADDR, &port_, 1);
  }

  HalResult setUserLed(bool on) override{
    if(!gpio_) return HalResult::NOT_SUPPORTED;
    // Active low
    return gpio_->digitalWrite(board::USER_LED, on ? GpioState::GPIO_LOW : GpioState::GPIO_HIGH);
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_STATUS_LEDS_HPP_
