/*****************************************************************
 * File:      RpiHal.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Master header for the Raspberry Pi HAL implementations and
 *    a factory that owns one instance of each for the Bugg main
 *    board.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_HPP_
#define BUGG_SRC_HAL_RPI_HAL_HPP_

// ============================================================
// Core HAL Implementations
// ============================================================
#include "RpiHalLog.hpp"
#include "RpiHalTimer.hpp"
#include "RpiHalGpio.hpp"
#include "RpiHalSystem.hpp"

// ============================================================
// Communication HAL Implementations
// ============================================================
#include "RpiHalI2c.hpp"
#include "RpiHalNetwork.hpp"

// ============================================================
// Peripheral HAL Implementations
// ============================================================
#include "RpiHalModem.hpp"
#include "RpiHalSoundcard.hpp"
#include "RpiHalAudioCapture.hpp"
#include "RpiHalStatusLeds.hpp"
#include "RpiHalRtc.hpp"

// ============================================================
// Storage HAL Implementations
// ============================================================
#include "RpiHalStorage.hpp"

namespace bugg::hal::rpi{

constexpr const char* SD_MOUNT_POINT = "/mnt/sd";
constexpr const char* SD_BLOCK_DEVICE = "/dev/mmcblk1p1";
constexpr const char* ONBOARD_ROOT = "/home/bugg";

/** Owns every HAL object for one Bugg unit */
struct RpiHalFactory{
  // Core
  RpiHalLog log;
  RpiHalSystemTimer timer;
  RpiHalGpio gpio;
  RpiHalSystem system;

  // Communication
  RpiHalI2c i2c;
  RpiHalNetwork network;

  // Peripherals
  RpiHalModem modem;
  RpiHalSoundcard soundcard;
  RpiHalAudioCapture capture;
  RpiHalStatusLeds leds;
  RpiHalRtc rtc;

  // Storage
  RpiHalStorage sd;
  RpiHalStorage onboard;

  RpiHalFactory()
    : gpio(&log)
    , system(&log)
    , i2c(&log)
    , network(&log)
    , modem(&gpio, &log)
    , soundcard(&gpio, &i2c, &log)
    , capture(&log)
    , leds(&i2c, &gpio, &log)
    , rtc(&log)
    , sd(StorageType::SD_CARD, SD_MOUNT_POINT, SD_BLOCK_DEVICE, &log)
    , onboard(StorageType::ONBOARD, ONBOARD_ROOT, "", &log)
  {}

  /** Initialize logging and GPIO */
  HalResult initCore(LogLevel level){
    HalResult result = log.init(level);
    if(result != HalResult::OK) return result;
    return gpio.init();
  }

  /** Initialize the buses and peripherals (requires initCore).
   * A missing peripheral is logged; the daemon keeps going so the
   * failure can be reported on the LEDs or by the factory test.
   */
  HalResult initPeripherals(){
    HalResult result = i2c.init(I2cConfig());
    if(result != HalResult::OK){
      log.warn("HAL", "I2C init failed: %s", halResultToString(result));
    }

    result = leds.init();
    if(result != HalResult::OK){
      log.warn("HAL", "LED init failed: %s", halResultToString(result));
    }

    result = modem.init();
    if(result != HalResult::OK){
      log.warn("HAL", "Modem init failed: %s", halResultToString(result));
    }

    result = soundcard.init();
    if(result != HalResult::OK){
      log.error("HAL", "Soundcard init failed: %s", halResultToString(result));
      return result;
    }
    return HalResult::OK;
  }

  HalContext context(){
    HalContext ctx;
    ctx.log = &log;
    ctx.timer = &timer;
    ctx.system = &system;
    ctx.i2c = &i2c;
    ctx.gpio = &gpio;
    ctx.modem = &modem;
    ctx.soundcard = &soundcard;
    ctx.capture = &capture;
    ctx.leds = &leds;
    ctx.rtc = &rtc;
    ctx.network = &network;
    ctx.sd_storage = &sd;
    ctx.onboard_storage = &onboard;
    return ctx;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_HPP_
