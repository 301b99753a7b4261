/*****************************************************************
 * File:      Hal.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Master HAL header that includes all HAL interfaces.
 *    Include this single header to access all HAL functionality.
 *
 * Architecture:
 *    HAL Layer (this) -> Middleware Layer -> Application Layer
 *
 *    The HAL layer provides platform-independent interfaces that
 *    abstract hardware access. Middleware MUST NOT use platform-
 *    specific code or directly access devices.
 *
 *    Hardware implementations of these interfaces live in
 *    src/HAL/RPi and are injected at runtime through HalContext.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_HAL_HPP_
#define BUGG_INCLUDE_HAL_HAL_HPP_

// ============================================================
// Core Type Definitions
// ============================================================
#include "HalTypes.hpp"

// ============================================================
// Logging
// ============================================================
#include "IHalLog.hpp"

// ============================================================
// Communication Interfaces
// ============================================================
#include "IHalGpio.hpp"         // Power rails, user LED
#include "IHalI2c.hpp"          // Audio bridge, RTC, LED controller
#include "IHalNetwork.hpp"      // Reachability probe

// ============================================================
// System Interfaces
// ============================================================
#include "IHalTimer.hpp"        // Monotonic timer, wall clock, delays
#include "IHalSystem.hpp"       // Serial number, reboot
#include "IHalRtc.hpp"          // Hardware clock

// ============================================================
// Peripheral Interfaces
// ============================================================
#include "IHalModem.hpp"        // Cellular modem
#include "IHalSoundcard.hpp"    // Gain, phantom power, channel power
#include "IHalAudioCapture.hpp" // WAV recording and PCM streams
#include "IHalStatusLeds.hpp"   // Enclosure RGB LEDs

// ============================================================
// Storage Interfaces
// ============================================================
#include "IHalStorage.hpp"      // SD card, onboard storage

namespace bugg::hal{

/** Bundle of HAL interfaces handed to the middleware.
 * Pointers are non-owning; the platform layer owns the objects.
 */
struct HalContext{
  IHalLog* log = nullptr;
  IHalSystemTimer* timer = nullptr;
  IHalSystem* system = nullptr;
  IHalI2c* i2c = nullptr;
  IHalGpio* gpio = nullptr;
  IHalModem* modem = nullptr;
  IHalSoundcard* soundcard = nullptr;
  IHalAudioCapture* capture = nullptr;
  IHalStatusLeds* leds = nullptr;
  IHalRtc* rtc = nullptr;
  IHalNetwork* network = nullptr;
  IHalStorage* sd_storage = nullptr;
  IHalStorage* onboard_storage = nullptr;
};

// ============================================================
// Board constants
// ============================================================

namespace board{
  constexpr i2c_addr_t AUDIO_BRIDGE_ADDR = 0x4c;    // PCMD3180 I2S bridge
  constexpr i2c_addr_t RTC_ADDR = 0x68;             // DS3231
  constexpr i2c_addr_t LED_CONTROLLER_ADDR = 0x23;  // PCF8574

  constexpr gpio_pin_t AUDIO_BRIDGE_SHDNZ = 0;
  constexpr gpio_pin_t EXT_MIC_EN = 12;
  constexpr gpio_pin_t USER_LED = 13;
  constexpr gpio_pin_t MODEM_RAIL_EN = 16;
  constexpr gpio_pin_t MODEM_PWRKEY = 6;
} // namespace board

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_HAL_HPP_
