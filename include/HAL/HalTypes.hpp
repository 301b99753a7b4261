/*****************************************************************
 * File:      HalTypes.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Common type definitions and data structures for the HAL API.
 *    These types are platform-independent and used throughout
 *    the HAL layer to provide consistent interfaces.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_HAL_TYPES_HPP_
#define BUGG_INCLUDE_HAL_HAL_TYPES_HPP_

#include <stdint.h>
#include <stddef.h>

namespace bugg::hal{

// ============================================================
// Result Types
// ============================================================

/** HAL operation result codes */
enum class HalResult : uint8_t{
  OK = 0,              // Operation successful
  ERROR,               // Generic error
  TIMEOUT,             // Operation timed out
  BUSY,                // Resource is busy
  INVALID_PARAM,       // Invalid parameter
  NOT_INITIALIZED,     // Module not initialized
  NOT_SUPPORTED,       // Feature not supported
  BUFFER_FULL,         // Buffer is full
  BUFFER_EMPTY,        // Buffer is empty
  KEY_NOT_FOUND,       // Key/data not found in storage
  HARDWARE_FAULT,      // Hardware fault detected
  ALREADY_INITIALIZED, // Already initialized
  INVALID_STATE,       // Invalid state for operation
  NO_MEMORY,           // Memory allocation failed
  DEVICE_NOT_FOUND,    // Device not found
  READ_FAILED,         // Read operation failed
  WRITE_FAILED,        // Write operation failed
  NOT_MOUNTED          // Storage medium not mounted
};

// ============================================================
// Color Types
// ============================================================

/** Colours an RGB status LED can show (one bit per channel) */
enum class LedColour : uint8_t{
  OFF = 0,
  RED,
  GREEN,
  BLUE,
  YELLOW,
  CYAN,
  MAGENTA,
  WHITE
};

/** Physical status LED positions, top to bottom */
enum class LedPosition : uint8_t{
  TOP = 0,
  MIDDLE,
  BOTTOM
};

/** Per-channel on/off state for a colour */
struct RgbBits{
  bool r = false;
  bool g = false;
  bool b = false;
};

inline RgbBits colourToBits(LedColour colour){
  switch(colour){
    case LedColour::RED:     return RgbBits{true, false, false};
    case LedColour::GREEN:   return RgbBits{false, true, false};
    case LedColour::BLUE:    return RgbBits{false, false, true};
    case LedColour::YELLOW:  return RgbBits{true, true, false};
    case LedColour::CYAN:    return RgbBits{false, true, true};
    case LedColour::MAGENTA: return RgbBits{true, false, true};
    case LedColour::WHITE:   return RgbBits{true, true, true};
    default:                 return RgbBits{};
  }
}

inline const char* ledColourToString(LedColour colour){
  switch(colour){
    case LedColour::OFF:     return "OFF";
    case LedColour::RED:     return "RED";
    case LedColour::GREEN:   return "GREEN";
    case LedColour::BLUE:    return "BLUE";
    case LedColour::YELLOW:  return "YELLOW";
    case LedColour::CYAN:    return "CYAN";
    case LedColour::MAGENTA: return "MAGENTA";
    case LedColour::WHITE:   return "WHITE";
    default:                 return "UNKNOWN";
  }
}

// ============================================================
// Audio Types
// ============================================================

/** PCM sample encodings understood by the capture layer */
enum class SampleFormat : uint8_t{
  S16_LE = 0,
  S32_LE
};

/** Capture format for one recording */
struct AudioFormat{
  uint32_t sample_rate = 44100;
  uint16_t channels = 1;
  SampleFormat format = SampleFormat::S16_LE;

  uint16_t bytesPerSample() const{
    return format == SampleFormat::S32_LE ? 4 : 2;
  }

  uint32_t bytesPerFrame() const{
    return static_cast<uint32_t>(bytesPerSample()) * channels;
  }
};

inline const char* sampleFormatToString(SampleFormat format){
  return format == SampleFormat::S32_LE ? "S32_LE" : "S16_LE";
}

/** Soundcard phantom power modes (values are the PGA register codes) */
enum class PhantomPower : uint8_t{
  NONE = 0,   // Off
  PIP = 1,    // Plug-in power
  P3V3 = 2,   // 3.3V on M12 pin 4
  P48 = 4     // 48V
};

inline const char* phantomPowerToString(PhantomPower mode){
  switch(mode){
    case PhantomPower::NONE: return "NONE";
    case PhantomPower::PIP:  return "PIP";
    case PhantomPower::P3V3: return "P3V3";
    case PhantomPower::P48:  return "P48";
    default:                 return "UNKNOWN";
  }
}

// ============================================================
// Time Types
// ============================================================

/** Timestamp in milliseconds since process start */
using timestamp_ms_t = uint64_t;

/** Wall-clock time in milliseconds since the Unix epoch (UTC) */
using epoch_ms_t = int64_t;

// ============================================================
// GPIO Types
// ============================================================

/** GPIO pin number type (BCM numbering) */
using gpio_pin_t = uint8_t;

/** GPIO pin mode */
enum class GpioMode : uint8_t{
  GPIO_INPUT,
  GPIO_OUTPUT
};

/** GPIO pin state */
enum class GpioState : uint8_t{
  GPIO_LOW = 0,
  GPIO_HIGH = 1
};

// ============================================================
// Communication Types
// ============================================================

/** I2C address type (7-bit) */
using i2c_addr_t = uint8_t;

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_HAL_TYPES_HPP_
