/*****************************************************************
 * File:      LedStatusController.hpp
 * Category:  include/Diagnostics
 * Author:    Bugg Project
 *
 * Purpose:
 *    Everything the three status LEDs show. Factory results are
 *    encoded as a (top, middle) colour pair; at run time the top
 *    LED tracks recording and the middle LED tracks the data link.
 *    Each LED is only written when its colour changes.
 *
 * Factory codes:
 *    Green/Off      all passed
 *    White/Off      failures in two or more categories
 *    Yellow/x       modem     (Red USB, Magenta AT, Blue SIM, Yellow towers)
 *    Red/x          I2C       (Red bridge, Cyan RTC, Magenta LED ctrl)
 *    Blue/x         recording (Red internal, Yellow external, White both)
 *    Yellow|Red/White  several failures within modem or I2C
 *****************************************************************/

#ifndef BUGG_INCLUDE_DIAGNOSTICS_LED_STATUS_CONTROLLER_HPP_
#define BUGG_INCLUDE_DIAGNOSTICS_LED_STATUS_CONTROLLER_HPP_

#include "Diagnostics/DiagnosticResult.hpp"
#include "HAL/IHalLog.hpp"
#include "HAL/IHalStatusLeds.hpp"
#include "HAL/IHalTimer.hpp"

#include <atomic>
#include <mutex>

namespace bugg::diag{

/** Colour pair shown on the top and middle LEDs */
struct LedCode{
  hal::LedColour top = hal::LedColour::OFF;
  hal::LedColour middle = hal::LedColour::OFF;

  bool operator==(const LedCode& o) const{ return top == o.top && middle == o.middle; }
  bool operator!=(const LedCode& o) const{ return !(*this == o); }
};

constexpr LedCode LED_TEST_RUNNING{hal::LedColour::MAGENTA, hal::LedColour::OFF};
constexpr LedCode LED_ALL_PASSED{hal::LedColour::GREEN, hal::LedColour::OFF};
constexpr LedCode LED_BOOT_PREVIOUSLY_PASSED{hal::LedColour::MAGENTA, hal::LedColour::GREEN};
constexpr LedCode LED_BOOT_PREVIOUSLY_FAILED{hal::LedColour::MAGENTA, hal::LedColour::RED};

/** Data LED states at run time */
enum class DataLedState : uint8_t{
  SETUP = 0,        ///< Green
  UPLOADING,        ///< Cyan
  CONNECTED,        ///< Blue
  NOT_CONNECTED,    ///< Red
  OFFLINE           ///< Off
};

class LedStatusController{
public:
  static constexpr const char* TAG = "LEDS";

  explicit LedStatusController(hal::IHalStatusLeds* leds, hal::IHalLog* log = nullptr)
    : leds_(leds), log_(log){}

  /** Map a complete result sequence to its colour pair */
  static LedCode codeFor(const std::vector<DiagnosticResult>& results);

  /** Show a colour pair on the top and middle LEDs */
  void show(const LedCode& code);

  /** Set one LED (skipped if it already shows that colour) */
  void set(hal::LedPosition position, hal::LedColour colour);

  /** Top LED green while recording, off otherwise */
  void setRecording(bool recording);

  void setData(DataLedState state);

  /** Turn the top and middle LEDs off */
  void clear();

  /** Toggle the LEDs white/off once a second to signal a fatal error
   * @param duration_s Seconds to blink for
   * @param abort Optional flag ending the blink early
   */
  void errorBlink(hal::IHalSystemTimer* timer, uint32_t duration_s,
                  const std::atomic<bool>* abort = nullptr);

  hal::LedColour current(hal::LedPosition position) const;

private:
  void setLocked(hal::LedPosition position, hal::LedColour colour);

  hal::IHalStatusLeds* leds_ = nullptr;
  hal::IHalLog* log_ = nullptr;
  mutable std::mutex mutex_;
  hal::LedColour shown_[3] = {hal::LedColour::OFF, hal::LedColour::OFF, hal::LedColour::OFF};
  bool known_[3] = {false, false, false};
};

} // namespace bugg::diag

#endif // BUGG_INCLUDE_DIAGNOSTICS_LED_STATUS_CONTROLLER_HPP_
