/*****************************************************************
 * File:      IHalStatusLeds.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Status LED Hardware Abstraction Layer interface.
 *    Three RGB LEDs on the enclosure (bottom has red hard-wired
 *    as the power indicator) and a single user LED on the board.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_STATUS_LEDS_HPP_
#define BUGG_INCLUDE_HAL_IHAL_STATUS_LEDS_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** Status LED Hardware Abstraction Interface */
class IHalStatusLeds{
public:
  virtual ~IHalStatusLeds() = default;

  /** Initialize the LED controller
   * @return HalResult::OK on success
   */
  virtual HalResult init() = 0;

  /** Set one LED colour
   * @param position LED position
   * @param colour Colour to show
   * @return HalResult::INVALID_PARAM if the LED cannot show the colour
   */
  virtual HalResult setColour(LedPosition position, LedColour colour) = 0;

  /** Switch the on-board user LED
   * @param on true to light it
   * @return HalResult::OK on success
   */
  virtual HalResult setUserLed(bool on) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_STATUS_LEDS_HPP_
