/*****************************************************************
 * File:      IHalGpio.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    GPIO Hardware Abstraction Layer interface.
 *    Used for power rails, the audio bridge shutdown line and
 *    the user LED on the main board.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_GPIO_HPP_
#define BUGG_INCLUDE_HAL_IHAL_GPIO_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** GPIO Hardware Abstraction Interface */
class IHalGpio{
public:
  virtual ~IHalGpio() = default;

  /** Initialize GPIO subsystem
   * @return HalResult::OK on success
   */
  virtual HalResult init() = 0;

  /** Configure pin mode
   * @param pin GPIO pin number
   * @param mode Pin mode
   * @return HalResult::OK on success
   */
  virtual HalResult pinMode(gpio_pin_t pin, GpioMode mode) = 0;

  /** Read digital input
   * @param pin GPIO pin number
   * @return Pin state
   */
  virtual GpioState digitalRead(gpio_pin_t pin) = 0;

  /** Write digital output
   * @param pin GPIO pin number
   * @param state Pin state to write
   * @return HalResult::OK on success
   */
  virtual HalResult digitalWrite(gpio_pin_t pin, GpioState state) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_GPIO_HPP_
