/*****************************************************************
 * File:      IHalTimer.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Timer Hardware Abstraction Layer interface.
 *    Provides the monotonic timer, blocking delays and the UTC
 *    wall clock used for scheduling and file naming.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_TIMER_HPP_
#define BUGG_INCLUDE_HAL_IHAL_TIMER_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

// ============================================================
// System Timer Interface
// ============================================================

/** System Timer Hardware Abstraction Interface
 *
 * All waiting in the daemon goes through delayMs() so that the
 * whole pipeline can be driven by a simulated clock.
 */
class IHalSystemTimer{
public:
  virtual ~IHalSystemTimer() = default;

  /** Get milliseconds since start (monotonic)
   * @return Milliseconds since start
   */
  virtual timestamp_ms_t millis() const = 0;

  /** Get current UTC wall-clock time
   * @return Milliseconds since the Unix epoch
   */
  virtual epoch_ms_t utcNowMs() const = 0;

  /** Blocking delay in milliseconds
   * @param ms Milliseconds to delay
   */
  virtual void delayMs(uint32_t ms) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_TIMER_HPP_
