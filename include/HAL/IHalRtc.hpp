/*****************************************************************
 * File:      IHalRtc.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Real-time clock Hardware Abstraction Layer interface.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_RTC_HPP_
#define BUGG_INCLUDE_HAL_IHAL_RTC_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** RTC Hardware Abstraction Interface */
class IHalRtc{
public:
  virtual ~IHalRtc() = default;

  /** Read the hardware clock
   * @param utc_ms Output time, ms since the Unix epoch
   * @return HalResult::OK on success
   */
  virtual HalResult getTime(epoch_ms_t* utc_ms) = 0;

  /** Write the hardware clock
   * @param utc_ms Time to set, ms since the Unix epoch
   * @return HalResult::OK on success
   */
  virtual HalResult setTime(epoch_ms_t utc_ms) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_RTC_HPP_
