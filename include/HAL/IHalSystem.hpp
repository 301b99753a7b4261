/*****************************************************************
 * File:      IHalSystem.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    System-level Hardware Abstraction Layer interface: device
 *    identity and the reboot action.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_SYSTEM_HPP_
#define BUGG_INCLUDE_HAL_IHAL_SYSTEM_HPP_

#include "HalTypes.hpp"
#include <string>

namespace bugg::hal{

/** System Hardware Abstraction Interface */
class IHalSystem{
public:
  virtual ~IHalSystem() = default;

  /** Get the board serial number
   * @return Serial string, "UNKNOWN" if it cannot be read
   */
  virtual std::string getDeviceSerial() = 0;

  /** Flush file systems and reboot the unit
   * @return Only returns on failure
   */
  virtual HalResult reboot() = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_SYSTEM_HPP_
