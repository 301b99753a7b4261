/*****************************************************************
 * File:      IHalNetwork.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Network reachability Hardware Abstraction Layer interface.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_NETWORK_HPP_
#define BUGG_INCLUDE_HAL_IHAL_NETWORK_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** Network Hardware Abstraction Interface */
class IHalNetwork{
public:
  virtual ~IHalNetwork() = default;

  /** Run a single reachability probe
   * @return true if the internet is reachable now
   */
  virtual bool probeInternet() = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_NETWORK_HPP_
