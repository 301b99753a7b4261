/*****************************************************************
 * File:      IHalSoundcard.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Soundcard Hardware Abstraction Layer interface.
 *    The soundcard has an internal channel (I2S bridge) and an
 *    external channel (PGA with gain and phantom power).
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_SOUNDCARD_HPP_
#define BUGG_INCLUDE_HAL_IHAL_SOUNDCARD_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** Maximum gain step accepted by the PGA */
constexpr uint8_t SOUNDCARD_MAX_GAIN = 20;

/** Signal variance measured on each channel over a short sample */
struct ChannelVariance{
  double internal = 0.0;
  double external = 0.0;
};

/** Soundcard Hardware Abstraction Interface */
class IHalSoundcard{
public:
  virtual ~IHalSoundcard() = default;

  /** Initialize control interfaces and restore saved state
   * @return HalResult::OK on success
   */
  virtual HalResult init() = 0;

  /** Power the external channel with gain 0 and phantom power off */
  virtual HalResult enableExternalChannel() = 0;

  /** Power down the external channel */
  virtual HalResult disableExternalChannel() = 0;

  /** Power and configure the internal I2S bridge */
  virtual HalResult enableInternalChannel() = 0;

  /** Power down the internal I2S bridge */
  virtual HalResult disableInternalChannel() = 0;

  /** Set external channel gain
   * @param gain Gain step 0..SOUNDCARD_MAX_GAIN
   * @return HalResult::INVALID_PARAM when out of range
   */
  virtual HalResult setGain(uint8_t gain) = 0;

  /** Set phantom power mode */
  virtual HalResult setPhantom(PhantomPower mode) = 0;

  virtual uint8_t getGain() const = 0;
  virtual PhantomPower getPhantom() const = 0;

  /** Record one second from both channels and compute the variance
   * @param out Variance per channel
   * @return HalResult::OK if the recording could be made
   */
  virtual HalResult measureVariance(ChannelVariance& out) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_SOUNDCARD_HPP_
