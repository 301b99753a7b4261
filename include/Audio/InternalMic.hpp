/*****************************************************************
 * File:      InternalMic.hpp
 * Category:  include/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    Internal I2S MEMS microphone behind the PCMD3180 bridge.
 *    Mono, 32-bit samples, default amplification x5.
 *****************************************************************/

#ifndef BUGG_INCLUDE_AUDIO_INTERNAL_MIC_HPP_
#define BUGG_INCLUDE_AUDIO_INTERNAL_MIC_HPP_

#include "Audio/SensorSource.hpp"

namespace bugg::audio{

class InternalMic : public SensorSource{
public:
  using SensorSource::SensorSource;

  const char* name() const override{ return "InternalMic"; }
  hal::HalResult setup() override;
  void shutdown() override;
  hal::AudioFormat captureFormat() const override;
};

} // namespace bugg::audio

#endif // BUGG_INCLUDE_AUDIO_INTERNAL_MIC_HPP_
