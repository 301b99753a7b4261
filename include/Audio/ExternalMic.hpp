/*****************************************************************
 * File:      ExternalMic.hpp
 * Category:  include/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    External microphone input on the soundcard PGA. 16-bit,
 *    mono, or stereo with the internal mic on the second channel.
 *    Applies configured gain and phantom power at setup.
 *****************************************************************/

#ifndef BUGG_INCLUDE_AUDIO_EXTERNAL_MIC_HPP_
#define BUGG_INCLUDE_AUDIO_EXTERNAL_MIC_HPP_

#include "Audio/SensorSource.hpp"

namespace bugg::audio{

class ExternalMic : public SensorSource{
public:
  using SensorSource::SensorSource;

  const char* name() const override{ return "ExternalMic"; }
  hal::HalResult setup() override;
  void shutdown() override;
  hal::AudioFormat captureFormat() const override;
};

} // namespace bugg::audio

#endif // BUGG_INCLUDE_AUDIO_EXTERNAL_MIC_HPP_
