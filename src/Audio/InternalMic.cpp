/*****************************************************************
 * File:      InternalMic.cpp
 * Category:  src/Audio
 * Author:    Bugg Project
 *****************************************************************/

#include "Audio/InternalMic.hpp"

namespace bugg::audio{

using hal::HalResult;

HalResult InternalMic::setup(){
  if(!hal_.soundcard) return HalResult::NOT_INITIALIZED;
  HalResult result = hal_.soundcard->enableInternalChannel();
  if(hal_.log) hal_.log->logResult(result, TAG, "internal mic setup");
  return result;
}

void InternalMic::shutdown(){
  if(hal_.soundcard) hal_.soundcard->disableInternalChannel();
}

hal::AudioFormat InternalMic::captureFormat() const{
  hal::AudioFormat format;
  format.sample_rate = config_.sample_rate;
  format.channels = 1;
  format.format = hal::SampleFormat::S32_LE;
  return format;
}

} // namespace bugg::audio
