/*****************************************************************
 * File:      ExternalMic.cpp
 * Category:  src/Audio
 * Author:    Bugg Project
 *****************************************************************/

#include "Audio/ExternalMic.hpp"

namespace bugg::audio{

using hal::HalResult;

HalResult ExternalMic::setup(){
  if(!hal_.soundcard) return HalResult::NOT_INITIALIZED;

  // Enabling resets gain to 0 and phantom off before applying ours
  HalResult result = hal_.soundcard->enableExternalChannel();
  if(result == HalResult::OK) result = hal_.soundcard->setGain(config_.gain);
  if(result == HalResult::OK) result = hal_.soundcard->setPhantom(config_.phantom);
  if(result == HalResult::OK && config_.enable_internal_mic){
    result = hal_.soundcard->enableInternalChannel();
  }

  if(hal_.log){
    hal_.log->info(TAG, "External mic: gain %u, phantom %s, internal %s", config_.gain,
                   hal::phantomPowerToString(config_.phantom),
                   config_.enable_internal_mic ? "on" : "off");
    hal_.log->logResult(result, TAG, "external mic setup");
  }
  return result;
}

void ExternalMic::shutdown(){
  if(!hal_.soundcard) return;
  hal_.soundcard->disableExternalChannel();
  if(config_.enable_internal_mic) hal_.soundcard->disableInternalChannel();
}

hal::AudioFormat ExternalMic::captureFormat() const{
  hal::AudioFormat format;
  format.sample_rate = config_.sample_rate;
  format.channels = config_.enable_internal_mic ? 2 : 1;
  format.format = hal::SampleFormat::S16_LE;
  return format;
}

} // namespace bugg::audio
