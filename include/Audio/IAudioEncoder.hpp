/*****************************************************************
 * File:      IAudioEncoder.hpp
 * Category:  include/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    Opaque compression transform: WAV in, encoded bytes out.
 *****************************************************************/

#ifndef BUGG_INCLUDE_AUDIO_IAUDIO_ENCODER_HPP_
#define BUGG_INCLUDE_AUDIO_IAUDIO_ENCODER_HPP_

#include "HAL/HalTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace bugg::audio{

class IAudioEncoder{
public:
  virtual ~IAudioEncoder() = default;

  /** File extension of the encoded output, without dot */
  virtual const char* extension() const = 0;

  /** Encode a WAV file to a new file */
  virtual hal::HalResult encodeFile(const std::string& wav_path, const std::string& out_path) = 0;

  /** Encode an in-memory WAV image */
  virtual hal::HalResult encodeBuffer(const std::vector<uint8_t>& wav, std::vector<uint8_t>& out) = 0;
};

} // namespace bugg::audio

#endif // BUGG_INCLUDE_AUDIO_IAUDIO_ENCODER_HPP_
