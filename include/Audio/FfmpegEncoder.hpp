/*****************************************************************
 * File:      FfmpegEncoder.hpp
 * Category:  include/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    VBR MP3 encoder that runs ffmpeg/libmp3lame as a child
 *    process. In-memory encoding goes through stdin/stdout pipes
 *    so continuous streaming never touches the disk.
 *****************************************************************/

#ifndef BUGG_INCLUDE_AUDIO_FFMPEG_ENCODER_HPP_
#define BUGG_INCLUDE_AUDIO_FFMPEG_ENCODER_HPP_

#include "Audio/IAudioEncoder.hpp"
#include "HAL/IHalLog.hpp"

namespace bugg::audio{

class FfmpegEncoder : public IAudioEncoder{
public:
  static constexpr const char* TAG = "MP3";

  explicit FfmpegEncoder(hal::IHalLog* log = nullptr, std::string binary = "ffmpeg")
    : log_(log), binary_(std::move(binary)){}

  const char* extension() const override{ return "mp3"; }

  hal::HalResult encodeFile(const std::string& wav_path, const std::string& out_path) override;
  hal::HalResult encodeBuffer(const std::vector<uint8_t>& wav, std::vector<uint8_t>& out) override;

private:
  hal::IHalLog* log_ = nullptr;
  std::string binary_;
};

} // namespace bugg::audio

#endif // BUGG_INCLUDE_AUDIO_FFMPEG_ENCODER_HPP_
