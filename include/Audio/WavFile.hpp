/*****************************************************************
 * File:      WavFile.hpp
 * Category:  include/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    Minimal streaming RIFF/WAVE reader and writer for integer
 *    PCM (16 and 32 bit). Used by postprocessing so that a
 *    twenty-minute segment never has to fit in memory.
 *****************************************************************/

#ifndef BUGG_INCLUDE_AUDIO_WAV_FILE_HPP_
#define BUGG_INCLUDE_AUDIO_WAV_FILE_HPP_

#include "HAL/HalTypes.hpp"
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace bugg::audio{

/** Size of the canonical header this writer produces */
constexpr size_t WAV_HEADER_SIZE = 44;

/** Streaming WAV reader */
class WavReader{
public:
  WavReader() = default;
  ~WavReader();

  WavReader(const WavReader&) = delete;
  WavReader& operator=(const WavReader&) = delete;

  /** Open a file and parse the header up to the data chunk
   * @return HalResult::INVALID_PARAM for non-PCM or malformed files
   */
  hal::HalResult open(const std::string& path);

  void close();

  /** Read up to length bytes of PCM data */
  hal::HalResult read(uint8_t* buffer, size_t length, size_t* bytes_read);

  /** Skip whole frames of PCM data */
  hal::HalResult skipFrames(uint64_t frames);

  const hal::AudioFormat& format() const{ return format_; }
  uint64_t dataBytes() const{ return data_bytes_; }
  uint64_t frameCount() const{
    return format_.bytesPerFrame() ? data_bytes_ / format_.bytesPerFrame() : 0;
  }

private:
  FILE* file_ = nullptr;
  hal::AudioFormat format_;
  uint64_t data_bytes_ = 0;
  uint64_t remaining_ = 0;
};

/** Streaming WAV writer; sizes are patched in close() */
class WavWriter{
public:
  WavWriter() = default;
  ~WavWriter();

  WavWriter(const WavWriter&) = delete;
  WavWriter& operator=(const WavWriter&) = delete;

  hal::HalResult open(const std::string& path, const hal::AudioFormat& format);
  hal::HalResult write(const uint8_t* data, size_t length);

  /** Finalize the header and close the file */
  hal::HalResult close();

  uint64_t dataBytes() const{ return data_bytes_; }

private:
  FILE* file_ = nullptr;
  hal::AudioFormat format_;
  uint64_t data_bytes_ = 0;
};

/** Build a canonical 44-byte header for a PCM payload */
std::vector<uint8_t> makeWavHeader(const hal::AudioFormat& format, uint32_t data_bytes);

/** Multiply every sample by factor, clipping to the sample range.
 * Trailing bytes that do not form a whole sample are left untouched.
 */
void amplifyPcm(uint8_t* data, size_t length, hal::SampleFormat format, int32_t factor);

/** Population variance of the samples of one channel of interleaved PCM */
double channelVariance(const uint8_t* data, size_t length, const hal::AudioFormat& format,
                       uint16_t channel);

} // namespace bugg::audio

#endif // BUGG_INCLUDE_AUDIO_WAV_FILE_HPP_
