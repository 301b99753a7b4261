/*****************************************************************
 * File:      SensorSource.hpp
 * Category:  include/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    Polymorphic audio producer. A concrete microphone front-end
 *    is selected once at startup from the configuration; the
 *    orchestrator only sees this interface.
 *
 * Capabilities:
 *    captureData          record one segment plus the splice trim
 *    postprocess          trim, amplify, optionally compress
 *    sleepUntilNextSample wait out the configured capture delay
 *    startStream/readChunk/postprocessChunk for continuous mode
 *****************************************************************/

#ifndef BUGG_INCLUDE_AUDIO_SENSOR_SOURCE_HPP_
#define BUGG_INCLUDE_AUDIO_SENSOR_SOURCE_HPP_

#include "Audio/IAudioEncoder.hpp"
#include "Config/DeviceConfig.hpp"
#include "HAL/Hal.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace bugg::audio{

/** Seconds dropped from the start of every file segment (start-up pop) */
constexpr uint32_t SPLICE_TRIM_SECONDS = 1;

/** Duration of one continuous-mode chunk */
constexpr uint32_t STREAM_CHUNK_MS = 300;

/** Granularity at which the capture delay notices a stop request */
constexpr uint32_t SLEEP_STEP_MS = 100;

class SensorSource{
public:
  static constexpr const char* TAG = "SENSOR";

  SensorSource(const config::SensorConfig& config, const hal::HalContext& hal,
               IAudioEncoder* encoder)
    : config_(config), hal_(hal), encoder_(encoder){}
  virtual ~SensorSource() = default;

  SensorSource(const SensorSource&) = delete;
  SensorSource& operator=(const SensorSource&) = delete;

  /** Short name for logs */
  virtual const char* name() const = 0;

  /** Power and configure the front-end
   * @return HalResult::OK on success
   */
  virtual hal::HalResult setup() = 0;

  /** Power the front-end down */
  virtual void shutdown(){}

  /** Format this front-end records in */
  virtual hal::AudioFormat captureFormat() const = 0;

  // ----------------------------------------------------------
  // File segments
  // ----------------------------------------------------------

  /** Record recordLength + trim seconds to a WAV file.
   * Blocks for the whole duration.
   * @return HalResult::DEVICE_NOT_FOUND if the capture device is missing
   */
  hal::HalResult captureData(const std::string& raw_path);

  /** Produce the finalized segment from a sealed raw recording.
   * Drops exactly trimSeconds() from the start, caps the output at
   * recordLength seconds and applies amplification. Depends only on
   * the raw file and the compress flag.
   * @param raw_path Sealed raw WAV
   * @param out_base Output path without extension
   * @param compress Encode to MP3
   * @param final_path Output file written
   */
  hal::HalResult postprocess(const std::string& raw_path, const std::string& out_base,
                             bool compress, std::string* final_path) const;

  /** Block for the configured delay between captures
   * @param stop Ends the wait early when set
   * @return false if the wait was cut short
   */
  bool sleepUntilNextSample(const std::atomic<bool>* stop = nullptr);

  // ----------------------------------------------------------
  // Continuous stream
  // ----------------------------------------------------------

  hal::HalResult startStream();

  /** Read one STREAM_CHUNK_MS chunk of raw PCM */
  hal::HalResult readChunk(std::vector<uint8_t>& pcm);

  hal::HalResult stopStream();

  /** Amplify and wrap one raw chunk, compressing when asked. No trim. */
  hal::HalResult postprocessChunk(const std::vector<uint8_t>& pcm, bool compress,
                                  std::vector<uint8_t>& out) const;

  uint32_t trimSeconds() const{ return SPLICE_TRIM_SECONDS; }
  uint32_t recordLengthSeconds() const{ return config_.record_length_s; }
  size_t chunkBytes() const;

protected:
  config::SensorConfig config_;
  hal::HalContext hal_;
  IAudioEncoder* encoder_ = nullptr;
};

/** Create the front-end named by config.type */
std::unique_ptr<SensorSource> createSensorSource(const config::SensorConfig& config,
                                                 const hal::HalContext& hal,
                                                 IAudioEncoder* encoder);

} // namespace bugg::audio

#endif // BUGG_INCLUDE_AUDIO_SENSOR_SOURCE_HPP_
