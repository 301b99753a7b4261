/*****************************************************************
 * File:      IHalAudioCapture.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Audio capture Hardware Abstraction Layer interface.
 *    Provides blocking fixed-duration recording to a WAV file and
 *    a raw PCM stream for continuous capture.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_AUDIO_CAPTURE_HPP_
#define BUGG_INCLUDE_HAL_IHAL_AUDIO_CAPTURE_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** One fixed-duration capture */
struct CaptureRequest{
  uint8_t card = 0;            ///< ALSA card index
  AudioFormat format;          ///< Rate, channels and sample format
  uint32_t duration_s = 0;     ///< Recording length in seconds
};

/** Audio Capture Hardware Abstraction Interface */
class IHalAudioCapture{
public:
  virtual ~IHalAudioCapture() = default;

  /** Check if the capture card exists
   * @param card ALSA card index
   * @return true if present
   */
  virtual bool isDevicePresent(uint8_t card) = 0;

  /** Record to a WAV file, blocking for the full duration
   * @param request Capture parameters
   * @param wav_path Destination file
   * @return HalResult::DEVICE_NOT_FOUND if the card is missing
   */
  virtual HalResult record(const CaptureRequest& request, const char* wav_path) = 0;

  /** Start a raw PCM stream
   * @param card ALSA card index
   * @param format Stream format
   * @return HalResult::OK on success
   */
  virtual HalResult openStream(uint8_t card, const AudioFormat& format) = 0;

  /** Read raw interleaved PCM from the stream, blocking until full
   * @param buffer Destination buffer
   * @param length Bytes wanted
   * @param bytes_read Bytes actually read
   * @return HalResult::OK on success
   */
  virtual HalResult readStream(uint8_t* buffer, size_t length, size_t* bytes_read) = 0;

  /** Stop the raw PCM stream */
  virtual HalResult closeStream() = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_AUDIO_CAPTURE_HPP_
