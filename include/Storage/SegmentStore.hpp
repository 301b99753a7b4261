/*****************************************************************
 * File:      SegmentStore.hpp
 * Category:  include/Storage
 * Author:    Bugg Project
 *
 * Purpose:
 *    Lifecycle of one recorded segment from capture to delivery.
 *    An AudioSegment is a plain value moved between tasks; the
 *    store enforces the legal transitions and performs the file
 *    side effects of each one through StorageBackend.
 *
 * Lifecycle:
 *    CAPTURING -> SEALED -> COMPRESSED -> QUEUED -> UPLOADING
 *      -> DELIVERED (file deleted) | FAILED (file kept; moved
 *         out of the upload tree when the server refused it)
 *****************************************************************/

#ifndef BUGG_INCLUDE_STORAGE_SEGMENT_STORE_HPP_
#define BUGG_INCLUDE_STORAGE_SEGMENT_STORE_HPP_

#include "HAL/IHalLog.hpp"
#include "Storage/StorageBackend.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace bugg::storage{

enum class SegmentState : uint8_t{
  CAPTURING = 0,
  SEALED,
  COMPRESSED,
  QUEUED,
  UPLOADING,
  DELIVERED,
  FAILED
};

const char* segmentStateToString(SegmentState state);

/** One bounded unit of recorded audio */
struct AudioSegment{
  uint64_t sequence = 0;
  hal::epoch_ms_t start_utc_ms = 0;   ///< Start of the usable audio (after trim)
  std::string name;                   ///< File stem, e.g. 2024-05-01T02_00_01.000Z
  std::string raw_path;               ///< Working capture file
  std::string final_path;             ///< Finalized file in the data directory
  SegmentState state = SegmentState::CAPTURING;
};

class SegmentStore{
public:
  static constexpr const char* TAG = "SEGMENT";

  SegmentStore(StorageBackend* backend, uint32_t trim_seconds, hal::IHalLog* log = nullptr)
    : backend_(backend), trim_seconds_(trim_seconds), log_(log){}

  /** Begin a new segment
   * @param capture_start_ms Wall clock when the capture starts
   */
  AudioSegment open(hal::epoch_ms_t capture_start_ms);

  /** CAPTURING -> SEALED; the raw file becomes read-only */
  hal::HalResult seal(AudioSegment& segment);

  /** SEALED -> COMPRESSED; moves the processed file into the data
   * directory and deletes the raw file */
  hal::HalResult finalize(AudioSegment& segment, const std::string& processed_path);

  /** COMPRESSED -> QUEUED */
  hal::HalResult enqueue(AudioSegment& segment);

  /** QUEUED -> UPLOADING */
  hal::HalResult beginUpload(AudioSegment& segment);

  /** UPLOADING -> DELIVERED; deletes the file. Call only after the
   * remote end has acknowledged it. */
  hal::HalResult markDelivered(AudioSegment& segment);

  /** QUEUED/UPLOADING -> FAILED; the file stays for the next run */
  hal::HalResult markFailed(AudioSegment& segment);

  /** UPLOADING -> FAILED after a fatal rejection; the file moves to
   * the rejected directory so no later run sends it again */
  hal::HalResult markRejected(AudioSegment& segment);

  /** CAPTURING/SEALED -> FAILED after a capture or postprocess error;
   * removes the working file */
  hal::HalResult discard(AudioSegment& segment);

  /** Build QUEUED segments for finalized files left by an earlier run */
  hal::HalResult recoverPending(std::vector<AudioSegment>& out);

  /** File stem for a UTC time: ISO 8601 with ':' replaced by '_' */
  static std::string segmentName(hal::epoch_ms_t utc_ms);

private:
  hal::HalResult transition(AudioSegment& segment, SegmentState from, SegmentState to);

  StorageBackend* backend_ = nullptr;
  uint32_t trim_seconds_ = 0;
  hal::IHalLog* log_ = nullptr;
  std::atomic<uint64_t> next_sequence_{1};
};

} // namespace bugg::storage

#endif // BUGG_INCLUDE_STORAGE_SEGMENT_STORE_HPP_
