/*****************************************************************
 * File:      RecordingOrchestrator.hpp
 * Category:  include/Application
 * Author:    Bugg Project
 *
 * Purpose:
 *    Runs one recording session. Sets up storage, the sensor and
 *    the mode's transport, then runs the recording task and the
 *    upload task side by side until stopped or the daily reboot
 *    is due.
 *
 * Tasks:
 *    recording    capture -> seal -> hand to postprocess (file modes)
 *                 or read chunks into the chunk queue (stream mode)
 *    postprocess  one long-lived thread fed through a FIFO, so a slow
 *                 encode never holds up the next capture and segments
 *                 are queued in capture order
 *    upload       UploadWorker; absent in offline mode
 *
 * Capture errors:
 *    hardware faults end the run at once. Other errors retry with a
 *    doubling pause until capture_failure_limit in a row end it.
 *
 * Shutdown order:
 *    stop capture after the current segment, let postprocess drain
 *    its FIFO, drain uploads within the grace period, return.
 *****************************************************************/

#ifndef BUGG_INCLUDE_APPLICATION_RECORDING_ORCHESTRATOR_HPP_
#define BUGG_INCLUDE_APPLICATION_RECORDING_ORCHESTRATOR_HPP_

#include "Application/ModeStrategy.hpp"
#include "Application/RebootWatchdog.hpp"
#include "Application/UploadWorker.hpp"
#include "Audio/IAudioEncoder.hpp"
#include "Audio/SensorSource.hpp"
#include "Config/DeviceConfig.hpp"
#include "Diagnostics/LedStatusController.hpp"
#include "Network/ConnectivityGate.hpp"
#include "Storage/SegmentStore.hpp"
#include "Storage/StorageBackend.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace bugg::app{

enum class RunOutcome : uint8_t{
  STOPPED = 0,    ///< Operator requested stop
  REBOOT,         ///< Daily reboot due
  FATAL,          ///< Hardware fault or no usable storage
  CONFIG_ERROR    ///< Configuration cannot run on this device
};

inline const char* runOutcomeToString(RunOutcome outcome){
  switch(outcome){
    case RunOutcome::STOPPED:      return "STOPPED";
    case RunOutcome::REBOOT:       return "REBOOT";
    case RunOutcome::FATAL:        return "FATAL";
    case RunOutcome::CONFIG_ERROR: return "CONFIG_ERROR";
    default:                       return "UNKNOWN";
  }
}

/** Collaborators owned by the caller */
struct OrchestratorDeps{
  hal::HalContext hal;
  audio::IAudioEncoder* encoder = nullptr;
  TransportClients clients;
  diag::LedStatusController* leds = nullptr;
};

class RecordingOrchestrator{
public:
  static constexpr const char* TAG = "ORCH";

  struct Options{
    net::ConnectivityGate::Options gate;
    uint32_t offline_pause_ms = 60000;     ///< Upload retry spacing while the link is down
    size_t file_queue_capacity = FILE_QUEUE_CAPACITY;
    size_t stream_queue_capacity = STREAM_QUEUE_CAPACITY;
    uint32_t capture_retry_ms = 1000;      ///< First pause after a non-fatal capture error
    uint32_t capture_retry_max_ms = 60000; ///< Ceiling for the doubling retry pause
    uint32_t capture_failure_limit = 5;    ///< Consecutive capture errors that end the run
  };

  RecordingOrchestrator(const config::DeviceConfig& config, const OrchestratorDeps& deps)
    : RecordingOrchestrator(config, deps, Options()){}
  RecordingOrchestrator(const config::DeviceConfig& config, const OrchestratorDeps& deps,
                        const Options& options);
  ~RecordingOrchestrator();

  RecordingOrchestrator(const RecordingOrchestrator&) = delete;
  RecordingOrchestrator& operator=(const RecordingOrchestrator&) = delete;

  /** Blocks until the session ends */
  RunOutcome run();

  /** Ask run() to shut down in order; safe from any thread */
  void requestStop();

  const ModeStrategy& strategy() const{ return strategy_; }
  bool isOffline() const{ return offline_; }
  const storage::StorageBackend& storage() const{ return backend_; }
  uint64_t segmentsCaptured() const{ return captured_.load(); }
  uint64_t segmentsQueued() const{ return queued_.load(); }
  uint64_t itemsDroppedFromQueue() const{ return queue_dropped_.load(); }
  const UploadWorker* uploadWorker() const{ return worker_.get(); }

private:
  RunOutcome setup();
  void recordFiles();
  void recordStream();
  void postprocessAndEnqueue(storage::AudioSegment segment);
  void postprocessLoop();
  void startPostprocess();
  void submitPostprocess(storage::AudioSegment segment);
  void closePostprocess();
  bool pauseCapture(uint32_t ms);
  bool rebootDue();
  void finishRecording();
  void shutdownUploads();

  config::DeviceConfig config_;
  OrchestratorDeps deps_;
  Options options_;
  const ModeStrategy& strategy_;
  bool offline_ = false;

  storage::StorageBackend backend_;
  std::unique_ptr<storage::SegmentStore> store_;
  std::unique_ptr<audio::SensorSource> sensor_;
  std::unique_ptr<net::ConnectivityGate> gate_;
  std::unique_ptr<net::UploadTransport> transport_;
  std::unique_ptr<SegmentQueue> segment_queue_;
  std::unique_ptr<ChunkQueue> chunk_queue_;
  std::unique_ptr<UploadWorker> worker_;
  RebootWatchdog watchdog_;

  std::thread record_thread_;
  std::thread postprocess_thread_;
  std::mutex postprocess_mutex_;
  std::condition_variable postprocess_cv_;
  std::deque<storage::AudioSegment> postprocess_fifo_;
  bool postprocess_closed_ = false;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> capture_stop_{false};
  std::atomic<bool> recording_done_{false};
  std::atomic<bool> reboot_due_{false};
  std::atomic<bool> fatal_{false};
  std::atomic<bool> net_abort_{false};

  std::atomic<uint64_t> captured_{0};
  std::atomic<uint64_t> queued_{0};
  std::atomic<uint64_t> queue_dropped_{0};
};

} // namespace bugg::app

#endif // BUGG_INCLUDE_APPLICATION_RECORDING_ORCHESTRATOR_HPP_
