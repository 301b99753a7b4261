/*****************************************************************
 * File:      UploadWorker.hpp
 * Category:  include/Application
 * Author:    Bugg Project
 *
 * Purpose:
 *    The upload task. Pulls finished segments (or stream chunks)
 *    from the handoff queue and hands them to the transport,
 *    retrying retryable failures with bounded exponential backoff.
 *    Only this task ever waits on the network.
 *
 * Shutdown:
 *    requestDrain() lets the worker finish what is queued until a
 *    deadline; abort() stops at the next check. Segments that were
 *    not delivered keep their files and are recovered next start.
 *****************************************************************/

#ifndef BUGG_INCLUDE_APPLICATION_UPLOAD_WORKER_HPP_
#define BUGG_INCLUDE_APPLICATION_UPLOAD_WORKER_HPP_

#include "Application/HandoffQueue.hpp"
#include "Audio/SensorSource.hpp"
#include "Diagnostics/LedStatusController.hpp"
#include "HAL/IHalLog.hpp"
#include "HAL/IHalTimer.hpp"
#include "Network/RetryPolicy.hpp"
#include "Network/UploadTransport.hpp"
#include "Storage/SegmentStore.hpp"

#include <atomic>
#include <deque>
#include <thread>

namespace bugg::app{

using SegmentQueue = HandoffQueue<storage::AudioSegment>;
using ChunkQueue = HandoffQueue<std::vector<uint8_t>>;

class UploadWorker{
public:
  static constexpr const char* TAG = "UPLOAD";

  struct Options{
    uint32_t startup_delay_s = 0;      ///< Wait before the first batch
    uint32_t offline_pause_ms = 60000; ///< Wait after the network stayed down
    size_t backlog_limit = FILE_QUEUE_CAPACITY;
    bool compress_chunks = true;
  };

  /** File-segment worker */
  UploadWorker(net::UploadTransport* transport, storage::SegmentStore* store, SegmentQueue* queue,
               const net::RetryPolicy& policy, const Options& options,
               hal::IHalSystemTimer* timer, hal::IHalLog* log = nullptr,
               diag::LedStatusController* leds = nullptr);

  /** Stream-chunk worker */
  UploadWorker(net::UploadTransport* transport, ChunkQueue* chunks, const audio::SensorSource* sensor,
               const Options& options, hal::IHalSystemTimer* timer, hal::IHalLog* log = nullptr,
               diag::LedStatusController* leds = nullptr);

  ~UploadWorker();

  UploadWorker(const UploadWorker&) = delete;
  UploadWorker& operator=(const UploadWorker&) = delete;

  void start();

  /** Deliver what is queued, giving up once grace_ms has passed */
  void requestDrain(uint32_t grace_ms);

  /** Stop as soon as possible */
  void abort();

  void join();

  /** Send one segment, retrying until ACK, FATAL or the ceiling.
   * The file is deleted only on ACK.
   * @return Final classification
   */
  net::SendStatus deliverWithRetry(storage::AudioSegment& segment);

  uint64_t deliveredCount() const{ return delivered_.load(); }
  uint64_t failedCount() const{ return failed_.load(); }
  uint64_t attemptCount() const{ return attempts_.load(); }
  bool isDraining() const{ return draining_.load(); }
  bool isFinished() const{ return finished_.load(); }

private:
  void runFiles();
  void runStream();
  bool stopRequested() const;
  bool deadlinePassed() const;

  /** Sleep in short slices; false if stopped or past the deadline */
  bool pause(uint32_t ms);

  void setData(diag::DataLedState state);
  void keepBacklog(storage::AudioSegment segment);

  net::UploadTransport* transport_ = nullptr;
  storage::SegmentStore* store_ = nullptr;
  SegmentQueue* queue_ = nullptr;
  ChunkQueue* chunks_ = nullptr;
  const audio::SensorSource* sensor_ = nullptr;
  net::RetryPolicy policy_;
  Options options_;
  hal::IHalSystemTimer* timer_ = nullptr;
  hal::IHalLog* log_ = nullptr;
  diag::LedStatusController* leds_ = nullptr;

  std::thread thread_;
  std::deque<storage::AudioSegment> backlog_;
  std::atomic<bool> aborted_{false};
  std::atomic<bool> draining_{false};
  std::atomic<bool> finished_{false};
  std::atomic<hal::timestamp_ms_t> deadline_ms_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> attempts_{0};
};

} // namespace bugg::app

#endif // BUGG_INCLUDE_APPLICATION_UPLOAD_WORKER_HPP_
