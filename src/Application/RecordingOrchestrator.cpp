/*****************************************************************
 * File:      RecordingOrchestrator.cpp
 * Category:  src/Application
 * Author:    Bugg Project
 *****************************************************************/

#include "Application/RecordingOrchestrator.hpp"

#include <algorithm>
#include <chrono>

namespace bugg::app{

using hal::HalResult;
using storage::AudioSegment;

RecordingOrchestrator::RecordingOrchestrator(const config::DeviceConfig& config,
                                             const OrchestratorDeps& deps,
                                             const Options& options)
  : config_(config), deps_(deps), options_(options), strategy_(strategyFor(config.mode)),
    offline_(config.offline_mode),
    backend_(deps.hal.sd_storage, deps.hal.onboard_storage, deps.hal.log),
    watchdog_(config.reboot_hour_utc, config.reboot_minute_utc){}

RecordingOrchestrator::~RecordingOrchestrator(){
  requestStop();
  net_abort_ = true;
  if(worker_) worker_->abort();
  if(record_thread_.joinable()) record_thread_.join();
  closePostprocess();
  if(worker_) worker_->join();
}

void RecordingOrchestrator::requestStop(){
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    capture_stop_ = true;
  }
  cv_.notify_all();
}

bool RecordingOrchestrator::rebootDue(){
  if(!deps_.hal.timer || !watchdog_.isDue(deps_.hal.timer->utcNowMs())) return false;
  if(!reboot_due_.exchange(true)){
    hal::IHalLog* log = deps_.hal.log;
    if(log) log->info(TAG, "Daily reboot due, finishing up");
  }
  return true;
}

// ============================================================
// Setup
// ============================================================

RunOutcome RecordingOrchestrator::setup(){
  hal::IHalLog* log = deps_.hal.log;
  diag::LedStatusController* leds = deps_.leds;

  if(log) log->info(TAG, "Mode %u (%s), %s", static_cast<unsigned>(config_.mode),
                    config::recordingModeToString(config_.mode), offline_ ? "offline" : "online");

  if(strategy_.requires_network && offline_){
    if(log) log->error(TAG, "Mode %s needs a network connection but offline_mode is set",
                       config::recordingModeToString(config_.mode));
    if(leds) leds->setData(diag::DataLedState::OFFLINE);
    return RunOutcome::CONFIG_ERROR;
  }
  if(leds) leds->setData(diag::DataLedState::SETUP);

  // Modem: no modem means no uploads this run
  if(!offline_){
    HalResult result = deps_.hal.modem ? deps_.hal.modem->powerOn() : HalResult::NOT_INITIALIZED;
    if(result != HalResult::OK){
      if(log) log->warn(TAG, "Modem power on failed (%s), running offline",
                        hal::halResultToString(result));
      offline_ = true;
      if(strategy_.requires_network){
        if(log) log->error(TAG, "Mode %s cannot run without a modem",
                           config::recordingModeToString(config_.mode));
        if(leds) leds->setData(diag::DataLedState::OFFLINE);
        return RunOutcome::CONFIG_ERROR;
      }
    }
  }

  gate_ = std::make_unique<net::ConnectivityGate>(deps_.hal.network, deps_.hal.timer, offline_,
                                                  options_.gate, log, deps_.hal.rtc);
  if(leds){
    gate_->setStatusListener([leds](bool connected){
      leds->setData(connected ? diag::DataLedState::CONNECTED : diag::DataLedState::NOT_CONNECTED);
    });
  }
  if(!offline_){
    // One quick probe sets the clock early when the link is already up
    gate_->checkNow();
    if(strategy_.modem == ModemPolicy::DOWN_BETWEEN_BATCHES && deps_.hal.modem){
      HalResult result = deps_.hal.modem->powerOff();
      if(log) log->logResult(result, TAG, "modem off until first upload batch");
    }
  }

  // Storage
  storage::DataLayout layout;
  layout.project_id = config_.project_id;
  layout.config_id = config_.config_id;
  if(deps_.hal.system) layout.serial = deps_.hal.system->getDeviceSerial();
  HalResult result = backend_.init(layout);
  if(result != HalResult::OK){
    if(log) log->error(TAG, "No usable storage: %s", hal::halResultToString(result));
    return RunOutcome::FATAL;
  }
  result = backend_.cleanWorkingDir();
  if(result != HalResult::OK && log) log->logResult(result, TAG, "clean working directory");
  store_ = std::make_unique<storage::SegmentStore>(&backend_, audio::SPLICE_TRIM_SECONDS, log);

  // Sensor
  sensor_ = audio::createSensorSource(config_.sensor, deps_.hal, deps_.encoder);
  if(!sensor_) return RunOutcome::CONFIG_ERROR;
  result = sensor_->setup();
  if(hal::isHardwareFault(result)){
    if(log) log->error(TAG, "Sensor %s setup failed: %s", sensor_->name(), hal::halResultToString(result));
    return RunOutcome::FATAL;
  }
  if(result != HalResult::OK && log) log->warn(TAG, "Sensor setup: %s", hal::halResultToString(result));

  // Upload side
  if(offline_){
    if(log) log->info(TAG, "Offline: recordings stay on %s", hal::storageTypeToString(backend_.activeType()));
    if(leds) leds->setData(diag::DataLedState::OFFLINE);
  }else{
    transport_ = createTransport(strategy_, config_, deps_.hal, deps_.clients, gate_.get(), &net_abort_);
    if(!transport_){
      if(log) log->error(TAG, "No client available for the %s transport",
                         config::recordingModeToString(config_.mode));
      return RunOutcome::CONFIG_ERROR;
    }
  }

  UploadWorker::Options worker_options;
  worker_options.startup_delay_s = startupDelaySeconds(strategy_, config_);
  worker_options.offline_pause_ms = options_.offline_pause_ms;
  worker_options.backlog_limit = options_.file_queue_capacity;
  worker_options.compress_chunks = config_.sensor.compress;

  if(strategy_.lifecycle == SegmentLifecycle::STREAM_CHUNKS){
    chunk_queue_ = std::make_unique<ChunkQueue>(options_.stream_queue_capacity);
    worker_ = std::make_unique<UploadWorker>(transport_.get(), chunk_queue_.get(), sensor_.get(),
                                             worker_options, deps_.hal.timer, log, leds);
  }else{
    segment_queue_ = std::make_unique<SegmentQueue>(options_.file_queue_capacity);
    if(transport_){
      // Files from an earlier run go out ahead of new captures
      std::vector<AudioSegment> pending;
      result = store_->recoverPending(pending);
      if(result != HalResult::OK && log) log->logResult(result, TAG, "recover pending segments");
      for(AudioSegment& segment : pending){
        std::optional<AudioSegment> evicted = segment_queue_->push(std::move(segment));
        if(evicted){
          queue_dropped_++;
          store_->markFailed(*evicted);
        }
      }
      worker_ = std::make_unique<UploadWorker>(transport_.get(), store_.get(), segment_queue_.get(),
                                               net::RetryPolicy::fromConfig(config_.upload),
                                               worker_options, deps_.hal.timer, log, leds);
    }
  }
  return RunOutcome::STOPPED;
}

// ============================================================
// Recording task
// ============================================================

void RecordingOrchestrator::startPostprocess(){
  {
    std::lock_guard<std::mutex> lock(postprocess_mutex_);
    postprocess_closed_ = false;
  }
  postprocess_thread_ = std::thread(&RecordingOrchestrator::postprocessLoop, this);
}

void RecordingOrchestrator::submitPostprocess(AudioSegment segment){
  {
    std::lock_guard<std::mutex> lock(postprocess_mutex_);
    postprocess_fifo_.push_back(std::move(segment));
  }
  postprocess_cv_.notify_one();
}

void RecordingOrchestrator::closePostprocess(){
  {
    std::lock_guard<std::mutex> lock(postprocess_mutex_);
    postprocess_closed_ = true;
  }
  postprocess_cv_.notify_all();
  if(postprocess_thread_.joinable()) postprocess_thread_.join();
}

void RecordingOrchestrator::postprocessLoop(){
  for(;;){
    AudioSegment segment;
    {
      std::unique_lock<std::mutex> lock(postprocess_mutex_);
      postprocess_cv_.wait(lock, [this]{ return postprocess_closed_ || !postprocess_fifo_.empty(); });
      // Closed and empty: every sealed segment has been handled
      if(postprocess_fifo_.empty()) return;
      segment = std::move(postprocess_fifo_.front());
      postprocess_fifo_.pop_front();
    }
    postprocessAndEnqueue(std::move(segment));
  }
}

bool RecordingOrchestrator::pauseCapture(uint32_t ms){
  uint32_t waited = 0;
  while(waited < ms){
    if(capture_stop_) return false;
    uint32_t step = std::min(audio::SLEEP_STEP_MS, ms - waited);
    deps_.hal.timer->delayMs(step);
    waited += step;
  }
  return !capture_stop_;
}

void RecordingOrchestrator::postprocessAndEnqueue(AudioSegment segment){
  hal::IHalLog* log = deps_.hal.log;

  std::string processed;
  HalResult result = sensor_->postprocess(segment.raw_path, backend_.workingPath(segment.name),
                                          config_.sensor.compress, &processed);
  if(result != HalResult::OK){
    if(log) log->error(TAG, "Postprocess of %s failed: %s", segment.name.c_str(),
                       hal::halResultToString(result));
    store_->discard(segment);
    return;
  }

  result = store_->finalize(segment, processed);
  if(result != HalResult::OK){
    if(log) log->error(TAG, "Could not store %s: %s", segment.name.c_str(), hal::halResultToString(result));
    store_->discard(segment);
    backend_.remove(processed);
    return;
  }

  // Offline: the finished file simply stays on storage
  if(!worker_ || !segment_queue_) return;

  result = store_->enqueue(segment);
  if(result != HalResult::OK) return;
  queued_++;
  std::optional<AudioSegment> evicted = segment_queue_->push(std::move(segment));
  if(evicted){
    queue_dropped_++;
    if(log) log->warn(TAG, "Upload queue full, %s stays on storage", evicted->name.c_str());
    store_->markFailed(*evicted);
  }
}

void RecordingOrchestrator::recordFiles(){
  hal::IHalLog* log = deps_.hal.log;
  diag::LedStatusController* leds = deps_.leds;

  uint32_t failures = 0;
  uint32_t retry_ms = options_.capture_retry_ms;

  while(!capture_stop_){
    if(rebootDue()) break;

    AudioSegment segment = store_->open(deps_.hal.timer->utcNowMs());
    if(log) log->info(TAG, "Capturing %s", segment.name.c_str());
    if(leds) leds->setRecording(true);
    HalResult result = sensor_->captureData(segment.raw_path);
    if(leds) leds->setRecording(false);

    if(result != HalResult::OK){
      store_->discard(segment);
      if(hal::isHardwareFault(result)){
        if(log) log->error(TAG, "Capture hardware fault: %s", hal::halResultToString(result));
        fatal_ = true;
        break;
      }
      failures++;
      if(failures >= options_.capture_failure_limit){
        if(log) log->error(TAG, "Capture failed %u times in a row (%s), giving up",
                           failures, hal::halResultToString(result));
        fatal_ = true;
        break;
      }
      if(log) log->warn(TAG, "Capture failed (%s), retry %u in %ums", hal::halResultToString(result),
                        failures, retry_ms);
      if(!pauseCapture(retry_ms)) break;
      retry_ms = std::min(retry_ms * 2, options_.capture_retry_max_ms);
      continue;
    }
    failures = 0;
    retry_ms = options_.capture_retry_ms;

    store_->seal(segment);
    captured_++;
    submitPostprocess(std::move(segment));

    if(capture_stop_) break;
    sensor_->sleepUntilNextSample(&capture_stop_);
  }
}

void RecordingOrchestrator::recordStream(){
  hal::IHalLog* log = deps_.hal.log;
  diag::LedStatusController* leds = deps_.leds;

  HalResult result = sensor_->startStream();
  if(result != HalResult::OK){
    if(log) log->error(TAG, "Stream start failed: %s", hal::halResultToString(result));
    fatal_ = true;
    return;
  }
  if(leds) leds->setRecording(true);

  bool restarted = false;
  while(!capture_stop_){
    if(rebootDue()) break;

    std::vector<uint8_t> pcm;
    result = sensor_->readChunk(pcm);
    if(result == HalResult::OK){
      restarted = false;
      captured_++;
      if(chunk_queue_->push(std::move(pcm))) queue_dropped_++;
      continue;
    }
    if(result == HalResult::BUFFER_EMPTY) continue;

    if(hal::isHardwareFault(result) || restarted){
      if(log) log->error(TAG, "Stream capture failed: %s", hal::halResultToString(result));
      fatal_ = true;
      break;
    }
    // One restart is allowed for a transient capture error
    if(log) log->warn(TAG, "Stream read failed (%s), restarting capture", hal::halResultToString(result));
    sensor_->stopStream();
    restarted = true;
    if(sensor_->startStream() != HalResult::OK){
      fatal_ = true;
      break;
    }
  }

  sensor_->stopStream();
  if(leds) leds->setRecording(false);
}

void RecordingOrchestrator::finishRecording(){
  capture_stop_ = true;
  if(record_thread_.joinable()) record_thread_.join();
  closePostprocess();
}

void RecordingOrchestrator::shutdownUploads(){
  if(!worker_) return;
  hal::IHalSystemTimer* timer = deps_.hal.timer;

  const uint32_t grace_ms = config_.upload.shutdown_grace_s * 1000;
  const hal::timestamp_ms_t deadline = timer->millis() + grace_ms;
  worker_->requestDrain(grace_ms);

  while(!worker_->isFinished()){
    if(timer->millis() >= deadline){
      // Cancels any connectivity wait still in progress
      net_abort_ = true;
      worker_->abort();
      break;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(50));
  }
  worker_->join();

  hal::IHalLog* log = deps_.hal.log;
  if(log){
    log->info(TAG, "Uploads: %llu delivered, %llu left on storage",
              static_cast<unsigned long long>(worker_->deliveredCount()),
              static_cast<unsigned long long>(worker_->failedCount()));
  }
}

// ============================================================
// Run
// ============================================================

RunOutcome RecordingOrchestrator::run(){
  hal::IHalLog* log = deps_.hal.log;

  RunOutcome outcome = setup();
  if(outcome != RunOutcome::STOPPED) return outcome;
  if(stop_requested_) return RunOutcome::STOPPED;

  watchdog_.arm(deps_.hal.timer->utcNowMs());
  if(worker_) worker_->start();

  if(strategy_.lifecycle == SegmentLifecycle::STREAM_CHUNKS){
    record_thread_ = std::thread([this]{
      recordStream();
      recording_done_ = true;
      cv_.notify_all();
    });
  }else{
    startPostprocess();
    record_thread_ = std::thread([this]{
      recordFiles();
      recording_done_ = true;
      cv_.notify_all();
    });
  }

  {
    std::unique_lock<std::mutex> lock(mutex_);
    while(!stop_requested_ && !recording_done_){
      cv_.wait_for(lock, std::chrono::milliseconds(200));
    }
  }

  if(log) log->info(TAG, "Shutting down: finishing current capture");
  finishRecording();
  shutdownUploads();
  if(sensor_) sensor_->shutdown();
  if(deps_.leds) deps_.leds->setRecording(false);

  if(fatal_) outcome = RunOutcome::FATAL;
  else if(reboot_due_ && !stop_requested_) outcome = RunOutcome::REBOOT;
  else outcome = RunOutcome::STOPPED;

  if(log) log->info(TAG, "Session ended: %s (%llu captured)", runOutcomeToString(outcome),
                    static_cast<unsigned long long>(captured_.load()));
  return outcome;
}

} // namespace bugg::app
