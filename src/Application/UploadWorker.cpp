/*****************************************************************
 * File:      UploadWorker.cpp
 * Category:  src/Application
 * Author:    Bugg Project
 *****************************************************************/

#include "Application/UploadWorker.hpp"

#include <algorithm>

namespace bugg::app{

using hal::HalResult;
using net::SendOutcome;
using net::SendStatus;
using storage::AudioSegment;

static constexpr uint32_t POLL_MS = 250;

UploadWorker::UploadWorker(net::UploadTransport* transport, storage::SegmentStore* store,
                           SegmentQueue* queue, const net::RetryPolicy& policy,
                           const Options& options, hal::IHalSystemTimer* timer,
                           hal::IHalLog* log, diag::LedStatusController* leds)
  : transport_(transport), store_(store), queue_(queue), policy_(policy), options_(options),
    timer_(timer), log_(log), leds_(leds){}

UploadWorker::UploadWorker(net::UploadTransport* transport, ChunkQueue* chunks,
                           const audio::SensorSource* sensor, const Options& options,
                           hal::IHalSystemTimer* timer, hal::IHalLog* log,
                           diag::LedStatusController* leds)
  : transport_(transport), chunks_(chunks), sensor_(sensor), options_(options),
    timer_(timer), log_(log), leds_(leds){}

UploadWorker::~UploadWorker(){
  abort();
  join();
}

void UploadWorker::start(){
  if(thread_.joinable()) return;
  finished_ = false;
  if(chunks_){
    thread_ = std::thread(&UploadWorker::runStream, this);
  }else{
    thread_ = std::thread(&UploadWorker::runFiles, this);
  }
}

void UploadWorker::requestDrain(uint32_t grace_ms){
  deadline_ms_ = timer_->millis() + grace_ms;
  draining_ = true;
  if(queue_) queue_->close();
  if(chunks_) chunks_->close();
  if(log_) log_->info(TAG, "Draining uploads (grace %u ms)", grace_ms);
}

void UploadWorker::abort(){
  aborted_ = true;
  if(queue_) queue_->close();
  if(chunks_) chunks_->close();
}

void UploadWorker::join(){
  if(thread_.joinable()) thread_.join();
}

bool UploadWorker::deadlinePassed() const{
  return timer_->millis() >= deadline_ms_.load();
}

bool UploadWorker::stopRequested() const{
  return aborted_.load() || (draining_.load() && deadlinePassed());
}

bool UploadWorker::pause(uint32_t ms){
  uint32_t waited = 0;
  while(waited < ms){
    if(stopRequested()) return false;
    uint32_t step = std::min(POLL_MS, ms - waited);
    timer_->delayMs(step);
    waited += step;
  }
  return !stopRequested();
}

void UploadWorker::setData(diag::DataLedState state){
  if(leds_) leds_->setData(state);
}

void UploadWorker::keepBacklog(AudioSegment segment){
  backlog_.push_back(std::move(segment));
  while(backlog_.size() > options_.backlog_limit){
    AudioSegment& oldest = backlog_.front();
    if(log_) log_->warn(TAG, "Upload backlog full, %s left on storage", oldest.name.c_str());
    store_->markFailed(oldest);
    failed_++;
    backlog_.pop_front();
  }
}

// ============================================================
// Delivery
// ============================================================

SendStatus UploadWorker::deliverWithRetry(AudioSegment& segment){
  if(segment.state == storage::SegmentState::QUEUED){
    HalResult result = store_->beginUpload(segment);
    if(result != HalResult::OK) return SendStatus::FATAL;
  }

  net::UploadMetadata meta;
  size_t slash = segment.final_path.find_last_of('/');
  meta.file_name = slash == std::string::npos ? segment.final_path : segment.final_path.substr(slash + 1);
  meta.sequence = segment.sequence;

  for(uint32_t attempt = 1; attempt <= policy_.max_attempts; attempt++){
    attempts_++;
    setData(diag::DataLedState::UPLOADING);
    SendOutcome outcome = transport_->send(segment.final_path, meta);

    if(outcome.status == SendStatus::ACK){
      store_->markDelivered(segment);
      delivered_++;
      setData(diag::DataLedState::CONNECTED);
      return SendStatus::ACK;
    }
    if(outcome.status == SendStatus::FATAL){
      if(log_) log_->error(TAG, "%s rejected: %s", meta.file_name.c_str(), outcome.reason.c_str());
      HalResult result = store_->markRejected(segment);
      if(result != HalResult::OK && log_) log_->logResult(result, TAG, "set aside rejected segment");
      failed_++;
      setData(diag::DataLedState::CONNECTED);
      return SendStatus::FATAL;
    }

    if(attempt == policy_.max_attempts) break;
    uint32_t delay = policy_.backoffFor(attempt);
    if(log_) log_->warn(TAG, "%s attempt %u/%u failed (%s), retry in %u ms", meta.file_name.c_str(),
                        attempt, policy_.max_attempts, outcome.reason.c_str(), delay);
    if(!pause(delay)) break;
  }

  if(log_) log_->error(TAG, "Giving up on %s for this run", meta.file_name.c_str());
  store_->markFailed(segment);
  failed_++;
  setData(diag::DataLedState::NOT_CONNECTED);
  return SendStatus::RETRYABLE;
}

// ============================================================
// File loop
// ============================================================

void UploadWorker::runFiles(){
  if(options_.startup_delay_s > 0){
    if(log_) log_->info(TAG, "First upload in %u s", options_.startup_delay_s);
    uint32_t waited = 0;
    const uint32_t total = options_.startup_delay_s * 1000;
    while(waited < total && !aborted_ && !draining_){
      uint32_t step = std::min(POLL_MS, total - waited);
      timer_->delayMs(step);
      waited += step;
    }
  }

  bool batch_open = false;
  while(!aborted_){
    if(backlog_.empty()){
      std::optional<AudioSegment> item = queue_->popWait(POLL_MS);
      if(item) keepBacklog(std::move(*item));
    }
    while(std::optional<AudioSegment> more = queue_->tryPop()){
      keepBacklog(std::move(*more));
    }

    if(backlog_.empty()){
      if(batch_open){
        transport_->endBatch();
        batch_open = false;
      }
      if(draining_) break;
      continue;
    }
    if(stopRequested()) break;

    if(!batch_open){
      HalResult result = transport_->beginBatch();
      if(result != HalResult::OK){
        if(log_) log_->warn(TAG, "%s: network unavailable (%s), %zu waiting", transport_->name(),
                            hal::halResultToString(result), backlog_.size());
        setData(diag::DataLedState::NOT_CONNECTED);
        transport_->endBatch();
        if(!pause(options_.offline_pause_ms)) break;
        continue;
      }
      batch_open = true;
      setData(diag::DataLedState::CONNECTED);
    }

    AudioSegment segment = std::move(backlog_.front());
    backlog_.pop_front();
    if(deliverWithRetry(segment) == SendStatus::RETRYABLE){
      // The link is likely down; reopen it before the next file
      transport_->endBatch();
      batch_open = false;
    }
  }

  size_t kept = 0;
  while(std::optional<AudioSegment> rest = queue_->tryPop()){
    keepBacklog(std::move(*rest));
  }
  for(AudioSegment& segment : backlog_){
    store_->markFailed(segment);
    kept++;
  }
  backlog_.clear();
  if(kept && log_) log_->warn(TAG, "%zu segments left for the next run", kept);

  if(batch_open) transport_->endBatch();
  transport_->stop();
  finished_ = true;
}

// ============================================================
// Stream loop
// ============================================================

void UploadWorker::runStream(){
  HalResult result = transport_->start();
  setData(result == HalResult::OK ? diag::DataLedState::UPLOADING : diag::DataLedState::NOT_CONNECTED);

  while(!aborted_){
    std::optional<std::vector<uint8_t>> chunk = chunks_->popWait(POLL_MS);
    if(!chunk){
      if(draining_) break;
      continue;
    }
    if(stopRequested()) break;

    std::vector<uint8_t> payload;
    result = sensor_->postprocessChunk(*chunk, options_.compress_chunks, payload);
    if(result != HalResult::OK){
      if(log_) log_->warn(TAG, "Chunk postprocess failed: %s", hal::halResultToString(result));
      continue;
    }

    attempts_++;
    if(transport_->pushChunk(std::move(payload))){
      delivered_++;
      setData(diag::DataLedState::UPLOADING);
    }else{
      setData(diag::DataLedState::NOT_CONNECTED);
    }
  }

  if(!aborted_ && !transport_->flush() && log_){
    log_->warn(TAG, "Stream buffer not flushed before stop");
  }
  transport_->stop();
  finished_ = true;
}

} // namespace bugg::app
