/*****************************************************************
 * File:      SegmentStore.cpp
 * Category:  src/Storage
 * Author:    Bugg Project
 *****************************************************************/

#include "Storage/SegmentStore.hpp"

#include <cstdio>
#include <ctime>

namespace bugg::storage{

using hal::HalResult;

const char* segmentStateToString(SegmentState state){
  switch(state){
    case SegmentState::CAPTURING:  return "CAPTURING";
    case SegmentState::SEALED:     return "SEALED";
    case SegmentState::COMPRESSED: return "COMPRESSED";
    case SegmentState::QUEUED:     return "QUEUED";
    case SegmentState::UPLOADING:  return "UPLOADING";
    case SegmentState::DELIVERED:  return "DELIVERED";
    case SegmentState::FAILED:     return "FAILED";
    default:                       return "UNKNOWN";
  }
}

std::string SegmentStore::segmentName(hal::epoch_ms_t utc_ms){
  time_t secs = static_cast<time_t>(utc_ms / 1000);
  int millis = static_cast<int>(utc_ms % 1000);
  struct tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[40];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d_%02d_%02d.%03dZ",
           tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
           tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, millis);
  return buf;
}

HalResult SegmentStore::transition(AudioSegment& segment, SegmentState from, SegmentState to){
  if(segment.state != from){
    if(log_) log_->error(TAG, "Segment %llu: illegal %s -> %s (state %s)",
                         static_cast<unsigned long long>(segment.sequence),
                         segmentStateToString(from), segmentStateToString(to),
                         segmentStateToString(segment.state));
    return HalResult::INVALID_STATE;
  }
  segment.state = to;
  return HalResult::OK;
}

AudioSegment SegmentStore::open(hal::epoch_ms_t capture_start_ms){
  AudioSegment segment;
  segment.sequence = next_sequence_.fetch_add(1);
  segment.start_utc_ms = capture_start_ms + static_cast<hal::epoch_ms_t>(trim_seconds_) * 1000;
  segment.name = segmentName(segment.start_utc_ms);
  segment.raw_path = backend_->workingPath(segment.name + ".raw.wav");
  segment.state = SegmentState::CAPTURING;
  return segment;
}

HalResult SegmentStore::seal(AudioSegment& segment){
  HalResult result = transition(segment, SegmentState::CAPTURING, SegmentState::SEALED);
  if(result != HalResult::OK) return result;
  result = backend_->protect(segment.raw_path);
  if(result != HalResult::OK && log_){
    log_->warn(TAG, "Could not make %s read-only (%s)", segment.raw_path.c_str(),
               hal::halResultToString(result));
  }
  return HalResult::OK;
}

HalResult SegmentStore::finalize(AudioSegment& segment, const std::string& processed_path){
  if(segment.state != SegmentState::SEALED) return transition(segment, SegmentState::SEALED, SegmentState::COMPRESSED);

  std::string final_path;
  HalResult result = backend_->commit(processed_path, &final_path);
  if(result != HalResult::OK) return result;

  segment.final_path = final_path;
  segment.state = SegmentState::COMPRESSED;

  result = backend_->remove(segment.raw_path);
  if(result != HalResult::OK && log_){
    log_->warn(TAG, "Could not remove raw %s", segment.raw_path.c_str());
  }
  return HalResult::OK;
}

HalResult SegmentStore::enqueue(AudioSegment& segment){
  return transition(segment, SegmentState::COMPRESSED, SegmentState::QUEUED);
}

HalResult SegmentStore::beginUpload(AudioSegment& segment){
  return transition(segment, SegmentState::QUEUED, SegmentState::UPLOADING);
}

HalResult SegmentStore::markDelivered(AudioSegment& segment){
  HalResult result = transition(segment, SegmentState::UPLOADING, SegmentState::DELIVERED);
  if(result != HalResult::OK) return result;
  result = backend_->remove(segment.final_path);
  if(result != HalResult::OK && log_){
    log_->error(TAG, "Delivered %s but could not delete it (%s)", segment.final_path.c_str(),
                hal::halResultToString(result));
  }
  return result;
}

HalResult SegmentStore::markFailed(AudioSegment& segment){
  if(segment.state != SegmentState::UPLOADING && segment.state != SegmentState::QUEUED){
    return transition(segment, SegmentState::UPLOADING, SegmentState::FAILED);
  }
  segment.state = SegmentState::FAILED;
  if(log_) log_->warn(TAG, "Segment %s kept on storage for a later run", segment.name.c_str());
  return HalResult::OK;
}

HalResult SegmentStore::markRejected(AudioSegment& segment){
  HalResult result = transition(segment, SegmentState::UPLOADING, SegmentState::FAILED);
  if(result != HalResult::OK) return result;

  std::string rejected;
  result = backend_->reject(segment.final_path, &rejected);
  if(result != HalResult::OK) return result;
  segment.final_path = rejected;
  if(log_) log_->warn(TAG, "Segment %s refused by server, kept as %s", segment.name.c_str(), rejected.c_str());
  return HalResult::OK;
}

HalResult SegmentStore::discard(AudioSegment& segment){
  if(segment.state != SegmentState::CAPTURING && segment.state != SegmentState::SEALED){
    return transition(segment, SegmentState::SEALED, SegmentState::FAILED);
  }
  segment.state = SegmentState::FAILED;
  HalResult result = backend_->remove(segment.raw_path);
  // Capture may have died before creating the file
  if(result == HalResult::KEY_NOT_FOUND) result = HalResult::OK;
  return result;
}

HalResult SegmentStore::recoverPending(std::vector<AudioSegment>& out){
  out.clear();
  std::vector<std::string> files;
  HalResult result = backend_->listPending(files);
  if(result != HalResult::OK) return result;

  for(const std::string& path : files){
    AudioSegment segment;
    segment.sequence = next_sequence_.fetch_add(1);
    size_t slash = path.find_last_of('/');
    std::string file = slash == std::string::npos ? path : path.substr(slash + 1);
    segment.name = file.substr(0, file.find_last_of('.'));
    segment.final_path = path;
    segment.state = SegmentState::QUEUED;
    out.push_back(std::move(segment));
  }
  if(!out.empty() && log_) log_->info(TAG, "Recovered %zu segments from an earlier run", out.size());
  return HalResult::OK;
}

} // namespace bugg::storage
