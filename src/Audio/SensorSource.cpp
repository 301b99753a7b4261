/*****************************************************************
 * File:      SensorSource.cpp
 * Category:  src/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    Capture and postprocessing shared by all microphone
 *    front-ends, plus the front-end factory.
 *****************************************************************/

#include "Audio/SensorSource.hpp"
#include "Audio/ExternalMic.hpp"
#include "Audio/InternalMic.hpp"
#include "Audio/WavFile.hpp"

#include <algorithm>
#include <cstdio>

namespace bugg::audio{

using hal::HalResult;

// ============================================================
// File segments
// ============================================================

HalResult SensorSource::captureData(const std::string& raw_path){
  if(!hal_.capture) return HalResult::NOT_INITIALIZED;

  if(!hal_.capture->isDevicePresent(config_.capture_card)){
    if(hal_.log) hal_.log->error(TAG, "Capture card %u not present", config_.capture_card);
    return HalResult::DEVICE_NOT_FOUND;
  }

  hal::CaptureRequest request;
  request.card = config_.capture_card;
  request.format = captureFormat();
  request.duration_s = config_.record_length_s + trimSeconds();

  if(hal_.log){
    hal_.log->info(TAG, "%s: recording %us at %u Hz, %u ch %s", name(), request.duration_s,
                   request.format.sample_rate, request.format.channels,
                   hal::sampleFormatToString(request.format.format));
  }
  HalResult result = hal_.capture->record(request, raw_path.c_str());
  if(result != HalResult::OK && hal_.log){
    hal_.log->logResult(result, TAG, "capture");
  }
  return result;
}

HalResult SensorSource::postprocess(const std::string& raw_path, const std::string& out_base,
                                    bool compress, std::string* final_path) const{
  WavReader reader;
  HalResult result = reader.open(raw_path);
  if(result != HalResult::OK){
    if(hal_.log) hal_.log->error(TAG, "Cannot open raw segment %s (%s)", raw_path.c_str(),
                                 hal::halResultToString(result));
    return result;
  }

  const hal::AudioFormat format = reader.format();
  const uint64_t trim_frames = static_cast<uint64_t>(trimSeconds()) * format.sample_rate;
  const uint64_t keep_frames = static_cast<uint64_t>(config_.record_length_s) * format.sample_rate;

  if(reader.frameCount() < trim_frames + keep_frames && hal_.log){
    hal_.log->warn(TAG, "Raw segment short: %llu frames, expected %llu",
                   static_cast<unsigned long long>(reader.frameCount()),
                   static_cast<unsigned long long>(trim_frames + keep_frames));
  }

  result = reader.skipFrames(trim_frames);
  if(result != HalResult::OK) return result;

  // Without an encoder the trimmed WAV is the final file
  const bool encode = compress && encoder_;
  const std::string wav_path = encode ? out_base + ".tmp.wav" : out_base + ".wav";
  WavWriter writer;
  result = writer.open(wav_path, format);
  if(result != HalResult::OK) return result;

  std::vector<uint8_t> buffer(format.bytesPerFrame() * 4096);
  uint64_t remaining = keep_frames * format.bytesPerFrame();
  while(remaining > 0){
    size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
    size_t got = 0;
    result = reader.read(buffer.data(), want, &got);
    if(result != HalResult::OK || got == 0) break;
    amplifyPcm(buffer.data(), got, format.format, config_.amplification);
    result = writer.write(buffer.data(), got);
    if(result != HalResult::OK) break;
    remaining -= got;
  }
  reader.close();

  HalResult close_result = writer.close();
  if(result == HalResult::OK) result = close_result;
  if(result != HalResult::OK){
    std::remove(wav_path.c_str());
    if(hal_.log) hal_.log->logResult(result, TAG, "trim");
    return result;
  }

  if(!encode){
    *final_path = wav_path;
    return HalResult::OK;
  }

  const std::string encoded_path = out_base + "." + encoder_->extension();
  result = encoder_->encodeFile(wav_path, encoded_path);
  if(result != HalResult::OK){
    // Keep the audio as WAV rather than lose the segment
    std::remove(encoded_path.c_str());
    const std::string fallback = out_base + ".wav";
    if(std::rename(wav_path.c_str(), fallback.c_str()) != 0){
      std::remove(wav_path.c_str());
      return HalResult::WRITE_FAILED;
    }
    if(hal_.log) hal_.log->warn(TAG, "Compression failed, keeping %s", fallback.c_str());
    *final_path = fallback;
    return HalResult::OK;
  }

  std::remove(wav_path.c_str());
  *final_path = encoded_path;
  return HalResult::OK;
}

bool SensorSource::sleepUntilNextSample(const std::atomic<bool>* stop){
  if(config_.capture_delay_s == 0 || !hal_.timer) return true;
  if(hal_.log) hal_.log->debug(TAG, "Sleeping %us before next capture", config_.capture_delay_s);

  const uint32_t total = config_.capture_delay_s * 1000;
  uint32_t waited = 0;
  while(waited < total){
    if(stop && stop->load()) return false;
    uint32_t step = std::min(SLEEP_STEP_MS, total - waited);
    hal_.timer->delayMs(step);
    waited += step;
  }
  return true;
}

// ============================================================
// Continuous stream
// ============================================================

size_t SensorSource::chunkBytes() const{
  hal::AudioFormat format = captureFormat();
  size_t frames = static_cast<size_t>(format.sample_rate) * STREAM_CHUNK_MS / 1000;
  return frames * format.bytesPerFrame();
}

HalResult SensorSource::startStream(){
  if(!hal_.capture) return HalResult::NOT_INITIALIZED;
  if(!hal_.capture->isDevicePresent(config_.capture_card)) return HalResult::DEVICE_NOT_FOUND;
  HalResult result = hal_.capture->openStream(config_.capture_card, captureFormat());
  if(hal_.log) hal_.log->logResult(result, TAG, "open stream");
  return result;
}

HalResult SensorSource::readChunk(std::vector<uint8_t>& pcm){
  if(!hal_.capture) return HalResult::NOT_INITIALIZED;
  pcm.resize(chunkBytes());
  size_t got = 0;
  HalResult result = hal_.capture->readStream(pcm.data(), pcm.size(), &got);
  pcm.resize(got);
  if(result == HalResult::OK && got == 0) return HalResult::BUFFER_EMPTY;
  return result;
}

HalResult SensorSource::stopStream(){
  if(!hal_.capture) return HalResult::NOT_INITIALIZED;
  return hal_.capture->closeStream();
}

HalResult SensorSource::postprocessChunk(const std::vector<uint8_t>& pcm, bool compress,
                                         std::vector<uint8_t>& out) const{
  hal::AudioFormat format = captureFormat();
  std::vector<uint8_t> wav = makeWavHeader(format, static_cast<uint32_t>(pcm.size()));
  size_t header = wav.size();
  wav.insert(wav.end(), pcm.begin(), pcm.end());
  amplifyPcm(wav.data() + header, pcm.size(), format.format, config_.amplification);

  if(!compress || !encoder_){
    out.swap(wav);
    return HalResult::OK;
  }
  return encoder_->encodeBuffer(wav, out);
}

// ============================================================
// Factory
// ============================================================

std::unique_ptr<SensorSource> createSensorSource(const config::SensorConfig& config,
                                                 const hal::HalContext& hal,
                                                 IAudioEncoder* encoder){
  if(config.type == config::SensorType::EXTERNAL_MIC){
    return std::make_unique<ExternalMic>(config, hal, encoder);
  }
  return std::make_unique<InternalMic>(config, hal, encoder);
}

} // namespace bugg::audio
