/*****************************************************************
 * File:      RpiHalAudioCapture.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    ALSA capture through arecord. Segment recordings run arecord
 *    to completion; streams read raw PCM from its stdout.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_AUDIO_CAPTURE_HPP_
#define BUGG_SRC_HAL_RPI_HAL_AUDIO_CAPTURE_HPP_

#include "HAL/IHalAudioCapture.hpp"
#include "HAL/IHalLog.hpp"
#include "Utils/ChildProcess.hpp"

#include <memory>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace bugg::hal::rpi{

class RpiHalAudioCapture : public IHalAudioCapture{
private:
  static constexpr const char* TAG = "CAPTURE";

  IHalLog* log_ = nullptr;
  std::unique_ptr<utils::ChildProcess> stream_;

  static std::vector<std::string> baseArgs(uint8_t card, const AudioFormat& format){
    return {"arecord", "--device", "plughw:" + std::to_string(card) + ",0",
            "--channels=" + std::to_string(format.channels),
            std::string("--format=") + sampleFormatToString(format.format),
            "--rate=" + std::to_string(format.sample_rate)};
  }

public:
  RpiHalAudioCapture(IHalLog* log = nullptr) : log_(log){}

  ~RpiHalAudioCapture() override{
    if(stream_) stream_->terminate();
  }

  bool isDevicePresent(uint8_t card) override{
    std::string path = "/proc/asound/card" + std::to_string(card);
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
  }

  HalResult record(const CaptureRequest& request, const char* wav_path) override{
    if(!wav_path || request.duration_s == 0) return HalResult::INVALID_PARAM;
    if(!isDevicePresent(request.card)) return HalResult::DEVICE_NOT_FOUND;

    std::vector<std::string> argv = baseArgs(request.card, request.format);
    argv.push_back("--duration=" + std::to_string(request.duration_s));
    argv.push_back("--file-type=wav");
    argv.push_back("--quiet");
    argv.push_back(wav_path);

    int exit_code = 0;
    HalResult result = utils::runCommand(argv, &exit_code);
    if(result != HalResult::OK && log_){
      log_->error(TAG, "arecord exited with %d", exit_code);
    }
    return result == HalResult::OK ? HalResult::OK : HalResult::READ_FAILED;
  }

  HalResult openStream(uint8_t card, const AudioFormat& format) override{
    if(stream_) return HalResult::ALREADY_INITIALIZED;
    if(!isDevicePresent(card)) return HalResult::DEVICE_NOT_FOUND;

    std::vector<std::string> argv = baseArgs(card, format);
    argv.push_back("--file-type=raw");
    argv.push_back("--quiet");

    auto child = std::make_unique<utils::ChildProcess>();
    HalResult result = child->start(argv, false, true);
    if(result != HalResult::OK) return result;
    stream_ = std::move(child);
    if(log_) log_->info(TAG, "Streaming from card %u at %u Hz", card, format.sample_rate);
    return HalResult::OK;
  }

  HalResult readStream(uint8_t* buffer, size_t length, size_t* bytes_read) override{
    if(!stream_) return HalResult::NOT_INITIALIZED;
    HalResult result = stream_->readStdout(buffer, length, bytes_read);
    if(result == HalResult::OK && *bytes_read < length){
      // arecord ended early: the card went away
      if(log_) log_->error(TAG, "Capture stream ended after %zu of %zu bytes", *bytes_read, length);
      return HalResult::READ_FAILED;
    }
    return result;
  }

  HalResult closeStream() override{
    if(!stream_) return HalResult::OK;
    stream_->terminate();
    stream_.reset();
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_AUDIO_CAPTURE_HPP_
