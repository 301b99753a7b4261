/*****************************************************************
 * File:      FfmpegEncoder.cpp
 * Category:  src/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    ffmpeg child-process MP3 encoding.
 *****************************************************************/

#include "Audio/FfmpegEncoder.hpp"
#include "Utils/ChildProcess.hpp"

#include <thread>

namespace bugg::audio{

using hal::HalResult;

HalResult FfmpegEncoder::encodeFile(const std::string& wav_path, const std::string& out_path){
  int code = -1;
  HalResult result = utils::runCommand({binary_, "-hide_banner", "-loglevel", "error", "-y",
                                        "-i", wav_path,
                                        "-codec:a", "libmp3lame", "-qscale:a", "0",
                                        out_path}, &code);
  if(result != HalResult::OK){
    if(log_) log_->error(TAG, "Encoding %s failed (%s, exit %d)", wav_path.c_str(),
                         hal::halResultToString(result), code);
  }
  return result;
}

HalResult FfmpegEncoder::encodeBuffer(const std::vector<uint8_t>& wav, std::vector<uint8_t>& out){
  out.clear();
  utils::ChildProcess child;
  HalResult result = child.start({binary_, "-hide_banner", "-loglevel", "error",
                                  "-f", "wav", "-i", "pipe:0",
                                  "-codec:a", "libmp3lame", "-qscale:a", "0",
                                  "-f", "mp3", "pipe:1"}, true, true);
  if(result != HalResult::OK){
    if(log_) log_->error(TAG, "Cannot start %s", binary_.c_str());
    return result;
  }

  // Feed stdin from a second thread so a full stdout pipe cannot deadlock us
  HalResult write_result = HalResult::OK;
  std::thread writer([&child, &wav, &write_result]{
    write_result = child.writeStdin(wav.data(), wav.size());
    child.closeStdin();
  });

  uint8_t buf[16384];
  size_t n = 0;
  HalResult read_result = HalResult::OK;
  do{
    read_result = child.readStdout(buf, sizeof(buf), &n);
    out.insert(out.end(), buf, buf + n);
  }while(read_result == HalResult::OK && n == sizeof(buf));

  writer.join();

  int code = -1;
  HalResult wait_result = child.wait(&code);
  if(read_result != HalResult::OK) return read_result;
  if(write_result != HalResult::OK) return write_result;
  if(wait_result != HalResult::OK) return wait_result;
  if(code != 0){
    if(log_) log_->error(TAG, "ffmpeg exited with %d on a %zu byte chunk", code, wav.size());
    return HalResult::ERROR;
  }
  return HalResult::OK;
}

} // namespace bugg::audio
