/*****************************************************************
 * File:      WavFile.cpp
 * Category:  src/Audio
 * Author:    Bugg Project
 *
 * Purpose:
 *    RIFF/WAVE streaming implementation.
 *****************************************************************/

#include "Audio/WavFile.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace bugg::audio{

using hal::HalResult;

namespace{

constexpr uint16_t WAVE_FORMAT_PCM = 1;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t le16(const uint8_t* p){
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t* p){
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void put16(std::vector<uint8_t>& v, size_t at, uint16_t x){
  v[at] = static_cast<uint8_t>(x);
  v[at + 1] = static_cast<uint8_t>(x >> 8);
}

void put32(std::vector<uint8_t>& v, size_t at, uint32_t x){
  for(int i = 0; i < 4; i++) v[at + i] = static_cast<uint8_t>(x >> (8 * i));
}

} // namespace

// ============================================================
// Header helpers
// ============================================================

std::vector<uint8_t> makeWavHeader(const hal::AudioFormat& format, uint32_t data_bytes){
  std::vector<uint8_t> h(WAV_HEADER_SIZE, 0);
  std::memcpy(&h[0], "RIFF", 4);
  put32(h, 4, 36 + data_bytes);
  std::memcpy(&h[8], "WAVE", 4);
  std::memcpy(&h[12], "fmt ", 4);
  put32(h, 16, 16);
  put16(h, 20, WAVE_FORMAT_PCM);
  put16(h, 22, format.channels);
  put32(h, 24, format.sample_rate);
  put32(h, 28, format.sample_rate * format.bytesPerFrame());
  put16(h, 32, static_cast<uint16_t>(format.bytesPerFrame()));
  put16(h, 34, static_cast<uint16_t>(format.bytesPerSample() * 8));
  std::memcpy(&h[36], "data", 4);
  put32(h, 40, data_bytes);
  return h;
}

void amplifyPcm(uint8_t* data, size_t length, hal::SampleFormat format, int32_t factor){
  if(factor == 1) return;

  if(format == hal::SampleFormat::S16_LE){
    for(size_t i = 0; i + 1 < length; i += 2){
      int64_t s = static_cast<int16_t>(le16(data + i));
      s = std::clamp<int64_t>(s * factor, std::numeric_limits<int16_t>::min(),
                              std::numeric_limits<int16_t>::max());
      uint16_t u = static_cast<uint16_t>(static_cast<int16_t>(s));
      data[i] = static_cast<uint8_t>(u);
      data[i + 1] = static_cast<uint8_t>(u >> 8);
    }
  }else{
    for(size_t i = 0; i + 3 < length; i += 4){
      int64_t s = static_cast<int32_t>(le32(data + i));
      s = std::clamp<int64_t>(s * factor, std::numeric_limits<int32_t>::min(),
                              std::numeric_limits<int32_t>::max());
      uint32_t u = static_cast<uint32_t>(static_cast<int32_t>(s));
      for(int b = 0; b < 4; b++) data[i + b] = static_cast<uint8_t>(u >> (8 * b));
    }
  }
}

double channelVariance(const uint8_t* data, size_t length, const hal::AudioFormat& format,
                       uint16_t channel){
  const uint32_t frame = format.bytesPerFrame();
  const uint16_t bps = format.bytesPerSample();
  if(frame == 0 || channel >= format.channels) return 0.0;

  size_t frames = length / frame;
  if(frames == 0) return 0.0;

  // Welford, the sums overflow doubles' precision for 32-bit input otherwise
  double mean = 0.0;
  double m2 = 0.0;
  for(size_t i = 0; i < frames; i++){
    const uint8_t* p = data + i * frame + channel * bps;
    double x = (bps == 2) ? static_cast<double>(static_cast<int16_t>(le16(p)))
                          : static_cast<double>(static_cast<int32_t>(le32(p)));
    double delta = x - mean;
    mean += delta / static_cast<double>(i + 1);
    m2 += delta * (x - mean);
  }
  return m2 / static_cast<double>(frames);
}

// ============================================================
// WavReader
// ============================================================

WavReader::~WavReader(){
  close();
}

void WavReader::close(){
  if(file_){
    fclose(file_);
    file_ = nullptr;
  }
}

HalResult WavReader::open(const std::string& path){
  close();
  file_ = fopen(path.c_str(), "rb");
  if(!file_) return HalResult::KEY_NOT_FOUND;

  uint8_t riff[12];
  if(fread(riff, 1, sizeof(riff), file_) != sizeof(riff) ||
     std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0){
    close();
    return HalResult::INVALID_PARAM;
  }

  bool have_fmt = false;
  while(true){
    uint8_t chunk[8];
    if(fread(chunk, 1, sizeof(chunk), file_) != sizeof(chunk)){
      close();
      return HalResult::INVALID_PARAM;
    }
    uint32_t size = le32(chunk + 4);

    if(std::memcmp(chunk, "fmt ", 4) == 0){
      uint8_t fmt[40] = {0};
      size_t want = std::min<size_t>(size, sizeof(fmt));
      if(size < 16 || fread(fmt, 1, want, file_) != want){
        close();
        return HalResult::INVALID_PARAM;
      }
      if(size > want && fseek(file_, static_cast<long>(size - want), SEEK_CUR) != 0){
        close();
        return HalResult::READ_FAILED;
      }
      uint16_t tag = le16(fmt);
      uint16_t bits = le16(fmt + 14);
      if((tag != WAVE_FORMAT_PCM && tag != WAVE_FORMAT_EXTENSIBLE) || (bits != 16 && bits != 32)){
        close();
        return HalResult::INVALID_PARAM;
      }
      format_.channels = le16(fmt + 2);
      format_.sample_rate = le32(fmt + 4);
      format_.format = bits == 32 ? hal::SampleFormat::S32_LE : hal::SampleFormat::S16_LE;
      have_fmt = format_.channels > 0;
    }else if(std::memcmp(chunk, "data", 4) == 0){
      if(!have_fmt){
        close();
        return HalResult::INVALID_PARAM;
      }
      // Streamed files carry a placeholder size; clamp to what is on disk
      long here = ftell(file_);
      if(fseek(file_, 0, SEEK_END) != 0){
        close();
        return HalResult::READ_FAILED;
      }
      long end = ftell(file_);
      if(here < 0 || end < here || fseek(file_, here, SEEK_SET) != 0){
        close();
        return HalResult::READ_FAILED;
      }
      uint64_t on_disk = static_cast<uint64_t>(end - here);
      data_bytes_ = std::min<uint64_t>(size, on_disk);
      data_bytes_ -= data_bytes_ % format_.bytesPerFrame();
      remaining_ = data_bytes_;
      return HalResult::OK;
    }else{
      // LIST and other metadata chunks, padded to even length
      long skip = static_cast<long>(size + (size & 1));
      if(fseek(file_, skip, SEEK_CUR) != 0){
        close();
        return HalResult::INVALID_PARAM;
      }
    }
  }
}

HalResult WavReader::read(uint8_t* buffer, size_t length, size_t* bytes_read){
  *bytes_read = 0;
  if(!file_) return HalResult::NOT_INITIALIZED;
  size_t want = static_cast<size_t>(std::min<uint64_t>(length, remaining_));
  if(want == 0) return HalResult::OK;
  size_t got = fread(buffer, 1, want, file_);
  remaining_ -= got;
  *bytes_read = got;
  if(got != want && ferror(file_)) return HalResult::READ_FAILED;
  return HalResult::OK;
}

HalResult WavReader::skipFrames(uint64_t frames){
  if(!file_) return HalResult::NOT_INITIALIZED;
  uint64_t bytes = std::min<uint64_t>(frames * format_.bytesPerFrame(), remaining_);
  if(fseek(file_, static_cast<long>(bytes), SEEK_CUR) != 0) return HalResult::READ_FAILED;
  remaining_ -= bytes;
  return HalResult::OK;
}

// ============================================================
// WavWriter
// ============================================================

WavWriter::~WavWriter(){
  if(file_){
    fclose(file_);
    file_ = nullptr;
  }
}

HalResult WavWriter::open(const std::string& path, const hal::AudioFormat& format){
  if(file_) return HalResult::ALREADY_INITIALIZED;
  file_ = fopen(path.c_str(), "wb");
  if(!file_) return HalResult::WRITE_FAILED;
  format_ = format;
  data_bytes_ = 0;
  std::vector<uint8_t> header = makeWavHeader(format_, 0);
  if(fwrite(header.data(), 1, header.size(), file_) != header.size()){
    fclose(file_);
    file_ = nullptr;
    return HalResult::WRITE_FAILED;
  }
  return HalResult::OK;
}

HalResult WavWriter::write(const uint8_t* data, size_t length){
  if(!file_) return HalResult::NOT_INITIALIZED;
  if(length == 0) return HalResult::OK;
  if(fwrite(data, 1, length, file_) != length) return HalResult::WRITE_FAILED;
  data_bytes_ += length;
  return HalResult::OK;
}

HalResult WavWriter::close(){
  if(!file_) return HalResult::NOT_INITIALIZED;
  HalResult result = HalResult::OK;
  if(data_bytes_ > std::numeric_limits<uint32_t>::max() - 36){
    result = HalResult::BUFFER_FULL;
  }else{
    std::vector<uint8_t> header = makeWavHeader(format_, static_cast<uint32_t>(data_bytes_));
    if(fseek(file_, 0, SEEK_SET) != 0 ||
       fwrite(header.data(), 1, header.size(), file_) != header.size()){
      result = HalResult::WRITE_FAILED;
    }
  }
  if(fclose(file_) != 0 && result == HalResult::OK) result = HalResult::WRITE_FAILED;
  file_ = nullptr;
  return result;
}

} // namespace bugg::audio
