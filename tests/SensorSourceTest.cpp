/*****************************************************************
 * File:      SensorSourceTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Audio/SensorSource.hpp"
#include "Audio/WavFile.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using hal::HalResult;

namespace{

int32_t sampleAt(const std::vector<uint8_t>& pcm, size_t index, const hal::AudioFormat& format){
  const size_t off = index * format.bytesPerFrame();
  if(format.format == hal::SampleFormat::S16_LE){
    return static_cast<int16_t>(pcm[off] | (pcm[off + 1] << 8));
  }
  uint32_t u = 0;
  for(int b = 0; b < 4; b++) u |= static_cast<uint32_t>(pcm[off + b]) << (8 * b);
  return static_cast<int32_t>(u);
}

std::vector<uint8_t> readPcm(const std::string& path, hal::AudioFormat* format){
  audio::WavReader reader;
  EXPECT_EQ(reader.open(path), HalResult::OK);
  *format = reader.format();
  std::vector<uint8_t> pcm(static_cast<size_t>(reader.dataBytes()));
  size_t got = 0;
  EXPECT_EQ(reader.read(pcm.data(), pcm.size(), &got), HalResult::OK);
  pcm.resize(got);
  return pcm;
}

} // namespace

class SensorSourceTest : public ::testing::Test{
protected:
  void SetUp() override{
    cfg_.record_length_s = 3;
    cfg_.sample_rate = 800;
    cfg_.amplification = 5;
  }

  std::unique_ptr<audio::SensorSource> make(audio::IAudioEncoder* encoder = nullptr){
    return audio::createSensorSource(cfg_, board_.context(), encoder);
  }

  test::FakeBoard board_;
  config::SensorConfig cfg_;
  test::FakeEncoder encoder_;
};

TEST_F(SensorSourceTest, CaptureRecordsTrimExtra){
  auto sensor = make();
  ASSERT_EQ(sensor->captureData(board_.dir.sub("raw.wav")), HalResult::OK);
  EXPECT_EQ(board_.capture.last_request.duration_s, 4u);
  EXPECT_EQ(board_.capture.last_request.format.format, hal::SampleFormat::S32_LE);
  EXPECT_EQ(board_.capture.last_request.format.channels, 1);
}

TEST_F(SensorSourceTest, MissingCardIsDeviceNotFound){
  board_.capture.present = false;
  auto sensor = make();
  EXPECT_EQ(sensor->captureData(board_.dir.sub("raw.wav")), HalResult::DEVICE_NOT_FOUND);
  EXPECT_EQ(board_.capture.records.load(), 0u);
}

TEST_F(SensorSourceTest, PostprocessDropsFirstSecondAndKeepsRecordLength){
  auto sensor = make();
  const std::string raw = board_.dir.sub("raw.wav");
  ASSERT_EQ(sensor->captureData(raw), HalResult::OK);

  std::string out;
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("seg"), false, &out), HalResult::OK);
  EXPECT_EQ(out, board_.dir.sub("seg.wav"));

  hal::AudioFormat format;
  std::vector<uint8_t> pcm = readPcm(out, &format);
  const size_t frames = pcm.size() / format.bytesPerFrame();
  EXPECT_EQ(frames, 3u * 800u);
  // Second 0 is the start-up pop and must be gone; the rest is amplified
  EXPECT_EQ(sampleAt(pcm, 0, format), 1 * 5);
  EXPECT_EQ(sampleAt(pcm, frames - 1, format), 3 * 5);
}

TEST_F(SensorSourceTest, PostprocessCapsLongRecordings){
  auto sensor = make();
  hal::CaptureRequest req;
  req.format = sensor->captureFormat();
  req.duration_s = 10;
  const std::string raw = board_.dir.sub("long.wav");
  ASSERT_EQ(board_.capture.record(req, raw.c_str()), HalResult::OK);

  std::string out;
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("seg"), false, &out), HalResult::OK);
  hal::AudioFormat format;
  std::vector<uint8_t> pcm = readPcm(out, &format);
  EXPECT_EQ(pcm.size() / format.bytesPerFrame(), 3u * 800u);
}

TEST_F(SensorSourceTest, PostprocessIsRepeatable){
  auto sensor = make();
  const std::string raw = board_.dir.sub("raw.wav");
  ASSERT_EQ(sensor->captureData(raw), HalResult::OK);

  std::string a;
  std::string b;
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("a"), false, &a), HalResult::OK);
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("b"), false, &b), HalResult::OK);
  EXPECT_EQ(test::readAll(a), test::readAll(b));
}

TEST_F(SensorSourceTest, CompressionUsesEncoder){
  auto sensor = make(&encoder_);
  const std::string raw = board_.dir.sub("raw.wav");
  ASSERT_EQ(sensor->captureData(raw), HalResult::OK);

  std::string out;
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("seg"), true, &out), HalResult::OK);
  EXPECT_EQ(out, board_.dir.sub("seg.mp3"));
  EXPECT_EQ(test::readAll(out).rfind(test::FakeEncoder::TAG_BYTES, 0), 0u);
  EXPECT_FALSE(test::fs::exists(board_.dir.sub("seg.tmp.wav")));
}

TEST_F(SensorSourceTest, EncoderFailureKeepsWav){
  encoder_.fail = true;
  auto sensor = make(&encoder_);
  const std::string raw = board_.dir.sub("raw.wav");
  ASSERT_EQ(sensor->captureData(raw), HalResult::OK);

  std::string out;
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("seg"), true, &out), HalResult::OK);
  EXPECT_EQ(out, board_.dir.sub("seg.wav"));
  EXPECT_FALSE(test::fs::exists(board_.dir.sub("seg.mp3")));
}

TEST_F(SensorSourceTest, CompressionWithoutEncoderWritesFinalWav){
  auto sensor = make();
  const std::string raw = board_.dir.sub("raw.wav");
  ASSERT_EQ(sensor->captureData(raw), HalResult::OK);

  std::string out;
  ASSERT_EQ(sensor->postprocess(raw, board_.dir.sub("seg"), true, &out), HalResult::OK);
  EXPECT_EQ(out, board_.dir.sub("seg.wav"));
  EXPECT_TRUE(test::fs::exists(out));
  EXPECT_FALSE(test::fs::exists(board_.dir.sub("seg.tmp.wav")));
}

TEST_F(SensorSourceTest, ExternalMicAppliesGainAndPhantom){
  cfg_.type = config::SensorType::EXTERNAL_MIC;
  cfg_.gain = 12;
  cfg_.phantom = hal::PhantomPower::P48;
  cfg_.enable_internal_mic = true;
  auto sensor = make();

  ASSERT_EQ(sensor->setup(), HalResult::OK);
  EXPECT_TRUE(board_.soundcard.external);
  EXPECT_TRUE(board_.soundcard.internal);
  EXPECT_EQ(board_.soundcard.getGain(), 12);
  EXPECT_EQ(board_.soundcard.getPhantom(), hal::PhantomPower::P48);
  EXPECT_EQ(sensor->captureFormat().channels, 2);
  EXPECT_EQ(sensor->captureFormat().format, hal::SampleFormat::S16_LE);

  sensor->shutdown();
  EXPECT_FALSE(board_.soundcard.external);
  EXPECT_FALSE(board_.soundcard.internal);
}

TEST_F(SensorSourceTest, InternalMicEnablesInternalChannel){
  auto sensor = make();
  ASSERT_EQ(sensor->setup(), HalResult::OK);
  EXPECT_TRUE(board_.soundcard.internal);
  EXPECT_FALSE(board_.soundcard.external);
}

TEST_F(SensorSourceTest, StreamChunksAreThreeHundredMilliseconds){
  auto sensor = make();
  EXPECT_EQ(sensor->chunkBytes(), 240u * 4u);
  ASSERT_EQ(sensor->startStream(), HalResult::OK);

  std::vector<uint8_t> pcm;
  ASSERT_EQ(sensor->readChunk(pcm), HalResult::OK);
  EXPECT_EQ(pcm.size(), sensor->chunkBytes());
  EXPECT_EQ(sensor->stopStream(), HalResult::OK);
}

TEST_F(SensorSourceTest, ChunkPostprocessWrapsWithoutTrim){
  auto sensor = make();
  std::vector<uint8_t> pcm(8, 0);
  pcm[0] = 2;
  pcm[4] = 3;

  std::vector<uint8_t> out;
  ASSERT_EQ(sensor->postprocessChunk(pcm, false, out), HalResult::OK);
  ASSERT_EQ(out.size(), audio::WAV_HEADER_SIZE + pcm.size());
  EXPECT_EQ(std::string(out.begin(), out.begin() + 4), "RIFF");
  EXPECT_EQ(out[audio::WAV_HEADER_SIZE], 10);
  EXPECT_EQ(out[audio::WAV_HEADER_SIZE + 4], 15);
}

TEST_F(SensorSourceTest, CaptureDelaySleepsBetweenSamples){
  cfg_.capture_delay_s = 30;
  auto sensor = make();
  EXPECT_TRUE(sensor->sleepUntilNextSample());
  EXPECT_EQ(board_.timer.totalDelayMs(), 30000u);
}

TEST_F(SensorSourceTest, CaptureDelayEndsOnStop){
  cfg_.capture_delay_s = 600;
  auto sensor = make();
  std::atomic<bool> stop{true};
  EXPECT_FALSE(sensor->sleepUntilNextSample(&stop));
  EXPECT_EQ(board_.timer.totalDelayMs(), 0u);

  // Set partway through: the wait ends within one step
  stop = false;
  board_.timer.on_delay = [&stop](uint64_t total_ms){
    if(total_ms >= 1000) stop = true;
  };
  EXPECT_FALSE(sensor->sleepUntilNextSample(&stop));
  EXPECT_EQ(board_.timer.totalDelayMs(), 1000u);
}
