/*****************************************************************
 * File:      SegmentStoreTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Storage/SegmentStore.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using hal::HalResult;
using storage::AudioSegment;
using storage::SegmentState;

class SegmentStoreTest : public ::testing::Test{
protected:
  SegmentStoreTest()
    : sd_(hal::StorageType::SD_CARD, dir_.sub("sd")),
      backend_(&sd_, nullptr), store_(&backend_, 1){}

  void SetUp() override{
    ASSERT_EQ(backend_.init(storage::DataLayout()), HalResult::OK);
  }

  /** Walk a segment to COMPRESSED with a real file behind it */
  AudioSegment compressed(hal::epoch_ms_t start_ms){
    AudioSegment s = store_.open(start_ms);
    test::writeAll(s.raw_path, "raw");
    EXPECT_EQ(store_.seal(s), HalResult::OK);
    const std::string processed = backend_.workingPath(s.name + ".mp3");
    test::writeAll(processed, "mp3");
    EXPECT_EQ(store_.finalize(s, processed), HalResult::OK);
    return s;
  }

  test::TempDir dir_;
  test::FakeStorage sd_;
  storage::StorageBackend backend_;
  storage::SegmentStore store_;
};

TEST(SegmentName, IsoUtcWithUnderscores){
  EXPECT_EQ(storage::SegmentStore::segmentName(1714528801000LL), "2024-05-01T02_00_01.000Z");
  EXPECT_EQ(storage::SegmentStore::segmentName(1714528801042LL), "2024-05-01T02_00_01.042Z");
}

TEST_F(SegmentStoreTest, OpenNamesByStartOfUsableAudio){
  AudioSegment a = store_.open(1714528800000LL);
  EXPECT_EQ(a.state, SegmentState::CAPTURING);
  EXPECT_EQ(a.start_utc_ms, 1714528801000LL);
  EXPECT_EQ(a.name, "2024-05-01T02_00_01.000Z");
  EXPECT_EQ(a.raw_path, backend_.workingPath("2024-05-01T02_00_01.000Z.raw.wav"));

  AudioSegment b = store_.open(1714528800000LL);
  EXPECT_GT(b.sequence, a.sequence);
}

TEST_F(SegmentStoreTest, FullLifecycleDeletesOnlyOnDelivery){
  AudioSegment s = compressed(1714528800000LL);
  EXPECT_EQ(s.state, SegmentState::COMPRESSED);
  EXPECT_FALSE(test::fs::exists(s.raw_path));
  EXPECT_EQ(s.final_path, backend_.dataDir() + "/" + s.name + ".mp3");
  ASSERT_TRUE(test::fs::exists(s.final_path));

  ASSERT_EQ(store_.enqueue(s), HalResult::OK);
  ASSERT_EQ(store_.beginUpload(s), HalResult::OK);
  EXPECT_TRUE(test::fs::exists(s.final_path));
  ASSERT_EQ(store_.markDelivered(s), HalResult::OK);
  EXPECT_EQ(s.state, SegmentState::DELIVERED);
  EXPECT_FALSE(test::fs::exists(s.final_path));
}

TEST_F(SegmentStoreTest, FailedSegmentKeepsFile){
  AudioSegment s = compressed(1714528800000LL);
  ASSERT_EQ(store_.enqueue(s), HalResult::OK);
  ASSERT_EQ(store_.beginUpload(s), HalResult::OK);
  ASSERT_EQ(store_.markFailed(s), HalResult::OK);
  EXPECT_EQ(s.state, SegmentState::FAILED);
  EXPECT_TRUE(test::fs::exists(s.final_path));
}

TEST_F(SegmentStoreTest, IllegalTransitionsRejected){
  AudioSegment s = store_.open(1714528800000LL);
  EXPECT_EQ(store_.enqueue(s), HalResult::INVALID_STATE);
  EXPECT_EQ(store_.beginUpload(s), HalResult::INVALID_STATE);
  EXPECT_EQ(store_.markDelivered(s), HalResult::INVALID_STATE);
  EXPECT_EQ(store_.markFailed(s), HalResult::INVALID_STATE);
  EXPECT_EQ(s.state, SegmentState::CAPTURING);
}

TEST_F(SegmentStoreTest, DiscardRemovesPartialCapture){
  AudioSegment s = store_.open(1714528800000LL);
  test::writeAll(s.raw_path, "partial");
  ASSERT_EQ(store_.discard(s), HalResult::OK);
  EXPECT_EQ(s.state, SegmentState::FAILED);
  EXPECT_FALSE(test::fs::exists(s.raw_path));

  // Capture died before the file existed
  AudioSegment t = store_.open(1714528800000LL);
  EXPECT_EQ(store_.discard(t), HalResult::OK);
}

TEST_F(SegmentStoreTest, RecoverPendingQueuesOldestFirst){
  AudioSegment late = compressed(1714532400000LL);
  AudioSegment early = compressed(1714528800000LL);

  std::vector<AudioSegment> pending;
  ASSERT_EQ(store_.recoverPending(pending), HalResult::OK);
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].name, early.name);
  EXPECT_EQ(pending[1].name, late.name);
  EXPECT_EQ(pending[0].state, SegmentState::QUEUED);
  EXPECT_EQ(pending[0].final_path, early.final_path);
}
