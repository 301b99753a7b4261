/*****************************************************************
 * File:      UploadWorkerTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Application/UploadWorker.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using hal::HalResult;
using net::SendOutcome;
using net::SendStatus;
using storage::AudioSegment;

namespace{

/** File transport answering from a script */
class ScriptedTransport : public net::UploadTransport{
public:
  const char* name() const override{ return "Scripted"; }

  HalResult beginBatch() override{
    batches++;
    return batch_result;
  }
  void endBatch() override{ ends++; }
  void stop() override{ stopped = true; }

  SendOutcome send(const std::string& path, const net::UploadMetadata& meta) override{
    (void)path;
    sent.push_back(meta.file_name);
    if(script.empty()) return fallback;
    SendOutcome o = script.front();
    script.pop_front();
    return o;
  }

  std::deque<SendOutcome> script;
  SendOutcome fallback = SendOutcome::ack();
  HalResult batch_result = HalResult::OK;
  std::vector<std::string> sent;
  int batches = 0;
  int ends = 0;
  bool stopped = false;
};

/** Stream transport collecting chunks */
class CollectingTransport : public net::UploadTransport{
public:
  const char* name() const override{ return "Collecting"; }
  bool handlesFiles() const override{ return false; }
  HalResult start() override{ return HalResult::OK; }
  void stop() override{ stopped = true; }
  bool pushChunk(std::vector<uint8_t> bytes) override{
    std::lock_guard<std::mutex> lock(mutex);
    chunks.push_back(std::move(bytes));
    return true;
  }

  std::mutex mutex;
  std::vector<std::vector<uint8_t>> chunks;
  std::atomic<bool> stopped{false};
};

} // namespace

class UploadWorkerTest : public ::testing::Test{
protected:
  UploadWorkerTest()
    : backend_(&board_.sd, &board_.onboard), store_(&backend_, 1), queue_(8){}

  void SetUp() override{
    ASSERT_EQ(backend_.init(storage::DataLayout()), HalResult::OK);
  }

  AudioSegment queued(int minute){
    AudioSegment s = store_.open(test::FakeTimer::DEFAULT_EPOCH_MS + minute * 60000LL);
    test::writeAll(s.raw_path, "raw");
    store_.seal(s);
    const std::string processed = backend_.workingPath(s.name + ".mp3");
    test::writeAll(processed, "mp3");
    EXPECT_EQ(store_.finalize(s, processed), HalResult::OK);
    EXPECT_EQ(store_.enqueue(s), HalResult::OK);
    return s;
  }

  std::unique_ptr<app::UploadWorker> fileWorker(app::UploadWorker::Options options = {}){
    return std::make_unique<app::UploadWorker>(&transport_, &store_, &queue_, net::RetryPolicy(),
                                               options, &board_.timer, &board_.log);
  }

  test::FakeBoard board_;
  storage::StorageBackend backend_;
  storage::SegmentStore store_;
  app::SegmentQueue queue_;
  ScriptedTransport transport_;
};

TEST_F(UploadWorkerTest, RetriesWithBackoffUntilAck){
  auto worker = fileWorker();
  AudioSegment s = queued(0);
  transport_.script = {SendOutcome::retryable("timeout"), SendOutcome::retryable("503"), SendOutcome::ack()};

  EXPECT_EQ(worker->deliverWithRetry(s), SendStatus::ACK);
  EXPECT_EQ(worker->attemptCount(), 3u);
  EXPECT_EQ(board_.timer.totalDelayMs(), 2000u + 4000u);
  EXPECT_EQ(s.state, storage::SegmentState::DELIVERED);
  EXPECT_FALSE(test::fs::exists(s.final_path));
}

TEST_F(UploadWorkerTest, FatalIsNeverRetried){
  auto worker = fileWorker();
  AudioSegment s = queued(0);
  transport_.script = {SendOutcome::fatal("HTTP 401")};

  EXPECT_EQ(worker->deliverWithRetry(s), SendStatus::FATAL);
  EXPECT_EQ(worker->attemptCount(), 1u);
  EXPECT_EQ(board_.timer.totalDelayMs(), 0u);
  EXPECT_EQ(s.state, storage::SegmentState::FAILED);
  EXPECT_TRUE(test::fs::exists(s.final_path));
  EXPECT_EQ(s.final_path, backend_.rejectedDir() + "/" + s.name + ".mp3");
}

TEST_F(UploadWorkerTest, RejectedFileIsNotSentOnLaterRuns){
  AudioSegment refused = queued(0);
  AudioSegment unlucky = queued(20);
  transport_.script = {SendOutcome::fatal("HTTP 400")};
  transport_.fallback = SendOutcome::retryable("no response");
  {
    auto worker = fileWorker();
    EXPECT_EQ(worker->deliverWithRetry(refused), SendStatus::FATAL);
    EXPECT_EQ(worker->deliverWithRetry(unlucky), SendStatus::RETRYABLE);
  }

  // Each restart builds a fresh store over the same medium
  for(int run = 0; run < 3; run++){
    storage::StorageBackend backend(&board_.sd, &board_.onboard);
    ASSERT_EQ(backend.init(storage::DataLayout()), HalResult::OK);
    storage::SegmentStore store(&backend, 1);
    std::vector<AudioSegment> pending;
    ASSERT_EQ(store.recoverPending(pending), HalResult::OK);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].name, unlucky.name);
  }
  EXPECT_TRUE(test::fs::exists(refused.final_path));
}

TEST_F(UploadWorkerTest, GivesUpAtAttemptCeilingAndKeepsFile){
  auto worker = fileWorker();
  AudioSegment s = queued(0);
  transport_.fallback = SendOutcome::retryable("no response");

  EXPECT_EQ(worker->deliverWithRetry(s), SendStatus::RETRYABLE);
  EXPECT_EQ(worker->attemptCount(), 5u);
  EXPECT_EQ(board_.timer.totalDelayMs(), 2000u + 4000u + 8000u + 16000u);
  EXPECT_EQ(worker->failedCount(), 1u);
  EXPECT_TRUE(test::fs::exists(s.final_path));
}

TEST_F(UploadWorkerTest, DrainDeliversQueueInOrder){
  std::vector<AudioSegment> segments = {queued(0), queued(20), queued(40)};
  for(AudioSegment& s : segments) queue_.push(s);

  auto worker = fileWorker();
  worker->start();
  worker->requestDrain(120000);
  worker->join();

  EXPECT_TRUE(worker->isFinished());
  EXPECT_EQ(worker->deliveredCount(), 3u);
  ASSERT_EQ(transport_.sent.size(), 3u);
  for(size_t i = 0; i < segments.size(); i++){
    EXPECT_EQ(transport_.sent[i], segments[i].name + ".mp3");
    EXPECT_FALSE(test::fs::exists(segments[i].final_path));
  }
  EXPECT_EQ(transport_.batches, 1);
  EXPECT_GE(transport_.ends, 1);
  EXPECT_TRUE(transport_.stopped);
}

TEST_F(UploadWorkerTest, UnreachableNetworkKeepsFilesPastGrace){
  AudioSegment a = queued(0);
  AudioSegment b = queued(20);
  queue_.push(a);
  queue_.push(b);
  transport_.batch_result = HalResult::TIMEOUT;

  auto worker = fileWorker();
  EXPECT_FALSE(worker->isDraining());
  worker->requestDrain(5000);
  EXPECT_TRUE(worker->isDraining());
  worker->start();
  worker->join();

  EXPECT_TRUE(worker->isFinished());
  EXPECT_TRUE(transport_.sent.empty());
  EXPECT_TRUE(test::fs::exists(a.final_path));
  EXPECT_TRUE(test::fs::exists(b.final_path));
}

TEST_F(UploadWorkerTest, RetryableFailureReopensBatch){
  queue_.push(queued(0));
  queue_.push(queued(20));
  transport_.script = {SendOutcome::retryable("x"), SendOutcome::retryable("x"),
                       SendOutcome::retryable("x"), SendOutcome::retryable("x"),
                       SendOutcome::retryable("x")};

  auto worker = fileWorker();
  worker->start();
  worker->requestDrain(600000);
  worker->join();

  EXPECT_EQ(worker->deliveredCount(), 1u);
  EXPECT_EQ(worker->failedCount(), 1u);
  EXPECT_EQ(transport_.batches, 2);
}

TEST_F(UploadWorkerTest, StartupDelayBeforeFirstBatch){
  app::UploadWorker::Options options;
  options.startup_delay_s = 600;
  queue_.push(queued(0));

  auto worker = fileWorker(options);
  worker->start();
  // Let the startup wait run out on the virtual clock before draining
  for(int i = 0; i < 2000 && board_.timer.millis() < 600000; i++){
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  worker->requestDrain(60000);
  worker->join();

  EXPECT_GE(board_.timer.totalDelayMs(), 600000u);
  EXPECT_EQ(worker->deliveredCount(), 1u);
}

TEST_F(UploadWorkerTest, AbortStopsPromptly){
  transport_.fallback = SendOutcome::retryable("down");
  queue_.push(queued(0));

  auto worker = fileWorker();
  worker->abort();
  worker->start();
  worker->join();
  EXPECT_TRUE(worker->isFinished());
  EXPECT_EQ(worker->deliveredCount(), 0u);
}

TEST(UploadWorkerStream, ChunksAreWrappedAndSentInOrder){
  test::FakeBoard board;
  config::SensorConfig cfg;
  cfg.amplification = 1;
  auto sensor = audio::createSensorSource(cfg, board.context(), nullptr);
  app::ChunkQueue chunks(50);
  CollectingTransport transport;

  app::UploadWorker::Options options;
  options.compress_chunks = false;
  app::UploadWorker worker(&transport, &chunks, sensor.get(), options, &board.timer, &board.log);

  for(uint8_t i = 1; i <= 3; i++){
    chunks.push(std::vector<uint8_t>(8, i));
  }
  worker.start();
  worker.requestDrain(10000);
  worker.join();

  EXPECT_TRUE(transport.stopped);
  ASSERT_EQ(transport.chunks.size(), 3u);
  for(uint8_t i = 0; i < 3; i++){
    ASSERT_EQ(transport.chunks[i].size(), audio::WAV_HEADER_SIZE + 8);
    EXPECT_EQ(transport.chunks[i][audio::WAV_HEADER_SIZE], i + 1);
  }
  EXPECT_EQ(worker.deliveredCount(), 3u);
}
