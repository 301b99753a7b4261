/*****************************************************************
 * File:      WebSocketTransportTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/BeastWebSocketClient.hpp"
#include "Network/WebSocketTransport.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using net::SendStatus;

// ============================================================
// Ack parsing
// ============================================================

TEST(ParseAck, PlainAndJsonForms){
  EXPECT_EQ(net::parseAck("ok").status, SendStatus::ACK);
  EXPECT_EQ(net::parseAck(" ACK\n").status, SendStatus::ACK);
  EXPECT_EQ(net::parseAck(R"({"status": "ok", "file": "a.mp3"})").status, SendStatus::ACK);
  EXPECT_EQ(net::parseAck("ERR auth").status, SendStatus::FATAL);
  EXPECT_EQ(net::parseAck(R"({"status": "error", "message": "bad password"})").status, SendStatus::FATAL);
  EXPECT_EQ(net::parseAck("busy").status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::parseAck(R"({"status": "later"})").status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::parseAck("").status, SendStatus::RETRYABLE);
}

TEST(ParseWebSocketUri, SchemesPortsAndTargets){
  net::WebSocketUri u;
  ASSERT_TRUE(net::parseWebSocketUri("wss://bugg.example.org/ws/audio/", &u));
  EXPECT_TRUE(u.secure);
  EXPECT_EQ(u.host, "bugg.example.org");
  EXPECT_EQ(u.port, "443");
  EXPECT_EQ(u.target, "/ws/audio/");

  ASSERT_TRUE(net::parseWebSocketUri("ws://10.0.0.2:8000/ws/audio/", &u));
  EXPECT_FALSE(u.secure);
  EXPECT_EQ(u.host, "10.0.0.2");
  EXPECT_EQ(u.port, "8000");

  ASSERT_TRUE(net::parseWebSocketUri("ws://host", &u));
  EXPECT_EQ(u.port, "80");
  EXPECT_EQ(u.target, "/");

  EXPECT_FALSE(net::parseWebSocketUri("http://host/", &u));
  EXPECT_FALSE(net::parseWebSocketUri("ws:///path", &u));
}

// ============================================================
// File transport
// ============================================================

class FileWebSocketTest : public ::testing::Test{
protected:
  void SetUp() override{
    file_ = dir_.sub("seg.mp3");
    test::writeAll(file_, "payload");
  }

  test::TempDir dir_;
  std::string file_;
  test::FakeWebSocketClient client_;
  test::FakeTimer timer_;
  net::UploadMetadata meta_{"seg.mp3", 1};
};

TEST_F(FileWebSocketTest, SendsWholeFileAsOneFrame){
  net::FileWebSocketTransport t(&client_, nullptr, &timer_, "ws://srv/ws/audio/");
  client_.acks.push_back("ok");

  EXPECT_EQ(t.send(file_, meta_).status, SendStatus::ACK);
  auto frames = client_.sentFrames();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(std::string(frames[0].begin(), frames[0].end()), "payload");
  EXPECT_EQ(client_.last_uri, "ws://srv/ws/audio/");
}

TEST_F(FileWebSocketTest, NoAckIsRetryableAndResetsConnection){
  net::FileWebSocketTransport t(&client_, nullptr, &timer_, "ws://srv/ws/audio/");
  client_.auto_ack = false;

  EXPECT_EQ(t.send(file_, meta_).status, SendStatus::RETRYABLE);
  EXPECT_FALSE(client_.isOpen());
}

TEST_F(FileWebSocketTest, ServerRejectionIsFatal){
  net::FileWebSocketTransport t(&client_, nullptr, &timer_, "ws://srv/ws/audio/");
  client_.acks.push_back(R"({"status": "error", "message": "unknown device"})");
  EXPECT_EQ(t.send(file_, meta_).status, SendStatus::FATAL);
}

TEST_F(FileWebSocketTest, UnreachableServerIsRetryable){
  net::FileWebSocketTransport t(&client_, nullptr, &timer_, "ws://srv/ws/audio/");
  client_.reachable = false;
  EXPECT_EQ(t.send(file_, meta_).status, SendStatus::RETRYABLE);
  EXPECT_EQ(client_.frameCount(), 0u);
}

TEST_F(FileWebSocketTest, ReconnectAttemptsAreSpaced){
  net::FileWebSocketTransport t(&client_, nullptr, &timer_, "ws://srv/ws/audio/");
  client_.reachable = false;
  t.send(file_, meta_);
  t.send(file_, meta_);
  EXPECT_EQ(client_.connects, 2);
  EXPECT_GE(timer_.totalDelayMs(), net::WS_RECONNECT_INTERVAL_MS);
}

TEST_F(FileWebSocketTest, ConnectionIsReused){
  net::FileWebSocketTransport t(&client_, nullptr, &timer_, "ws://srv/ws/audio/");
  EXPECT_EQ(t.send(file_, meta_).status, SendStatus::ACK);
  EXPECT_EQ(t.send(file_, meta_).status, SendStatus::ACK);
  EXPECT_EQ(client_.connects, 1);
  t.stop();
  EXPECT_FALSE(client_.isOpen());
}

// ============================================================
// Stream transport
// ============================================================

namespace{

std::vector<uint8_t> chunk(uint8_t tag){
  return std::vector<uint8_t>(4, tag);
}

} // namespace

TEST(StreamWebSocket, PushesWhileConnected){
  test::FakeWebSocketClient client;
  test::FakeTimer timer;
  net::StreamWebSocketTransport t(&client, &timer, "ws://srv/ws/audio/");

  ASSERT_EQ(t.start(), hal::HalResult::OK);
  EXPECT_FALSE(t.handlesFiles());
  EXPECT_TRUE(t.pushChunk(chunk(1)));
  EXPECT_TRUE(t.pushChunk(chunk(2)));
  EXPECT_EQ(t.deliveredChunks(), 2u);
  EXPECT_EQ(t.pendingChunks(), 0u);
}

TEST(StreamWebSocket, RingKeepsNewestAndFlushesInOrder){
  test::FakeWebSocketClient client;
  test::FakeTimer timer;
  net::StreamWebSocketTransport t(&client, &timer, "ws://srv/ws/audio/", nullptr, 3);

  client.reachable = false;
  EXPECT_NE(t.start(), hal::HalResult::OK);
  for(uint8_t i = 1; i <= 5; i++){
    EXPECT_FALSE(t.pushChunk(chunk(i)));
  }
  EXPECT_EQ(t.pendingChunks(), 3u);
  EXPECT_EQ(t.droppedChunks(), 2u);

  client.reachable = true;
  timer.advance(net::WS_RECONNECT_INTERVAL_MS);
  EXPECT_TRUE(t.flush());

  auto frames = client.sentFrames();
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0][0], 3);
  EXPECT_EQ(frames[1][0], 4);
  EXPECT_EQ(frames[2][0], 5);
}

TEST(StreamWebSocket, LinkDropParksChunkAndRecovers){
  test::FakeWebSocketClient client;
  test::FakeTimer timer;
  net::StreamWebSocketTransport t(&client, &timer, "ws://srv/ws/audio/");

  ASSERT_EQ(t.start(), hal::HalResult::OK);
  client.fail_sends = 1;
  EXPECT_FALSE(t.pushChunk(chunk(1)));
  EXPECT_EQ(t.pendingChunks(), 1u);

  // Reconnect is rate limited
  EXPECT_FALSE(t.pushChunk(chunk(2)));
  EXPECT_EQ(client.connects, 1);

  timer.advance(net::WS_RECONNECT_INTERVAL_MS);
  EXPECT_TRUE(t.pushChunk(chunk(3)));

  auto frames = client.sentFrames();
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0][0], 1);
  EXPECT_EQ(frames[1][0], 2);
  EXPECT_EQ(frames[2][0], 3);
}

TEST(StreamWebSocket, StopDropsBufferedChunks){
  test::FakeWebSocketClient client;
  test::FakeTimer timer;
  net::StreamWebSocketTransport t(&client, &timer, "ws://srv/ws/audio/");
  client.reachable = false;
  t.pushChunk(chunk(1));
  t.stop();
  EXPECT_EQ(t.pendingChunks(), 0u);
  EXPECT_EQ(t.droppedChunks(), 1u);
}
