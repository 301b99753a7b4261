/*****************************************************************
 * File:      HttpTransportTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/HttpTransport.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using net::SendStatus;
using test::FakeHttpClient;

TEST(ClassifyHttpResponse, StatusMapping){
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(200)).status, SendStatus::ACK);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(201)).status, SendStatus::ACK);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::noResponse()).status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(408)).status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(429)).status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(500)).status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(503)).status, SendStatus::RETRYABLE);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(400)).status, SendStatus::FATAL);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(401)).status, SendStatus::FATAL);
  EXPECT_EQ(net::classifyHttpResponse(FakeHttpClient::status(403)).status, SendStatus::FATAL);
}

class HttpTransportTest : public ::testing::Test{
protected:
  void SetUp() override{
    file_ = dir_.sub("2024-05-01T02_00_01.000Z.mp3");
    test::writeAll(file_, "audio");
  }

  test::TempDir dir_;
  std::string file_;
  FakeHttpClient client_;
  test::FakeNetwork network_;
  test::FakeTimer timer_;
  test::FakeModem modem_;
};

TEST_F(HttpTransportTest, SendPostsFileWithPassword){
  net::PersistentHttpTransport t(&client_, nullptr, "http://srv/api/bugg/upload", "pw");
  net::UploadMetadata meta{"2024-05-01T02_00_01.000Z.mp3", 1};

  EXPECT_EQ(t.send(file_, meta).status, SendStatus::ACK);
  EXPECT_EQ(client_.last_url, "http://srv/api/bugg/upload");
  EXPECT_EQ(client_.last_field, "file");
  ASSERT_EQ(client_.last_fields.size(), 1u);
  EXPECT_EQ(client_.last_fields[0].name, "password");
  EXPECT_EQ(client_.last_fields[0].value, "pw");
}

TEST_F(HttpTransportTest, MissingFileIsFatal){
  net::PersistentHttpTransport t(&client_, nullptr, "http://srv/api/bugg/upload", "pw");
  net::UploadMetadata meta{"gone.mp3", 1};
  EXPECT_EQ(t.send(dir_.sub("gone.mp3"), meta).status, SendStatus::FATAL);
}

TEST_F(HttpTransportTest, PersistentBatchWaitsForNetwork){
  net::ConnectivityGate::Options o;
  o.max_probes = 2;
  net::ConnectivityGate gate(&network_, &timer_, false, o);
  net::PersistentHttpTransport t(&client_, &gate, "http://srv/api/bugg/upload", "pw");

  EXPECT_EQ(t.beginBatch(), hal::HalResult::OK);
  network_.up = false;
  EXPECT_EQ(t.beginBatch(), hal::HalResult::TIMEOUT);
}

TEST_F(HttpTransportTest, BatchPowersModemAroundEachBatch){
  net::ConnectivityGate gate(&network_, &timer_, false);
  net::BatchHttpTransport t(&client_, &gate, &modem_, "http://srv/api/bugg/upload", "pw");

  EXPECT_FALSE(modem_.isPowered());
  ASSERT_EQ(t.beginBatch(), hal::HalResult::OK);
  EXPECT_TRUE(modem_.isPowered());

  net::UploadMetadata meta{"2024-05-01T02_00_01.000Z.mp3", 1};
  EXPECT_EQ(t.send(file_, meta).status, SendStatus::ACK);

  t.endBatch();
  EXPECT_FALSE(modem_.isPowered());
  EXPECT_GE(client_.resets.load(), 1);
}

TEST_F(HttpTransportTest, BatchFailsWhenModemWillNotPowerOn){
  net::ConnectivityGate gate(&network_, &timer_, false);
  net::BatchHttpTransport t(&client_, &gate, &modem_, "http://srv/api/bugg/upload", "pw");
  modem_.power_on_result = hal::HalResult::TIMEOUT;

  EXPECT_EQ(t.beginBatch(), hal::HalResult::TIMEOUT);
  EXPECT_EQ(network_.probes.load(), 0);
}
