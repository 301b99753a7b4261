/*****************************************************************
 * File:      ConfigLoaderTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Config/ConfigLoader.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using config::ConfigLoader;
using config::DeviceConfig;
using hal::HalResult;

namespace{

const char* FULL_CONFIG = R"({
  "device": {
    "mode": 2,
    "server_url": "https://bugg.example.org/",
    "project_id": "forest",
    "config_id": 17,
    "upload_password": "s3cret",
    "reboot_time_utc": "03:30",
    "upload_max_attempts": 3,
    "upload_initial_backoff_ms": 500,
    "shutdown_grace_s": 30
  },
  "mobile_network": {"apn": "iot.net", "username": "u", "password": "p"},
  "sensor": {
    "sensor_type": "ExternalMic",
    "record_length": 300,
    "record_freq": 48000,
    "capture_delay": 10,
    "capture_card": 1,
    "gain": 12,
    "compress_data": false,
    "enable_internal_mic": true,
    "phantom_power": "P48"
  }
})";

} // namespace

TEST(ConfigLoader, ParsesEveryKey){
  ConfigLoader loader;
  DeviceConfig cfg;
  ASSERT_EQ(loader.parse(FULL_CONFIG, cfg), HalResult::OK);

  EXPECT_EQ(cfg.mode, config::RecordingMode::WEBSOCKET_SAFE);
  EXPECT_EQ(cfg.server_url, "https://bugg.example.org");
  EXPECT_FALSE(cfg.offline_mode);
  EXPECT_EQ(cfg.project_id, "forest");
  EXPECT_EQ(cfg.config_id, "17");
  EXPECT_EQ(cfg.upload_password, "s3cret");
  EXPECT_EQ(cfg.reboot_hour_utc, 3);
  EXPECT_EQ(cfg.reboot_minute_utc, 30);
  EXPECT_EQ(cfg.upload.max_attempts, 3u);
  EXPECT_EQ(cfg.upload.initial_backoff_ms, 500u);
  EXPECT_EQ(cfg.upload.shutdown_grace_s, 30u);
  EXPECT_EQ(cfg.mobile_network.apn, "iot.net");

  EXPECT_EQ(cfg.sensor.type, config::SensorType::EXTERNAL_MIC);
  EXPECT_EQ(cfg.sensor.record_length_s, 300u);
  EXPECT_EQ(cfg.sensor.sample_rate, 48000u);
  EXPECT_EQ(cfg.sensor.amplification, 1);
  EXPECT_EQ(cfg.sensor.capture_delay_s, 10u);
  EXPECT_EQ(cfg.sensor.capture_card, 1);
  EXPECT_EQ(cfg.sensor.gain, 12);
  EXPECT_FALSE(cfg.sensor.compress);
  EXPECT_TRUE(cfg.sensor.enable_internal_mic);
  EXPECT_EQ(cfg.sensor.phantom, hal::PhantomPower::P48);

  EXPECT_EQ(config::uploadUrl(cfg), "https://bugg.example.org/api/bugg/upload");
  EXPECT_EQ(config::websocketUri(cfg), "wss://bugg.example.org/ws/audio/");
}

TEST(ConfigLoader, DefaultsForAbsentKeys){
  ConfigLoader loader;
  DeviceConfig cfg;
  ASSERT_EQ(loader.parse(R"({"device": {"server_url": "http://10.0.0.2:8000"}})", cfg), HalResult::OK);

  EXPECT_EQ(cfg.mode, config::RecordingMode::HTTP);
  EXPECT_EQ(cfg.project_id, "na");
  EXPECT_EQ(cfg.config_id, "na");
  EXPECT_EQ(cfg.sensor.type, config::SensorType::INTERNAL_MIC);
  EXPECT_EQ(cfg.sensor.record_length_s, 1200u);
  EXPECT_EQ(cfg.sensor.sample_rate, 44100u);
  EXPECT_EQ(cfg.sensor.amplification, 5);
  EXPECT_TRUE(cfg.sensor.compress);
  EXPECT_EQ(cfg.reboot_hour_utc, 2);
  EXPECT_EQ(cfg.upload.max_attempts, 5u);
  EXPECT_EQ(config::websocketUri(cfg), "ws://10.0.0.2:8000/ws/audio/");
}

TEST(ConfigLoader, ServerRequiredUnlessOffline){
  ConfigLoader loader;
  DeviceConfig cfg;
  EXPECT_EQ(loader.parse(R"({"device": {"mode": 1}})", cfg), HalResult::INVALID_PARAM);
  EXPECT_EQ(loader.parse(R"({"device": {"offline_mode": true}})", cfg), HalResult::OK);
  EXPECT_TRUE(cfg.offline_mode);
  EXPECT_EQ(loader.parse(R"({"device": {"offline_mode": 1}})", cfg), HalResult::OK);
  EXPECT_TRUE(cfg.offline_mode);
}

TEST(ConfigLoader, RejectsBadValues){
  ConfigLoader loader;
  DeviceConfig cfg;
  const char* bad[] = {
    R"({"device": {"offline_mode": true, "mode": 4}})",
    R"({"device": {"offline_mode": true, "mode": "two"}})",
    R"({"device": {"offline_mode": true, "reboot_time_utc": "25:00"}})",
    R"({"device": {"offline_mode": true, "upload_max_attempts": 0}})",
    R"({"device": {"offline_mode": true}, "sensor": {"record_length": 0}})",
    R"({"device": {"offline_mode": true}, "sensor": {"sensor_type": "Hydrophone"}})",
    R"({"device": {"offline_mode": true}, "sensor": {"gain": 21}})",
    R"({"device": {"offline_mode": true}, "sensor": {"phantom_power": "P12"}})",
    R"({"device": {"offline_mode": true}, "sensor": {"capture_card": 40}})",
    R"({"device": )",
  };
  for(const char* json : bad){
    EXPECT_EQ(loader.parse(json, cfg), HalResult::INVALID_PARAM) << json;
  }
}

TEST(ConfigLoader, FailedParseLeavesOutputUntouched){
  ConfigLoader loader;
  DeviceConfig cfg;
  cfg.project_id = "keep";
  EXPECT_EQ(loader.parse(R"({"device": {"project_id": "x", "mode": 9}})", cfg), HalResult::INVALID_PARAM);
  EXPECT_EQ(cfg.project_id, "keep");
}

TEST(ConfigLoader, ParseTimeOfDay){
  uint8_t h = 0;
  uint8_t m = 0;
  EXPECT_TRUE(ConfigLoader::parseTimeOfDay("00:00", &h, &m));
  EXPECT_TRUE(ConfigLoader::parseTimeOfDay("23:59", &h, &m));
  EXPECT_EQ(h, 23);
  EXPECT_EQ(m, 59);
  EXPECT_FALSE(ConfigLoader::parseTimeOfDay("24:00", &h, &m));
  EXPECT_FALSE(ConfigLoader::parseTimeOfDay("12:60", &h, &m));
  EXPECT_FALSE(ConfigLoader::parseTimeOfDay("12:00x", &h, &m));
  EXPECT_FALSE(ConfigLoader::parseTimeOfDay("noon", &h, &m));
}

TEST(ConfigLoader, LoadFileMissingIsKeyNotFound){
  test::TempDir dir;
  ConfigLoader loader;
  DeviceConfig cfg;
  EXPECT_EQ(loader.loadFile(dir.sub("absent.json"), cfg), HalResult::KEY_NOT_FOUND);

  test::writeAll(dir.sub("config.json"), R"({"device": {"offline_mode": true}})");
  EXPECT_EQ(loader.loadFile(dir.sub("config.json"), cfg), HalResult::OK);
}

TEST(ConfigLoader, RefreshCopiesCardConfigOverWorkingCopy){
  test::TempDir dir;
  test::FakeStorage sd(hal::StorageType::SD_CARD, dir.sub("sd"));
  ASSERT_EQ(sd.mount(), HalResult::OK);
  const std::string working = dir.sub("config.json");
  test::writeAll(working, "old");

  ConfigLoader loader;
  // No card config keeps the working copy
  EXPECT_EQ(loader.refreshFromCard(&sd, working), HalResult::OK);
  EXPECT_EQ(test::readAll(working), "old");

  test::writeAll(sd.root() + "/config.json", "new");
  EXPECT_EQ(loader.refreshFromCard(&sd, working), HalResult::OK);
  EXPECT_EQ(test::readAll(working), "new");

  sd.unmount();
  EXPECT_EQ(loader.refreshFromCard(&sd, working), HalResult::NOT_MOUNTED);
}
