/*****************************************************************
 * File:      LifecycleControllerTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Lifecycle/LifecycleController.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace bugg;
using hal::HalResult;
using hal::LedColour;
using hal::LedPosition;
using lifecycle::BootAction;
using lifecycle::LaunchOptions;
using lifecycle::LifecycleController;

// ============================================================
// Command line
// ============================================================

TEST(LaunchOptions, DefaultsWithoutArguments){
  const char* argv[] = {"buggd"};
  LaunchOptions opts;
  ASSERT_EQ(lifecycle::parseLaunchOptions(1, argv, &opts), HalResult::OK);
  EXPECT_FALSE(opts.force_factory_test);
  EXPECT_FALSE(opts.force_factory_test_bare);
  EXPECT_FALSE(opts.verbose);
  EXPECT_EQ(opts.config_path, "/home/bugg/config.json");
}

TEST(LaunchOptions, ParsesEverySwitch){
  const char* argv[] = {"buggd", "--force-factory-test", "--force-factory-test-bare",
                        "-v", "--config", "/tmp/c.json", "--version", "-h"};
  LaunchOptions opts;
  ASSERT_EQ(lifecycle::parseLaunchOptions(8, argv, &opts), HalResult::OK);
  EXPECT_TRUE(opts.force_factory_test);
  EXPECT_TRUE(opts.force_factory_test_bare);
  EXPECT_TRUE(opts.verbose);
  EXPECT_TRUE(opts.show_version);
  EXPECT_TRUE(opts.show_help);
  EXPECT_EQ(opts.config_path, "/tmp/c.json");
}

TEST(LaunchOptions, RejectsUnknownAndIncompleteSwitches){
  LaunchOptions opts;
  opts.config_path = "unchanged";

  const char* unknown[] = {"buggd", "--record-forever"};
  EXPECT_EQ(lifecycle::parseLaunchOptions(2, unknown, &opts), HalResult::INVALID_PARAM);
  const char* missing[] = {"buggd", "--config"};
  EXPECT_EQ(lifecycle::parseLaunchOptions(2, missing, &opts), HalResult::INVALID_PARAM);
  EXPECT_EQ(opts.config_path, "unchanged");
  EXPECT_NE(std::string(lifecycle::usageText()).find("--force-factory-test"), std::string::npos);
}

// ============================================================
// Controller
// ============================================================

class LifecycleControllerTest : public ::testing::Test{
protected:
  LifecycleControllerTest() : leds_(&board_.leds, &board_.log){
    config_path_ = board_.dir.sub("config.json");
    results_path_ = board_.dir.sub("factory_test_results.txt");
    options_.boot_summary_ms = 10;
    options_.error_blink_s = 1;
    options_.factory_results_path = results_path_;
    options_.orchestrator.gate.max_probes = 2;
    options_.orchestrator.gate.probe_interval_ms = 1000;
    options_.orchestrator.offline_pause_ms = 5000;
    launch_.config_path = config_path_;
  }

  app::OrchestratorDeps deps(){
    app::OrchestratorDeps d;
    d.hal = board_.context();
    d.encoder = &encoder_;
    d.clients.http = &http_;
    d.clients.websocket = &ws_;
    d.leds = &leds_;
    return d;
  }

  void writeMarker(const char* name){
    test::writeAll(board_.sd.root() + "/" + name, "");
  }

  test::FakeBoard board_;
  diag::LedStatusController leds_;
  test::FakeEncoder encoder_;
  test::FakeHttpClient http_;
  test::FakeWebSocketClient ws_;
  LifecycleController::Options options_;
  LaunchOptions launch_;
  std::string config_path_;
  std::string results_path_;
};

TEST_F(LifecycleControllerTest, RecordsWhenNothingAsksForATest){
  LifecycleController controller(deps(), options_);
  EXPECT_EQ(controller.decideBootAction(launch_), BootAction::RECORD);
}

TEST_F(LifecycleControllerTest, FlagsSelectFactoryTests){
  LifecycleController controller(deps(), options_);
  LaunchOptions bare = launch_;
  bare.force_factory_test_bare = true;
  EXPECT_EQ(controller.decideBootAction(bare), BootAction::FACTORY_BARE);

  LaunchOptions both = bare;
  both.force_factory_test = true;
  EXPECT_EQ(controller.decideBootAction(both), BootAction::FACTORY_FULL);
}

TEST_F(LifecycleControllerTest, MarkerFilesSelectFactoryTests){
  LifecycleController controller(deps(), options_);
  writeMarker(storage::FACTORY_TEST_BARE_MARKER);
  EXPECT_EQ(controller.decideBootAction(launch_), BootAction::FACTORY_BARE);

  writeMarker(storage::FACTORY_TEST_FULL_MARKER);
  EXPECT_EQ(controller.decideBootAction(launch_), BootAction::FACTORY_FULL);
}

TEST_F(LifecycleControllerTest, MarkersIgnoredWithoutCard){
  writeMarker(storage::FACTORY_TEST_FULL_MARKER);
  board_.sd.mount_fails = true;
  LifecycleController controller(deps(), options_);
  EXPECT_EQ(controller.decideBootAction(launch_), BootAction::RECORD);
}

// ============================================================
// Boot summary
// ============================================================

TEST_F(LifecycleControllerTest, BootSummaryShowsEarlierPass){
  test::writeAll(results_path_, "all_tests_passed: true\n");
  LifecycleController controller(deps(), options_);
  controller.showBootSummary();

  const auto& h = board_.leds.history;
  auto shown = [&h](LedPosition p, LedColour c){
    return std::find(h.begin(), h.end(), std::make_pair(p, c)) != h.end();
  };
  EXPECT_TRUE(shown(LedPosition::TOP, LedColour::MAGENTA));
  EXPECT_TRUE(shown(LedPosition::MIDDLE, LedColour::GREEN));
  EXPECT_TRUE(shown(LedPosition::BOTTOM, LedColour::RED));
  EXPECT_FALSE(shown(LedPosition::MIDDLE, LedColour::RED));
  EXPECT_GE(board_.timer.totalDelayMs(), 10u);

  for(LedPosition p : {LedPosition::TOP, LedPosition::MIDDLE, LedPosition::BOTTOM}){
    EXPECT_EQ(board_.leds.colour(p), LedColour::OFF);
  }
}

TEST_F(LifecycleControllerTest, BootSummaryShowsMissingResultsAsFailure){
  LifecycleController controller(deps(), options_);
  controller.showBootSummary();

  const auto& h = board_.leds.history;
  EXPECT_NE(std::find(h.begin(), h.end(), std::make_pair(LedPosition::MIDDLE, LedColour::RED)), h.end());
  EXPECT_GE(board_.log.count(hal::LogLevel::WARN), 1u);
}

// ============================================================
// Configuration
// ============================================================

TEST_F(LifecycleControllerTest, CardConfigReplacesWorkingCopy){
  test::writeAll(config_path_, R"({"device": {"offline_mode": true}})");
  test::writeAll(board_.sd.root() + "/config.json",
                 R"({"device": {"mode": 2, "server_url": "http://card"}})");
  LifecycleController controller(deps(), options_);

  config::DeviceConfig cfg;
  ASSERT_EQ(controller.loadConfig(config_path_, &cfg), HalResult::OK);
  EXPECT_EQ(cfg.server_url, "http://card");
  EXPECT_EQ(cfg.mode, config::RecordingMode::WEBSOCKET_SAFE);
  EXPECT_NE(test::readAll(config_path_).find("http://card"), std::string::npos);
}

TEST_F(LifecycleControllerTest, NoConfigRecordsOfflineWhenCardPresent){
  LifecycleController controller(deps(), options_);
  config::DeviceConfig cfg;
  ASSERT_EQ(controller.loadConfig(config_path_, &cfg), HalResult::OK);
  EXPECT_TRUE(cfg.offline_mode);
  EXPECT_EQ(cfg.mode, config::RecordingMode::HTTP);
}

TEST_F(LifecycleControllerTest, NoConfigAndNoCardIsNotFound){
  board_.sd.mount_fails = true;
  LifecycleController controller(deps(), options_);
  config::DeviceConfig cfg;
  EXPECT_EQ(controller.loadConfig(config_path_, &cfg), HalResult::KEY_NOT_FOUND);
}

TEST_F(LifecycleControllerTest, InvalidConfigRejected){
  test::writeAll(config_path_, R"({"device": {"offline_mode": true, "mode": 7}})");
  LifecycleController controller(deps(), options_);
  config::DeviceConfig cfg;
  EXPECT_EQ(controller.loadConfig(config_path_, &cfg), HalResult::INVALID_PARAM);
}

// ============================================================
// Run
// ============================================================

TEST_F(LifecycleControllerTest, StopEndsRecordingCleanly){
  test::writeAll(config_path_,
                 R"({"device": {"offline_mode": true}, "sensor": {"record_length": 2, "record_freq": 400}})");
  LifecycleController controller(deps(), options_);
  board_.capture.on_record = [&controller](uint64_t count){
    if(count >= 2) controller.requestStop();
  };

  EXPECT_EQ(controller.run(launch_), 0);
  EXPECT_EQ(board_.capture.records.load(), 2u);
  EXPECT_TRUE(board_.leds.user_led);
  EXPECT_EQ(board_.system.reboots.load(), 0);
}

TEST_F(LifecycleControllerTest, ConfigurationErrorExitsWithoutReboot){
  test::writeAll(config_path_, R"({"device": {"offline_mode": true, "mode": 3}})");
  LifecycleController controller(deps(), options_);
  EXPECT_EQ(controller.run(launch_), 2);
  EXPECT_EQ(board_.system.reboots.load(), 0);
}

TEST_F(LifecycleControllerTest, RejectedConfigExitsWithConfigError){
  test::writeAll(config_path_, R"({"device": )");
  LifecycleController controller(deps(), options_);
  EXPECT_EQ(controller.run(launch_), 2);
  EXPECT_EQ(board_.capture.records.load(), 0u);
}

TEST_F(LifecycleControllerTest, FatalErrorBlinksThenReboots){
  test::writeAll(config_path_, R"({"device": {"offline_mode": true}})");
  board_.capture.present = false;
  LifecycleController controller(deps(), options_);

  EXPECT_EQ(controller.run(launch_), 1);
  EXPECT_EQ(board_.system.reboots.load(), 1);
  EXPECT_GE(board_.timer.totalDelayMs(), 1000u);
  EXPECT_FALSE(board_.leds.user_led);
}

TEST_F(LifecycleControllerTest, FatalWithoutRebootPermission){
  test::writeAll(config_path_, R"({"device": {"offline_mode": true}})");
  board_.capture.present = false;
  options_.reboot_allowed = false;
  LifecycleController controller(deps(), options_);

  EXPECT_EQ(controller.run(launch_), 1);
  EXPECT_EQ(board_.system.reboots.load(), 0);
}

TEST_F(LifecycleControllerTest, NoConfigAndNoCardIsFatal){
  board_.sd.mount_fails = true;
  LifecycleController controller(deps(), options_);
  EXPECT_EQ(controller.run(launch_), 1);
  EXPECT_EQ(board_.system.reboots.load(), 1);
}

TEST_F(LifecycleControllerTest, DailyRebootRestartsDevice){
  // 01:59:55 with the reboot at 02:00
  board_.timer.setEpoch(test::FakeTimer::DEFAULT_EPOCH_MS + 2 * 3600 * 1000 - 5000);
  test::writeAll(config_path_,
                 R"({"device": {"offline_mode": true}, "sensor": {"record_length": 2, "record_freq": 400}})");
  LifecycleController controller(deps(), options_);

  EXPECT_EQ(controller.run(launch_), 0);
  EXPECT_EQ(board_.system.reboots.load(), 1);
}
