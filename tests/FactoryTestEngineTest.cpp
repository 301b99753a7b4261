/*****************************************************************
 * File:      FactoryTestEngineTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Diagnostics/FactoryTestEngine.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

using namespace bugg;
using diag::DiagCheck;
using diag::FactoryTestEngine;
using hal::LedColour;
using hal::LedPosition;

class FactoryTestEngineTest : public ::testing::Test{
protected:
  FactoryTestEngineTest() : leds_(&board_.leds){
    options_.results_path = board_.dir.sub("factory_test_results.txt");
    options_.rssi_polls = 3;
  }

  bool passed(const std::vector<diag::DiagnosticResult>& results, DiagCheck check){
    for(const auto& r : results){
      if(r.check == check) return r.passed;
    }
    ADD_FAILURE() << "missing " << diag::diagCheckKey(check);
    return false;
  }

  test::FakeBoard board_;
  diag::LedStatusController leds_;
  FactoryTestEngine::Options options_;
};

TEST_F(FactoryTestEngineTest, HealthyBoardPasses){
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  auto results = engine.runFull();

  ASSERT_EQ(results.size(), 9u);
  for(size_t i = 0; i < results.size(); i++){
    EXPECT_EQ(results[i].check, diag::DIAG_CHECK_ORDER[i]);
    EXPECT_TRUE(results[i].passed) << diag::diagCheckKey(results[i].check);
  }
  EXPECT_EQ(engine.state(), diag::FactoryTestState::PASSED);
  EXPECT_EQ(board_.leds.colour(LedPosition::TOP), LedColour::GREEN);
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::OFF);
  // Modem is left powered down
  EXPECT_FALSE(board_.modem.isPowered());
}

TEST_F(FactoryTestEngineTest, ResultsFileIsWorldReadable){
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  engine.runFull();

  std::string text = test::readAll(options_.results_path);
  EXPECT_NE(text.find("Device Serial: RPiID-00000000cafef00d"), std::string::npos);
  EXPECT_NE(text.find("modem_towers_found: True"), std::string::npos);
  EXPECT_NE(text.find("all_tests_passed: True"), std::string::npos);
  EXPECT_NE(text.find("Factory Self-Test PASS!"), std::string::npos);

  struct stat st{};
  ASSERT_EQ(::stat(options_.results_path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0644u);
  EXPECT_TRUE(FactoryTestEngine::passedAtFactory(options_.results_path));
}

TEST_F(FactoryTestEngineTest, NoTowersShowsYellowYellow){
  board_.modem.rssi = hal::MODEM_RSSI_UNKNOWN;
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  auto results = engine.runFull();

  EXPECT_FALSE(passed(results, DiagCheck::NO_CELL_TOWERS));
  EXPECT_TRUE(passed(results, DiagCheck::SIM_NOT_RESPONDING));
  EXPECT_EQ(board_.modem.rssi_polls.load(), 3);
  EXPECT_EQ(engine.state(), diag::FactoryTestState::FAILED);
  EXPECT_EQ(board_.leds.colour(LedPosition::TOP), LedColour::YELLOW);
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::YELLOW);
  EXPECT_FALSE(FactoryTestEngine::passedAtFactory(options_.results_path));
}

TEST_F(FactoryTestEngineTest, UnreadableSimShowsYellowBlue){
  board_.modem.sim = false;
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  auto results = engine.runFull();

  for(const auto& r : results){
    if(r.check == DiagCheck::SIM_NOT_RESPONDING) EXPECT_FALSE(r.passed);
    else EXPECT_TRUE(r.passed) << diag::diagCheckKey(r.check);
  }
  EXPECT_EQ(engine.state(), diag::FactoryTestState::FAILED);
  EXPECT_EQ(board_.leds.colour(LedPosition::TOP), LedColour::YELLOW);
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::BLUE);
  EXPECT_NE(test::readAll(options_.results_path).find("modem_sim_readable: False"), std::string::npos);
}

TEST_F(FactoryTestEngineTest, MissingRtcShowsRedCyan){
  board_.i2c.present.erase(hal::board::RTC_ADDR);
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  auto results = engine.runFull();

  EXPECT_FALSE(passed(results, DiagCheck::RTC_UNRESPONSIVE));
  EXPECT_TRUE(passed(results, DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE));
  EXPECT_EQ(board_.leds.colour(LedPosition::TOP), LedColour::RED);
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::CYAN);
}

TEST_F(FactoryTestEngineTest, BusyDeviceCountsAsPresent){
  board_.i2c.present.erase(hal::board::LED_CONTROLLER_ADDR);
  board_.i2c.busy.insert(hal::board::LED_CONTROLLER_ADDR);
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  EXPECT_TRUE(passed(engine.runFull(), DiagCheck::LED_CONTROLLER_UNRESPONSIVE));
}

TEST_F(FactoryTestEngineTest, BridgeIsPoweredForProbeOnly){
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  engine.runFull();
  const auto& writes = board_.gpio.writes;
  ASSERT_GE(writes.size(), 2u);
  EXPECT_EQ(writes.front().first, hal::board::AUDIO_BRIDGE_SHDNZ);
  EXPECT_EQ(writes.front().second, hal::GpioState::GPIO_HIGH);
  EXPECT_EQ(board_.gpio.digitalRead(hal::board::AUDIO_BRIDGE_SHDNZ), hal::GpioState::GPIO_LOW);
}

TEST_F(FactoryTestEngineTest, SilentExternalMicFails){
  board_.soundcard.variance = hal::ChannelVariance{5000.0, 3.0};
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  auto results = engine.runFull();

  EXPECT_TRUE(passed(results, DiagCheck::NO_VARIANCE_INTERNAL));
  EXPECT_FALSE(passed(results, DiagCheck::NO_VARIANCE_EXTERNAL));
  EXPECT_EQ(board_.leds.colour(LedPosition::TOP), LedColour::BLUE);
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::YELLOW);
}

TEST_F(FactoryTestEngineTest, RecordingFailureFailsBothMicChecks){
  board_.soundcard.variance_result = hal::HalResult::READ_FAILED;
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  auto results = engine.runFull();
  EXPECT_FALSE(passed(results, DiagCheck::NO_VARIANCE_INTERNAL));
  EXPECT_FALSE(passed(results, DiagCheck::NO_VARIANCE_EXTERNAL));
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::WHITE);
}

TEST_F(FactoryTestEngineTest, MixedFailuresShowWhiteOff){
  board_.modem.enumerates = false;
  board_.i2c.present.clear();
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  engine.runFull();
  EXPECT_EQ(board_.leds.colour(LedPosition::TOP), LedColour::WHITE);
  EXPECT_EQ(board_.leds.colour(LedPosition::MIDDLE), LedColour::OFF);
}

TEST_F(FactoryTestEngineTest, PassedAtFactoryParsing){
  EXPECT_FALSE(FactoryTestEngine::passedAtFactory(board_.dir.sub("absent.txt")));
  test::writeAll(board_.dir.sub("r1.txt"), "x: y\nall_tests_passed:  TRUE \n");
  EXPECT_TRUE(FactoryTestEngine::passedAtFactory(board_.dir.sub("r1.txt")));
  test::writeAll(board_.dir.sub("r2.txt"), "all_tests_passed: False\n");
  EXPECT_FALSE(FactoryTestEngine::passedAtFactory(board_.dir.sub("r2.txt")));
}

TEST_F(FactoryTestEngineTest, BareBoardPowersRailsAndBlinksUntilStopped){
  options_.blink_half_period_ms = 500;
  FactoryTestEngine engine(board_.context(), &leds_, options_);
  std::atomic<bool> stop{false};

  std::thread stopper([&]{
    while(board_.timer.totalDelayMs() < 5000){
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    stop = true;
  });
  EXPECT_EQ(engine.runBareBoard(&stop), hal::HalResult::OK);
  stopper.join();

  EXPECT_TRUE(board_.modem.rail.load());
  EXPECT_TRUE(board_.soundcard.external);
  EXPECT_EQ(board_.soundcard.getPhantom(), hal::PhantomPower::P48);
  EXPECT_GE(board_.leds.user_toggles, 10);
  EXPECT_FALSE(board_.leds.user_led);
}
