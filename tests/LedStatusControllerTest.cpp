/*****************************************************************
 * File:      LedStatusControllerTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Diagnostics/LedStatusController.hpp"
#include "fakes/FakeHal.hpp"

#include <gtest/gtest.h>

using namespace bugg;
using diag::DiagCheck;
using diag::DiagnosticResult;
using diag::LedCode;
using diag::LedStatusController;
using hal::LedColour;
using hal::LedPosition;

namespace{

std::vector<DiagnosticResult> failing(std::initializer_list<DiagCheck> failed){
  std::vector<DiagnosticResult> results;
  for(DiagCheck check : diag::DIAG_CHECK_ORDER){
    bool pass = true;
    for(DiagCheck f : failed){
      if(f == check) pass = false;
    }
    results.push_back(DiagnosticResult{check, pass});
  }
  return results;
}

} // namespace

TEST(LedCodeFor, AllPassedIsGreen){
  EXPECT_EQ(LedStatusController::codeFor(failing({})), diag::LED_ALL_PASSED);
}

TEST(LedCodeFor, SingleFailureCodes){
  struct Row{ DiagCheck check; LedCode code; };
  const Row table[] = {
    {DiagCheck::USB_ENUMERATION_FAILED,      {LedColour::YELLOW, LedColour::RED}},
    {DiagCheck::AT_UNRESPONSIVE,             {LedColour::YELLOW, LedColour::MAGENTA}},
    {DiagCheck::SIM_NOT_RESPONDING,          {LedColour::YELLOW, LedColour::BLUE}},
    {DiagCheck::NO_CELL_TOWERS,              {LedColour::YELLOW, LedColour::YELLOW}},
    {DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE,   {LedColour::RED,    LedColour::RED}},
    {DiagCheck::RTC_UNRESPONSIVE,            {LedColour::RED,    LedColour::CYAN}},
    {DiagCheck::LED_CONTROLLER_UNRESPONSIVE, {LedColour::RED,    LedColour::MAGENTA}},
    {DiagCheck::NO_VARIANCE_INTERNAL,        {LedColour::BLUE,   LedColour::RED}},
    {DiagCheck::NO_VARIANCE_EXTERNAL,        {LedColour::BLUE,   LedColour::YELLOW}},
  };
  for(const Row& row : table){
    EXPECT_EQ(LedStatusController::codeFor(failing({row.check})), row.code) << diag::diagCheckKey(row.check);
  }
}

TEST(LedCodeFor, SeveralFailuresInOneCategoryShowWhiteSubcode){
  LedCode code = LedStatusController::codeFor(failing({DiagCheck::AT_UNRESPONSIVE, DiagCheck::NO_CELL_TOWERS}));
  EXPECT_EQ(code, (LedCode{LedColour::YELLOW, LedColour::WHITE}));
}

TEST(LedCodeFor, FailuresAcrossCategoriesShowWhiteOff){
  LedCode code = LedStatusController::codeFor(failing({DiagCheck::NO_CELL_TOWERS, DiagCheck::RTC_UNRESPONSIVE}));
  EXPECT_EQ(code, (LedCode{LedColour::WHITE, LedColour::OFF}));
}

TEST(LedStatusController, SkipsRedundantWrites){
  test::FakeLeds leds;
  LedStatusController c(&leds);
  c.setRecording(true);
  c.setRecording(true);
  EXPECT_EQ(leds.writes(), 1u);
  EXPECT_EQ(c.current(LedPosition::TOP), LedColour::GREEN);
  c.setRecording(false);
  EXPECT_EQ(leds.colour(LedPosition::TOP), LedColour::OFF);
}

TEST(LedStatusController, DataStates){
  test::FakeLeds leds;
  LedStatusController c(&leds);
  c.setData(diag::DataLedState::SETUP);
  EXPECT_EQ(leds.colour(LedPosition::MIDDLE), LedColour::GREEN);
  c.setData(diag::DataLedState::UPLOADING);
  EXPECT_EQ(leds.colour(LedPosition::MIDDLE), LedColour::CYAN);
  c.setData(diag::DataLedState::CONNECTED);
  EXPECT_EQ(leds.colour(LedPosition::MIDDLE), LedColour::BLUE);
  c.setData(diag::DataLedState::NOT_CONNECTED);
  EXPECT_EQ(leds.colour(LedPosition::MIDDLE), LedColour::RED);
  c.setData(diag::DataLedState::OFFLINE);
  EXPECT_EQ(leds.colour(LedPosition::MIDDLE), LedColour::OFF);
}

TEST(LedStatusController, FailedWriteIsRetriedNextTime){
  test::FakeLeds leds;
  test::FakeLog log;
  LedStatusController c(&leds, &log);
  leds.fail = true;
  c.show(diag::LED_TEST_RUNNING);
  EXPECT_GE(log.count(hal::LogLevel::WARN), 1u);

  leds.fail = false;
  c.show(diag::LED_TEST_RUNNING);
  EXPECT_EQ(leds.colour(LedPosition::TOP), LedColour::MAGENTA);
}

TEST(LedStatusController, ErrorBlinkTogglesOncePerSecond){
  test::FakeLeds leds;
  test::FakeTimer timer;
  LedStatusController c(&leds);
  c.errorBlink(&timer, 4);
  EXPECT_EQ(timer.totalDelayMs(), 4000u);
  EXPECT_EQ(leds.writes(), 8u);
  EXPECT_EQ(leds.colour(LedPosition::TOP), LedColour::OFF);
}

TEST(LedStatusController, ErrorBlinkHonoursAbort){
  test::FakeLeds leds;
  test::FakeTimer timer;
  LedStatusController c(&leds);
  std::atomic<bool> abort{true};
  c.errorBlink(&timer, 300, &abort);
  EXPECT_EQ(timer.totalDelayMs(), 0u);
}
