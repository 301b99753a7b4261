/*****************************************************************
 * File:      RebootWatchdogTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Application/RebootWatchdog.hpp"

#include <gtest/gtest.h>

using bugg::app::RebootWatchdog;

namespace{
// 2024-05-01T00:00:00Z
constexpr bugg::hal::epoch_ms_t MIDNIGHT = 1714521600000LL;
constexpr bugg::hal::epoch_ms_t HOUR = 3600LL * 1000;
}

TEST(RebootWatchdog, NotDueUntilArmed){
  RebootWatchdog w(2, 0);
  EXPECT_FALSE(w.isArmed());
  EXPECT_FALSE(w.isDue(MIDNIGHT + 10 * HOUR));
}

TEST(RebootWatchdog, DueLaterTheSameDay){
  RebootWatchdog w(2, 0);
  w.arm(MIDNIGHT + HOUR);
  EXPECT_EQ(w.dueAt(), MIDNIGHT + 2 * HOUR);
  EXPECT_FALSE(w.isDue(MIDNIGHT + 2 * HOUR - 1));
  EXPECT_TRUE(w.isDue(MIDNIGHT + 2 * HOUR));
}

TEST(RebootWatchdog, PastTimeRollsToTomorrow){
  RebootWatchdog w(2, 0);
  w.arm(MIDNIGHT + 3 * HOUR);
  EXPECT_EQ(w.dueAt(), MIDNIGHT + 26 * HOUR);
}

TEST(RebootWatchdog, ArmingExactlyAtRebootTimeWaitsADay){
  // A unit rebooted at 02:00 must not reboot again immediately
  RebootWatchdog w(2, 0);
  w.arm(MIDNIGHT + 2 * HOUR);
  EXPECT_EQ(w.dueAt(), MIDNIGHT + 26 * HOUR);
}

TEST(RebootWatchdog, MinutesCount){
  RebootWatchdog w(23, 45);
  w.arm(MIDNIGHT);
  EXPECT_EQ(w.dueAt(), MIDNIGHT + 23 * HOUR + 45LL * 60 * 1000);
}
