/*****************************************************************
 * File:      RetryPolicyTest.cpp
 * Category:  tests
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/RetryPolicy.hpp"

#include <gtest/gtest.h>

using bugg::net::RetryPolicy;

TEST(RetryPolicy, DefaultsDoubleFromTwoSeconds){
  RetryPolicy p;
  EXPECT_EQ(p.max_attempts, 5u);
  EXPECT_EQ(p.backoffFor(1), 2000u);
  EXPECT_EQ(p.backoffFor(2), 4000u);
  EXPECT_EQ(p.backoffFor(3), 8000u);
  EXPECT_EQ(p.backoffFor(4), 16000u);
}

TEST(RetryPolicy, BackoffIsCapped){
  RetryPolicy p;
  EXPECT_EQ(p.backoffFor(6), 60000u);
  EXPECT_EQ(p.backoffFor(40), 60000u);
}

TEST(RetryPolicy, FromConfigClampsNonsense){
  bugg::config::UploadConfig cfg;
  cfg.max_attempts = 0;
  cfg.backoff_multiplier = 0;
  cfg.initial_backoff_ms = 5000;
  cfg.max_backoff_ms = 100;

  RetryPolicy p = RetryPolicy::fromConfig(cfg);
  EXPECT_EQ(p.max_attempts, 1u);
  EXPECT_EQ(p.multiplier, 1u);
  EXPECT_EQ(p.max_backoff_ms, 5000u);
  EXPECT_EQ(p.backoffFor(3), 5000u);
}
