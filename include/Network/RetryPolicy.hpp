/*****************************************************************
 * File:      RetryPolicy.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Bounded exponential backoff for retryable upload failures.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_RETRY_POLICY_HPP_
#define BUGG_INCLUDE_NETWORK_RETRY_POLICY_HPP_

#include "Config/DeviceConfig.hpp"
#include <algorithm>
#include <cstdint>

namespace bugg::net{

struct RetryPolicy{
  uint32_t max_attempts = 5;
  uint32_t initial_backoff_ms = 2000;
  uint32_t multiplier = 2;
  uint32_t max_backoff_ms = 60000;

  static RetryPolicy fromConfig(const config::UploadConfig& cfg){
    RetryPolicy p;
    p.max_attempts = std::max<uint32_t>(1, cfg.max_attempts);
    p.initial_backoff_ms = cfg.initial_backoff_ms;
    p.multiplier = std::max<uint32_t>(1, cfg.backoff_multiplier);
    p.max_backoff_ms = std::max(cfg.max_backoff_ms, cfg.initial_backoff_ms);
    return p;
  }

  /** Delay after failed attempt number `attempt` (1-based) */
  uint32_t backoffFor(uint32_t attempt) const{
    uint64_t delay = initial_backoff_ms;
    for(uint32_t i = 1; i < attempt && delay < max_backoff_ms; i++){
      delay *= multiplier;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(delay, max_backoff_ms));
  }
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_RETRY_POLICY_HPP_
