/*****************************************************************
 * File:      ConnectivityGate.cpp
 * Category:  src/Network
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/ConnectivityGate.hpp"

#include <algorithm>

namespace bugg::net{

using hal::HalResult;

void ConnectivityGate::setStatusListener(StatusListener listener){
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void ConnectivityGate::report(bool connected){
  bool was = connected_.exchange(connected);
  if(was != connected && log_){
    log_->info(TAG, connected ? "Internet connection up" : "Internet connection down");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if(connected && !rtc_synced_ && rtc_ && timer_){
    HalResult result = rtc_->setTime(timer_->utcNowMs());
    rtc_synced_ = result == HalResult::OK;
    if(log_) log_->logResult(result, TAG, "update RTC from network time");
  }
  if(listener_) listener_(connected);
}

bool ConnectivityGate::checkNow(){
  if(offline_ || !network_) return false;
  probes_++;
  bool up = network_->probeInternet();
  report(up);
  return up;
}

bool ConnectivityGate::waitForConnection(const std::atomic<bool>* abort){
  if(offline_) return false;

  for(uint32_t i = 0; i < options_.max_probes; i++){
    if(abort && abort->load()) return false;
    if(checkNow()) return true;
    if(i + 1 < options_.max_probes && timer_){
      if(log_) log_->debug(TAG, "No connection (probe %u/%u)", i + 1, options_.max_probes);
      // Sleep in short slices so an abort is noticed promptly
      uint32_t waited = 0;
      while(waited < options_.probe_interval_ms){
        if(abort && abort->load()) return false;
        uint32_t step = std::min<uint32_t>(500, options_.probe_interval_ms - waited);
        timer_->delayMs(step);
        waited += step;
      }
    }
  }
  if(log_) log_->warn(TAG, "No connection after %u probes", options_.max_probes);
  return false;
}

} // namespace bugg::net
