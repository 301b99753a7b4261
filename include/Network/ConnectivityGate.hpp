/*****************************************************************
 * File:      ConnectivityGate.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Waits for a usable network before uploads. In offline mode
 *    it answers "unavailable" at once without probing. The first
 *    successful probe also copies network time into the RTC.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_CONNECTIVITY_GATE_HPP_
#define BUGG_INCLUDE_NETWORK_CONNECTIVITY_GATE_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalNetwork.hpp"
#include "HAL/IHalRtc.hpp"
#include "HAL/IHalTimer.hpp"

#include <atomic>
#include <functional>
#include <mutex>

namespace bugg::net{

class ConnectivityGate{
public:
  static constexpr const char* TAG = "NET";

  struct Options{
    uint32_t max_probes = 30;
    uint32_t probe_interval_ms = 10000;
  };

  using StatusListener = std::function<void(bool connected)>;

  ConnectivityGate(hal::IHalNetwork* network, hal::IHalSystemTimer* timer, bool offline,
                   hal::IHalLog* log = nullptr, hal::IHalRtc* rtc = nullptr)
    : ConnectivityGate(network, timer, offline, Options(), log, rtc){}

  ConnectivityGate(hal::IHalNetwork* network, hal::IHalSystemTimer* timer, bool offline,
                   const Options& options, hal::IHalLog* log = nullptr, hal::IHalRtc* rtc = nullptr)
    : network_(network), timer_(timer), offline_(offline), options_(options), log_(log), rtc_(rtc){}

  /** Block until the network answers or the probe budget runs out.
   * @param abort Optional flag checked between probes
   * @return true if connected; false immediately in offline mode
   */
  bool waitForConnection(const std::atomic<bool>* abort = nullptr);

  /** Single probe, no waiting */
  bool checkNow();

  bool isOffline() const{ return offline_; }
  bool lastKnownConnected() const{ return connected_.load(); }
  uint32_t probeCount() const{ return probes_.load(); }

  /** Called with every probe outcome (used for the data LED) */
  void setStatusListener(StatusListener listener);

private:
  void report(bool connected);

  hal::IHalNetwork* network_ = nullptr;
  hal::IHalSystemTimer* timer_ = nullptr;
  bool offline_ = false;
  Options options_;
  hal::IHalLog* log_ = nullptr;
  hal::IHalRtc* rtc_ = nullptr;

  std::atomic<bool> connected_{false};
  std::atomic<uint32_t> probes_{0};
  bool rtc_synced_ = false;
  std::mutex mutex_;
  StatusListener listener_;
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_CONNECTIVITY_GATE_HPP_
