/*****************************************************************
 * File:      main.cpp
 * Category:  src
 * Author:    Bugg Project
 *
 * Purpose:
 *    buggd entry point. Builds the Raspberry Pi HAL and network
 *    clients, hands them to the lifecycle controller, and turns
 *    SIGINT/SIGTERM into an orderly stop.
 *****************************************************************/

#include "Audio/FfmpegEncoder.hpp"
#include "Diagnostics/LedStatusController.hpp"
#include "HAL/RPi/RpiHal.hpp"
#include "Lifecycle/LifecycleController.hpp"
#include "Network/BeastWebSocketClient.hpp"
#include "Network/CurlHttpClient.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <pthread.h>
#include <thread>

#ifndef BUGG_VERSION
#define BUGG_VERSION "0.0.0"
#endif

using namespace bugg;

static constexpr const char* TAG = "MAIN";

int main(int argc, char** argv){
  lifecycle::LaunchOptions launch;
  if(lifecycle::parseLaunchOptions(argc, argv, &launch) != hal::HalResult::OK){
    fputs(lifecycle::usageText(), stderr);
    return 2;
  }
  if(launch.show_help){
    fputs(lifecycle::usageText(), stdout);
    return 0;
  }
  if(launch.show_version){
    printf("buggd %s\n", BUGG_VERSION);
    return 0;
  }

  // Block the stop signals before any thread starts so only the
  // waiter below receives them
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
  signal(SIGPIPE, SIG_IGN);

  // ============================================================
  // HAL
  // ============================================================
  hal::rpi::RpiHalFactory board;
  board.initCore(launch.verbose ? hal::LogLevel::DEBUG : hal::LogLevel::INFO);
  board.log.info(TAG, "buggd %s starting", BUGG_VERSION);

  hal::HalResult result = board.initPeripherals();
  if(result != hal::HalResult::OK){
    board.log.warn(TAG, "Peripheral init incomplete (%s), continuing", hal::halResultToString(result));
  }

  // ============================================================
  // Middleware
  // ============================================================
  diag::LedStatusController leds(&board.leds, &board.log);
  audio::FfmpegEncoder encoder(&board.log);
  net::CurlHttpClient http(&board.log);
  net::BeastWebSocketClient websocket(&board.log);

  app::OrchestratorDeps deps;
  deps.hal = board.context();
  deps.encoder = &encoder;
  deps.clients.http = &http;
  deps.clients.websocket = &websocket;
  deps.leds = &leds;

  lifecycle::LifecycleController controller(deps, lifecycle::LifecycleController::Options());

  std::atomic<bool> exiting{false};
  std::thread signal_waiter([&](){
    int sig = 0;
    if(sigwait(&stop_signals, &sig) == 0 && !exiting){
      board.log.info(TAG, "Signal %d received, stopping", sig);
      controller.requestStop();
    }
  });

  int code = controller.run(launch);
  board.log.info(TAG, "Exiting with code %d", code);
  board.log.flush();

  // Wake the waiter if no signal came
  exiting = true;
  pthread_kill(signal_waiter.native_handle(), SIGTERM);
  signal_waiter.join();
  return code;
}
