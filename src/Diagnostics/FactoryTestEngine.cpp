/*****************************************************************
 * File:      FactoryTestEngine.cpp
 * Category:  src/Diagnostics
 * Author:    Bugg Project
 *****************************************************************/

#include "Diagnostics/FactoryTestEngine.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace bugg::diag{

using hal::HalResult;

void FactoryTestEngine::record(std::vector<DiagnosticResult>& out, DiagCheck check, bool passed){
  out.push_back(DiagnosticResult{check, passed});
  if(hal_.log){
    hal_.log->info(TAG, "%-30s %s", diagCheckKey(check), passed ? "PASS" : "FAIL");
  }
}

// ============================================================
// Modem
// ============================================================

void FactoryTestEngine::testModem(std::vector<DiagnosticResult>& out){
  hal::IHalModem* modem = hal_.modem;
  if(!modem){
    for(DiagCheck c : {DiagCheck::USB_ENUMERATION_FAILED, DiagCheck::AT_UNRESPONSIVE,
                       DiagCheck::SIM_NOT_RESPONDING, DiagCheck::NO_CELL_TOWERS}){
      record(out, c, false);
    }
    return;
  }

  // Power cycle so enumeration is observed from a cold start
  bool enumerates = modem->powerOff() == HalResult::OK &&
                    modem->powerOn() == HalResult::OK &&
                    modem->isEnumerated();
  record(out, DiagCheck::USB_ENUMERATION_FAILED, enumerates);
  record(out, DiagCheck::AT_UNRESPONSIVE, modem->isResponding());
  record(out, DiagCheck::SIM_NOT_RESPONDING, modem->simPresent());

  // Registration can lag behind power-on
  int rssi = hal::MODEM_RSSI_UNKNOWN;
  bool towers = false;
  for(uint32_t i = 0; i < options_.rssi_polls; i++){
    HalResult result = modem->getRssi(&rssi);
    if(hal_.log) hal_.log->debug(TAG, "RSSI poll %u: %d (%s)", i + 1, rssi, hal::halResultToString(result));
    if(hal_.timer) hal_.timer->delayMs(options_.rssi_interval_ms);
    if(result == HalResult::OK && rssi != hal::MODEM_RSSI_UNKNOWN){
      towers = true;
      break;
    }
  }
  record(out, DiagCheck::NO_CELL_TOWERS, towers);

  HalResult result = modem->powerOff();
  if(hal_.log) hal_.log->logResult(result, TAG, "modem power off");
}

// ============================================================
// I2C
// ============================================================

bool FactoryTestEngine::probe(hal::i2c_addr_t address){
  if(!hal_.i2c) return false;
  HalResult result = hal_.i2c->probe(address);
  // A busy device is present
  return result == HalResult::OK || result == HalResult::BUSY;
}

void FactoryTestEngine::testI2c(std::vector<DiagnosticResult>& out){
  if(hal_.i2c && !hal_.i2c->isInitialized()){
    HalResult result = hal_.i2c->init(hal::I2cConfig());
    if(hal_.log) hal_.log->logResult(result, TAG, "I2C init");
  }

  // The bridge only answers while SHDNZ is high
  if(hal_.gpio){
    hal_.gpio->pinMode(hal::board::AUDIO_BRIDGE_SHDNZ, hal::GpioMode::GPIO_OUTPUT);
    hal_.gpio->digitalWrite(hal::board::AUDIO_BRIDGE_SHDNZ, hal::GpioState::GPIO_HIGH);
    if(hal_.timer) hal_.timer->delayMs(options_.bridge_settle_ms);
  }
  record(out, DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE, probe(hal::board::AUDIO_BRIDGE_ADDR));
  record(out, DiagCheck::RTC_UNRESPONSIVE, probe(hal::board::RTC_ADDR));
  record(out, DiagCheck::LED_CONTROLLER_UNRESPONSIVE, probe(hal::board::LED_CONTROLLER_ADDR));
  if(hal_.gpio){
    hal_.gpio->digitalWrite(hal::board::AUDIO_BRIDGE_SHDNZ, hal::GpioState::GPIO_LOW);
  }
}

// ============================================================
// Recording
// ============================================================

void FactoryTestEngine::testRecording(std::vector<DiagnosticResult>& out){
  hal::IHalSoundcard* card = hal_.soundcard;
  hal::ChannelVariance variance;
  HalResult result = HalResult::NOT_INITIALIZED;

  if(card){
    card->disableInternalChannel();
    card->disableExternalChannel();
    card->enableInternalChannel();
    card->enableExternalChannel();
    result = card->measureVariance(variance);
  }

  if(result != HalResult::OK){
    if(hal_.log) hal_.log->error(TAG, "Variance measurement failed: %s", hal::halResultToString(result));
    record(out, DiagCheck::NO_VARIANCE_INTERNAL, false);
    record(out, DiagCheck::NO_VARIANCE_EXTERNAL, false);
    return;
  }

  if(hal_.log){
    hal_.log->info(TAG, "Signal variances: internal = %.2f, external = %.2f",
                   variance.internal, variance.external);
  }
  record(out, DiagCheck::NO_VARIANCE_INTERNAL, variance.internal > options_.variance_threshold);
  record(out, DiagCheck::NO_VARIANCE_EXTERNAL, variance.external > options_.variance_threshold);
}

// ============================================================
// Runs
// ============================================================

std::vector<DiagnosticResult> FactoryTestEngine::runFull(){
  state_ = FactoryTestState::RUNNING;
  if(hal_.log) hal_.log->info(TAG, "Full factory test running");
  if(leds_) leds_->show(LED_TEST_RUNNING);

  std::vector<DiagnosticResult> results;
  results.reserve(sizeof(DIAG_CHECK_ORDER) / sizeof(DIAG_CHECK_ORDER[0]));
  testModem(results);
  testI2c(results);
  testRecording(results);

  const bool passed = allPassed(results);
  state_ = passed ? FactoryTestState::PASSED : FactoryTestState::FAILED;

  LedCode code = LedStatusController::codeFor(results);
  if(leds_) leds_->show(code);

  std::string serial = hal_.system ? hal_.system->getDeviceSerial() : "UNKNOWN";
  if(hal_.log) hal_.log->info(TAG, "%s", formatResults(results, serial).c_str());

  HalResult result = writeResults(results);
  if(result != HalResult::OK && hal_.log){
    hal_.log->error(TAG, "Failed to write results to %s: %s", options_.results_path.c_str(),
                    hal::halResultToString(result));
  }
  return results;
}

HalResult FactoryTestEngine::runBareBoard(const std::atomic<bool>* abort){
  if(hal_.log) hal_.log->info(TAG, "Board-level test running");

  HalResult result = hal_.modem ? hal_.modem->powerOnRail() : HalResult::NOT_INITIALIZED;
  if(hal_.log) hal_.log->logResult(result, TAG, "modem rail on");

  if(hal_.soundcard){
    result = hal_.soundcard->enableExternalChannel();
    if(hal_.log) hal_.log->logResult(result, TAG, "external channel on");
    result = hal_.soundcard->setPhantom(hal::PhantomPower::P48);
    if(hal_.log) hal_.log->logResult(result, TAG, "48V phantom on");
  }

  if(!hal_.leds || !hal_.timer) return HalResult::NOT_INITIALIZED;

  // Runs until the technician removes power or the process is stopped
  bool on = true;
  while(!(abort && abort->load())){
    hal_.leds->setUserLed(on);
    on = !on;
    hal_.timer->delayMs(options_.blink_half_period_ms);
  }
  hal_.leds->setUserLed(false);
  return HalResult::OK;
}

// ============================================================
// Results file
// ============================================================

std::string FactoryTestEngine::formatResults(const std::vector<DiagnosticResult>& results,
                                             const std::string& serial){
  const bool passed = allPassed(results);
  std::ostringstream s;
  s << "\nFactory Self-Test Results:\n"
    << "--------------------------\n"
    << "Device Serial: " << serial << "\n";
  for(const DiagnosticResult& r : results){
    s << diagCheckKey(r.check) << ": " << (r.passed ? "True" : "False") << "\n";
  }
  s << "all_tests_passed: " << (passed ? "True" : "False") << "\n"
    << "-----------------------\n"
    << (passed ? "Factory Self-Test PASS!" : "Factory Self-Test FAIL!") << "\n\n";
  return s.str();
}

HalResult FactoryTestEngine::writeResults(const std::vector<DiagnosticResult>& results){
  std::string serial = hal_.system ? hal_.system->getDeviceSerial() : "UNKNOWN";
  {
    std::ofstream out(options_.results_path, std::ios::trunc);
    if(!out) return HalResult::WRITE_FAILED;
    out << formatResults(results, serial);
    if(!out) return HalResult::WRITE_FAILED;
  }
  // Shown on the console login banner, so it must be world-readable
  if(::chmod(options_.results_path.c_str(), 0644) != 0) return HalResult::WRITE_FAILED;
  return HalResult::OK;
}

bool FactoryTestEngine::passedAtFactory(const std::string& path){
  std::ifstream in(path);
  if(!in) return false;

  std::string line;
  while(std::getline(in, line)){
    size_t colon = line.find(':');
    if(colon == std::string::npos) continue;
    if(line.compare(0, colon, "all_tests_passed") != 0) continue;

    std::string value = line.substr(colon + 1);
    std::string lowered;
    for(char c : value){
      if(!std::isspace(static_cast<unsigned char>(c))){
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      }
    }
    return lowered == "true";
  }
  return false;
}

} // namespace bugg::diag
