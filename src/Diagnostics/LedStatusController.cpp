/*****************************************************************
 * File:      LedStatusController.cpp
 * Category:  src/Diagnostics
 * Author:    Bugg Project
 *****************************************************************/

#include "Diagnostics/LedStatusController.hpp"

namespace bugg::diag{

using hal::HalResult;
using hal::LedColour;
using hal::LedPosition;

// ============================================================
// Code mapping
// ============================================================

namespace{

LedColour categoryColour(DiagCategory category){
  switch(category){
    case DiagCategory::MODEM: return LedColour::YELLOW;
    case DiagCategory::I2C:   return LedColour::RED;
    default:                  return LedColour::BLUE;
  }
}

LedColour subcodeColour(DiagCheck check){
  switch(check){
    case DiagCheck::USB_ENUMERATION_FAILED:      return LedColour::RED;
    case DiagCheck::AT_UNRESPONSIVE:             return LedColour::MAGENTA;
    case DiagCheck::SIM_NOT_RESPONDING:          return LedColour::BLUE;
    case DiagCheck::NO_CELL_TOWERS:              return LedColour::YELLOW;
    case DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE:   return LedColour::RED;
    case DiagCheck::RTC_UNRESPONSIVE:            return LedColour::CYAN;
    case DiagCheck::LED_CONTROLLER_UNRESPONSIVE: return LedColour::MAGENTA;
    case DiagCheck::NO_VARIANCE_INTERNAL:        return LedColour::RED;
    case DiagCheck::NO_VARIANCE_EXTERNAL:        return LedColour::YELLOW;
    default:                                     return LedColour::WHITE;
  }
}

} // namespace

LedCode LedStatusController::codeFor(const std::vector<DiagnosticResult>& results){
  std::vector<DiagCheck> failed;
  for(const DiagnosticResult& r : results){
    if(!r.passed) failed.push_back(r.check);
  }
  if(failed.empty()) return LED_ALL_PASSED;

  DiagCategory category = diagCategoryOf(failed.front());
  for(DiagCheck check : failed){
    if(diagCategoryOf(check) != category) return LedCode{LedColour::WHITE, LedColour::OFF};
  }

  // Several failures in one category share the White subcode
  LedColour middle = failed.size() > 1 ? LedColour::WHITE : subcodeColour(failed.front());
  return LedCode{categoryColour(category), middle};
}

// ============================================================
// Output
// ============================================================

void LedStatusController::setLocked(LedPosition position, LedColour colour){
  size_t idx = static_cast<size_t>(position);
  if(idx >= 3) return;
  if(known_[idx] && shown_[idx] == colour) return;
  if(!leds_) return;

  HalResult result = leds_->setColour(position, colour);
  if(result == HalResult::OK){
    shown_[idx] = colour;
    known_[idx] = true;
  }else if(log_){
    log_->warn(TAG, "LED %u -> %s: %s", static_cast<unsigned>(idx),
               hal::ledColourToString(colour), hal::halResultToString(result));
  }
}

void LedStatusController::set(LedPosition position, LedColour colour){
  std::lock_guard<std::mutex> lock(mutex_);
  setLocked(position, colour);
}

void LedStatusController::show(const LedCode& code){
  std::lock_guard<std::mutex> lock(mutex_);
  setLocked(LedPosition::TOP, code.top);
  setLocked(LedPosition::MIDDLE, code.middle);
}

void LedStatusController::setRecording(bool recording){
  set(LedPosition::TOP, recording ? LedColour::GREEN : LedColour::OFF);
}

void LedStatusController::setData(DataLedState state){
  LedColour colour = LedColour::OFF;
  switch(state){
    case DataLedState::SETUP:         colour = LedColour::GREEN; break;
    case DataLedState::UPLOADING:     colour = LedColour::CYAN; break;
    case DataLedState::CONNECTED:     colour = LedColour::BLUE; break;
    case DataLedState::NOT_CONNECTED: colour = LedColour::RED; break;
    case DataLedState::OFFLINE:       colour = LedColour::OFF; break;
  }
  set(LedPosition::MIDDLE, colour);
}

void LedStatusController::clear(){
  show(LedCode{LedColour::OFF, LedColour::OFF});
}

void LedStatusController::errorBlink(hal::IHalSystemTimer* timer, uint32_t duration_s,
                                     const std::atomic<bool>* abort){
  if(log_) log_->error(TAG, "Blinking error code for %u s", duration_s);
  bool on = true;
  for(uint32_t i = 0; i < duration_s; i++){
    if(abort && abort->load()) break;
    LedColour colour = on ? LedColour::WHITE : LedColour::OFF;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      setLocked(LedPosition::TOP, colour);
      setLocked(LedPosition::MIDDLE, colour);
    }
    on = !on;
    if(timer) timer->delayMs(1000);
  }
}

LedColour LedStatusController::current(LedPosition position) const{
  std::lock_guard<std::mutex> lock(mutex_);
  size_t idx = static_cast<size_t>(position);
  return idx < 3 ? shown_[idx] : LedColour::OFF;
}

} // namespace bugg::diag
