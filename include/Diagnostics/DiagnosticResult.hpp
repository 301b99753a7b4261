/*****************************************************************
 * File:      DiagnosticResult.hpp
 * Category:  include/Diagnostics
 * Author:    Bugg Project
 *
 * Purpose:
 *    Outcome of one factory self-test check. A full run yields
 *    all nine checks in the fixed order of DIAG_CHECK_ORDER.
 *****************************************************************/

#ifndef BUGG_INCLUDE_DIAGNOSTICS_DIAGNOSTIC_RESULT_HPP_
#define BUGG_INCLUDE_DIAGNOSTICS_DIAGNOSTIC_RESULT_HPP_

#include <cstdint>
#include <vector>

namespace bugg::diag{

enum class DiagCategory : uint8_t{
  MODEM = 0,
  I2C,
  RECORDING
};

/** One check; the name is the failure it detects */
enum class DiagCheck : uint8_t{
  USB_ENUMERATION_FAILED = 0,
  AT_UNRESPONSIVE,
  SIM_NOT_RESPONDING,
  NO_CELL_TOWERS,
  AUDIO_BRIDGE_UNRESPONSIVE,
  RTC_UNRESPONSIVE,
  LED_CONTROLLER_UNRESPONSIVE,
  NO_VARIANCE_INTERNAL,
  NO_VARIANCE_EXTERNAL
};

constexpr DiagCheck DIAG_CHECK_ORDER[] = {
  DiagCheck::USB_ENUMERATION_FAILED,
  DiagCheck::AT_UNRESPONSIVE,
  DiagCheck::SIM_NOT_RESPONDING,
  DiagCheck::NO_CELL_TOWERS,
  DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE,
  DiagCheck::RTC_UNRESPONSIVE,
  DiagCheck::LED_CONTROLLER_UNRESPONSIVE,
  DiagCheck::NO_VARIANCE_INTERNAL,
  DiagCheck::NO_VARIANCE_EXTERNAL
};

inline DiagCategory diagCategoryOf(DiagCheck check){
  switch(check){
    case DiagCheck::USB_ENUMERATION_FAILED:
    case DiagCheck::AT_UNRESPONSIVE:
    case DiagCheck::SIM_NOT_RESPONDING:
    case DiagCheck::NO_CELL_TOWERS:
      return DiagCategory::MODEM;
    case DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE:
    case DiagCheck::RTC_UNRESPONSIVE:
    case DiagCheck::LED_CONTROLLER_UNRESPONSIVE:
      return DiagCategory::I2C;
    default:
      return DiagCategory::RECORDING;
  }
}

/** Key used in the results file */
inline const char* diagCheckKey(DiagCheck check){
  switch(check){
    case DiagCheck::USB_ENUMERATION_FAILED:      return "modem_enumerates";
    case DiagCheck::AT_UNRESPONSIVE:             return "modem_responsive";
    case DiagCheck::SIM_NOT_RESPONDING:          return "modem_sim_readable";
    case DiagCheck::NO_CELL_TOWERS:              return "modem_towers_found";
    case DiagCheck::AUDIO_BRIDGE_UNRESPONSIVE:   return "i2s_bridge_responding";
    case DiagCheck::RTC_UNRESPONSIVE:            return "rtc_responding";
    case DiagCheck::LED_CONTROLLER_UNRESPONSIVE: return "led_controller_responding";
    case DiagCheck::NO_VARIANCE_INTERNAL:        return "internal_microphone_recording";
    case DiagCheck::NO_VARIANCE_EXTERNAL:        return "external_microphone_recording";
    default:                                     return "unknown";
  }
}

inline const char* diagCategoryToString(DiagCategory category){
  switch(category){
    case DiagCategory::MODEM:     return "MODEM";
    case DiagCategory::I2C:       return "I2C";
    case DiagCategory::RECORDING: return "RECORDING";
    default:                      return "UNKNOWN";
  }
}

struct DiagnosticResult{
  DiagCheck check;
  bool passed = false;

  DiagCategory category() const{ return diagCategoryOf(check); }
};

inline bool allPassed(const std::vector<DiagnosticResult>& results){
  for(const DiagnosticResult& r : results){
    if(!r.passed) return false;
  }
  return !results.empty();
}

} // namespace bugg::diag

#endif // BUGG_INCLUDE_DIAGNOSTICS_DIAGNOSTIC_RESULT_HPP_
