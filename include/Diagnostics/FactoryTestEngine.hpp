/*****************************************************************
 * File:      FactoryTestEngine.hpp
 * Category:  include/Diagnostics
 * Author:    Bugg Project
 *
 * Purpose:
 *    Factory self-test. The full test runs every check in order
 *    (a failure never stops the later checks), shows the outcome
 *    on the LEDs and writes the results file that later boots read
 *    for their summary. The board-level test only powers the rails
 *    so voltages can be measured, then blinks the user LED.
 *
 * Sequence:
 *    modem: power cycle + USB enumeration, AT, SIM, cell towers
 *    I2C:   audio bridge 0x4c (powered), RTC 0x68, LED ctrl 0x23
 *    audio: variance on the internal and external microphones
 *****************************************************************/

#ifndef BUGG_INCLUDE_DIAGNOSTICS_FACTORY_TEST_ENGINE_HPP_
#define BUGG_INCLUDE_DIAGNOSTICS_FACTORY_TEST_ENGINE_HPP_

#include "Diagnostics/DiagnosticResult.hpp"
#include "Diagnostics/LedStatusController.hpp"
#include "HAL/Hal.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace bugg::diag{

constexpr const char* FACTORY_RESULTS_PATH = "/home/bugg/factory_test_results.txt";

enum class FactoryTestState : uint8_t{
  IDLE = 0,
  RUNNING,
  PASSED,
  FAILED
};

class FactoryTestEngine{
public:
  static constexpr const char* TAG = "FACTORY";

  struct Options{
    std::string results_path = FACTORY_RESULTS_PATH;
    uint32_t rssi_polls = 6;
    uint32_t rssi_interval_ms = 1000;
    double variance_threshold = 100.0;
    uint32_t bridge_settle_ms = 10;
    uint32_t blink_half_period_ms = 500;
  };

  FactoryTestEngine(const hal::HalContext& hal, LedStatusController* leds)
    : FactoryTestEngine(hal, leds, Options()){}
  FactoryTestEngine(const hal::HalContext& hal, LedStatusController* leds, const Options& options)
    : hal_(hal), leds_(leds), options_(options){}

  /** Run the full test
   * @return All nine results in check order
   */
  std::vector<DiagnosticResult> runFull();

  /** Power the rails and blink the user LED until abort is set */
  hal::HalResult runBareBoard(const std::atomic<bool>* abort);

  /** Results file content for a run */
  static std::string formatResults(const std::vector<DiagnosticResult>& results,
                                   const std::string& serial);

  /** Write the results file (mode 0644) */
  hal::HalResult writeResults(const std::vector<DiagnosticResult>& results);

  /** Read all_tests_passed from an earlier results file
   * @return false if the file is missing or unreadable
   */
  static bool passedAtFactory(const std::string& path = FACTORY_RESULTS_PATH);

  FactoryTestState state() const{ return state_; }

private:
  void testModem(std::vector<DiagnosticResult>& out);
  void testI2c(std::vector<DiagnosticResult>& out);
  void testRecording(std::vector<DiagnosticResult>& out);
  bool probe(hal::i2c_addr_t address);
  void record(std::vector<DiagnosticResult>& out, DiagCheck check, bool passed);

  hal::HalContext hal_;
  LedStatusController* leds_ = nullptr;
  Options options_;
  FactoryTestState state_ = FactoryTestState::IDLE;
};

} // namespace bugg::diag

#endif // BUGG_INCLUDE_DIAGNOSTICS_FACTORY_TEST_ENGINE_HPP_
