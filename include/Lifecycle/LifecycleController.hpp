/*****************************************************************
 * File:      LifecycleController.hpp
 * Category:  include/Lifecycle
 * Author:    Bugg Project
 *
 * Purpose:
 *    Process-level flow of the daemon:
 *    1. Decide between factory test (marker file or flag) and
 *       normal recording
 *    2. Show the factory pass/fail summary on the LEDs
 *    3. Load the configuration (refreshed from the SD card)
 *    4. Run the recording session and act on its outcome
 *       (exit, reboot, or blink the error code then reboot)
 *
 *    Hardware is reached only through the injected HalContext.
 *****************************************************************/

#ifndef BUGG_INCLUDE_LIFECYCLE_LIFECYCLE_CONTROLLER_HPP_
#define BUGG_INCLUDE_LIFECYCLE_LIFECYCLE_CONTROLLER_HPP_

#include "Application/RecordingOrchestrator.hpp"
#include "Config/DeviceConfig.hpp"
#include "Diagnostics/FactoryTestEngine.hpp"
#include "Diagnostics/LedStatusController.hpp"
#include "HAL/Hal.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace bugg::lifecycle{

/** Command-line switches */
struct LaunchOptions{
  bool force_factory_test = false;       ///< --force-factory-test
  bool force_factory_test_bare = false;  ///< --force-factory-test-bare
  bool verbose = false;                  ///< --verbose
  bool show_help = false;                ///< --help
  bool show_version = false;             ///< --version
  std::string config_path = "/home/bugg/config.json";  ///< --config <path>
};

/** Parse argv
 * @return HalResult::INVALID_PARAM on an unknown or incomplete switch
 */
hal::HalResult parseLaunchOptions(int argc, const char* const* argv, LaunchOptions* out);

const char* usageText();

enum class BootAction : uint8_t{
  RECORD = 0,
  FACTORY_FULL,
  FACTORY_BARE
};

class LifecycleController{
public:
  static constexpr const char* TAG = "LIFECYCLE";

  struct Options{
    uint32_t boot_summary_ms = 4000;
    uint32_t error_blink_s = 300;
    std::string factory_results_path = diag::FACTORY_RESULTS_PATH;
    app::RecordingOrchestrator::Options orchestrator;
    bool reboot_allowed = true;
  };

  LifecycleController(const app::OrchestratorDeps& deps, const Options& options)
    : deps_(deps), options_(options){}

  /** Run to completion
   * @return Process exit code
   */
  int run(const LaunchOptions& launch);

  /** Stop whatever is running; safe from any thread */
  void requestStop();

  /** Factory test requested by flag or by a marker file on the SD card */
  BootAction decideBootAction(const LaunchOptions& launch);

  /** Show the earlier factory result for a few seconds */
  void showBootSummary();

  /** Load the configuration, falling back to offline defaults when
   * no file exists but the SD card can hold recordings
   * @return HalResult::KEY_NOT_FOUND if there is neither
   */
  hal::HalResult loadConfig(const std::string& path, config::DeviceConfig* out);

private:
  int runFactory(BootAction action);
  int runRecording(const LaunchOptions& launch);
  int handleOutcome(app::RunOutcome outcome);
  void fatalRecovery();

  app::OrchestratorDeps deps_;
  Options options_;
  std::atomic<bool> stop_{false};
  std::mutex mutex_;
  app::RecordingOrchestrator* orchestrator_ = nullptr;
};

} // namespace bugg::lifecycle

#endif // BUGG_INCLUDE_LIFECYCLE_LIFECYCLE_CONTROLLER_HPP_
