/*****************************************************************
 * File:      LifecycleController.cpp
 * Category:  src/Lifecycle
 * Author:    Bugg Project
 *****************************************************************/

#include "Lifecycle/LifecycleController.hpp"
#include "Config/ConfigLoader.hpp"
#include "Storage/StorageBackend.hpp"
#include "Utils/ChildProcess.hpp"

#include <cstring>

namespace bugg::lifecycle{

using hal::HalResult;

// ============================================================
// Command line
// ============================================================

const char* usageText(){
  return "Usage: buggd [options]\n"
         "  --force-factory-test       run the full factory test and exit\n"
         "  --force-factory-test-bare  run the board-level test until stopped\n"
         "  --config <path>            working config file (default /home/bugg/config.json)\n"
         "  --verbose                  debug logging\n"
         "  --version                  print version and exit\n"
         "  --help                     show this text\n";
}

HalResult parseLaunchOptions(int argc, const char* const* argv, LaunchOptions* out){
  LaunchOptions opts;
  for(int i = 1; i < argc; i++){
    const char* arg = argv[i];
    if(std::strcmp(arg, "--force-factory-test") == 0){
      opts.force_factory_test = true;
    }else if(std::strcmp(arg, "--force-factory-test-bare") == 0){
      opts.force_factory_test_bare = true;
    }else if(std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0){
      opts.verbose = true;
    }else if(std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0){
      opts.show_help = true;
    }else if(std::strcmp(arg, "--version") == 0){
      opts.show_version = true;
    }else if(std::strcmp(arg, "--config") == 0){
      if(i + 1 >= argc) return HalResult::INVALID_PARAM;
      opts.config_path = argv[++i];
    }else{
      return HalResult::INVALID_PARAM;
    }
  }
  *out = opts;
  return HalResult::OK;
}

// ============================================================
// Boot decisions
// ============================================================

BootAction LifecycleController::decideBootAction(const LaunchOptions& launch){
  // The full test takes precedence over the board-level test
  if(launch.force_factory_test) return BootAction::FACTORY_FULL;

  storage::StorageBackend probe(deps_.hal.sd_storage, deps_.hal.onboard_storage, deps_.hal.log);
  if(probe.markerExists(storage::FACTORY_TEST_FULL_MARKER)) return BootAction::FACTORY_FULL;
  if(launch.force_factory_test_bare) return BootAction::FACTORY_BARE;
  if(probe.markerExists(storage::FACTORY_TEST_BARE_MARKER)) return BootAction::FACTORY_BARE;
  return BootAction::RECORD;
}

void LifecycleController::showBootSummary(){
  diag::LedStatusController* leds = deps_.leds;
  if(!leds) return;

  bool passed = diag::FactoryTestEngine::passedAtFactory(options_.factory_results_path);
  if(!passed && deps_.hal.log){
    deps_.hal.log->warn(TAG, "Factory test has not run on this unit or it failed");
  }
  leds->set(hal::LedPosition::BOTTOM, hal::LedColour::RED);
  leds->show(passed ? diag::LED_BOOT_PREVIOUSLY_PASSED : diag::LED_BOOT_PREVIOUSLY_FAILED);
  if(deps_.hal.timer) deps_.hal.timer->delayMs(options_.boot_summary_ms);
  leds->clear();
}

HalResult LifecycleController::loadConfig(const std::string& path, config::DeviceConfig* out){
  hal::IHalLog* log = deps_.hal.log;
  config::ConfigLoader loader(log);

  hal::IHalStorage* sd = deps_.hal.sd_storage;
  bool sd_ok = sd && (sd->isMounted() || sd->mount() == HalResult::OK);
  if(sd_ok){
    HalResult result = loader.refreshFromCard(sd, path);
    if(result != HalResult::OK && log){
      log->warn(TAG, "Could not copy SD card config (%s)", hal::halResultToString(result));
    }
  }

  HalResult result = loader.loadFile(path, *out);
  if(result == HalResult::KEY_NOT_FOUND){
    if(!sd_ok) return HalResult::KEY_NOT_FOUND;
    // The card can still hold recordings without any server details
    if(log) log->warn(TAG, "No configuration found, recording offline with defaults");
    *out = config::DeviceConfig();
    out->offline_mode = true;
    return HalResult::OK;
  }
  return result;
}

// ============================================================
// Run
// ============================================================

void LifecycleController::requestStop(){
  stop_ = true;
  std::lock_guard<std::mutex> lock(mutex_);
  if(orchestrator_) orchestrator_->requestStop();
}

int LifecycleController::run(const LaunchOptions& launch){
  BootAction action = decideBootAction(launch);
  if(action != BootAction::RECORD) return runFactory(action);
  return runRecording(launch);
}

int LifecycleController::runFactory(BootAction action){
  hal::IHalLog* log = deps_.hal.log;
  diag::FactoryTestEngine::Options engine_options;
  engine_options.results_path = options_.factory_results_path;
  diag::FactoryTestEngine engine(deps_.hal, deps_.leds, engine_options);

  if(action == BootAction::FACTORY_BARE){
    HalResult result = engine.runBareBoard(&stop_);
    return result == HalResult::OK ? 0 : 1;
  }

  // ModemManager would fight the test for the AT port
  HalResult result = utils::runCommand({"systemctl", "stop", "ModemManager"});
  if(result != HalResult::OK && log){
    log->warn(TAG, "Failed to stop ModemManager (%s)", hal::halResultToString(result));
  }
  std::vector<diag::DiagnosticResult> results = engine.runFull();
  return diag::allPassed(results) ? 0 : 1;
}

int LifecycleController::runRecording(const LaunchOptions& launch){
  hal::IHalLog* log = deps_.hal.log;

  showBootSummary();

  config::DeviceConfig config;
  HalResult result = loadConfig(launch.config_path, &config);
  if(result == HalResult::KEY_NOT_FOUND){
    if(log) log->error(TAG, "No configuration and no SD card, nothing to record to");
    fatalRecovery();
    return 1;
  }
  if(result != HalResult::OK){
    if(log) log->error(TAG, "Configuration %s rejected: %s", launch.config_path.c_str(),
                       hal::halResultToString(result));
    return handleOutcome(app::RunOutcome::CONFIG_ERROR);
  }

  if(deps_.hal.leds) deps_.hal.leds->setUserLed(true);

  app::RecordingOrchestrator orchestrator(config, deps_, options_.orchestrator);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stop_) return 0;
    orchestrator_ = &orchestrator;
  }
  app::RunOutcome outcome = orchestrator.run();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    orchestrator_ = nullptr;
  }
  return handleOutcome(outcome);
}

int LifecycleController::handleOutcome(app::RunOutcome outcome){
  hal::IHalLog* log = deps_.hal.log;
  switch(outcome){
    case app::RunOutcome::STOPPED:
      return 0;
    case app::RunOutcome::REBOOT:
      if(options_.reboot_allowed && deps_.hal.system){
        if(log) log->info(TAG, "Rebooting for daily restart");
        if(log) log->flush();
        HalResult result = deps_.hal.system->reboot();
        if(result != HalResult::OK && log) log->logResult(result, TAG, "reboot");
      }
      return 0;
    case app::RunOutcome::FATAL:
      if(deps_.hal.leds) deps_.hal.leds->setUserLed(false);
      fatalRecovery();
      return 1;
    case app::RunOutcome::CONFIG_ERROR:
    default:
      return 2;
  }
}

void LifecycleController::fatalRecovery(){
  hal::IHalLog* log = deps_.hal.log;
  if(deps_.leds) deps_.leds->errorBlink(deps_.hal.timer, options_.error_blink_s, &stop_);
  if(stop_ || !options_.reboot_allowed || !deps_.hal.system) return;

  if(log) log->info(TAG, "Rebooting device to try to recover from error");
  if(log) log->flush();
  HalResult result = deps_.hal.system->reboot();
  if(result != HalResult::OK && log) log->logResult(result, TAG, "reboot");
}

} // namespace bugg::lifecycle
