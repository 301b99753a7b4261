/*****************************************************************
 * File:      IHalLog.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Logging Hardware Abstraction Layer interface.
 *    Provides platform-independent logging and result reporting
 *    for all HAL and middleware components.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_LOG_HPP_
#define BUGG_INCLUDE_HAL_IHAL_LOG_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

// ============================================================
// Log Levels
// ============================================================

/** Log severity levels */
enum class LogLevel : uint8_t{
  NONE = 0,     // No logging
  ERROR = 1,    // Errors only
  WARN = 2,     // Warnings and errors
  INFO = 3,     // Info, warnings, errors
  DEBUG = 4,    // Debug and above
  VERBOSE = 5   // All messages
};

// ============================================================
// Log Interface
// ============================================================

/** Logging Hardware Abstraction Interface
 *
 * Provides platform-independent logging functionality.
 * Implementations can output to stderr (journald), file, etc.
 * Implementations must be safe to call from several threads.
 */
class IHalLog{
public:
  virtual ~IHalLog() = default;

  /** Initialize logging system
   * @param level Minimum log level to output
   * @return HalResult::OK on success
   */
  virtual HalResult init(LogLevel level = LogLevel::INFO) = 0;

  /** Set log level
   * @param level New log level
   */
  virtual void setLevel(LogLevel level) = 0;

  /** Get current log level
   * @return Current log level
   */
  virtual LogLevel getLevel() const = 0;

  /** Log error message
   * @param tag Module tag
   * @param format Printf-style format string
   * @param ... Format arguments
   */
  virtual void error(const char* tag, const char* format, ...) = 0;

  /** Log warning message */
  virtual void warn(const char* tag, const char* format, ...) = 0;

  /** Log info message */
  virtual void info(const char* tag, const char* format, ...) = 0;

  /** Log debug message */
  virtual void debug(const char* tag, const char* format, ...) = 0;

  /** Log verbose message */
  virtual void verbose(const char* tag, const char* format, ...) = 0;

  /** Log with specified level
   * @param level Log level
   * @param tag Module tag
   * @param format Printf-style format string
   * @param ... Format arguments
   */
  virtual void log(LogLevel level, const char* tag, const char* format, ...) = 0;

  /** Log HalResult with context
   * @param result Result code to log
   * @param tag Module tag
   * @param operation Description of operation
   */
  virtual void logResult(HalResult result, const char* tag, const char* operation) = 0;

  /** Flush log buffer (if buffered)
   */
  virtual void flush() = 0;
};

// ============================================================
// Helper Functions
// ============================================================

/** Convert HalResult to string
 * @param result HalResult code
 * @return String representation
 */
inline const char* halResultToString(HalResult result){
  switch(result){
    case HalResult::OK:                  return "OK";
    case HalResult::ERROR:               return "ERROR";
    case HalResult::TIMEOUT:             return "TIMEOUT";
    case HalResult::BUSY:                return "BUSY";
    case HalResult::INVALID_PARAM:       return "INVALID_PARAM";
    case HalResult::NOT_INITIALIZED:     return "NOT_INITIALIZED";
    case HalResult::NOT_SUPPORTED:       return "NOT_SUPPORTED";
    case HalResult::BUFFER_FULL:         return "BUFFER_FULL";
    case HalResult::BUFFER_EMPTY:        return "BUFFER_EMPTY";
    case HalResult::KEY_NOT_FOUND:       return "KEY_NOT_FOUND";
    case HalResult::HARDWARE_FAULT:      return "HARDWARE_FAULT";
    case HalResult::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
    case HalResult::INVALID_STATE:       return "INVALID_STATE";
    case HalResult::NO_MEMORY:           return "NO_MEMORY";
    case HalResult::DEVICE_NOT_FOUND:    return "DEVICE_NOT_FOUND";
    case HalResult::READ_FAILED:         return "READ_FAILED";
    case HalResult::WRITE_FAILED:        return "WRITE_FAILED";
    case HalResult::NOT_MOUNTED:         return "NOT_MOUNTED";
    default:                             return "UNKNOWN";
  }
}

/** Convert LogLevel to string
 * @param level LogLevel
 * @return String representation
 */
inline const char* logLevelToString(LogLevel level){
  switch(level){
    case LogLevel::NONE:    return "NONE";
    case LogLevel::ERROR:   return "ERROR";
    case LogLevel::WARN:    return "WARN";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::VERBOSE: return "VERBOSE";
    default:                return "UNKNOWN";
  }
}

/** Get log level prefix character
 * @param level LogLevel
 * @return Single character prefix
 */
inline char logLevelChar(LogLevel level){
  switch(level){
    case LogLevel::ERROR:   return 'E';
    case LogLevel::WARN:    return 'W';
    case LogLevel::INFO:    return 'I';
    case LogLevel::DEBUG:   return 'D';
    case LogLevel::VERBOSE: return 'V';
    default:                return '?';
  }
}

/** True when the result means the hardware itself is absent or broken */
inline bool isHardwareFault(HalResult result){
  return result == HalResult::HARDWARE_FAULT || result == HalResult::DEVICE_NOT_FOUND;
}

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_LOG_HPP_
