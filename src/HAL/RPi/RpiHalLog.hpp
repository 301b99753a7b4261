/*****************************************************************
 * File:      RpiHalLog.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Linux implementation of the HAL logging interface. Lines go
 *    to stderr, which systemd forwards to the journal.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_LOG_HPP_
#define BUGG_SRC_HAL_RPI_HAL_LOG_HPP_

#include "HAL/IHalLog.hpp"

#include <chrono>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>

namespace bugg::hal::rpi{

/** stderr logger, one line per call */
class RpiHalLog : public IHalLog{
private:
  static constexpr size_t LOG_BUFFER_SIZE = 512;

  LogLevel level_ = LogLevel::INFO;
  char buffer_[LOG_BUFFER_SIZE];
  bool initialized_ = false;
  std::mutex mutex_;
  std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

  void printLog(LogLevel lvl, const char* tag, const char* format, va_list args){
    if(lvl > level_ || !initialized_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    unsigned long long ms = static_cast<unsigned long long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_).count());
    int len = snprintf(buffer_, LOG_BUFFER_SIZE, "[%c][%llu][%s] ",
                       logLevelChar(lvl), ms, tag);

    if(len > 0 && len < (int)LOG_BUFFER_SIZE - 1){
      vsnprintf(buffer_ + len, LOG_BUFFER_SIZE - len, format, args);
    }

    fputs(buffer_, stderr);
    fputc('\n', stderr);
  }

public:
  RpiHalLog() = default;

  HalResult init(LogLevel level = LogLevel::INFO) override{
    level_ = level;
    initialized_ = true;
    return HalResult::OK;
  }

  void setLevel(LogLevel level) override{
    level_ = level;
  }

  LogLevel getLevel() const override{
    return level_;
  }

  void error(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::ERROR, tag, format, args);
    va_end(args);
  }

  void warn(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::WARN, tag, format, args);
    va_end(args);
  }

  void info(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::INFO, tag, format, args);
    va_end(args);
  }

  void debug(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::DEBUG, tag, format, args);
    va_end(args);
  }

  void verbose(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::VERBOSE, tag, format, args);
    va_end(args);
  }

  void log(LogLevel level, const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(level, tag, format, args);
    va_end(args);
  }

  void logResult(HalResult result, const char* tag, const char* operation) override{
    if(result == HalResult::OK){
      info(tag, "%s: OK", operation);
    }else{
      error(tag, "%s: FAILED (%s)", operation, halResultToString(result));
    }
  }

  void flush() override{
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stderr);
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_LOG_HPP_
