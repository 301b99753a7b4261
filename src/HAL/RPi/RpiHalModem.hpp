/*****************************************************************
 * File:      RpiHalModem.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Cellular modem control: supply rail and PWRKEY on GPIO,
 *    status queries as AT commands over the USB serial port.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_MODEM_HPP_
#define BUGG_SRC_HAL_RPI_HAL_MODEM_HPP_

#include "HAL/Hal.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace bugg::hal::rpi{

class RpiHalModem : public IHalModem{
public:
  struct Config{
    std::string at_port = "/dev/ttyUSB2";
    uint32_t pwrkey_pulse_ms = 600;
    uint32_t boot_timeout_ms = 30000;
    uint32_t shutdown_ms = 3000;
    uint32_t at_timeout_ms = 2000;
  };

private:
  static constexpr const char* TAG = "MODEM";

  IHalGpio* gpio_ = nullptr;
  IHalLog* log_ = nullptr;
  Config config_;
  bool powered_ = false;
  bool initialized_ = false;
  std::mutex mutex_;

  static void sleepMs(uint32_t ms){
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }

  /** Send one command and collect the reply up to OK or ERROR
   * @return HalResult::BUSY if another process holds the port
   */
  HalResult command(const std::string& cmd, std::string* reply){
    int fd = ::open(config_.at_port.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if(fd < 0) return HalResult::DEVICE_NOT_FOUND;
    if(flock(fd, LOCK_EX | LOCK_NB) != 0){
      ::close(fd);
      if(log_) log_->warn(TAG, "AT port in use, probably by ModemManager");
      return HalResult::BUSY;
    }

    struct termios tio{};
    if(tcgetattr(fd, &tio) == 0){
      cfmakeraw(&tio);
      cfsetispeed(&tio, B115200);
      cfsetospeed(&tio, B115200);
      tio.c_cflag |= CLOCAL | CREAD;
      tcsetattr(fd, TCSANOW, &tio);
    }
    tcflush(fd, TCIOFLUSH);

    std::string line = cmd + "\r";
    if(::write(fd, line.data(), line.size()) != static_cast<ssize_t>(line.size())){
      ::close(fd);
      return HalResult::WRITE_FAILED;
    }

    std::string buffer;
    HalResult result = HalResult::TIMEOUT;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.at_timeout_ms);
    while(std::chrono::steady_clock::now() < deadline){
      struct pollfd pfd{fd, POLLIN, 0};
      if(poll(&pfd, 1, 100) <= 0) continue;
      char chunk[128];
      ssize_t n = ::read(fd, chunk, sizeof(chunk));
      if(n <= 0) continue;
      buffer.append(chunk, static_cast<size_t>(n));
      if(buffer.find("\r\nOK\r\n") != std::string::npos){
        result = HalResult::OK;
        break;
      }
      if(buffer.find("ERROR") != std::string::npos){
        result = HalResult::ERROR;
        break;
      }
    }
    ::close(fd);
    if(reply) *reply = buffer;
    if(log_) log_->debug(TAG, "%s -> %s", cmd.c_str(), halResultToString(result));
    return result;
  }

public:
  RpiHalModem(IHalGpio* gpio, IHalLog* log = nullptr) : RpiHalModem(gpio, Config(), log){}

  RpiHalModem(IHalGpio* gpio, const Config& config, IHalLog* log = nullptr)
    : gpio_(gpio), log_(log), config_(config){}

  HalResult init() override{
    std::lock_guard<std::mutex> lock(mutex_);
    HalResult result = gpio_->pinMode(board::MODEM_RAIL_EN, GpioMode::GPIO_OUTPUT);
    if(result == HalResult::OK) result = gpio_->pinMode(board::MODEM_PWRKEY, GpioMode::GPIO_OUTPUT);
    if(result == HalResult::OK) result = gpio_->digitalWrite(board::MODEM_PWRKEY, GpioState::GPIO_LOW);
    if(result != HalResult::OK) return result;
    powered_ = gpio_->digitalRead(board::MODEM_RAIL_EN) == GpioState::GPIO_HIGH;
    initialized_ = true;
    return HalResult::OK;
  }

  HalResult powerOnRail() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    return gpio_->digitalWrite(board::MODEM_RAIL_EN, GpioState::GPIO_HIGH);
  }

  HalResult powerOn() override{
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!initialized_) return HalResult::NOT_INITIALIZED;
      HalResult result = gpio_->digitalWrite(board::MODEM_RAIL_EN, GpioState::GPIO_HIGH);
      if(result != HalResult::OK) return result;
      sleepMs(100);
      result = gpio_->digitalWrite(board::MODEM_PWRKEY, GpioState::GPIO_HIGH);
      sleepMs(config_.pwrkey_pulse_ms);
      if(result == HalResult::OK) result = gpio_->digitalWrite(board::MODEM_PWRKEY, GpioState::GPIO_LOW);
      if(result != HalResult::OK) return result;
      powered_ = true;
    }

    if(log_) log_->info(TAG, "Waiting for modem to enumerate");
    for(uint32_t waited = 0; waited < config_.boot_timeout_ms; waited += 1000){
      if(isEnumerated()) return HalResult::OK;
      sleepMs(1000);
    }
    if(log_) log_->error(TAG, "Modem did not enumerate within %u ms", config_.boot_timeout_ms);
    return HalResult::TIMEOUT;
  }

  HalResult powerOff() override{
    if(isEnumerated()){
      // Let the modem detach from the network before losing power
      HalResult result = command("AT+QPOWD=1", nullptr);
      if(result == HalResult::OK) sleepMs(config_.shutdown_ms);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    HalResult result = gpio_->digitalWrite(board::MODEM_RAIL_EN, GpioState::GPIO_LOW);
    if(result == HalResult::OK) powered_ = false;
    return result;
  }

  bool isPowered() const override{
    return powered_;
  }

  bool isEnumerated() override{
    struct stat st{};
    return ::stat(config_.at_port.c_str(), &st) == 0;
  }

  bool isResponding() override{
    return command("AT", nullptr) == HalResult::OK;
  }

  bool simPresent() override{
    std::string reply;
    if(command("AT+CPIN?", &reply) != HalResult::OK) return false;
    return reply.find("+CPIN: READY") != std::string::npos;
  }

  HalResult getRssi(int* rssi) override{
    if(!rssi) return HalResult::INVALID_PARAM;
    std::string reply;
    HalResult result = command("AT+CSQ", &reply);
    if(result != HalResult::OK) return result;

    size_t pos = reply.find("+CSQ:");
    if(pos == std::string::npos) return HalResult::READ_FAILED;
    *rssi = std::atoi(reply.c_str() + pos + 5);
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_MODEM_HPP_
