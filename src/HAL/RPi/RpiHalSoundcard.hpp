/*****************************************************************
 * File:      RpiHalSoundcard.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Soundcard control for the Bugg main board:
 *    - External channel: supply rail on EXT_MIC_EN, gain and
 *      phantom power in one SPI word to the PGA
 *    - Internal channel: PCMD3180 PDM bridge over I2C, powered
 *      through SHDNZ
 *
 *    The PGA cannot be read back, so gain and phantom power are
 *    kept in a small JSON state file that survives restarts of
 *    the daemon (but not reboots). A lock file keeps a second
 *    process off the hardware.
 *
 * SPI word:
 *    byte 0  gain (0..20)
 *    byte 1  bit5 zero-cross GPO, bit4 zero-cross gain, bits2..0 phantom
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_SOUNDCARD_HPP_
#define BUGG_SRC_HAL_RPI_HAL_SOUNDCARD_HPP_

#include "HAL/Hal.hpp"
#include "Utils/ChildProcess.hpp"
#include "cJSON.h"

#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <linux/spi/spidev.h>
#include <mutex>
#include <string>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace bugg::hal::rpi{

class RpiHalSoundcard : public IHalSoundcard{
public:
  struct Config{
    std::string spi_device = "/dev/spidev0.0";
    uint32_t spi_speed_hz = 5000000;
    std::string state_file = "/tmp/soundcard_state.json";
    std::string lock_file = "/tmp/soundcard.lock";
    std::string test_capture = "/tmp/soundcard_test.raw";
  };

private:
  static constexpr const char* TAG = "SOUNDCARD";

  struct RegisterWrite{
    uint8_t reg;
    uint8_t value;
  };

  /** PCMD3180: one PDM channel, left-justified 16-bit, 27 dB digital gain */
  static constexpr RegisterWrite BRIDGE_CONFIG[] = {
    {0x02, 0x81}, {0x3C, 0x40}, {0x41, 0x40}, {0x46, 0x40},
    {0x4B, 0x40}, {0x22, 0x41}, {0x23, 0x41}, {0x24, 0x41},
    {0x25, 0x41}, {0x2B, 0x45}, {0x2C, 0x67}, {0x73, 0xFF},
    {0x74, 0xFF}, {0x75, 0x60}, {0x3E, 0xFF}, {0x07, 0x80}
  };

  IHalGpio* gpio_ = nullptr;
  IHalI2c* i2c_ = nullptr;
  IHalLog* log_ = nullptr;
  Config config_;
  int spi_fd_ = -1;
  int lock_fd_ = -1;
  uint8_t gain_ = 0;
  PhantomPower phantom_ = PhantomPower::NONE;
  std::mutex mutex_;

  static void sleepMs(uint32_t ms){
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }

  static PhantomPower phantomFromCode(int code){
    switch(code){
      case 1:  return PhantomPower::PIP;
      case 2:  return PhantomPower::P3V3;
      case 4:  return PhantomPower::P48;
      default: return PhantomPower::NONE;
    }
  }

  void loadState(){
    std::ifstream in(config_.state_file);
    if(!in){
      storeState();
      return;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    cJSON* root = cJSON_Parse(text.c_str());
    if(!root){
      if(log_) log_->warn(TAG, "Failed to load soundcard state");
      return;
    }
    const cJSON* gain = cJSON_GetObjectItemCaseSensitive(root, "gain");
    const cJSON* phantom = cJSON_GetObjectItemCaseSensitive(root, "phantom");
    if(cJSON_IsNumber(gain) && gain->valueint >= 0 && gain->valueint <= SOUNDCARD_MAX_GAIN){
      gain_ = static_cast<uint8_t>(gain->valueint);
    }
    if(cJSON_IsNumber(phantom)) phantom_ = phantomFromCode(phantom->valueint);
    cJSON_Delete(root);
    if(log_) log_->debug(TAG, "State loaded: gain %u, phantom %s", gain_, phantomPowerToString(phantom_));
  }

  void storeState(){
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "gain", gain_);
    cJSON_AddNumberToObject(root, "phantom", static_cast<int>(phantom_));
    char* text = cJSON_PrintUnformatted(root);
    if(text){
      std::ofstream out(config_.state_file, std::ios::trunc);
      out << text;
      if(!out && log_) log_->warn(TAG, "Cannot write %s", config_.state_file.c_str());
      cJSON_free(text);
    }
    cJSON_Delete(root);
  }

  HalResult writeState(){
    if(spi_fd_ < 0) return HalResult::NOT_INITIALIZED;

    uint8_t tx[2] = {0, 0};
    tx[0] = gain_;
    tx[1] = static_cast<uint8_t>((1u << 5) | (1u << 4) | static_cast<uint8_t>(phantom_));

    struct spi_ioc_transfer xfer{};
    xfer.tx_buf = reinterpret_cast<unsigned long>(tx);
    xfer.len = sizeof(tx);
    xfer.speed_hz = config_.spi_speed_hz;
    xfer.bits_per_word = 8;
    if(ioctl(spi_fd_, SPI_IOC_MESSAGE(1), &xfer) < 0){
      if(log_) log_->error(TAG, "SPI write to PGA failed");
      return HalResult::WRITE_FAILED;
    }
    if(log_) log_->debug(TAG, "Writing state: gain %u, phantom %s", gain_, phantomPowerToString(phantom_));
    storeState();
    return HalResult::OK;
  }

  HalResult bridgePower(bool on){
    HalResult result = gpio_->pinMode(board::AUDIO_BRIDGE_SHDNZ, GpioMode::GPIO_OUTPUT);
    if(result == HalResult::OK){
      result = gpio_->digitalWrite(board::AUDIO_BRIDGE_SHDNZ, on ? GpioState::GPIO_HIGH : GpioState::GPIO_LOW);
    }
    sleepMs(on ? 500 : 100);
    return result;
  }

  static std::vector<int16_t> readPcm16(const std::string& path){
    std::ifstream in(path, std::ios::binary);
    std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<int16_t> samples(bytes.size() / 2);
    for(size_t i = 0; i < samples.size(); i++){
      uint16_t lo = static_cast<uint8_t>(bytes[2 * i]);
      uint16_t hi = static_cast<uint8_t>(bytes[2 * i + 1]);
      samples[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return samples;
  }

  static double variance(const std::vector<int16_t>& samples){
    if(samples.empty()) return 0.0;
    double mean = 0.0;
    for(int16_t s : samples) mean += s;
    mean /= static_cast<double>(samples.size());
    double acc = 0.0;
    for(int16_t s : samples) acc += (s - mean) * (s - mean);
    return acc / static_cast<double>(samples.size());
  }

public:
  RpiHalSoundcard(IHalGpio* gpio, IHalI2c* i2c, IHalLog* log = nullptr)
    : RpiHalSoundcard(gpio, i2c, Config(), log){}

  RpiHalSoundcard(IHalGpio* gpio, IHalI2c* i2c, const Config& config, IHalLog* log = nullptr)
    : gpio_(gpio), i2c_(i2c), log_(log), config_(config){}

  ~RpiHalSoundcard() override{
    if(spi_fd_ >= 0) ::close(spi_fd_);
    if(lock_fd_ >= 0){
      flock(lock_fd_, LOCK_UN);
      ::close(lock_fd_);
    }
  }

  RpiHalSoundcard(const RpiHalSoundcard&) = delete;
  RpiHalSoundcard& operator=(const RpiHalSoundcard&) = delete;

  HalResult init() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(spi_fd_ >= 0) return HalResult::OK;

    lock_fd_ = ::open(config_.lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if(lock_fd_ < 0 || flock(lock_fd_, LOCK_EX | LOCK_NB) != 0){
      if(log_) log_->error(TAG, "Soundcard is in use by another process");
      return HalResult::BUSY;
    }

    spi_fd_ = ::open(config_.spi_device.c_str(), O_RDWR | O_CLOEXEC);
    if(spi_fd_ < 0){
      if(log_) log_->error(TAG, "Cannot open %s", config_.spi_device.c_str());
      return HalResult::DEVICE_NOT_FOUND;
    }
    uint32_t speed = config_.spi_speed_hz;
    ioctl(spi_fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed);

    if(!i2c_->isInitialized()){
      HalResult result = i2c_->init(I2cConfig());
      if(result != HalResult::OK) return result;
    }
    loadState();
    return HalResult::OK;
  }

  HalResult enableExternalChannel() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(log_) log_->debug(TAG, "Enabling external channel");
    HalResult result = gpio_->pinMode(board::EXT_MIC_EN, GpioMode::GPIO_OUTPUT);
    if(result == HalResult::OK) result = gpio_->digitalWrite(board::EXT_MIC_EN, GpioState::GPIO_HIGH);
    if(result != HalResult::OK) return result;
    gain_ = 0;
    phantom_ = PhantomPower::NONE;
    return writeState();
  }

  HalResult disableExternalChannel() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(log_) log_->debug(TAG, "Disabling external channel");
    HalResult result = gpio_->pinMode(board::EXT_MIC_EN, GpioMode::GPIO_OUTPUT);
    if(result == HalResult::OK) result = gpio_->digitalWrite(board::EXT_MIC_EN, GpioState::GPIO_LOW);
    return result;
  }

  HalResult enableInternalChannel() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(log_) log_->debug(TAG, "Enabling internal channel");
    // Power cycle for a clean reset before configuring
    bridgePower(true);
    bridgePower(false);
    HalResult result = bridgePower(true);
    if(result != HalResult::OK) return result;

    for(const RegisterWrite& w : BRIDGE_CONFIG){
      result = i2c_->writeRegister(board::AUDIO_BRIDGE_ADDR, w.reg, w.value);
      if(result != HalResult::OK){
        if(log_) log_->error(TAG, "Bridge register 0x%02X write failed (%s)", w.reg, halResultToString(result));
        return result;
      }
    }
    if(log_) log_->info(TAG, "PDM bridge configured");
    return HalResult::OK;
  }

  HalResult disableInternalChannel() override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(log_) log_->debug(TAG, "Disabling internal channel");
    return bridgePower(false);
  }

  HalResult setGain(uint8_t gain) override{
    if(gain > SOUNDCARD_MAX_GAIN) return HalResult::INVALID_PARAM;
    std::lock_guard<std::mutex> lock(mutex_);
    if(log_) log_->info(TAG, "Setting gain to %u", gain);
    gain_ = gain;
    return writeState();
  }

  HalResult setPhantom(PhantomPower mode) override{
    std::lock_guard<std::mutex> lock(mutex_);
    if(log_) log_->info(TAG, "Setting phantom power to %s", phantomPowerToString(mode));
    phantom_ = mode;
    return writeState();
  }

  uint8_t getGain() const override{ return gain_; }
  PhantomPower getPhantom() const override{ return phantom_; }

  HalResult measureVariance(ChannelVariance& out) override{
    const std::string& fn = config_.test_capture;
    HalResult result = utils::runCommand({"arecord", "--separate-channels", "--device", "plughw:0,0",
                                          "--channels=2", "--format=S16_LE", "--rate=48000",
                                          "--duration=1", "--file-type=raw", fn});
    if(result != HalResult::OK){
      if(log_) log_->error(TAG, "Failed to record audio (%s)", halResultToString(result));
      return result;
    }

    std::vector<int16_t> internal = readPcm16(fn + ".0");
    std::vector<int16_t> external = readPcm16(fn + ".1");
    std::remove((fn + ".0").c_str());
    std::remove((fn + ".1").c_str());
    if(internal.empty() || external.empty()) return HalResult::READ_FAILED;

    out.internal = variance(internal);
    out.external = variance(external);
    if(log_) log_->info(TAG, "Variance internal %.1f, external %.1f", out.internal, out.external);
    return HalResult::OK;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_SOUNDCARD_HPP_
