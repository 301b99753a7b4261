/*****************************************************************
 * File:      IHalI2c.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    I2C Hardware Abstraction Layer interface.
 *    Provides platform-independent I2C master communication
 *    for the audio bridge, RTC and LED controller.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_I2C_HPP_
#define BUGG_INCLUDE_HAL_IHAL_I2C_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

// ============================================================
// I2C Configuration
// ============================================================

/** I2C configuration */
struct I2cConfig{
  uint8_t bus = 1;  // /dev/i2c-1 on the main board
};

// ============================================================
// I2C Interface
// ============================================================

/** I2C Hardware Abstraction Interface
 *
 * Provides platform-independent I2C master operations.
 */
class IHalI2c{
public:
  virtual ~IHalI2c() = default;

  /** Initialize I2C bus
   * @param config I2C configuration
   * @return HalResult::OK on success
   */
  virtual HalResult init(const I2cConfig& config) = 0;

  /** Check if I2C is initialized
   * @return true if initialized
   */
  virtual bool isInitialized() const = 0;

  /** Scan for device on bus
   * @param address 7-bit I2C address
   * @return HalResult::OK if device responds
   */
  virtual HalResult probe(i2c_addr_t address) = 0;

  /** Write data to device
   * @param address 7-bit I2C address
   * @param data Data buffer to write
   * @param length Number of bytes to write
   * @return HalResult::OK on success
   */
  virtual HalResult write(i2c_addr_t address, const uint8_t* data, size_t length) = 0;

  /** Read data from device
   * @param address 7-bit I2C address
   * @param buffer Buffer to store read data
   * @param length Number of bytes to read
   * @return HalResult::OK on success
   */
  virtual HalResult read(i2c_addr_t address, uint8_t* buffer, size_t length) = 0;

  /** Write single register
   * @param address 7-bit I2C address
   * @param reg Register address
   * @param value Value to write
   * @return HalResult::OK on success
   */
  virtual HalResult writeRegister(i2c_addr_t address, uint8_t reg, uint8_t value) = 0;

  /** Read single register
   * @param address 7-bit I2C address
   * @param reg Register address
   * @param value Output value
   * @return HalResult::OK on success
   */
  virtual HalResult readRegister(i2c_addr_t address, uint8_t reg, uint8_t* value) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_I2C_HPP_
