/*****************************************************************
 * File:      IHalModem.hpp
 * Category:  include/HAL
 * Author:    Bugg Project
 *
 * Purpose:
 *    Cellular modem Hardware Abstraction Layer interface.
 *    Covers power sequencing, USB enumeration and the small
 *    set of AT queries needed by the self-test and uploader.
 *****************************************************************/

#ifndef BUGG_INCLUDE_HAL_IHAL_MODEM_HPP_
#define BUGG_INCLUDE_HAL_IHAL_MODEM_HPP_

#include "HalTypes.hpp"

namespace bugg::hal{

/** RSSI value the modem reports when no signal is known (AT+CSQ) */
constexpr int MODEM_RSSI_UNKNOWN = 99;

/** Cellular Modem Hardware Abstraction Interface */
class IHalModem{
public:
  virtual ~IHalModem() = default;

  /** Initialize control lines
   * @return HalResult::OK on success
   */
  virtual HalResult init() = 0;

  /** Switch on the modem supply rail only (bare-board test points)
   * @return HalResult::OK on success
   */
  virtual HalResult powerOnRail() = 0;

  /** Power the modem on and wait for it to boot
   * @return HalResult::OK on success
   */
  virtual HalResult powerOn() = 0;

  /** Power the modem off
   * @return HalResult::OK on success
   */
  virtual HalResult powerOff() = 0;

  /** Check if the modem is currently powered
   * @return true if powered
   */
  virtual bool isPowered() const = 0;

  /** Check the modem has enumerated on USB
   * @return true if the USB device is present
   */
  virtual bool isEnumerated() = 0;

  /** Check the modem answers a plain AT command
   * @return true on "OK"
   */
  virtual bool isResponding() = 0;

  /** Check the SIM can be read (AT+CPIN?)
   * @return true if SIM is ready
   */
  virtual bool simPresent() = 0;

  /** Read signal strength (AT+CSQ)
   * @param rssi Output RSSI, MODEM_RSSI_UNKNOWN when no towers are visible
   * @return HalResult::OK if the modem answered
   */
  virtual HalResult getRssi(int* rssi) = 0;
};

} // namespace bugg::hal

#endif // BUGG_INCLUDE_HAL_IHAL_MODEM_HPP_
