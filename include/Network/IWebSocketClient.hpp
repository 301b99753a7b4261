/*****************************************************************
 * File:      IWebSocketClient.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Minimal WebSocket client seam used by the WebSocket upload
 *    transports. Calls are blocking and not thread-safe; each
 *    transport owns exactly one client.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_IWEBSOCKET_CLIENT_HPP_
#define BUGG_INCLUDE_NETWORK_IWEBSOCKET_CLIENT_HPP_

#include "HAL/HalTypes.hpp"
#include <string>

namespace bugg::net{

class IWebSocketClient{
public:
  virtual ~IWebSocketClient() = default;

  /** Open a connection (ws:// or wss://)
   * @param uri Endpoint
   * @param timeout_ms Connect and handshake budget
   * @return HalResult::OK once the handshake completes
   */
  virtual hal::HalResult connect(const std::string& uri, uint32_t timeout_ms) = 0;

  virtual bool isOpen() const = 0;

  /** Send one binary frame
   * @return HalResult::WRITE_FAILED if the link dropped
   */
  virtual hal::HalResult sendBinary(const uint8_t* data, size_t length) = 0;

  /** Wait for one text frame
   * @return HalResult::TIMEOUT if nothing arrived in time
   */
  virtual hal::HalResult receiveText(std::string& out, uint32_t timeout_ms) = 0;

  virtual void close() = 0;
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_IWEBSOCKET_CLIENT_HPP_
