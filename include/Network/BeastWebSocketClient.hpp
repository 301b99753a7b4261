/*****************************************************************
 * File:      BeastWebSocketClient.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Boost.Beast implementation of IWebSocketClient for ws:// and
 *    wss:// (OpenSSL) endpoints. Every operation runs on a private
 *    io_context bounded by a timeout, so callers see blocking
 *    calls that always return.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_BEAST_WEBSOCKET_CLIENT_HPP_
#define BUGG_INCLUDE_NETWORK_BEAST_WEBSOCKET_CLIENT_HPP_

#include "HAL/IHalLog.hpp"
#include "Network/IWebSocketClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <memory>

namespace bugg::net{

/** Components of a ws:// or wss:// URI */
struct WebSocketUri{
  bool secure = false;
  std::string host;
  std::string port;
  std::string target = "/";
};

/** Split a ws(s) URI; the port defaults to 80/443
 * @return false if the scheme is not ws or wss, or the host is empty
 */
bool parseWebSocketUri(const std::string& uri, WebSocketUri* out);

class BeastWebSocketClient : public IWebSocketClient{
public:
  static constexpr const char* TAG = "BEAST";

  explicit BeastWebSocketClient(hal::IHalLog* log = nullptr);
  ~BeastWebSocketClient() override;

  BeastWebSocketClient(const BeastWebSocketClient&) = delete;
  BeastWebSocketClient& operator=(const BeastWebSocketClient&) = delete;

  hal::HalResult connect(const std::string& uri, uint32_t timeout_ms) override;
  bool isOpen() const override;
  hal::HalResult sendBinary(const uint8_t* data, size_t length) override;
  hal::HalResult receiveText(std::string& out, uint32_t timeout_ms) override;
  void close() override;

private:
  using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
  using SecureStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

  template<typename Stream>
  hal::HalResult handshake(Stream& ws, const WebSocketUri& uri, uint32_t timeout_ms);

  template<typename Start>
  hal::HalResult runFor(Start&& start, uint32_t timeout_ms, boost::system::error_code* ec);

  void cancelSocket();

  boost::asio::io_context ioc_;
  boost::asio::ssl::context ssl_ctx_;
  std::unique_ptr<PlainStream> plain_;
  std::unique_ptr<SecureStream> secure_;
  hal::IHalLog* log_ = nullptr;
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_BEAST_WEBSOCKET_CLIENT_HPP_
