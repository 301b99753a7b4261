/*****************************************************************
 * File:      BeastWebSocketClient.cpp
 * Category:  src/Network
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/BeastWebSocketClient.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <chrono>
#include <type_traits>

namespace bugg::net{

using hal::HalResult;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

/** Budget for one binary frame (a full segment over cellular) */
static constexpr uint32_t WRITE_TIMEOUT_MS = 300000;
static constexpr uint32_t CLOSE_TIMEOUT_MS = 2000;

bool parseWebSocketUri(const std::string& uri, WebSocketUri* out){
  WebSocketUri u;
  std::string rest;
  if(uri.compare(0, 6, "wss://") == 0){
    u.secure = true;
    rest = uri.substr(6);
  }else if(uri.compare(0, 5, "ws://") == 0){
    rest = uri.substr(5);
  }else{
    return false;
  }

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if(slash != std::string::npos) u.target = rest.substr(slash);

  size_t colon = authority.rfind(':');
  if(colon != std::string::npos && authority.find(']') == std::string::npos){
    u.host = authority.substr(0, colon);
    u.port = authority.substr(colon + 1);
  }else{
    u.host = authority;
  }
  if(u.port.empty()) u.port = u.secure ? "443" : "80";
  if(u.host.empty()) return false;

  *out = u;
  return true;
}

// ============================================================
// Construction
// ============================================================

BeastWebSocketClient::BeastWebSocketClient(hal::IHalLog* log)
  : ssl_ctx_(asio::ssl::context::tls_client), log_(log){
  boost::system::error_code ec;
  ssl_ctx_.set_default_verify_paths(ec);
  if(ec && log_) log_->warn(TAG, "No system CA store: %s", ec.message().c_str());
  ssl_ctx_.set_verify_mode(asio::ssl::verify_peer, ec);
}

BeastWebSocketClient::~BeastWebSocketClient(){
  close();
}

bool BeastWebSocketClient::isOpen() const{
  if(plain_) return plain_->is_open();
  if(secure_) return secure_->is_open();
  return false;
}

// ============================================================
// Timed execution
// ============================================================

void BeastWebSocketClient::cancelSocket(){
  boost::system::error_code ec;
  if(plain_) beast::get_lowest_layer(*plain_).socket().cancel(ec);
  if(secure_) beast::get_lowest_layer(*secure_).socket().cancel(ec);
}

template<typename Start>
HalResult BeastWebSocketClient::runFor(Start&& start, uint32_t timeout_ms,
                                       boost::system::error_code* ec){
  bool done = false;
  *ec = asio::error::would_block;
  start([&done, ec](boost::system::error_code e, auto&&...){
    *ec = e;
    done = true;
  });

  ioc_.restart();
  ioc_.run_for(std::chrono::milliseconds(timeout_ms));
  if(!done){
    cancelSocket();
    // Let the aborted handler complete before returning
    ioc_.restart();
    ioc_.run();
    return HalResult::TIMEOUT;
  }
  return *ec ? HalResult::ERROR : HalResult::OK;
}

// ============================================================
// Connect
// ============================================================

template<typename Stream>
HalResult BeastWebSocketClient::handshake(Stream& ws, const WebSocketUri& uri, uint32_t timeout_ms){
  boost::system::error_code ec;

  tcp::resolver resolver(ioc_);
  tcp::resolver::results_type endpoints;
  bool resolved = false;
  resolver.async_resolve(uri.host, uri.port,
    [&](boost::system::error_code e, tcp::resolver::results_type r){
      ec = e;
      endpoints = r;
      resolved = true;
    });
  ioc_.restart();
  ioc_.run_for(std::chrono::milliseconds(timeout_ms));
  if(!resolved){
    resolver.cancel();
    ioc_.restart();
    ioc_.run();
    return HalResult::TIMEOUT;
  }
  if(ec){
    if(log_) log_->warn(TAG, "Resolve %s: %s", uri.host.c_str(), ec.message().c_str());
    return HalResult::ERROR;
  }

  HalResult result = runFor([&](auto handler){
    asio::async_connect(beast::get_lowest_layer(ws).socket(), endpoints, handler);
  }, timeout_ms, &ec);
  if(result != HalResult::OK){
    if(log_) log_->warn(TAG, "TCP connect %s:%s: %s", uri.host.c_str(), uri.port.c_str(),
                        result == HalResult::TIMEOUT ? "timeout" : ec.message().c_str());
    return result;
  }

  if constexpr(std::is_same<Stream, SecureStream>::value){
    if(!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), uri.host.c_str())){
      if(log_) log_->warn(TAG, "Failed to set SNI host name");
      return HalResult::ERROR;
    }
    ws.next_layer().set_verify_callback(asio::ssl::host_name_verification(uri.host));
    result = runFor([&](auto handler){
      ws.next_layer().async_handshake(asio::ssl::stream_base::client, handler);
    }, timeout_ms, &ec);
    if(result != HalResult::OK){
      if(log_) log_->warn(TAG, "TLS handshake: %s",
                          result == HalResult::TIMEOUT ? "timeout" : ec.message().c_str());
      return result;
    }
  }

  ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws.binary(true);
  std::string host_header = uri.host + ":" + uri.port;
  result = runFor([&](auto handler){
    ws.async_handshake(host_header, uri.target, handler);
  }, timeout_ms, &ec);
  if(result != HalResult::OK && log_){
    log_->warn(TAG, "WebSocket handshake: %s",
               result == HalResult::TIMEOUT ? "timeout" : ec.message().c_str());
  }
  return result;
}

HalResult BeastWebSocketClient::connect(const std::string& uri, uint32_t timeout_ms){
  close();

  WebSocketUri parsed;
  if(!parseWebSocketUri(uri, &parsed)){
    if(log_) log_->error(TAG, "Invalid WebSocket URI: %s", uri.c_str());
    return HalResult::INVALID_PARAM;
  }

  HalResult result = HalResult::ERROR;
  try{
    if(parsed.secure){
      secure_ = std::make_unique<SecureStream>(ioc_, ssl_ctx_);
      result = handshake(*secure_, parsed, timeout_ms);
    }else{
      plain_ = std::make_unique<PlainStream>(ioc_);
      result = handshake(*plain_, parsed, timeout_ms);
    }
  }catch(const boost::system::system_error& e){
    if(log_) log_->error(TAG, "Connect %s: %s", uri.c_str(), e.what());
    result = HalResult::ERROR;
  }

  if(result != HalResult::OK){
    plain_.reset();
    secure_.reset();
  }
  return result;
}

// ============================================================
// Frames
// ============================================================

HalResult BeastWebSocketClient::sendBinary(const uint8_t* data, size_t length){
  if(!isOpen()) return HalResult::WRITE_FAILED;

  boost::system::error_code ec;
  HalResult result;
  if(plain_){
    result = runFor([&](auto handler){
      plain_->async_write(asio::buffer(data, length), handler);
    }, WRITE_TIMEOUT_MS, &ec);
  }else{
    result = runFor([&](auto handler){
      secure_->async_write(asio::buffer(data, length), handler);
    }, WRITE_TIMEOUT_MS, &ec);
  }

  if(result != HalResult::OK){
    if(log_) log_->warn(TAG, "Write failed: %s", result == HalResult::TIMEOUT ? "timeout" : ec.message().c_str());
    plain_.reset();
    secure_.reset();
    return HalResult::WRITE_FAILED;
  }
  return HalResult::OK;
}

HalResult BeastWebSocketClient::receiveText(std::string& out, uint32_t timeout_ms){
  if(!isOpen()) return HalResult::READ_FAILED;

  beast::flat_buffer buffer;
  boost::system::error_code ec;
  HalResult result;
  if(plain_){
    result = runFor([&](auto handler){ plain_->async_read(buffer, handler); }, timeout_ms, &ec);
  }else{
    result = runFor([&](auto handler){ secure_->async_read(buffer, handler); }, timeout_ms, &ec);
  }

  if(result != HalResult::OK){
    // An interrupted read leaves the stream unusable
    plain_.reset();
    secure_.reset();
    if(result == HalResult::TIMEOUT) return HalResult::TIMEOUT;
    if(log_) log_->warn(TAG, "Read failed: %s", ec.message().c_str());
    return HalResult::READ_FAILED;
  }
  out = beast::buffers_to_string(buffer.data());
  return HalResult::OK;
}

void BeastWebSocketClient::close(){
  if(isOpen()){
    boost::system::error_code ec;
    HalResult result;
    if(plain_){
      result = runFor([&](auto handler){ plain_->async_close(websocket::close_code::normal, handler); },
                      CLOSE_TIMEOUT_MS, &ec);
    }else{
      result = runFor([&](auto handler){ secure_->async_close(websocket::close_code::normal, handler); },
                      CLOSE_TIMEOUT_MS, &ec);
    }
    if(result != HalResult::OK && log_) log_->debug(TAG, "Close handshake incomplete");
  }
  plain_.reset();
  secure_.reset();
}

} // namespace bugg::net
