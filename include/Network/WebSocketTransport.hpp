/*****************************************************************
 * File:      WebSocketTransport.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    WebSocket upload transports sharing one persistent
 *    connection to ws(s)://<server>/ws/audio/.
 *
 *    FileWebSocketTransport sends each finished segment as one
 *    binary frame and waits for the server's acknowledgment frame.
 *    The caller deletes the file only on ACK.
 *
 *    StreamWebSocketTransport pushes raw chunks as they are
 *    captured. While the link is down chunks wait in a small ring
 *    (oldest dropped) and are flushed in order on reconnect.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_WEBSOCKET_TRANSPORT_HPP_
#define BUGG_INCLUDE_NETWORK_WEBSOCKET_TRANSPORT_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalTimer.hpp"
#include "Network/ConnectivityGate.hpp"
#include "Network/IWebSocketClient.hpp"
#include "Network/UploadTransport.hpp"

#include <atomic>
#include <deque>
#include <mutex>

namespace bugg::net{

/** Connect and handshake budget */
constexpr uint32_t WS_CONNECT_TIMEOUT_MS = 10000;

/** Minimum spacing between reconnect attempts */
constexpr uint32_t WS_RECONNECT_INTERVAL_MS = 5000;

/** Wait for the server to acknowledge one file */
constexpr uint32_t WS_ACK_TIMEOUT_MS = 30000;

/** Chunks held while the stream link is down */
constexpr size_t WS_STREAM_RING_CHUNKS = 8;

/** Classify one acknowledgment frame.
 * "ok"/"ack" or {"status":"ok"} is ACK; text starting with "ERR" or
 * {"status":"error"} is FATAL; anything else is RETRYABLE.
 */
SendOutcome parseAck(const std::string& frame);

// ============================================================
// File transport (mode 2)
// ============================================================

class FileWebSocketTransport : public UploadTransport{
public:
  static constexpr const char* TAG = "WS";

  FileWebSocketTransport(IWebSocketClient* client, ConnectivityGate* gate,
                         hal::IHalSystemTimer* timer, std::string uri,
                         hal::IHalLog* log = nullptr)
    : client_(client), gate_(gate), timer_(timer), uri_(std::move(uri)), log_(log){}

  const char* name() const override{ return "FileWebSocket"; }
  hal::HalResult beginBatch() override;
  SendOutcome send(const std::string& path, const UploadMetadata& meta) override;
  void stop() override;

  void setAbortFlag(const std::atomic<bool>* abort){ abort_ = abort; }

private:
  hal::HalResult ensureConnected();

  IWebSocketClient* client_ = nullptr;
  ConnectivityGate* gate_ = nullptr;
  hal::IHalSystemTimer* timer_ = nullptr;
  std::string uri_;
  hal::IHalLog* log_ = nullptr;
  const std::atomic<bool>* abort_ = nullptr;
  bool attempted_ = false;
  hal::timestamp_ms_t last_attempt_ms_ = 0;
};

// ============================================================
// Stream transport (mode 3)
// ============================================================

class StreamWebSocketTransport : public UploadTransport{
public:
  static constexpr const char* TAG = "WS_STREAM";

  StreamWebSocketTransport(IWebSocketClient* client, hal::IHalSystemTimer* timer,
                           std::string uri, hal::IHalLog* log = nullptr,
                           size_t ring_capacity = WS_STREAM_RING_CHUNKS)
    : client_(client), timer_(timer), uri_(std::move(uri)), log_(log),
      ring_capacity_(ring_capacity == 0 ? 1 : ring_capacity){}

  const char* name() const override{ return "StreamWebSocket"; }
  bool handlesFiles() const override{ return false; }
  hal::HalResult start() override;
  void stop() override;

  /** Send one chunk, or park it in the ring while disconnected */
  bool pushChunk(std::vector<uint8_t> bytes) override;

  /** Try to empty the ring (reconnecting if allowed)
   * @return true if the ring is empty afterwards
   */
  bool flush() override;

  size_t pendingChunks() const;
  uint64_t deliveredChunks() const{ return delivered_.load(); }
  uint64_t droppedChunks() const{ return dropped_.load(); }

private:
  bool reconnectIfDue();
  bool flushRingLocked();
  void park(std::vector<uint8_t> bytes);

  IWebSocketClient* client_ = nullptr;
  hal::IHalSystemTimer* timer_ = nullptr;
  std::string uri_;
  hal::IHalLog* log_ = nullptr;
  size_t ring_capacity_;

  mutable std::mutex mutex_;
  std::deque<std::vector<uint8_t>> ring_;
  bool attempted_ = false;
  hal::timestamp_ms_t last_attempt_ms_ = 0;
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_WEBSOCKET_TRANSPORT_HPP_
