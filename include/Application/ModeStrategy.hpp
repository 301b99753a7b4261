/*****************************************************************
 * File:      ModeStrategy.hpp
 * Category:  include/Application
 * Author:    Bugg Project
 *
 * Purpose:
 *    The one table that says what each recording mode does. The
 *    orchestrator consults it instead of branching on the mode.
 *
 *    Mode            Lifecycle      Transport        Delay   Modem
 *    0 DEFAULT       file segments  BatchHttp        1/2 seg down between batches
 *    1 HTTP          file segments  PersistentHttp   none    warm
 *    2 WS_SAFE       file segments  FileWebSocket    none    warm
 *    3 STREAM        stream chunks  StreamWebSocket  none    warm
 *****************************************************************/

#ifndef BUGG_INCLUDE_APPLICATION_MODE_STRATEGY_HPP_
#define BUGG_INCLUDE_APPLICATION_MODE_STRATEGY_HPP_

#include "Config/DeviceConfig.hpp"
#include "HAL/Hal.hpp"
#include "Network/ConnectivityGate.hpp"
#include "Network/IHttpClient.hpp"
#include "Network/IWebSocketClient.hpp"
#include "Network/UploadTransport.hpp"

#include <atomic>
#include <memory>

namespace bugg::app{

enum class SegmentLifecycle : uint8_t{
  FILE_SEGMENTS = 0,
  STREAM_CHUNKS
};

enum class TransportKind : uint8_t{
  BATCH_HTTP = 0,
  PERSISTENT_HTTP,
  FILE_WEBSOCKET,
  STREAM_WEBSOCKET
};

enum class ModemPolicy : uint8_t{
  DOWN_BETWEEN_BATCHES = 0,
  KEEP_WARM
};

struct ModeStrategy{
  config::RecordingMode mode;
  SegmentLifecycle lifecycle;
  TransportKind transport;
  bool half_segment_startup_delay;  ///< First upload waits half a segment
  ModemPolicy modem;
  bool requires_network;            ///< Offline mode is a configuration error
};

/** Row of the strategy table for a mode */
const ModeStrategy& strategyFor(config::RecordingMode mode);

/** Seconds the upload task waits before its first batch */
uint32_t startupDelaySeconds(const ModeStrategy& strategy, const config::DeviceConfig& config);

/** Network clients a transport may be built on */
struct TransportClients{
  net::IHttpClient* http = nullptr;
  net::IWebSocketClient* websocket = nullptr;
};

/** Build the transport named by the strategy
 * @param abort Flag that cancels connectivity waits
 */
std::unique_ptr<net::UploadTransport> createTransport(const ModeStrategy& strategy,
                                                      const config::DeviceConfig& config,
                                                      const hal::HalContext& hal,
                                                      const TransportClients& clients,
                                                      net::ConnectivityGate* gate,
                                                      const std::atomic<bool>* abort);

} // namespace bugg::app

#endif // BUGG_INCLUDE_APPLICATION_MODE_STRATEGY_HPP_
