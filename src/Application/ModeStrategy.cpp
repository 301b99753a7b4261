/*****************************************************************
 * File:      ModeStrategy.cpp
 * Category:  src/Application
 * Author:    Bugg Project
 *****************************************************************/

#include "Application/ModeStrategy.hpp"
#include "Network/HttpTransport.hpp"
#include "Network/WebSocketTransport.hpp"

namespace bugg::app{

using config::RecordingMode;

namespace{

const ModeStrategy STRATEGIES[] = {
  {RecordingMode::DEFAULT,           SegmentLifecycle::FILE_SEGMENTS, TransportKind::BATCH_HTTP,
   true,  ModemPolicy::DOWN_BETWEEN_BATCHES, false},
  {RecordingMode::HTTP,              SegmentLifecycle::FILE_SEGMENTS, TransportKind::PERSISTENT_HTTP,
   false, ModemPolicy::KEEP_WARM,            false},
  {RecordingMode::WEBSOCKET_SAFE,    SegmentLifecycle::FILE_SEGMENTS, TransportKind::FILE_WEBSOCKET,
   false, ModemPolicy::KEEP_WARM,            false},
  {RecordingMode::CONTINUOUS_STREAM, SegmentLifecycle::STREAM_CHUNKS, TransportKind::STREAM_WEBSOCKET,
   false, ModemPolicy::KEEP_WARM,            true},
};

} // namespace

const ModeStrategy& strategyFor(RecordingMode mode){
  for(const ModeStrategy& s : STRATEGIES){
    if(s.mode == mode) return s;
  }
  // ConfigLoader only produces listed modes
  return STRATEGIES[1];
}

uint32_t startupDelaySeconds(const ModeStrategy& strategy, const config::DeviceConfig& config){
  return strategy.half_segment_startup_delay ? config.sensor.record_length_s / 2 : 0;
}

std::unique_ptr<net::UploadTransport> createTransport(const ModeStrategy& strategy,
                                                      const config::DeviceConfig& config,
                                                      const hal::HalContext& hal,
                                                      const TransportClients& clients,
                                                      net::ConnectivityGate* gate,
                                                      const std::atomic<bool>* abort){
  switch(strategy.transport){
    case TransportKind::BATCH_HTTP:{
      if(!clients.http) return nullptr;
      auto t = std::make_unique<net::BatchHttpTransport>(clients.http, gate, hal.modem,
                                                         config::uploadUrl(config),
                                                         config.upload_password, hal.log);
      t->setAbortFlag(abort);
      return t;
    }
    case TransportKind::PERSISTENT_HTTP:{
      if(!clients.http) return nullptr;
      auto t = std::make_unique<net::PersistentHttpTransport>(clients.http, gate,
                                                              config::uploadUrl(config),
                                                              config.upload_password, hal.log);
      t->setAbortFlag(abort);
      return t;
    }
    case TransportKind::FILE_WEBSOCKET:{
      if(!clients.websocket) return nullptr;
      auto t = std::make_unique<net::FileWebSocketTransport>(clients.websocket, gate, hal.timer,
                                                             config::websocketUri(config), hal.log);
      t->setAbortFlag(abort);
      return t;
    }
    case TransportKind::STREAM_WEBSOCKET:
      if(!clients.websocket) return nullptr;
      return std::make_unique<net::StreamWebSocketTransport>(clients.websocket, hal.timer,
                                                             config::websocketUri(config), hal.log);
    default:
      return nullptr;
  }
}

} // namespace bugg::app
