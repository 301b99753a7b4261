/*****************************************************************
 * File:      HttpTransport.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Multipart HTTP upload transports.
 *
 *    BatchHttpTransport powers the modem up for each batch of
 *    uploads and down again when the queue is empty.
 *    PersistentHttpTransport keeps the modem and the connection
 *    warm and sends as soon as a file is queued.
 *
 * Status mapping:
 *    2xx                     ACK
 *    no response, 408, 429   RETRYABLE
 *    5xx                     RETRYABLE
 *    any other status        FATAL (401/403 auth, 400 malformed)
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_HTTP_TRANSPORT_HPP_
#define BUGG_INCLUDE_NETWORK_HTTP_TRANSPORT_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalModem.hpp"
#include "Network/ConnectivityGate.hpp"
#include "Network/IHttpClient.hpp"
#include "Network/UploadTransport.hpp"

#include <atomic>

namespace bugg::net{

/** Map a response to a send outcome */
SendOutcome classifyHttpResponse(const HttpResponse& response);

class HttpTransportBase : public UploadTransport{
public:
  static constexpr const char* TAG = "HTTP";

  HttpTransportBase(IHttpClient* client, ConnectivityGate* gate, std::string url,
                    std::string password, hal::IHalLog* log = nullptr)
    : client_(client), gate_(gate), url_(std::move(url)), password_(std::move(password)), log_(log){}

  SendOutcome send(const std::string& path, const UploadMetadata& meta) override;

  /** Set by the owner to abandon a connectivity wait */
  void setAbortFlag(const std::atomic<bool>* abort){ abort_ = abort; }

protected:
  IHttpClient* client_ = nullptr;
  ConnectivityGate* gate_ = nullptr;
  std::string url_;
  std::string password_;
  hal::IHalLog* log_ = nullptr;
  const std::atomic<bool>* abort_ = nullptr;
};

class BatchHttpTransport : public HttpTransportBase{
public:
  BatchHttpTransport(IHttpClient* client, ConnectivityGate* gate, hal::IHalModem* modem,
                     std::string url, std::string password, hal::IHalLog* log = nullptr)
    : HttpTransportBase(client, gate, std::move(url), std::move(password), log), modem_(modem){}

  const char* name() const override{ return "BatchHttp"; }
  hal::HalResult beginBatch() override;
  void endBatch() override;
  void stop() override;

private:
  hal::IHalModem* modem_ = nullptr;
};

class PersistentHttpTransport : public HttpTransportBase{
public:
  using HttpTransportBase::HttpTransportBase;

  const char* name() const override{ return "PersistentHttp"; }
  hal::HalResult beginBatch() override;
  void stop() override;
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_HTTP_TRANSPORT_HPP_
