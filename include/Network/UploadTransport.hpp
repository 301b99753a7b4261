/*****************************************************************
 * File:      UploadTransport.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Polymorphic delivery channel. File transports implement
 *    send(); the stream transport implements pushChunk(). No
 *    variant may report a delivery the remote end did not
 *    acknowledge (or, for streams, that was not written to an
 *    open socket).
 *
 * Variants:
 *    BatchHttpTransport       mode 0
 *    PersistentHttpTransport  mode 1
 *    FileWebSocketTransport   mode 2
 *    StreamWebSocketTransport mode 3
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_UPLOAD_TRANSPORT_HPP_
#define BUGG_INCLUDE_NETWORK_UPLOAD_TRANSPORT_HPP_

#include "HAL/HalTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace bugg::net{

/** Classification of one delivery attempt */
enum class SendStatus : uint8_t{
  ACK = 0,     ///< Remote end confirmed receipt
  RETRYABLE,   ///< Timeout, link failure, 5xx; try again later
  FATAL        ///< Auth or protocol rejection; never retry
};

inline const char* sendStatusToString(SendStatus status){
  switch(status){
    case SendStatus::ACK:       return "ACK";
    case SendStatus::RETRYABLE: return "RETRYABLE";
    case SendStatus::FATAL:     return "FATAL";
    default:                    return "UNKNOWN";
  }
}

struct SendOutcome{
  SendStatus status = SendStatus::RETRYABLE;
  std::string reason;

  static SendOutcome ack(){ return SendOutcome{SendStatus::ACK, ""}; }
  static SendOutcome retryable(std::string why){ return SendOutcome{SendStatus::RETRYABLE, std::move(why)}; }
  static SendOutcome fatal(std::string why){ return SendOutcome{SendStatus::FATAL, std::move(why)}; }
};

/** Describes the file being sent */
struct UploadMetadata{
  std::string file_name;
  uint64_t sequence = 0;
};

class UploadTransport{
public:
  virtual ~UploadTransport() = default;

  virtual const char* name() const = 0;

  /** True for file transports, false for the chunk stream */
  virtual bool handlesFiles() const{ return true; }

  /** Acquire long-lived resources */
  virtual hal::HalResult start(){ return hal::HalResult::OK; }

  /** Release everything, closing connections */
  virtual void stop(){}

  /** Called before the first send after the queue was empty.
   * Waits for connectivity (and powers the link where needed).
   * @return HalResult::TIMEOUT if the network stayed unavailable
   */
  virtual hal::HalResult beginBatch(){ return hal::HalResult::OK; }

  /** Called when the queue has drained */
  virtual void endBatch(){}

  /** Deliver one file; blocks until acknowledged or failed */
  virtual SendOutcome send(const std::string& path, const UploadMetadata& meta){
    (void)path;
    (void)meta;
    return SendOutcome::fatal("transport does not send files");
  }

  /** Push one stream chunk
   * @return true if the chunk was written to an open socket
   */
  virtual bool pushChunk(std::vector<uint8_t> bytes){
    (void)bytes;
    return false;
  }

  /** Send anything buffered inside the transport
   * @return true if nothing is left buffered
   */
  virtual bool flush(){ return true; }
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_UPLOAD_TRANSPORT_HPP_
