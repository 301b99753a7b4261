/*****************************************************************
 * File:      WebSocketTransport.cpp
 * Category:  src/Network
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/WebSocketTransport.hpp"
#include "cJSON.h"

#include <cctype>
#include <fstream>
#include <iterator>

namespace bugg::net{

using hal::HalResult;

namespace{

std::string trimLower(const std::string& in){
  size_t b = 0;
  size_t e = in.size();
  while(b < e && std::isspace(static_cast<unsigned char>(in[b]))) b++;
  while(e > b && std::isspace(static_cast<unsigned char>(in[e - 1]))) e--;
  std::string out = in.substr(b, e - b);
  for(char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace

SendOutcome parseAck(const std::string& frame){
  std::string text = trimLower(frame);
  if(text == "ok" || text == "ack") return SendOutcome::ack();
  if(text.compare(0, 3, "err") == 0) return SendOutcome::fatal("server rejected: " + frame);

  cJSON* root = cJSON_Parse(frame.c_str());
  if(!root) return SendOutcome::retryable("unrecognised ack: " + frame);

  SendOutcome outcome = SendOutcome::retryable("unrecognised ack: " + frame);
  const cJSON* status = cJSON_GetObjectItemCaseSensitive(root, "status");
  if(cJSON_IsString(status) && status->valuestring){
    std::string value = trimLower(status->valuestring);
    if(value == "ok" || value == "ack"){
      outcome = SendOutcome::ack();
    }else if(value == "error"){
      const cJSON* message = cJSON_GetObjectItemCaseSensitive(root, "message");
      std::string why = cJSON_IsString(message) && message->valuestring ? message->valuestring : "error";
      outcome = SendOutcome::fatal("server rejected: " + why);
    }
  }
  cJSON_Delete(root);
  return outcome;
}

// ============================================================
// FileWebSocketTransport
// ============================================================

HalResult FileWebSocketTransport::ensureConnected(){
  if(client_->isOpen()) return HalResult::OK;

  if(attempted_ && timer_){
    hal::timestamp_ms_t since = timer_->millis() - last_attempt_ms_;
    if(since < WS_RECONNECT_INTERVAL_MS){
      timer_->delayMs(static_cast<uint32_t>(WS_RECONNECT_INTERVAL_MS - since));
    }
  }
  attempted_ = true;
  if(timer_) last_attempt_ms_ = timer_->millis();

  if(log_) log_->info(TAG, "Connecting to %s", uri_.c_str());
  HalResult result = client_->connect(uri_, WS_CONNECT_TIMEOUT_MS);
  if(log_) log_->logResult(result, TAG, "websocket connect");
  return result;
}

HalResult FileWebSocketTransport::beginBatch(){
  if(gate_ && !gate_->waitForConnection(abort_)) return HalResult::TIMEOUT;
  return HalResult::OK;
}

SendOutcome FileWebSocketTransport::send(const std::string& path, const UploadMetadata& meta){
  std::ifstream in(path, std::ios::binary);
  if(!in) return SendOutcome::fatal("file missing: " + path);
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  in.close();

  if(ensureConnected() != HalResult::OK){
    return SendOutcome::retryable("connect failed");
  }

  HalResult result = client_->sendBinary(data.data(), data.size());
  if(result != HalResult::OK){
    client_->close();
    return SendOutcome::retryable(std::string("send failed: ") + hal::halResultToString(result));
  }

  std::string frame;
  result = client_->receiveText(frame, WS_ACK_TIMEOUT_MS);
  if(result != HalResult::OK){
    // Without an ack the server state is unknown; start clean next time
    client_->close();
    return SendOutcome::retryable(std::string("no ack: ") + hal::halResultToString(result));
  }

  SendOutcome outcome = parseAck(frame);
  if(log_){
    if(outcome.status == SendStatus::ACK){
      log_->info(TAG, "Server acknowledged %s (%zu bytes)", meta.file_name.c_str(), data.size());
    }else{
      log_->warn(TAG, "Ack for %s: %s (%s)", meta.file_name.c_str(),
                 sendStatusToString(outcome.status), outcome.reason.c_str());
    }
  }
  return outcome;
}

void FileWebSocketTransport::stop(){
  if(client_->isOpen()) client_->close();
}

// ============================================================
// StreamWebSocketTransport
// ============================================================

HalResult StreamWebSocketTransport::start(){
  std::lock_guard<std::mutex> lock(mutex_);
  return reconnectIfDue() ? HalResult::OK : HalResult::TIMEOUT;
}

void StreamWebSocketTransport::stop(){
  std::lock_guard<std::mutex> lock(mutex_);
  if(client_->isOpen()) client_->close();
  if(!ring_.empty() && log_){
    log_->warn(TAG, "Dropping %zu undelivered chunks on stop", ring_.size());
  }
  dropped_ += ring_.size();
  ring_.clear();
}

bool StreamWebSocketTransport::reconnectIfDue(){
  if(client_->isOpen()) return true;

  hal::timestamp_ms_t now = timer_ ? timer_->millis() : 0;
  if(attempted_ && now - last_attempt_ms_ < WS_RECONNECT_INTERVAL_MS) return false;
  attempted_ = true;
  last_attempt_ms_ = now;

  HalResult result = client_->connect(uri_, WS_CONNECT_TIMEOUT_MS);
  if(result != HalResult::OK){
    if(log_) log_->warn(TAG, "Connect to %s failed: %s", uri_.c_str(), hal::halResultToString(result));
    return false;
  }
  if(log_) log_->info(TAG, "Connected to %s", uri_.c_str());
  return true;
}

void StreamWebSocketTransport::park(std::vector<uint8_t> bytes){
  while(ring_.size() >= ring_capacity_){
    ring_.pop_front();
    dropped_++;
  }
  ring_.push_back(std::move(bytes));
}

bool StreamWebSocketTransport::flushRingLocked(){
  while(!ring_.empty()){
    const std::vector<uint8_t>& front = ring_.front();
    if(client_->sendBinary(front.data(), front.size()) != HalResult::OK){
      client_->close();
      return false;
    }
    ring_.pop_front();
    delivered_++;
  }
  return true;
}

bool StreamWebSocketTransport::pushChunk(std::vector<uint8_t> bytes){
  std::lock_guard<std::mutex> lock(mutex_);

  if(!reconnectIfDue() || !flushRingLocked()){
    park(std::move(bytes));
    return false;
  }

  if(client_->sendBinary(bytes.data(), bytes.size()) != HalResult::OK){
    if(log_) log_->warn(TAG, "Link dropped, buffering");
    client_->close();
    park(std::move(bytes));
    return false;
  }
  delivered_++;
  return true;
}

bool StreamWebSocketTransport::flush(){
  std::lock_guard<std::mutex> lock(mutex_);
  if(ring_.empty()) return true;
  if(!reconnectIfDue()) return false;
  return flushRingLocked();
}

size_t StreamWebSocketTransport::pendingChunks() const{
  std::lock_guard<std::mutex> lock(mutex_);
  return ring_.size();
}

} // namespace bugg::net
