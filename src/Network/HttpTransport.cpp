/*****************************************************************
 * File:      HttpTransport.cpp
 * Category:  src/Network
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/HttpTransport.hpp"

namespace bugg::net{

using hal::HalResult;

SendOutcome classifyHttpResponse(const HttpResponse& response){
  if(!response.transport_ok){
    return SendOutcome::retryable(response.error.empty() ? "no response" : response.error);
  }
  const long s = response.status;
  if(s >= 200 && s < 300) return SendOutcome::ack();

  std::string reason = "HTTP " + std::to_string(s);
  if(s == 408 || s == 429 || s >= 500) return SendOutcome::retryable(reason);
  return SendOutcome::fatal(reason);
}

// ============================================================
// Shared send
// ============================================================

SendOutcome HttpTransportBase::send(const std::string& path, const UploadMetadata& meta){
  HttpResponse response;
  std::vector<HttpFormField> fields;
  fields.push_back(HttpFormField{"password", password_});

  HalResult result = client_->postFile(url_, "file", path, fields, response);
  if(result == HalResult::KEY_NOT_FOUND){
    return SendOutcome::fatal("file missing: " + path);
  }

  SendOutcome outcome = classifyHttpResponse(response);
  if(log_){
    if(outcome.status == SendStatus::ACK){
      log_->info(TAG, "Uploaded %s", meta.file_name.c_str());
    }else{
      log_->warn(TAG, "Upload of %s: %s (%s)", meta.file_name.c_str(),
                 sendStatusToString(outcome.status), outcome.reason.c_str());
    }
  }
  return outcome;
}

// ============================================================
// Batch
// ============================================================

HalResult BatchHttpTransport::beginBatch(){
  if(modem_ && !modem_->isPowered()){
    HalResult result = modem_->powerOn();
    if(log_) log_->logResult(result, TAG, "modem power on for upload batch");
    if(result != HalResult::OK) return result;
  }
  if(gate_ && !gate_->waitForConnection(abort_)) return HalResult::TIMEOUT;
  return HalResult::OK;
}

void BatchHttpTransport::endBatch(){
  client_->reset();
  if(modem_ && modem_->isPowered()){
    HalResult result = modem_->powerOff();
    if(log_) log_->logResult(result, TAG, "modem power off after upload batch");
  }
}

void BatchHttpTransport::stop(){
  endBatch();
}

// ============================================================
// Persistent
// ============================================================

HalResult PersistentHttpTransport::beginBatch(){
  if(gate_ && !gate_->waitForConnection(abort_)) return HalResult::TIMEOUT;
  return HalResult::OK;
}

void PersistentHttpTransport::stop(){
  client_->reset();
}

} // namespace bugg::net
