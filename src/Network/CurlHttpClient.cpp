/*****************************************************************
 * File:      CurlHttpClient.cpp
 * Category:  src/Network
 * Author:    Bugg Project
 *****************************************************************/

#include "Network/CurlHttpClient.hpp"

#include <mutex>
#include <sys/stat.h>

namespace bugg::net{

using hal::HalResult;

namespace{
std::once_flag g_curl_once;
}

CurlHttpClient::CurlHttpClient(hal::IHalLog* log, long timeout_s)
  : log_(log), timeout_s_(timeout_s){
  std::call_once(g_curl_once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient(){
  reset();
}

void CurlHttpClient::reset(){
  if(handle_){
    curl_easy_cleanup(handle_);
    handle_ = nullptr;
  }
}

size_t CurlHttpClient::onBody(char* data, size_t size, size_t count, void* user){
  std::string* body = static_cast<std::string*>(user);
  const size_t n = size * count;
  // Responses are short status documents; cap to keep memory bounded
  if(body->size() < 4096) body->append(data, n < 4096 - body->size() ? n : 4096 - body->size());
  return n;
}

HalResult CurlHttpClient::postFile(const std::string& url, const std::string& file_field,
                                   const std::string& file_path,
                                   const std::vector<HttpFormField>& fields,
                                   HttpResponse& response){
  response = HttpResponse();

  struct stat st;
  if(stat(file_path.c_str(), &st) != 0){
    response.error = "file missing";
    return HalResult::KEY_NOT_FOUND;
  }

  if(!handle_){
    handle_ = curl_easy_init();
    if(!handle_){
      response.error = "curl_easy_init failed";
      return HalResult::NO_MEMORY;
    }
  }else{
    curl_easy_reset(handle_);
  }

  curl_mime* mime = curl_mime_init(handle_);
  curl_mimepart* part = curl_mime_addpart(mime);
  curl_mime_name(part, file_field.c_str());
  curl_mime_filedata(part, file_path.c_str());
  for(const HttpFormField& field : fields){
    part = curl_mime_addpart(mime);
    curl_mime_name(part, field.name.c_str());
    curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
  }

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle_, CURLOPT_MIMEPOST, mime);
  curl_easy_setopt(handle_, CURLOPT_TIMEOUT, timeout_s_);
  curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, 30L);
  curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle_, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &CurlHttpClient::onBody);
  curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &response.body);

  CURLcode rc = curl_easy_perform(handle_);
  curl_mime_free(mime);

  if(rc != CURLE_OK){
    response.transport_ok = false;
    response.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
    if(log_) log_->warn(TAG, "POST %s failed: %s", url.c_str(), response.error.c_str());
    // A broken connection must not be reused
    reset();
    return rc == CURLE_OPERATION_TIMEDOUT ? HalResult::TIMEOUT : HalResult::ERROR;
  }

  curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &response.status);
  response.transport_ok = true;
  if(log_) log_->debug(TAG, "POST %s -> %ld", url.c_str(), response.status);
  return HalResult::OK;
}

} // namespace bugg::net
