/*****************************************************************
 * File:      CurlHttpClient.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    libcurl implementation of IHttpClient. One easy handle is
 *    kept between requests so the connection stays alive until
 *    reset() is called.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_CURL_HTTP_CLIENT_HPP_
#define BUGG_INCLUDE_NETWORK_CURL_HTTP_CLIENT_HPP_

#include "HAL/IHalLog.hpp"
#include "Network/IHttpClient.hpp"

#include <curl/curl.h>

namespace bugg::net{

class CurlHttpClient : public IHttpClient{
public:
  static constexpr const char* TAG = "CURL";

  explicit CurlHttpClient(hal::IHalLog* log = nullptr, long timeout_s = 120);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  hal::HalResult postFile(const std::string& url, const std::string& file_field,
                          const std::string& file_path,
                          const std::vector<HttpFormField>& fields,
                          HttpResponse& response) override;

  void reset() override;

private:
  static size_t onBody(char* data, size_t size, size_t count, void* user);

  CURL* handle_ = nullptr;
  hal::IHalLog* log_ = nullptr;
  long timeout_s_;
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_CURL_HTTP_CLIENT_HPP_
