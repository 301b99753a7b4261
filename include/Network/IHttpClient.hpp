/*****************************************************************
 * File:      IHttpClient.hpp
 * Category:  include/Network
 * Author:    Bugg Project
 *
 * Purpose:
 *    Minimal HTTP client seam used by the HTTP upload transports.
 *****************************************************************/

#ifndef BUGG_INCLUDE_NETWORK_IHTTP_CLIENT_HPP_
#define BUGG_INCLUDE_NETWORK_IHTTP_CLIENT_HPP_

#include "HAL/HalTypes.hpp"
#include <string>
#include <vector>

namespace bugg::net{

/** Plain multipart form field */
struct HttpFormField{
  std::string name;
  std::string value;
};

/** Result of one request */
struct HttpResponse{
  bool transport_ok = false;  ///< false when no HTTP status was received
  long status = 0;            ///< HTTP status code
  std::string error;          ///< Transport error text
  std::string body;
};

class IHttpClient{
public:
  virtual ~IHttpClient() = default;

  /** POST a file as multipart/form-data
   * @param url Endpoint
   * @param file_field Form field name for the file part
   * @param file_path File to send
   * @param fields Additional form fields
   * @param response Filled with status or transport error
   * @return HalResult::OK if a response (any status) was received
   */
  virtual hal::HalResult postFile(const std::string& url, const std::string& file_field,
                                  const std::string& file_path,
                                  const std::vector<HttpFormField>& fields,
                                  HttpResponse& response) = 0;

  /** Drop any connection kept alive between requests */
  virtual void reset() = 0;
};

} // namespace bugg::net

#endif // BUGG_INCLUDE_NETWORK_IHTTP_CLIENT_HPP_
