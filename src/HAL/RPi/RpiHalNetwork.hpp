/*****************************************************************
 * File:      RpiHalNetwork.hpp
 * Category:  src/HAL/RPi
 * Author:    Bugg Project
 *
 * Purpose:
 *    Reachability probe: a TCP connect to a well-known host with
 *    a short timeout.
 *****************************************************************/

#ifndef BUGG_SRC_HAL_RPI_HAL_NETWORK_HPP_
#define BUGG_SRC_HAL_RPI_HAL_NETWORK_HPP_

#include "HAL/IHalLog.hpp"
#include "HAL/IHalNetwork.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace bugg::hal::rpi{

class RpiHalNetwork : public IHalNetwork{
private:
  static constexpr const char* TAG = "NETWORK";

  std::string host_;
  uint16_t port_;
  int timeout_ms_;
  IHalLog* log_ = nullptr;

public:
  RpiHalNetwork(IHalLog* log = nullptr, std::string host = "8.8.8.8", uint16_t port = 53,
                int timeout_ms = 5000)
    : host_(std::move(host)), port_(port), timeout_ms_(timeout_ms), log_(log){}

  bool probeInternet() override{
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if(inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) return false;

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if(fd < 0) return false;

    bool up = false;
    int rc = ::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if(rc == 0){
      up = true;
    }else if(errno == EINPROGRESS){
      struct pollfd pfd{fd, POLLOUT, 0};
      if(poll(&pfd, 1, timeout_ms_) == 1){
        int err = 0;
        socklen_t len = sizeof(err);
        up = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
      }
    }
    ::close(fd);
    if(log_) log_->debug(TAG, "Probe %s:%u %s", host_.c_str(), port_, up ? "ok" : "failed");
    return up;
  }
};

} // namespace bugg::hal::rpi

#endif // BUGG_SRC_HAL_RPI_HAL_NETWORK_HPP_
