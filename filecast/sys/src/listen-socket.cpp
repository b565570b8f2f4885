#include "filecast/listen-socket.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstdint>

#include "filecast/base-fd.hpp"
#include "filecast/errno-throw.hpp"
#include "filecast/log.hpp"
#include "filecast/platform.hpp"

namespace filecast {

namespace {

void EnableOption(NativeHandle fd, int level, int option, const char* optionName) {
  static constexpr int kOn = 1;
  if (::setsockopt(fd, level, option, &kOn, sizeof(kOn)) != 0) {
    throw_errno("setsockopt({}) failed for listening fd # {}", optionName, fd);
  }
}

uint16_t BoundPort(NativeHandle fd) {
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
    throw_errno("getsockname failed for listening fd # {}", fd);
  }
  return ntohs(bound.sin_port);
}

}  // namespace

ListenSocket::ListenSocket(Options options)
    : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)), _port(options.port) {
  if (!_baseFd) {
    throw_errno("Unable to create a listening socket");
  }
  const NativeHandle fd = _baseFd.fd();
  EnableOption(fd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
  if (options.reusePort) {
    EnableOption(fd, SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
  }
  if (options.tcpNoDelay) {
    EnableOption(fd, IPPROTO_TCP, TCP_NODELAY, "TCP_NODELAY");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(options.port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed for port {}", options.port);
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    throw_errno("listen failed for fd # {}", fd);
  }
  if (_port == 0) {
    _port = BoundPort(fd);
  }
  log::debug("Listening fd # {} bound to port {}", fd, _port);
}

BaseFd ListenSocket::accept() const noexcept {
  BaseFd cnx(::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC));
  if (!cnx) {
    const int err = LastSystemError();
    if (err == error::kWouldBlock) {
      log::trace("No more pending connections on fd # {}", _baseFd.fd());
    } else {
      log::error("accept4 failed on fd # {} err={} ({})", _baseFd.fd(), err, SystemErrorMessage(err));
    }
    return cnx;
  }
  log::debug("Connection fd # {} accepted", cnx.fd());
  return cnx;
}

}  // namespace filecast
