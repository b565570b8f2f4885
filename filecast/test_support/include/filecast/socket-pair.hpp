#pragma once

#include <sys/socket.h>

#include <cerrno>
#include <system_error>

#include "filecast/base-fd.hpp"

namespace filecast::test {

// Connected pair of non-blocking, close-on-exec local stream sockets.
struct SocketPair {
  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) != 0) {
      throw std::system_error(errno, std::generic_category(), "socketpair failed");
    }
    first = BaseFd(fds[0]);
    second = BaseFd(fds[1]);
  }

  BaseFd first;
  BaseFd second;
};

}  // namespace filecast::test
