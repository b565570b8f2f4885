#include "filecast/socket-ops.hpp"

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstddef>

#include "filecast/platform.hpp"

namespace filecast {

bool IsNonBlocking(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  return flags != -1 && (flags & O_NONBLOCK) != 0;
}

bool SetTcpNoDelay(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

bool SetSendBufferSize(NativeHandle fd, int nbBytes) noexcept {
  return ::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &nbBytes, sizeof(nbBytes)) == 0;
}

int GetSocketError(NativeHandle fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  // NOLINTNEXTLINE(misc-include-cleaner) sys/socket.h is the correct header for SOL_SOCKET and SO_ERROR
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return LastSystemError();
  }
  return err;
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

bool DiscardPendingInput(NativeHandle fd) noexcept {
  static constexpr std::size_t kDiscardBufferSize = 4096;
  char buf[kDiscardBufferSize];
  while (true) {
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead > 0) {
      continue;
    }
    if (nbRead == 0) {
      return false;
    }
    const int err = LastSystemError();
    if (err == error::kInterrupted) {
      continue;
    }
    return err == error::kWouldBlock;
  }
}

}  // namespace filecast
