#include "filecast/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>

#include "filecast/log.hpp"
#include "filecast/base-fd.hpp"

namespace filecast::test {

namespace {

using Deadline = std::chrono::steady_clock::time_point;

// Waits for readability until 'deadline'. Returns false on timeout.
bool pollReadable(int fd, Deadline deadline) {
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return false;
    }
    pollfd pfd{fd, POLLIN, 0};
    const int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ret > 0) {
      return true;
    }
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed for fd={}: {}", fd, std::strerror(errno));
      return false;
    }
  }
}

// Appends up to 'maxBytes' received bytes to 'out'. Returns false when the peer closed (or on error).
bool recvInto(int fd, std::string& out, std::size_t maxBytes) {
  static constexpr std::size_t kChunkSize = static_cast<std::size_t>(64) * 1024ULL;
  char buf[kChunkSize];
  const auto recvBytes = ::recv(fd, buf, std::min(maxBytes, kChunkSize), MSG_DONTWAIT);
  if (recvBytes > 0) {
    out.append(buf, static_cast<std::size_t>(recvBytes));
    return true;
  }
  if (recvBytes < 0 && (errno == EAGAIN || errno == EINTR)) {
    return true;
  }
  if (recvBytes < 0) {
    log::debug("recv failed for fd={}: {}", fd, std::strerror(errno));
  }
  return false;
}

bool connectLoop(int fd, uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
      return true;
    }
    log::debug("connect failed for fd={}: {}", fd, std::strerror(errno));
  }
  return false;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout, int recvBufferSize)
    : _socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_socket) {
    log::error("socket creation failed: {}", std::strerror(errno));
    return;
  }
  if (recvBufferSize > 0 &&
      ::setsockopt(_socket.fd(), SOL_SOCKET, SO_RCVBUF, &recvBufferSize, sizeof(recvBufferSize)) != 0) {
    log::error("setsockopt(SO_RCVBUF) failed for fd={}: {}", _socket.fd(), std::strerror(errno));
  }
  _connected = connectLoop(_socket.fd(), port, timeout);
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  while (pollReadable(fd, deadline) && recvInto(fd, out, SIZE_MAX)) {
  }
  return out;
}

std::string recvExactly(int fd, std::size_t nbBytes, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  while (out.size() < nbBytes && pollReadable(fd, deadline) && recvInto(fd, out, nbBytes - out.size())) {
  }
  return out;
}

bool waitPeerClosed(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string discarded;
  while (pollReadable(fd, deadline)) {
    if (!recvInto(fd, discarded, SIZE_MAX)) {
      return true;
    }
    discarded.clear();
  }
  return false;
}

}  // namespace filecast::test
