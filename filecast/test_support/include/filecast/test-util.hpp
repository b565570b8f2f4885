#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "filecast/base-fd.hpp"

namespace filecast::test {

// Blocking IPv4 loopback client, retrying connect until 'timeout' elapses.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // 'recvBufferSize' > 0 sets SO_RCVBUF before connecting, so that the server hits backpressure quickly.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds{1000},
                            int recvBufferSize = 0);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  [[nodiscard]] bool connected() const noexcept { return _connected; }

 private:
  BaseFd _socket;
  bool _connected{false};
};

// Reads until the peer closes the connection or 'totalTimeout' elapses.
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = std::chrono::milliseconds{5000});

// Reads until 'nbBytes' are received, the peer closes or 'totalTimeout' elapses.
std::string recvExactly(int fd, std::size_t nbBytes,
                        std::chrono::milliseconds totalTimeout = std::chrono::milliseconds{5000});

// True if the peer closed the connection within 'timeout' (pending data is discarded).
bool waitPeerClosed(int fd, std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

}  // namespace filecast::test
