#pragma once

#include <cstdint>

#include "filecast/base-fd.hpp"
#include "filecast/platform.hpp"

namespace filecast {

// Non-blocking IPv4 TCP socket listening on all interfaces.
class ListenSocket {
 public:
  struct Options {
    uint16_t port{0};
    bool reusePort{false};
    bool tcpNoDelay{false};
  };

  // Binds and listens immediately. Port 0 picks an ephemeral port, available through port().
  // Throws std::system_error on failure.
  explicit ListenSocket(Options options);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Accept one pending connection, non-blocking and close-on-exec.
  // The returned handle is empty when no connection is pending or on accept failure (logged).
  [[nodiscard]] BaseFd accept() const noexcept;

 private:
  BaseFd _baseFd;
  uint16_t _port;
};

}  // namespace filecast
