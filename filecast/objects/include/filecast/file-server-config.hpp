#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace filecast {

struct FileServerConfig {
  // Default number of bytes requested from the kernel per sendfile(2) attempt.
  static constexpr std::size_t kDefaultChunkSize = std::size_t{1} << 16;

  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via FileServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT allowing multiple independent FileServer instances
  // to bind the same (non-ephemeral) port for load distribution by the kernel. Disabled by default.
  bool reusePort{false};

  // If true, TCP_NODELAY is set on the listening socket and on each accepted connection. Default: false.
  bool tcpNoDelay{false};

  // Kernel send buffer size (SO_SNDBUF) applied to each accepted connection.
  // 0 (default) keeps the kernel default. Small values make backpressure kick in earlier.
  int sendBufferSize{0};

  // Maximum number of simultaneously served connections. Connections accepted beyond this limit are
  // closed immediately without any data. 0 (default) means unlimited.
  uint32_t maxConnections{0};

  // ============================
  // Transfer parameters
  // ============================
  // Path of the file served to every accepted connection. It is opened once per connection,
  // so its content may change between connections. Required.
  std::string filePath;

  // Upper bound of bytes requested per transfer attempt. Must be > 0. Default: 64 KiB.
  std::size_t chunkSize{kDefaultChunkSize};

  // Maximum time a transfer may stay suspended on a full send buffer without any progress before it is
  // aborted. 0 (default) means wait indefinitely for the peer to drain its receive buffer.
  std::chrono::milliseconds stalledTransferTimeout{0};

  // Once a file is fully sent, the connection is shut down for writing and kept open, discarding any
  // input, until the peer closes it or this timeout expires. Closing earlier would make the kernel
  // reset the connection if the peer sent anything, losing data not yet delivered.
  // 0 closes right after discarding the input already received. Default: 5 s.
  std::chrono::milliseconds lingerTimeout{std::chrono::seconds{5}};

  // ============================
  // Event loop parameters
  // ============================
  // Maximum duration of a single poll() wait. It bounds the reaction time of stop requests and
  // stalled transfer detection. Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Validate config. Throws std::invalid_argument if invalid.
  void validate() const;

  FileServerConfig& withPort(uint16_t port);

  FileServerConfig& withReusePort(bool on = true);

  FileServerConfig& withTcpNoDelay(bool on = true);

  FileServerConfig& withSendBufferSize(int nbBytes);

  FileServerConfig& withMaxConnections(uint32_t maxConnections);

  FileServerConfig& withFilePath(std::string_view filePath);

  FileServerConfig& withChunkSize(std::size_t chunkSize);

  FileServerConfig& withStalledTransferTimeout(std::chrono::milliseconds timeout);

  FileServerConfig& withLingerTimeout(std::chrono::milliseconds timeout);

  FileServerConfig& withPollInterval(std::chrono::milliseconds interval);

  bool operator==(const FileServerConfig&) const noexcept = default;
};

}  // namespace filecast
