#include "filecast/file-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace filecast {

FileServerConfig& FileServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

FileServerConfig& FileServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

FileServerConfig& FileServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

FileServerConfig& FileServerConfig::withSendBufferSize(int nbBytes) {
  this->sendBufferSize = nbBytes;
  return *this;
}

FileServerConfig& FileServerConfig::withMaxConnections(uint32_t maxConnections) {
  this->maxConnections = maxConnections;
  return *this;
}

FileServerConfig& FileServerConfig::withFilePath(std::string_view filePath) {
  this->filePath = filePath;
  return *this;
}

FileServerConfig& FileServerConfig::withChunkSize(std::size_t chunkSize) {
  this->chunkSize = chunkSize;
  return *this;
}

FileServerConfig& FileServerConfig::withStalledTransferTimeout(std::chrono::milliseconds timeout) {
  this->stalledTransferTimeout = timeout;
  return *this;
}

FileServerConfig& FileServerConfig::withLingerTimeout(std::chrono::milliseconds timeout) {
  this->lingerTimeout = timeout;
  return *this;
}

FileServerConfig& FileServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

void FileServerConfig::validate() const {
  if (filePath.empty()) {
    throw std::invalid_argument("file path to serve must not be empty");
  }
  if (chunkSize == 0) {
    throw std::invalid_argument("chunk size must be strictly positive");
  }
  if (sendBufferSize < 0) {
    throw std::invalid_argument("send buffer size must be 0 (kernel default) or positive");
  }
  if (stalledTransferTimeout.count() < 0) {
    throw std::invalid_argument("stalled transfer timeout must not be negative");
  }
  if (lingerTimeout.count() < 0) {
    throw std::invalid_argument("linger timeout must not be negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("poll interval must be strictly positive");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
}

}  // namespace filecast
