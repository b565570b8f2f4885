#pragma once

#include <utility>

#include "filecast/platform.hpp"

namespace filecast {

// Exclusive owner of a file descriptor.
// The descriptor is closed on destruction, on reassignment and on close(), whichever comes first.
class BaseFd {
 public:
  BaseFd() noexcept = default;

  explicit BaseFd(NativeHandle fd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(std::exchange(other._fd, kInvalidHandle)) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept {
    reset(std::exchange(other._fd, kInvalidHandle));
    return *this;
  }

  ~BaseFd() { reset(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kInvalidHandle; }

  // Close the owned descriptor (if any) and take ownership of 'fd' instead.
  void reset(NativeHandle fd = kInvalidHandle) noexcept;

  // Idempotent.
  void close() noexcept { reset(); }

 private:
  NativeHandle _fd{kInvalidHandle};
};

}  // namespace filecast
