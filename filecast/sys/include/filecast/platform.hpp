#pragma once

// Platform detection, portable type aliases and error constants for filecast's system layer.
//
// filecast relies on Linux sendfile(2) and epoll(7), so Linux is the only supported platform.
//
// Portable types / functions:
//   NativeHandle       – the OS handle type for sockets / file descriptors
//   kInvalidHandle     – sentinel value representing an invalid handle
//   LastSystemError()  – retrieve the last system/socket error code
//   SystemErrorMessage – human-readable description for an error code
//
// Error constants (namespace filecast::error):
//   kWouldBlock, kInterrupted

#ifdef __linux__
#define FILECAST_LINUX
#define FILECAST_POSIX
#else
#error "Unsupported platform – filecast requires Linux (sendfile(2) and epoll(7))"
#endif

#include <cerrno>   // errno, EAGAIN, EINTR, …
#include <cstring>  // std::strerror

namespace filecast {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

inline int LastSystemError() noexcept { return errno; }

// The returned pointer is valid at least until the next call from the same thread.
// Always log the numeric code alongside the message.
inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

namespace error {
inline constexpr int kWouldBlock = EAGAIN;
inline constexpr int kInterrupted = EINTR;
}  // namespace error

}  // namespace filecast
