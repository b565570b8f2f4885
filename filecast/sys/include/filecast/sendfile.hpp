#pragma once

#include <sys/types.h>  // off_t, ssize_t

#include <cstddef>
#include <cstdint>

#include "filecast/platform.hpp"

namespace filecast {

// Wraps sendfile(2).
// Transfers up to `count` bytes from file descriptor `inFd` (at `offset`)
// to socket `outFd`.  On success, `offset` is advanced by the number of
// bytes actually sent.
//
// Returns the number of bytes transferred (>= 0) or -1 on error (errno set).
int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept;

}  // namespace filecast
