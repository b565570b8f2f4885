#pragma once

#include "filecast/platform.hpp"

namespace filecast {

// Socket operations applied to accepted connections.
// These thin wrappers centralise system calls so that higher-level modules never include
// platform networking headers directly.

// Returns true if the file descriptor is in non-blocking mode.
bool IsNonBlocking(NativeHandle fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Set the kernel send buffer size (SO_SNDBUF) of a socket.
// Returns true on success.
bool SetSendBufferSize(NativeHandle fd, int nbBytes) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
// On failure to query, returns the errno from getsockopt itself.
int GetSocketError(NativeHandle fd) noexcept;

// Half-close the sending side of a socket (FIN is sent after already queued data).
// Returns true on success.
bool ShutdownWrite(NativeHandle fd) noexcept;

// Read and drop everything currently readable on a non-blocking socket.
// Returns true if the socket is still open for reading (the next read would block), false once the peer
// closed its side or the socket is in error.
bool DiscardPendingInput(NativeHandle fd) noexcept;

}  // namespace filecast
