#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace filestream {

// Thin wrappers centralising socket system calls, so that higher-level modules
// never include networking headers directly.

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(int fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Send data on a connected socket with MSG_NOSIGNAL, so that a closed peer is reported
// as EPIPE instead of raising SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Receive data from a connected socket.
// Returns the number of bytes read, 0 on orderly shutdown, or -1 on error (errno is set).
int64_t SafeRecv(int fd, void* data, std::size_t len) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

}  // namespace filestream
