#include "filestream/socket-ops.hpp"

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstddef>
#include <cstdint>

namespace filestream {

bool SetNonBlocking(int fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t SafeRecv(int fd, void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::recv(fd, data, len, 0));
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace filestream
