#include "filestream/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "filestream/base-fd.hpp"
#include "filestream/log.hpp"
#include "filestream/socket.hpp"

namespace filestream {

namespace {
int ComputeConnectionFd(int socketFd) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("Connection accept would block: {}", std::strerror(savedErr));
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(savedErr));
    }
    fd = BaseFd::kClosedFd;
  } else {
    log::debug("Connection fd # {} opened", fd);
  }
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(ComputeConnectionFd(socket.fd())) {}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

}  // namespace filestream
