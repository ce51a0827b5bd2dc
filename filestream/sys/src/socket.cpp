#include "filestream/socket.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "filestream/errno-throw.hpp"
#include "filestream/log.hpp"

namespace filestream {

namespace {

int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
  }
  return SOCK_STREAM;
}

void SetIntOption(int fd, int level, int option, const char* optionName) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, level, option, &kEnable, sizeof(kEnable)) != 0) {
    ThrowSystemError("setsockopt({}) failed for fd # {}", optionName, fd);
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ToSocketType(type), protocol)) {
  if (!_baseFd) {
    ThrowSystemError("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port) {
  const int fd = _baseFd.fd();
  SetIntOption(fd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
  if (reusePort) {
    SetIntOption(fd, SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
  }
  if (tcpNoDelay) {
    SetIntOption(fd, IPPROTO_TCP, TCP_NODELAY, "TCP_NODELAY");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    ThrowSystemError("bind failed for port {}", port);
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    ThrowSystemError("listen failed for port {}", port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) != 0) {
      ThrowSystemError("getsockname failed for fd # {}", fd);
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd, port);
}

}  // namespace filestream
