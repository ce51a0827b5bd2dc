#pragma once

#include "filestream/base-fd.hpp"
#include "filestream/socket.hpp"

namespace filestream {

// Accepted client connection (non-blocking, close-on-exec).
class Connection {
 public:
  Connection() noexcept = default;

  // Accept a pending connection from given listening socket.
  // If no connection is pending (or accept failed, logged), the Connection is closed (operator bool() is false).
  explicit Connection(const Socket& socket);

  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace filestream
