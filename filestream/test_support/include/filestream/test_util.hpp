#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "filestream/http-status-code.hpp"
#include "filestream/socket.hpp"

namespace filestream::test {
using namespace std::chrono_literals;

// Blocking client socket connected to the loopback interface, with a receive timeout.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Throws std::system_error if the connection cannot be established within 'timeout'.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms,
                            std::chrono::milliseconds recvTimeout = 2000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  std::string reason;
  std::map<std::string, std::string> headers;  // case-sensitive keys (sufficient for tests)
  std::string body;

  [[nodiscard]] bool hasHeader(const std::string& name) const { return headers.contains(name); }

  [[nodiscard]] std::string header(const std::string& name) const {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
  }
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
};

std::string buildRequest(const RequestOptions& opt);

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Sends without blocking until all of 'data' is sent or the peer accepts nothing more during 'stallTimeout'.
// Returns the number of bytes sent.
std::size_t sendUntilStalled(int fd, std::string_view data, std::chrono::milliseconds stallTimeout);

// Reads until the peer closes the connection or the receive timeout expires.
std::string recvUntilClosed(int fd);

// Reads exactly one response, whose body length is given by its Content-Length header
// (or empty if 'headRequest' is true). Returns what was received if the peer closes earlier.
std::string recvResponse(int fd, bool headRequest = false);

// Very small HTTP/1.1 response parser (not resilient to all malformed cases, just for test consumption)
std::optional<ParsedResponse> parseResponse(std::string_view raw);

ParsedResponse parseResponseOrThrow(std::string_view raw);

// Sends one request on a fresh connection and returns the raw bytes received until the server closes it.
// Throws std::runtime_error on failure.
std::string requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// Returns true if the peer closes the connection within 'timeout'. Pending data is discarded.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

}  // namespace filestream::test
