#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "filestream/http-header.hpp"

namespace filestream {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{};
  // If true, enables SO_REUSEPORT so that several processes can share the same port.
  bool reusePort{false};
  // If true, disables Nagle's algorithm on the listener and accepted connections.
  bool tcpNoDelay{false};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // Whether HTTP/1.1 persistent connections are enabled. When false, the server closes after each response.
  bool enableKeepAlive{true};
  // Maximum number of requests served over a single persistent connection before forcing close.
  uint32_t maxRequestsPerConnection{100};
  // A connection without any read or write progress during this duration is closed.
  // This covers idle keep-alive connections as well as clients that stopped reading a streamed body.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + headers + CRLFCRLF). Exceeding it gives 431.
  std::size_t maxHeaderBytes{8192};
  // Maximum size of a request body. Bodies are read and discarded. Exceeding it gives 413.
  std::size_t maxBodyBytes{1 << 16};

  // Maximum duration of a single epoll wait. Bounds the latency of stop() and of idle connection sweeps.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};

  // Headers added to every response, unless the handler already set them.
  std::vector<http::Header> globalHeaders{http::Header{"Server", "filestream"}};

  HttpServerConfig& withPort(uint16_t port) {
    this->port = port;
    return *this;
  }

  HttpServerConfig& withReusePort(bool on = true) {
    this->reusePort = on;
    return *this;
  }

  HttpServerConfig& withTcpNoDelay(bool on = true) {
    this->tcpNoDelay = on;
    return *this;
  }

  HttpServerConfig& withKeepAliveMode(bool on = true) {
    this->enableKeepAlive = on;
    return *this;
  }

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests) {
    this->maxRequestsPerConnection = maxRequests;
    return *this;
  }

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout) {
    this->keepAliveTimeout = timeout;
    return *this;
  }

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes) {
    this->maxHeaderBytes = maxHeaderBytes;
    return *this;
  }

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes) {
    this->maxBodyBytes = maxBodyBytes;
    return *this;
  }

  HttpServerConfig& withPollInterval(std::chrono::milliseconds pollInterval) {
    this->pollInterval = pollInterval;
    return *this;
  }

  // Adds (or replaces) a global header.
  HttpServerConfig& withGlobalHeader(std::string_view name, std::string_view value);

  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;
};

}  // namespace filestream
