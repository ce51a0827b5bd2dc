#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "filestream/connection-state.hpp"
#include "filestream/event-loop.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-server-config.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/router.hpp"
#include "filestream/socket.hpp"

namespace filestream {

// Single threaded HTTP/1.1 server driven by a level-triggered epoll loop.
//
// Responses with a streamed body (HttpResponse::bodyStream) are sent with backpressure: the next chunk is
// pulled from the generator only once all previously queued bytes have been accepted by the socket, and at
// most one chunk is pulled per loop iteration for a given connection.
// If the generator ends before the declared Content-Length is reached, the server sends what it has and
// closes the connection. If the client goes away, the generator is destroyed without being resumed again.
//
// The listening socket is bound in the constructor, so port() is valid right after construction.
// run() / runUntil() block the calling thread. stop() can be called from any thread.
class HttpServer {
 public:
  // Validates the configuration, binds and listens. Throws std::invalid_argument on invalid configuration
  // and std::system_error if the socket cannot be set up.
  explicit HttpServer(HttpServerConfig config, Router router = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  // Router used to dispatch requests. It should not be modified while the server is running.
  [[nodiscard]] Router& router() noexcept { return _router; }

  // Runs the event loop until stop() is called or a termination signal is received (see SignalHandler).
  void run();

  // Runs the event loop until stop() is called or predicate returns true. The predicate is checked once per
  // loop iteration, so at least every pollInterval.
  void runUntil(const std::function<bool()>& predicate);

  // Requests the event loop to stop. Thread safe.
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

 private:
  using ConnectionMap = std::unordered_map<int, ConnectionState>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void eventLoop();

  void acceptNewConnections();

  void handleReadableClient(int fd);

  void handleWritableClient(int fd);

  // Parses and answers all complete requests of the input buffer, stopping at the first streamed response.
  // Returns false if the connection has been closed.
  bool processRequests(ConnectionMapIt cnxIt);

  void queueResponse(ConnectionState& state, HttpResponse& response, std::string_view version, bool keepAlive,
                     bool isHead);

  void queueSimpleError(ConnectionState& state, http::StatusCode statusCode);

  // Sends as much queued data as possible, pulling the next body chunk if the queue is empty.
  // Returns false if the connection has been closed.
  bool flushConnection(ConnectionMapIt cnxIt);

  // Returns false on a fatal send error.
  static bool sendPending(ConnectionState& state);

  void pullNextChunk(ConnectionState& state);

  [[nodiscard]] bool updateWritableInterest(ConnectionState& state, bool enable);

  // Stops or resumes polling the input of the connection, keeping the writable interest as is.
  [[nodiscard]] bool updateReadInterest(ConnectionState& state, bool paused);

  void sweepIdleConnections();

  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt);

  void closeAllConnections();

  std::string_view currentDate();

  HttpServerConfig _config;
  Router _router;
  Socket _listenSocket;
  EventLoop _eventLoop;
  ConnectionMap _connections;
  HttpRequest _request;
  std::vector<char> _readBuffer;
  std::string _cachedDate;
  std::chrono::sys_seconds _cachedDateTp{};
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace filestream
