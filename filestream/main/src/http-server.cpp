#include "filestream/http-server.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "filestream/connection-state.hpp"
#include "filestream/connection.hpp"
#include "filestream/event-loop.hpp"
#include "filestream/event.hpp"
#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-server-config.hpp"
#include "filestream/http-status-code.hpp"
#include "filestream/log.hpp"
#include "filestream/router.hpp"
#include "filestream/signal-handler.hpp"
#include "filestream/socket-ops.hpp"
#include "filestream/socket.hpp"
#include "filestream/timedef.hpp"
#include "filestream/timestring.hpp"

namespace filestream {

namespace {

constexpr std::size_t kReadChunkSize = 16UL * 1024UL;

constexpr EventBmp kClientEvents = EventIn | EventRdHup;

EventBmp ClientEvents(bool writable, bool readPaused) {
  EventBmp events = readPaused ? EventBmp{} : kClientEvents;
  if (writable) {
    events |= EventOut;
  }
  return events;
}

HttpServerConfig Validated(HttpServerConfig config) {
  config.validate();
  return config;
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, Router router)
    : _config(Validated(std::move(config))),
      _router(std::move(router)),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(_config.pollInterval),
      _readBuffer(kReadChunkSize) {
  _listenSocket.bindAndListen(_config.reusePort, _config.tcpNoDelay, _config.port);
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
  log::info("Server listening on port {}", _config.port);
}

HttpServer::~HttpServer() {
  stop();
  closeAllConnections();
}

void HttpServer::run() {
  runUntil([] { return SignalHandler::IsStopRequested(); });
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  if (_running.exchange(true)) {
    throw std::logic_error("Server is already running");
  }
  log::info("Server running on port {}", _config.port);
  while (!_stopRequested.load(std::memory_order_relaxed) && !predicate()) {
    eventLoop();
  }
  closeAllConnections();
  _stopRequested.store(false, std::memory_order_relaxed);
  _running.store(false);
  log::info("Server stopped");
}

void HttpServer::stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

void HttpServer::eventLoop() {
  const auto events = _eventLoop.poll();
  for (const auto event : events) {
    if (event.fd == _listenSocket.fd()) {
      acceptNewConnections();
      continue;
    }
    const auto bmp = event.eventBmp;
    if ((bmp & EventOut) != 0) {
      handleWritableClient(event.fd);
    }
    // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
    // Treat them as a read trigger so we promptly observe EOF/errors and close.
    if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
      handleReadableClient(event.fd);
    }
  }
  sweepIdleConnections();
}

void HttpServer::acceptNewConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    if (_config.tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {} errno={} msg={}", cnxFd, errno, std::strerror(errno));
    }
    if (!_eventLoop.add(EventLoop::EventFd{cnxFd, kClientEvents})) {
      // cnx is closed by its destructor
      continue;
    }
    auto [cnxIt, inserted] = _connections.try_emplace(cnxFd);
    ConnectionState& state = cnxIt->second;
    state.connection = std::move(cnx);
    state.lastActivity = SteadyClock::now();
  }
}

void HttpServer::handleReadableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = cnxIt->second;
  if (state.readPaused) {
    // Only EPOLLERR and EPOLLHUP are reported while input is not polled.
    log::info("Connection of fd # {} failed with {} body bytes left to stream", fd, state.streamRemaining);
    closeConnection(cnxIt);
    return;
  }
  while (true) {
    if (state.isStreaming() && state.inBuffer.size() >= _config.maxHeaderBytes) {
      // Pipelined bytes cannot be consumed before the end of the streamed body.
      log::debug("Pausing reads on fd # {} with {} pending input bytes", fd, state.inBuffer.size());
      if (!updateReadInterest(state, true)) {
        closeConnection(cnxIt);
      }
      return;
    }
    const auto nbRead = SafeRecv(fd, _readBuffer.data(), _readBuffer.size());
    if (nbRead > 0) {
      state.lastActivity = SteadyClock::now();
      if (!state.closeAfterFlush) {
        state.inBuffer.append(_readBuffer.data(), static_cast<std::size_t>(nbRead));
      }
      if (static_cast<std::size_t>(nbRead) < _readBuffer.size()) {
        break;
      }
      continue;
    }
    if (nbRead == 0) {
      // Peer closed its side: nothing can be answered anymore.
      if (state.isStreaming()) {
        log::info("Client of fd # {} went away with {} body bytes left to stream", fd, state.streamRemaining);
      }
      closeConnection(cnxIt);
      return;
    }
    const auto savedErr = errno;
    if (savedErr == EINTR) {
      continue;
    }
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      break;
    }
    log::debug("recv error on fd # {} errno={} msg={}", fd, savedErr, std::strerror(savedErr));
    closeConnection(cnxIt);
    return;
  }
  processRequests(cnxIt);
}

void HttpServer::handleWritableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  if (!flushConnection(cnxIt)) {
    return;
  }
  ConnectionState& state = cnxIt->second;
  if (state.isStreaming() || !state.outputDrained()) {
    return;
  }
  if (state.readPaused && !updateReadInterest(state, false)) {
    closeConnection(cnxIt);
    return;
  }
  if (!state.inBuffer.empty()) {
    // Pipelined requests were put on hold while the previous body was being streamed.
    processRequests(cnxIt);
  }
}

bool HttpServer::processRequests(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  while (!state.closeAfterFlush && !state.isStreaming()) {
    if (state.bodyBytesToDiscard != 0) {
      const auto nbDiscarded = std::min(state.bodyBytesToDiscard, state.inBuffer.size());
      state.inBuffer.erase(0, nbDiscarded);
      state.bodyBytesToDiscard -= nbDiscarded;
      if (state.bodyBytesToDiscard != 0) {
        break;
      }
    }
    if (state.inBuffer.empty()) {
      break;
    }

    const auto status = _request.initTrySetHead(state.inBuffer, _config.maxHeaderBytes);
    if (status == HttpRequest::kStatusNeedMoreData) {
      break;
    }
    if (status != http::StatusCodeOK) {
      log::debug("Invalid request on fd # {}: status {}", cnxIt->first, status);
      queueSimpleError(state, status);
      break;
    }
    if (_request.headerValue(http::TransferEncoding)) {
      queueSimpleError(state, http::StatusCodeNotImplemented);
      break;
    }
    if (_request.contentLength() > _config.maxBodyBytes) {
      queueSimpleError(state, http::StatusCodePayloadTooLarge);
      break;
    }
    state.inBuffer.erase(0, _request.headSize());
    state.bodyBytesToDiscard = _request.contentLength();
    ++state.requestsServed;

    const bool keepAlive = _config.enableKeepAlive && _request.wantsKeepAlive() &&
                           state.requestsServed < _config.maxRequestsPerConnection;
    const bool isHead = _request.method() == http::Method::HEAD;

    HttpResponse response;
    try {
      response = _router.dispatch(_request);
    } catch (const std::exception& ex) {
      log::error("Exception in path handler for {} {}: {}", http::MethodToStr(_request.method()), _request.path(),
                 ex.what());
      response = HttpResponse(http::StatusCodeInternalServerError, http::ReasonInternalServerError);
    }
    log::debug("{} {} -> {}", http::MethodToStr(_request.method()), _request.path(), response.status());

    queueResponse(state, response, _request.versionStr(), keepAlive, isHead);
    if (!keepAlive) {
      state.closeAfterFlush = true;
    }
  }
  return flushConnection(cnxIt);
}

void HttpServer::queueResponse(ConnectionState& state, HttpResponse& response, std::string_view version,
                               bool keepAlive, bool isHead) {
  state.outBuffer.append(response.serializeHead(version, keepAlive, _config.globalHeaders, currentDate()));
  if (!response.hasBodyStream()) {
    if (!isHead) {
      state.outBuffer.append(response.body());
    }
    return;
  }
  const auto declaredLength = response.declaredContentLength().value_or(0);
  if (isHead || declaredLength == 0) {
    // The generator is destroyed with the response without having been resumed.
    return;
  }
  state.bodyStream = response.extractBodyStream();
  state.streamRemaining = declaredLength;
}

void HttpServer::queueSimpleError(ConnectionState& state, http::StatusCode statusCode) {
  HttpResponse response(statusCode, http::ReasonPhraseFor(statusCode));
  queueResponse(state, response, http::HTTP11Sv, false, false);
  state.closeAfterFlush = true;
  state.inBuffer.clear();
}

bool HttpServer::flushConnection(ConnectionMapIt cnxIt) {
  ConnectionState& state = cnxIt->second;
  if (!sendPending(state)) {
    closeConnection(cnxIt);
    return false;
  }
  if (state.outputDrained() && state.isStreaming()) {
    pullNextChunk(state);
    if (!sendPending(state)) {
      closeConnection(cnxIt);
      return false;
    }
  }
  if (!state.outputDrained() || state.isStreaming()) {
    if (!updateWritableInterest(state, true)) {
      closeConnection(cnxIt);
      return false;
    }
    return true;
  }
  if (state.closeAfterFlush) {
    closeConnection(cnxIt);
    return false;
  }
  if (!updateWritableInterest(state, false)) {
    closeConnection(cnxIt);
    return false;
  }
  return true;
}

bool HttpServer::sendPending(ConnectionState& state) {
  const int fd = state.connection.fd();
  while (!state.outputDrained()) {
    const auto nbSent = SafeSend(fd, state.outBuffer.data() + state.outOffset, state.pendingOutputBytes());
    if (nbSent > 0) {
      state.outOffset += static_cast<std::size_t>(nbSent);
      state.lastActivity = SteadyClock::now();
      continue;
    }
    if (nbSent == 0) {
      return true;
    }
    const auto savedErr = errno;
    if (savedErr == EINTR) {
      continue;
    }
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      return true;
    }
    if (state.isStreaming()) {
      log::info("send error on fd # {} errno={} msg={}, cancelling body stream with {} bytes left", fd, savedErr,
                std::strerror(savedErr), state.streamRemaining);
    } else {
      log::debug("send error on fd # {} errno={} msg={}", fd, savedErr, std::strerror(savedErr));
    }
    return false;
  }
  state.outBuffer.clear();
  state.outOffset = 0;
  return true;
}

void HttpServer::pullNextChunk(ConnectionState& state) {
  std::optional<std::string> chunk;
  try {
    chunk = state.bodyStream.next();
  } catch (const std::exception& ex) {
    log::error("Exception in body stream of fd # {}: {}", state.connection.fd(), ex.what());
  }
  if (!chunk) {
    log::info("Body stream of fd # {} ended {} bytes before its declared length, closing after flush",
              state.connection.fd(), state.streamRemaining);
    state.cancelStream();
    state.closeAfterFlush = true;
    return;
  }
  if (chunk->size() > state.streamRemaining) {
    log::warn("Body stream of fd # {} produced {} bytes more than declared, clipping", state.connection.fd(),
              chunk->size() - state.streamRemaining);
    chunk->resize(static_cast<std::size_t>(state.streamRemaining));
  }
  state.streamRemaining -= chunk->size();
  state.outBuffer.append(*chunk);
  if (state.streamRemaining == 0) {
    state.cancelStream();
  }
}

bool HttpServer::updateWritableInterest(ConnectionState& state, bool enable) {
  if (state.writableInterest == enable) {
    return true;
  }
  if (!_eventLoop.mod(EventLoop::EventFd{state.connection.fd(), ClientEvents(enable, state.readPaused)})) {
    return false;
  }
  state.writableInterest = enable;
  return true;
}

bool HttpServer::updateReadInterest(ConnectionState& state, bool paused) {
  if (state.readPaused == paused) {
    return true;
  }
  if (!_eventLoop.mod(EventLoop::EventFd{state.connection.fd(), ClientEvents(state.writableInterest, paused)})) {
    return false;
  }
  state.readPaused = paused;
  return true;
}

void HttpServer::sweepIdleConnections() {
  const auto now = SteadyClock::now();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    if (now > cnxIt->second.lastActivity + _config.keepAliveTimeout) {
      log::debug("Closing inactive connection fd # {}", cnxIt->first);
      cnxIt = closeConnection(cnxIt);
    } else {
      ++cnxIt;
    }
  }
}

HttpServer::ConnectionMapIt HttpServer::closeConnection(ConnectionMapIt cnxIt) {
  const int fd = cnxIt->first;
  _eventLoop.del(fd);
  log::debug("Closing connection fd # {}", fd);
  // Destroying the state releases the socket and any pending body stream.
  return _connections.erase(cnxIt);
}

void HttpServer::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

std::string_view HttpServer::currentDate() {
  const auto nowSec = std::chrono::time_point_cast<std::chrono::seconds>(SysClock::now());
  if (nowSec != _cachedDateTp) {
    _cachedDateTp = nowSec;
    _cachedDate = TimeToStringRFC7231(nowSec);
  }
  return _cachedDate;
}

}  // namespace filestream
