#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>
#include <utility>

#include "filestream/http-server-config.hpp"
#include "filestream/http-server.hpp"
#include "filestream/router.hpp"
#include "filestream/test_util.hpp"

namespace filestream::test {

// Lightweight RAII test server harness to reduce boilerplate in end to end tests.
//  * Constructs the HttpServer on an ephemeral port (binds & listens immediately)
//  * Runs its event loop in a background jthread using runUntil(stopFlag)
//  * Stops & joins automatically on destruction
//
// Routes are registered by the initializer before the loop starts, as the router is not meant to be
// modified while the server is running.
class TestServer {
 public:
  explicit TestServer(HttpServerConfig cfg, const std::function<void(Router&)>& routerInitializer = {},
                      std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : _server(std::move(cfg.withPollInterval(pollPeriod)), MakeRouter(routerInitializer)),
        _loopThread([this] { _server.runUntil([this] { return _stopFlag.load(); }); }) {
    // The listening socket is active right after server construction, a successful connect
    // only confirms that the OS accepts connections on it.
    ClientConnection cnx(port(), std::chrono::milliseconds{500});
  }

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const noexcept { return _server.port(); }

  [[nodiscard]] const HttpServer& server() const noexcept { return _server; }

  // Cooperative stop, safe to call multiple times.
  void stop() {
    if (!_stopFlag.exchange(true)) {
      _server.stop();
    }
    if (_loopThread.joinable()) {
      _loopThread.join();
    }
  }

 private:
  static Router MakeRouter(const std::function<void(Router&)>& initializer) {
    Router router;
    if (initializer) {
      initializer(router);
    }
    return router;
  }

  std::atomic_bool _stopFlag{false};
  HttpServer _server;
  std::jthread _loopThread;
};

}  // namespace filestream::test
