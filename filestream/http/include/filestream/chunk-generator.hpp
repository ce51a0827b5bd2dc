#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace filestream {

// Lazy, single-pass sequence of byte chunks produced by a coroutine (co_yield std::string).
// Nothing runs before the first call to next(), and each call resumes the coroutine until it yields
// its next chunk or completes. Destroying the generator destroys the coroutine frame, releasing
// whatever the coroutine holds (upstream readers, file descriptors) without running it further.
//
// Example:
//   ChunkGenerator Produce() { co_yield std::string("abc"); }
class ChunkGenerator {
 public:
  struct promise_type {
    ChunkGenerator get_return_object() noexcept {
      return ChunkGenerator{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    std::suspend_always yield_value(std::string chunk) noexcept {
      _current = std::move(chunk);
      return {};
    }

    void return_void() const noexcept {}

    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    std::exception_ptr _exception;
    std::string _current;
  };

  ChunkGenerator() noexcept = default;
  explicit ChunkGenerator(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  ChunkGenerator(ChunkGenerator&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  ChunkGenerator& operator=(ChunkGenerator&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  ChunkGenerator(const ChunkGenerator&) = delete;
  ChunkGenerator& operator=(const ChunkGenerator&) = delete;

  ~ChunkGenerator() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  // Resumes the coroutine up to its next chunk.
  // Returns std::nullopt once the sequence is exhausted.
  // An exception escaping the coroutine body is rethrown here (the sequence is then exhausted).
  std::optional<std::string> next() {
    if (done()) {
      return std::nullopt;
    }
    _coro.resume();
    auto& promise = _coro.promise();
    if (promise._exception) {
      std::rethrow_exception(std::exchange(promise._exception, {}));
    }
    if (_coro.done()) {
      return std::nullopt;
    }
    return std::move(promise._current);
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace filestream
