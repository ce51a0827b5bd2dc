#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "filestream/base-fd.hpp"
#include "filestream/event.hpp"
#include "filestream/timedef.hpp"

namespace filestream {

// Thin RAII wrapper over epoll, in level-triggered mode.
// The event buffer starts with kInitialCapacity slots and doubles each time a poll saturates it.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll cannot be created.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Errors are logged.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns an empty span on timeout or EINTR. Throws std::system_error on unrecoverable failure.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  int _pollTimeoutMs{0};
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace filestream
