#include "filestream/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>

#include "filestream/base-fd.hpp"
#include "filestream/errno-throw.hpp"
#include "filestream/event.hpp"
#include "filestream/log.hpp"
#include "filestream/timedef.hpp"

namespace filestream {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

int ToPollTimeoutMs(SysDuration pollTimeout) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count());
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _pollTimeoutMs(ToPollTimeoutMs(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _epollEvents(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    ThrowSystemError("epoll_create1 failed");
  }
  if (initialCapacity == 0) {
    log::warn("EventLoop constructed with initialCapacity=0; promoting to 1");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    ThrowSystemError("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp,
                err, std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  _readyEvents.clear();
  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return _readyEvents;
    }
    ThrowSystemError("epoll_wait failed (timeout_ms={})", _pollTimeoutMs);
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _readyEvents.push_back(EventFd{_epollEvents[static_cast<std::size_t>(idx)].data.fd,
                                   static_cast<EventBmp>(_epollEvents[static_cast<std::size_t>(idx)].events)});
  }

  if (static_cast<std::size_t>(nbReadyFds) == _epollEvents.size()) {
    _epollEvents.resize(_epollEvents.size() * 2U);
  }
  return _readyEvents;
}

void EventLoop::updatePollTimeout(SysDuration pollTimeout) { _pollTimeoutMs = ToPollTimeoutMs(pollTimeout); }

}  // namespace filestream
