#include "filecast/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>

#include "filecast/errno-throw.hpp"
#include "filecast/event.hpp"
#include "filecast/log.hpp"
#include "filecast/platform.hpp"
#include "filecast/timedef.hpp"

namespace filecast {

static_assert(EventIn == EPOLLIN);
static_assert(EventOut == EPOLLOUT);
static_assert(EventErr == EPOLLERR);
static_assert(EventHup == EPOLLHUP);
static_assert(EventOneShot == EPOLLONESHOT);

namespace {

bool Control(NativeHandle epollFd, int op, const char* opName, NativeHandle fd, EventBmp events) noexcept {
  epoll_event ev{};
  ev.events = events;
  ev.data.fd = fd;
  if (::epoll_ctl(epollFd, op, fd, &ev) == 0) [[likely]] {
    return true;
  }
  const int err = LastSystemError();
  log::error("epoll_ctl {} failed for fd # {} (events=0x{:x}) err={} ({})", opName, fd, events, err,
             SystemErrorMessage(err));
  return false;
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _epollFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pollTimeoutMs(static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count())),
      _capacity(std::max(initialCapacity, 1U)),
      _rawEvents(std::make_unique<epoll_event[]>(_capacity)) {
  if (!_epollFd) {
    throw_errno("epoll_create1 failed");
  }
  _readyEvents.reserve(_capacity);
}

EventLoop::~EventLoop() = default;

bool EventLoop::add(NativeHandle fd, EventBmp events) const noexcept {
  return Control(_epollFd.fd(), EPOLL_CTL_ADD, "ADD", fd, events);
}

bool EventLoop::modify(NativeHandle fd, EventBmp events) const noexcept {
  return Control(_epollFd.fd(), EPOLL_CTL_MOD, "MOD", fd, events);
}

void EventLoop::remove(NativeHandle fd) const noexcept {
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    const int err = LastSystemError();
    log::debug("epoll_ctl DEL failed for fd # {} err={} ({})", fd, err, SystemErrorMessage(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll() {
  _readyEvents.clear();
  const int nbReady = ::epoll_wait(_epollFd.fd(), _rawEvents.get(), static_cast<int>(_capacity), _pollTimeoutMs);
  if (nbReady < 0) {
    if (LastSystemError() == error::kInterrupted) {
      return _readyEvents;
    }
    throw_errno("epoll_wait failed on fd # {}", _epollFd.fd());
  }

  for (int idx = 0; idx < nbReady; ++idx) {
    _readyEvents.push_back(Event{_rawEvents[idx].data.fd, _rawEvents[idx].events});
  }

  if (std::cmp_equal(nbReady, _capacity)) {
    _capacity *= 2U;
    _rawEvents = std::make_unique<epoll_event[]>(_capacity);
    log::debug("Event buffer saturated, growing it to {} events", _capacity);
  }
  return _readyEvents;
}

}  // namespace filecast
