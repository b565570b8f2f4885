#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "filecast/base-fd.hpp"
#include "filecast/event.hpp"
#include "filecast/platform.hpp"
#include "filecast/timedef.hpp"

struct epoll_event;

namespace filecast {

// Level-triggered epoll instance with a bounded wait.
//
// Registration calls return false on failure after logging it, so that the caller decides whether
// the failure concerns a single connection or the whole server.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct Event {
    NativeHandle fd;
    EventBmp events;
  };

  // Throws std::system_error if the epoll instance cannot be created.
  // 'initialCapacity' is the number of events a single poll() may return. It doubles each time a poll
  // fills it completely.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  ~EventLoop();

  [[nodiscard]] bool add(NativeHandle fd, EventBmp events) const noexcept;

  // Replace the interest of a registered fd. Also re-enables an fd disabled by a delivered EventOneShot.
  [[nodiscard]] bool modify(NativeHandle fd, EventBmp events) const noexcept;

  // Closing a descriptor removes it as well, this is only needed to keep it open without notifications.
  void remove(NativeHandle fd) const noexcept;

  // Wait at most the poll timeout for ready descriptors.
  // The returned span is valid until the next call. It is empty on timeout and when a signal interrupted
  // the wait. Throws std::system_error on any other epoll_wait failure.
  [[nodiscard]] std::span<const Event> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _capacity; }

 private:
  BaseFd _epollFd;
  int _pollTimeoutMs;
  uint32_t _capacity;
  std::unique_ptr<epoll_event[]> _rawEvents;
  std::vector<Event> _readyEvents;
};

}  // namespace filecast
