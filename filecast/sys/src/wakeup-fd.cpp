#include "filecast/wakeup-fd.hpp"

#include <sys/eventfd.h>

#include "filecast/errno-throw.hpp"
#include "filecast/log.hpp"
#include "filecast/platform.hpp"

namespace filecast {

WakeupFd::WakeupFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
}

void WakeupFd::notify() const noexcept {
  // EAGAIN means the counter is saturated: a wakeup is pending anyway.
  if (::eventfd_write(_baseFd.fd(), 1) != 0 && LastSystemError() != error::kWouldBlock) {
    const int err = LastSystemError();
    log::error("eventfd_write on fd # {} failed err={} ({})", _baseFd.fd(), err, SystemErrorMessage(err));
  }
}

void WakeupFd::drain() const noexcept {
  eventfd_t nbWakeups = 0;
  if (::eventfd_read(_baseFd.fd(), &nbWakeups) != 0) {
    const int err = LastSystemError();
    if (err != error::kWouldBlock) {
      log::error("eventfd_read on fd # {} failed err={} ({})", _baseFd.fd(), err, SystemErrorMessage(err));
    }
    return;
  }
  log::trace("Woken up {} time(s)", nbWakeups);
}

}  // namespace filecast
