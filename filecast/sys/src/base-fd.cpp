#include "filecast/base-fd.hpp"

#include <unistd.h>

#include <utility>

#include "filecast/log.hpp"
#include "filecast/platform.hpp"

namespace filecast {

void BaseFd::reset(NativeHandle fd) noexcept {
  const NativeHandle previous = std::exchange(_fd, fd);
  if (previous == kInvalidHandle || previous == fd) {
    return;
  }
  // Linux releases the descriptor even when close() is interrupted: retrying could close a reused one.
  if (::close(previous) != 0) {
    const int err = LastSystemError();
    if (err != error::kInterrupted) {
      log::error("close(fd # {}) failed err={} ({})", previous, err, SystemErrorMessage(err));
    }
  }
  log::trace("fd # {} closed", previous);
}

}  // namespace filecast
