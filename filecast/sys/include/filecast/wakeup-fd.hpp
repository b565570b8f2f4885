#pragma once

#include "filecast/base-fd.hpp"
#include "filecast/platform.hpp"

namespace filecast {

// eventfd counter becoming readable when notified. Lets another thread interrupt a blocking poll.
class WakeupFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  WakeupFd();

  // Thread-safe.
  void notify() const noexcept;

  // Reset the counter so that the descriptor is no longer readable.
  void drain() const noexcept;

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace filecast
