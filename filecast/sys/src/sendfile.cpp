#include "filecast/sendfile.hpp"

#include <sys/sendfile.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>

#include "filecast/platform.hpp"

namespace filecast {

int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept {
  static_assert(sizeof(ssize_t) <= sizeof(int64_t), "ssize_t must fit in int64_t");
  return static_cast<int64_t>(::sendfile(outFd, inFd, &offset, count));
}

}  // namespace filecast
