#include "filecast/transfer-driver.hpp"

#include <sys/types.h>

#include <cassert>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

#include "filecast/log.hpp"
#include "filecast/platform.hpp"
#include "filecast/sendfile.hpp"

namespace filecast {

TransferOutcome SendfileTransferDriver::attempt(NativeHandle destination, NativeHandle source, std::size_t offset,
                                                std::size_t maxBytes) {
  assert(maxBytes > 0);

  if (std::cmp_greater(offset, std::numeric_limits<off_t>::max())) [[unlikely]] {
    return TransferOutcome::Fatal("file offset does not fit in off_t", EOVERFLOW);
  }

  off_t off = static_cast<off_t>(offset);
  const auto bytes = Sendfile(destination, source, off, maxBytes);
  if (bytes > 0) {
    log::trace("sendfile fd # {} <- fd # {} offset={} sent={}", destination, source, offset, bytes);
    return TransferOutcome::Transferred(static_cast<std::size_t>(bytes));
  }
  if (bytes == 0) {
    log::trace("sendfile fd # {} <- fd # {} offset={} reached end of source", destination, source, offset);
    return TransferOutcome::EndOfSource();
  }

  const int errnoVal = errno;
  static_assert(EAGAIN == EWOULDBLOCK, "Check logic below if EAGAIN != EWOULDBLOCK");
  switch (errnoVal) {
    case error::kWouldBlock:
      [[fallthrough]];
    case error::kInterrupted:
      log::trace("sendfile fd # {} would block at offset={}", destination, offset);
      return TransferOutcome::WouldBlock();
    default:
      return TransferOutcome::Fatal(std::strerror(errnoVal), errnoVal);
  }
}

}  // namespace filecast
