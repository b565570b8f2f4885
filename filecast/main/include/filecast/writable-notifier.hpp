#pragma once

#include "filecast/base-fd.hpp"
#include "filecast/platform.hpp"

namespace filecast {

// Services a transfer session needs from the owner of its destination's event source.
//
// After a successful armWritable(fd), the owner delivers exactly one notification (by calling
// TransferSession::onWritable()) once 'fd' becomes writable again, then forgets the subscription.
// It must be re-armed to be notified again.
class IWritableNotifier {
 public:
  virtual ~IWritableNotifier() = default;

  // Subscribe to the next writability event of 'fd'.
  // Returns false if the subscription could not be registered (logged by the implementation).
  [[nodiscard]] virtual bool armWritable(NativeHandle fd) = 0;

  // Cancel a subscription that was armed and has not been delivered yet.
  virtual void disarmWritable(NativeHandle fd) noexcept = 0;

  // Take over the destination of a completed transfer, already shut down for writing.
  // Sent data may still sit in the kernel send buffer: the owner closes the descriptor once the peer
  // closed its side (or gave up waiting), discarding whatever the peer sends meanwhile.
  virtual void lingerClose(BaseFd destination) noexcept = 0;
};

}  // namespace filecast
