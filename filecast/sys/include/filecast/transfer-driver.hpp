#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "filecast/platform.hpp"

namespace filecast {

// Classified result of a single bounded zero-copy transfer attempt.
struct TransferOutcome {
  enum class Code : uint8_t {
    Transferred,  // 'bytes' (> 0) moved from source to destination
    EndOfSource,  // no more data at this offset
    WouldBlock,   // destination cannot accept data right now, nothing moved
    Fatal         // any other failure, see 'errnoValue' and 'reason'
  };

  [[nodiscard]] static TransferOutcome Transferred(std::size_t nbBytes) {
    return TransferOutcome{Code::Transferred, nbBytes, 0, {}};
  }
  [[nodiscard]] static TransferOutcome EndOfSource() { return TransferOutcome{Code::EndOfSource, 0, 0, {}}; }
  [[nodiscard]] static TransferOutcome WouldBlock() { return TransferOutcome{Code::WouldBlock, 0, 0, {}}; }
  [[nodiscard]] static TransferOutcome Fatal(std::string reason, int errnoValue = 0) {
    return TransferOutcome{Code::Fatal, 0, errnoValue, std::move(reason)};
  }

  bool operator==(const TransferOutcome&) const noexcept = default;

  Code code{Code::EndOfSource};
  std::size_t bytes{0};
  int errnoValue{0};
  std::string reason;
};

// Performs one bounded transfer attempt from a source file to a destination socket and classifies its outcome.
// Implementations hold no per-transfer state: every call derives its starting point purely from 'offset',
// and never retry internally (retry policy belongs to the caller).
class ITransferDriver {
 public:
  virtual ~ITransferDriver() = default;

  // Transfer at most 'maxBytes' (> 0) bytes of 'source' starting at 'offset' to 'destination'.
  virtual TransferOutcome attempt(NativeHandle destination, NativeHandle source, std::size_t offset,
                                  std::size_t maxBytes) = 0;
};

// Kernel zero-copy driver based on sendfile(2). The destination is expected to be non-blocking,
// so that a full send buffer is reported as WouldBlock instead of blocking the calling thread.
class SendfileTransferDriver final : public ITransferDriver {
 public:
  TransferOutcome attempt(NativeHandle destination, NativeHandle source, std::size_t offset,
                          std::size_t maxBytes) override;
};

}  // namespace filecast
