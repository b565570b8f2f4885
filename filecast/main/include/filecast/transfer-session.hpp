#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "filecast/base-fd.hpp"
#include "filecast/file.hpp"
#include "filecast/platform.hpp"
#include "filecast/timedef.hpp"
#include "filecast/transfer-driver.hpp"
#include "filecast/writable-notifier.hpp"

namespace filecast {

// Per-connection transfer of one source file to one non-blocking destination socket.
//
// The session repeatedly asks its driver for bounded transfers starting at the current offset, and:
//  - keeps going without yielding while data flows (a single attempt may under-transfer),
//  - on WouldBlock, arms exactly one writability notification and returns control to the caller,
//  - resumes from the same offset when onWritable() is delivered (no byte re-sent, none skipped),
//  - on Fatal (Failed), closes both handles exactly once,
//  - on EndOfSource (Done), closes the source, shuts the destination down for writing and hands it to
//    IWritableNotifier::lingerClose(), which closes it once the peer got everything.
//
// Lifecycle:  Active --WouldBlock--> AwaitingWritable --onWritable()--> Active
//             Active --EndOfSource--> Done,  Active/AwaitingWritable --Fatal/abort()--> Failed
//
// Calling start() twice, onWritable() outside AwaitingWritable, or any transition from a terminal
// state is a programming error caught by debug assertions.
class TransferSession {
 public:
  enum class State : uint8_t { Active, AwaitingWritable, Done, Failed };

  // Takes exclusive ownership of both handles. 'source' may be unopened, in which case start() fails the
  // session without transferring anything.
  // 'driver' and 'notifier' must outlive the session.
  TransferSession(BaseFd destination, File source, ITransferDriver& driver, IWritableNotifier& notifier,
                  std::size_t chunkSize);

  TransferSession(const TransferSession&) = delete;
  TransferSession(TransferSession&&) = delete;
  TransferSession& operator=(const TransferSession&) = delete;
  TransferSession& operator=(TransferSession&&) = delete;

  ~TransferSession();

  // Begin transferring. Returns when the session is finished or waiting for writability.
  void start();

  // Delivery of the one-shot writability notification armed by this session.
  // Resumes the transfer from the current offset.
  void onWritable();

  // External cancellation (peer disconnect, stall, shutdown): equivalent to a fatal transfer error.
  // Disarms a pending writability notification and releases both handles.
  // No-op if the session is already finished.
  void abort(std::string_view reason);

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool isFinished() const noexcept { return _state == State::Done || _state == State::Failed; }

  // Number of bytes already transferred to the destination.
  [[nodiscard]] std::size_t offset() const noexcept { return _offset; }

  [[nodiscard]] std::size_t chunkSize() const noexcept { return _chunkSize; }

  // Empty unless state() is Failed.
  [[nodiscard]] const std::string& failureReason() const noexcept { return _failureReason; }

  // True if the session ended through abort().
  [[nodiscard]] bool wasAborted() const noexcept { return _aborted; }

  // Number of times the transfer was suspended on a full destination.
  [[nodiscard]] uint32_t nbWritableWaits() const noexcept { return _nbWritableWaits; }

  // Time of the last state change that reflects progress (start, bytes transferred, writability delivered).
  [[nodiscard]] SteadyTimePoint lastProgress() const noexcept { return _lastProgress; }

  // Destination descriptor, or kInvalidHandle once the session is finished.
  [[nodiscard]] NativeHandle destinationFd() const noexcept { return _destination.fd(); }

 private:
  void pump();

  void fail(std::string reason);

  void releaseHandles(bool transferComplete) noexcept;

  ITransferDriver* _driver;
  IWritableNotifier* _notifier;
  BaseFd _destination;
  File _source;
  std::size_t _offset{0};
  std::size_t _chunkSize;
  std::string _failureReason;
  SteadyTimePoint _lastProgress;
  uint32_t _nbWritableWaits{0};
  State _state{State::Active};
  bool _started{false};
  bool _writableArmed{false};
  bool _aborted{false};
};

std::string_view StateName(TransferSession::State state) noexcept;

}  // namespace filecast
