#include "filecast/transfer-session.hpp"

#include <cassert>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "filecast/base-fd.hpp"
#include "filecast/file.hpp"
#include "filecast/log.hpp"
#include "filecast/platform.hpp"
#include "filecast/socket-ops.hpp"
#include "filecast/timedef.hpp"
#include "filecast/transfer-driver.hpp"
#include "filecast/writable-notifier.hpp"

namespace filecast {

std::string_view StateName(TransferSession::State state) noexcept {
  switch (state) {
    case TransferSession::State::Active:
      return "Active";
    case TransferSession::State::AwaitingWritable:
      return "AwaitingWritable";
    case TransferSession::State::Done:
      return "Done";
    case TransferSession::State::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

TransferSession::TransferSession(BaseFd destination, File source, ITransferDriver& driver,
                                 IWritableNotifier& notifier, std::size_t chunkSize)
    : _driver(&driver),
      _notifier(&notifier),
      _destination(std::move(destination)),
      _source(std::move(source)),
      _chunkSize(chunkSize),
      _lastProgress(SteadyClock::now()) {
  assert(_chunkSize > 0);
}

TransferSession::~TransferSession() {
  if (_writableArmed) {
    _notifier->disarmWritable(_destination.fd());
  }
}

void TransferSession::start() {
  assert(!_started);
  assert(_state == State::Active);
  if (_started || _state != State::Active) [[unlikely]] {
    log::error("Transfer session fd # {} started twice (state {})", _destination.fd(), StateName(_state));
    return;
  }
  _started = true;

  if (!_source) {
    // Open failure was already logged by File. Nothing is sent, the peer only observes the connection closing.
    fail("source file is not opened");
    return;
  }

  log::debug("Transfer session fd # {} <- fd # {} started (chunk size {})", _destination.fd(), _source.fd(),
             _chunkSize);
  pump();
}

void TransferSession::onWritable() {
  assert(_state == State::AwaitingWritable);
  if (_state != State::AwaitingWritable) [[unlikely]] {
    log::error("Unexpected writability notification for transfer session fd # {} in state {}", _destination.fd(),
               StateName(_state));
    return;
  }

  // The notification is one-shot: it was consumed by its delivery.
  _writableArmed = false;
  _state = State::Active;
  _lastProgress = SteadyClock::now();
  log::trace("Transfer session fd # {} resumed at offset {}", _destination.fd(), _offset);
  pump();
}

void TransferSession::abort(std::string_view reason) {
  if (isFinished()) {
    log::debug("Ignoring abort '{}' of already finished transfer session in state {}", reason, StateName(_state));
    return;
  }
  _started = true;
  _aborted = true;
  log::warn("Transfer session fd # {} aborted at offset {}: {}", _destination.fd(), _offset, reason);
  fail(std::string(reason));
}

void TransferSession::pump() {
  while (true) {
    auto outcome = _driver->attempt(_destination.fd(), _source.fd(), _offset, _chunkSize);
    switch (outcome.code) {
      case TransferOutcome::Code::Transferred:
        assert(outcome.bytes > 0 && outcome.bytes <= _chunkSize);
        _offset += outcome.bytes;
        _lastProgress = SteadyClock::now();
        break;
      case TransferOutcome::Code::EndOfSource:
        log::debug("Transfer session fd # {} done, {} bytes sent", _destination.fd(), _offset);
        releaseHandles(true);
        _state = State::Done;
        return;
      case TransferOutcome::Code::WouldBlock:
        assert(!_writableArmed);
        if (!_notifier->armWritable(_destination.fd())) {
          fail("unable to subscribe to destination writability");
          return;
        }
        _writableArmed = true;
        ++_nbWritableWaits;
        _state = State::AwaitingWritable;
        log::trace("Transfer session fd # {} waiting for writability at offset {}", _destination.fd(), _offset);
        return;
      case TransferOutcome::Code::Fatal:
        log::error("Transfer session fd # {} failed at offset {} errno={} msg={}", _destination.fd(), _offset,
                   outcome.errnoValue, outcome.reason);
        fail(std::move(outcome.reason));
        return;
      default:
        std::unreachable();
    }
  }
}

void TransferSession::fail(std::string reason) {
  _failureReason = std::move(reason);
  releaseHandles(false);
  _state = State::Failed;
}

void TransferSession::releaseHandles(bool transferComplete) noexcept {
  if (_writableArmed) {
    _notifier->disarmWritable(_destination.fd());
    _writableArmed = false;
  }
  _source.close();
  if (!transferComplete || !_destination) {
    _destination.close();
    return;
  }
  // Closing a socket with unread input resets the connection, dropping the tail still in the send buffer.
  if (ShutdownWrite(_destination.fd())) {
    _notifier->lingerClose(std::move(_destination));
  } else {
    const int err = LastSystemError();
    log::debug("shutdown(SHUT_WR) of fd # {} failed err={} ({})", _destination.fd(), err, SystemErrorMessage(err));
    _destination.close();
  }
}

}  // namespace filecast
