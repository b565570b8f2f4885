#include "filecast/file-server.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "filecast/base-fd.hpp"
#include "filecast/errno-throw.hpp"
#include "filecast/event-loop.hpp"
#include "filecast/event.hpp"
#include "filecast/file-server-config.hpp"
#include "filecast/file.hpp"
#include "filecast/listen-socket.hpp"
#include "filecast/log.hpp"
#include "filecast/platform.hpp"
#include "filecast/signal-handler.hpp"
#include "filecast/socket-ops.hpp"
#include "filecast/timedef.hpp"
#include "filecast/transfer-driver.hpp"
#include "filecast/transfer-session.hpp"
#include "filecast/writable-notifier.hpp"

namespace filecast {

namespace {

FileServerConfig Validated(FileServerConfig config) {
  config.validate();
  return config;
}

// Accepted connections are registered without interest: only EPOLLERR / EPOLLHUP are reported
// until a transfer session arms a one-shot writability notification.
constexpr EventBmp kIdleConnectionEvents = 0;
constexpr EventBmp kWritableOnceEvents = EventOut | EventOneShot;
constexpr EventBmp kLingeringEvents = EventIn;

}  // namespace

FileServer::FileServer(FileServerConfig config)
    : FileServer(std::move(config), std::make_unique<SendfileTransferDriver>()) {}

FileServer::FileServer(FileServerConfig config, std::unique_ptr<ITransferDriver> driver)
    : _config(Validated(std::move(config))),
      _driver(std::move(driver)),
      _listenSocket(ListenSocket::Options{
          .port = _config.port, .reusePort = _config.reusePort, .tcpNoDelay = _config.tcpNoDelay}),
      _eventLoop(_config.pollInterval) {
  if (!_driver) {
    throw std::invalid_argument("transfer driver must not be null");
  }
  _config.port = _listenSocket.port();
  SignalHandler::IgnoreSigPipe();
  if (!_eventLoop.add(_listenSocket.fd(), EventIn)) {
    throw_errno("Unable to watch listening fd # {}", _listenSocket.fd());
  }
  if (!_eventLoop.add(_wakeupFd.fd(), EventIn)) {
    throw_errno("Unable to watch wakeup fd # {}", _wakeupFd.fd());
  }
  log::info("Serving '{}' on port {} (chunk size {})", _config.filePath, _config.port, _config.chunkSize);
}

FileServer::~FileServer() {
  abortAllSessions("server destroyed");
  _lingering.clear();
}

void FileServer::run() {
  runUntil([] { return false; });
}

void FileServer::runUntil(const std::function<bool()>& predicate) {
  log::debug("Server on port {} running", _config.port);
  while (!_stopRequested.load(std::memory_order_acquire) && !SignalHandler::IsStopRequested() && !predicate()) {
    eventLoopOnce();
  }
  if (SignalHandler::IsStopRequested()) {
    log::warn("Signal {} received, stopping transfers", SignalHandler::StopSignal());
  }
  abortAllSessions("server stopping");
  _lingering.clear();
  _stopRequested.store(false, std::memory_order_release);
  log::info("Server on port {} stopped", _config.port);
}

void FileServer::stop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _wakeupFd.notify();
}

void FileServer::eventLoopOnce() {
  for (const auto event : _eventLoop.poll()) {
    const NativeHandle fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _wakeupFd.fd()) {
      _wakeupFd.drain();
    } else if (const auto cnxIt = _sessions.find(fd); cnxIt != _sessions.end()) {
      handleSessionEvent(cnxIt, event.events);
    } else if (const auto lingerIt = _lingering.find(fd); lingerIt != _lingering.end()) {
      handleLingeringEvent(lingerIt, event.events);
    } else {
      log::error("Received an unknown fd # {} from the event loop (or already removed?)", fd);
    }
  }

  sweepExpired();
}

void FileServer::acceptNewConnections() {
  while (true) {
    BaseFd cnx = _listenSocket.accept();
    if (!cnx) {
      // no more waiting connections
      break;
    }
    ++_stats.connectionsAccepted;
    const NativeHandle cnxFd = cnx.fd();
    if (_config.maxConnections != 0 && _sessions.size() >= _config.maxConnections) {
      log::warn("Maximum number of connections ({}) reached, closing fd # {}", _config.maxConnections, cnxFd);
      ++_stats.connectionsRejected;
      continue;
    }
    if (_config.tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      const auto err = LastSystemError();
      log::error("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", cnxFd, err, SystemErrorMessage(err));
    }
    if (_config.sendBufferSize != 0 && !SetSendBufferSize(cnxFd, _config.sendBufferSize)) {
      const auto err = LastSystemError();
      log::error("setsockopt(SO_SNDBUF={}) failed for fd # {} err={} ({})", _config.sendBufferSize, cnxFd, err,
                 SystemErrorMessage(err));
    }
    startSession(std::move(cnx));
  }
}

void FileServer::startSession(BaseFd cnx) {
  const NativeHandle cnxFd = cnx.fd();
  if (!_eventLoop.add(cnxFd, kIdleConnectionEvents)) {
    ++_stats.epollFailures;
    return;
  }

  // The file is opened per connection: each transfer owns its descriptor and sees the file as it is now.
  File source(_config.filePath);
  if (!source) {
    ++_stats.sourceOpenFailures;
  }

  IWritableNotifier& notifier = *this;
  auto [cnxIt, inserted] = _sessions.emplace(
      cnxFd,
      std::make_unique<TransferSession>(std::move(cnx), std::move(source), *_driver, notifier, _config.chunkSize));
  if (!inserted) [[unlikely]] {
    // A finished session is always erased before its descriptor can be reused, so this is a bug.
    log::error("Internal error: accepted connection fd # {} already present in session map", cnxFd);
    assert(false);
    return;
  }

  cnxIt->second->start();
  retireIfFinished(cnxIt);
}

void FileServer::handleSessionEvent(SessionMap::iterator cnxIt, EventBmp eventBmp) {
  TransferSession& session = *cnxIt->second;
  const NativeHandle fd = cnxIt->first;
  if ((eventBmp & EventOut) != 0 && session.state() == TransferSession::State::AwaitingWritable) {
    // A pending socket error also reports EPOLLOUT: the next sendfile attempt surfaces it as a fatal outcome.
    session.onWritable();
  } else if ((eventBmp & (EventErr | EventHup)) != 0) {
    const int err = GetSocketError(fd);
    session.abort(err != 0 ? std::string_view(SystemErrorMessage(err)) : std::string_view("peer hung up"));
  } else {
    log::debug("Ignoring events 0x{:x} for fd # {} in state {}", eventBmp, fd, StateName(session.state()));
  }
  retireIfFinished(cnxIt);
}

void FileServer::handleLingeringEvent(LingeringMap::iterator cnxIt, EventBmp eventBmp) {
  const NativeHandle fd = cnxIt->first;
  if ((eventBmp & EventErr) == 0 && DiscardPendingInput(fd)) {
    return;
  }
  log::debug("Lingering connection fd # {} closed by peer", fd);
  _lingering.erase(cnxIt);
}

void FileServer::sweepExpired() {
  const auto now = SteadyClock::now();
  if (_config.stalledTransferTimeout.count() != 0) {
    for (auto cnxIt = _sessions.begin(); cnxIt != _sessions.end();) {
      TransferSession& session = *cnxIt->second;
      if (session.state() == TransferSession::State::AwaitingWritable &&
          now - session.lastProgress() >= _config.stalledTransferTimeout) {
        session.abort("stalled transfer: destination not writable within timeout");
      }
      cnxIt = retireIfFinished(cnxIt);
    }
  }
  for (auto cnxIt = _lingering.begin(); cnxIt != _lingering.end();) {
    if (now < cnxIt->second.deadline) {
      ++cnxIt;
      continue;
    }
    log::debug("Lingering connection fd # {} not closed by peer in time, closing it", cnxIt->first);
    ++_stats.lingerTimeouts;
    cnxIt = _lingering.erase(cnxIt);
  }
}

void FileServer::abortAllSessions(std::string_view reason) {
  for (auto cnxIt = _sessions.begin(); cnxIt != _sessions.end();) {
    cnxIt->second->abort(reason);
    cnxIt = retireIfFinished(cnxIt);
  }
}

FileServer::SessionMap::iterator FileServer::retireIfFinished(SessionMap::iterator cnxIt) {
  const TransferSession& session = *cnxIt->second;
  if (!session.isFinished()) {
    return std::next(cnxIt);
  }
  _stats.bytesTransferred += session.offset();
  _stats.writableWaits += session.nbWritableWaits();
  if (session.state() == TransferSession::State::Done) {
    ++_stats.sessionsCompleted;
  } else {
    ++_stats.sessionsFailed;
    if (session.wasAborted()) {
      ++_stats.sessionsAborted;
    }
  }
  // The session either closed its destination or handed it over to lingerClose().
  return _sessions.erase(cnxIt);
}

bool FileServer::armWritable(NativeHandle fd) {
  if (_eventLoop.modify(fd, kWritableOnceEvents)) [[likely]] {
    return true;
  }
  ++_stats.epollFailures;
  return false;
}

void FileServer::disarmWritable(NativeHandle fd) noexcept { _eventLoop.remove(fd); }

void FileServer::lingerClose(BaseFd destination) noexcept {
  const NativeHandle fd = destination.fd();
  // Input received so far is dropped now. Without a linger period the descriptor closes right after.
  if (!DiscardPendingInput(fd) || _config.lingerTimeout.count() == 0) {
    return;
  }
  if (!_eventLoop.modify(fd, kLingeringEvents)) {
    ++_stats.epollFailures;
    return;
  }
  const auto deadline = SteadyClock::now() + _config.lingerTimeout;
  _lingering.insert_or_assign(fd, LingeringConnection{std::move(destination), deadline});
}

}  // namespace filecast
