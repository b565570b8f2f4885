#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <unordered_map>

#include "filecast/base-fd.hpp"
#include "filecast/event-loop.hpp"
#include "filecast/event.hpp"
#include "filecast/file-server-config.hpp"
#include "filecast/listen-socket.hpp"
#include "filecast/platform.hpp"
#include "filecast/server-stats.hpp"
#include "filecast/timedef.hpp"
#include "filecast/transfer-driver.hpp"
#include "filecast/transfer-session.hpp"
#include "filecast/wakeup-fd.hpp"
#include "filecast/writable-notifier.hpp"

namespace filecast {

// Single-threaded, epoll based server sending the configured file to every accepted connection.
//
// Each connection gets its own TransferSession reading the file from offset 0. Sessions suspended on a full
// send buffer are resumed through one-shot EPOLLOUT registrations: the server is the IWritableNotifier of
// all its sessions.
// Connections whose transfer completed linger, shut down for writing, until the peer closes them or
// FileServerConfig::lingerTimeout expires. Their input is read and discarded meanwhile.
//
// Threading: construction, run(), runUntil(), stats() and the destructor must be called from the same thread.
// stop() may be called from any thread.
class FileServer final : private IWritableNotifier {
 public:
  // Validates the config, binds and listens immediately (so port() is known right after construction).
  // Throws std::invalid_argument for an invalid config and std::system_error on socket failures.
  explicit FileServer(FileServerConfig config);

  // Same as above, with a custom transfer driver (useful to inject faults).
  FileServer(FileServerConfig config, std::unique_ptr<ITransferDriver> driver);

  FileServer(const FileServer&) = delete;
  FileServer(FileServer&&) = delete;
  FileServer& operator=(const FileServer&) = delete;
  FileServer& operator=(FileServer&&) = delete;

  // Aborts all in-flight transfers and closes lingering connections.
  ~FileServer() override;

  // Serve until stop() is called or a termination signal is caught by SignalHandler.
  void run();

  // Serve until 'predicate' returns true (checked after each poll), stop() is called or a termination
  // signal is caught by SignalHandler. In-flight transfers are aborted and lingering connections closed
  // when it returns. Throws std::system_error if polling fails.
  void runUntil(const std::function<bool()>& predicate);

  // Request the serving loop to return. Thread-safe.
  void stop() noexcept;

  // Effective listening port.
  [[nodiscard]] uint16_t port() const noexcept { return _listenSocket.port(); }

  [[nodiscard]] const FileServerConfig& config() const noexcept { return _config; }

  // Snapshot of the counters. Counters of a session are accounted when it finishes.
  [[nodiscard]] ServerStats stats() const noexcept { return _stats; }

  [[nodiscard]] std::size_t nbActiveSessions() const noexcept { return _sessions.size(); }

  [[nodiscard]] std::size_t nbLingeringConnections() const noexcept { return _lingering.size(); }

 private:
  using SessionMap = std::unordered_map<NativeHandle, std::unique_ptr<TransferSession>>;

  struct LingeringConnection {
    BaseFd fd;
    SteadyTimePoint deadline;
  };

  using LingeringMap = std::unordered_map<NativeHandle, LingeringConnection>;

  [[nodiscard]] bool armWritable(NativeHandle fd) override;

  void disarmWritable(NativeHandle fd) noexcept override;

  void lingerClose(BaseFd destination) noexcept override;

  void eventLoopOnce();

  void acceptNewConnections();

  void startSession(BaseFd cnx);

  void handleSessionEvent(SessionMap::iterator cnxIt, EventBmp eventBmp);

  void handleLingeringEvent(LingeringMap::iterator cnxIt, EventBmp eventBmp);

  void sweepExpired();

  void abortAllSessions(std::string_view reason);

  // Erases the session if it is finished, accounting its counters. Returns the next iterator.
  SessionMap::iterator retireIfFinished(SessionMap::iterator it);

  FileServerConfig _config;
  std::unique_ptr<ITransferDriver> _driver;
  ListenSocket _listenSocket;
  EventLoop _eventLoop;
  WakeupFd _wakeupFd;
  SessionMap _sessions;
  LingeringMap _lingering;
  ServerStats _stats;
  std::atomic<bool> _stopRequested{false};
};

}  // namespace filecast
