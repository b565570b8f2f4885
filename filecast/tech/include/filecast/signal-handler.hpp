#pragma once

namespace filecast {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request a stop of the serving loop.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Number of the last termination signal received, 0 if none.
  static int StopSignal();

  // Ignore SIGPIPE process-wide. sendfile(2) has no MSG_NOSIGNAL flag, so a peer closing its end
  // would otherwise kill the process instead of reporting EPIPE. Idempotent.
  static void IgnoreSigPipe();

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag (for testing purposes).
  // This allows multiple test runs in the same process.
  static void ResetStopRequest();
};

}  // namespace filecast
