#include "filecast/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe operations here: the serving loop logs the request when it notices it.
extern "C" void FilecastSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace filecast {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::FilecastSignalHandler);
  std::signal(SIGTERM, ::FilecastSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

void SignalHandler::IgnoreSigPipe() { std::signal(SIGPIPE, SIG_IGN); }

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

int SignalHandler::StopSignal() { return g_signalStatus; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace filecast
