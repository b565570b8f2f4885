#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <utility>

#include "filecast/file-server-config.hpp"
#include "filecast/file-server.hpp"
#include "filecast/server-stats.hpp"
#include "filecast/transfer-driver.hpp"

namespace filecast::test {

// RAII test harness running a FileServer event loop in a background jthread.
//  * The server binds and listens at construction, so port() is valid immediately.
//  * stopAndJoin() stops the loop and joins the thread; stats() may only be read afterwards
//    since FileServer is single-threaded.
//  * Destruction stops and joins (idempotent).
struct TestServer {
  explicit TestServer(FileServerConfig cfg, std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : server(std::move(cfg.withPollInterval(pollPeriod))),
        loopThread([this] { server.runUntil([this] { return stopFlag.load(); }); }) {}

  TestServer(FileServerConfig cfg, std::unique_ptr<ITransferDriver> driver,
             std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : server(std::move(cfg.withPollInterval(pollPeriod)), std::move(driver)),
        loopThread([this] { server.runUntil([this] { return stopFlag.load(); }); }) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stopAndJoin(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Cooperative stop; safe to call multiple times.
  void stopAndJoin() {
    if (!stopFlag.exchange(true)) {
      server.stop();
    }
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  [[nodiscard]] ServerStats stats() const { return server.stats(); }

  std::atomic_bool stopFlag{false};
  FileServer server;

 private:
  std::jthread loopThread;
};

}  // namespace filecast::test
