#include "filecast/file-server.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "filecast/file-server-config.hpp"
#include "filecast/platform.hpp"
#include "filecast/server-stats.hpp"
#include "filecast/temp-file.hpp"
#include "filecast/test-server-fixture.hpp"
#include "filecast/test-util.hpp"
#include "filecast/transfer-driver.hpp"

using namespace std::chrono_literals;

namespace filecast {

namespace {

constexpr std::size_t kLargeFileSize = std::size_t{8} << 20;
constexpr int kSmallBufferSize = 4096;

class FileServerTest : public ::testing::Test {
 protected:
  FileServerConfig configFor(const test::ScopedTempFile& file) const {
    return FileServerConfig{}.withFilePath(file.filePath().string());
  }

  test::ScopedTempDir dir;
};

// Fails every attempt: the peer must only observe the connection closing.
class AlwaysFailingDriver final : public ITransferDriver {
 public:
  TransferOutcome attempt(NativeHandle, NativeHandle, std::size_t, std::size_t) override {
    return TransferOutcome::Fatal("injected failure", 0);
  }
};

}  // namespace

TEST_F(FileServerTest, InvalidConfigThrows) {
  EXPECT_THROW(FileServer{FileServerConfig{}}, std::invalid_argument);
  test::ScopedTempFile file(dir, "abc");
  EXPECT_THROW(FileServer(configFor(file).withChunkSize(0)), std::invalid_argument);
  EXPECT_THROW(FileServer(configFor(file), nullptr), std::invalid_argument);
}

TEST_F(FileServerTest, EphemeralPortIsResolved) {
  test::ScopedTempFile file(dir, "abc");
  FileServer server(configFor(file));
  EXPECT_NE(server.port(), 0);
  EXPECT_EQ(server.config().port, server.port());
  EXPECT_EQ(server.nbActiveSessions(), 0U);
}

TEST_F(FileServerTest, ServesWholeFile) {
  test::ScopedTempFile file(dir, std::size_t{1} << 20);
  test::TestServer ts(configFor(file));

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(cnx.connected());
  EXPECT_EQ(test::recvUntilClosed(cnx.fd()), file.content());

  ts.stopAndJoin();
  const ServerStats stats = ts.stats();
  EXPECT_EQ(stats.connectionsAccepted, 1U);
  EXPECT_EQ(stats.sessionsCompleted, 1U);
  EXPECT_EQ(stats.sessionsFailed, 0U);
  EXPECT_EQ(stats.bytesTransferred, file.content().size());
}

TEST_F(FileServerTest, SmallChunksPreserveOrder) {
  test::ScopedTempFile file(dir, 10007);
  test::TestServer ts(configFor(file).withChunkSize(7));

  test::ClientConnection cnx(ts.port());
  EXPECT_EQ(test::recvUntilClosed(cnx.fd()), file.content());
}

TEST_F(FileServerTest, EmptyFileClosesWithoutData) {
  test::ScopedTempFile file(dir, std::string_view{});
  test::TestServer ts(configFor(file));

  test::ClientConnection cnx(ts.port());
  EXPECT_TRUE(test::recvUntilClosed(cnx.fd()).empty());

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsCompleted, 1U);
  EXPECT_EQ(ts.stats().writableWaits, 0U);
  EXPECT_EQ(ts.stats().bytesTransferred, 0U);
}

TEST_F(FileServerTest, MissingFileClosesConnection) {
  test::TestServer ts(FileServerConfig{}.withFilePath((dir.dirPath() / "missing.bin").string()));

  test::ClientConnection cnx(ts.port());
  EXPECT_TRUE(test::recvUntilClosed(cnx.fd()).empty());

  ts.stopAndJoin();
  const ServerStats stats = ts.stats();
  EXPECT_EQ(stats.sourceOpenFailures, 1U);
  EXPECT_EQ(stats.sessionsFailed, 1U);
  EXPECT_EQ(stats.sessionsAborted, 0U);
  EXPECT_EQ(stats.sessionsCompleted, 0U);
}

TEST_F(FileServerTest, FileIsReopenedForEachConnection) {
  test::ScopedTempFile file(dir, "first version");
  test::TestServer ts(configFor(file));
  {
    test::ClientConnection cnx(ts.port());
    EXPECT_EQ(test::recvUntilClosed(cnx.fd()), "first version");
  }
  std::ofstream(file.filePath(), std::ios::trunc) << "second";
  {
    test::ClientConnection cnx(ts.port());
    EXPECT_EQ(test::recvUntilClosed(cnx.fd()), "second");
  }
}

TEST_F(FileServerTest, BackpressureResumesWithoutLoss) {
  test::ScopedTempFile file(dir, kLargeFileSize);
  test::TestServer ts(configFor(file).withSendBufferSize(kSmallBufferSize).withChunkSize(1 << 20));

  test::ClientConnection cnx(ts.port(), 1000ms, kSmallBufferSize);
  ASSERT_TRUE(cnx.connected());
  // Let the server fill both socket buffers and suspend.
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(test::recvUntilClosed(cnx.fd(), 20s), file.content());

  ts.stopAndJoin();
  const ServerStats stats = ts.stats();
  EXPECT_EQ(stats.sessionsCompleted, 1U);
  EXPECT_GT(stats.writableWaits, 0U);
  EXPECT_EQ(stats.bytesTransferred, kLargeFileSize);
}

TEST_F(FileServerTest, ConcurrentClientsEachGetWholeFile) {
  static constexpr int kNbClients = 8;
  test::ScopedTempFile file(dir, std::size_t{512} << 10);
  test::TestServer ts(configFor(file).withSendBufferSize(kSmallBufferSize));

  std::vector<std::unique_ptr<test::ClientConnection>> clients;
  for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
    clients.push_back(std::make_unique<test::ClientConnection>(ts.port(), 1000ms, kSmallBufferSize));
  }
  for (const auto& client : clients) {
    EXPECT_EQ(test::recvUntilClosed(client->fd(), 20s), file.content());
  }

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsCompleted, static_cast<uint64_t>(kNbClients));
  EXPECT_EQ(ts.stats().bytesTransferred, static_cast<std::size_t>(kNbClients) * file.content().size());
}

TEST_F(FileServerTest, ConnectionsBeyondMaxAreClosed) {
  test::ScopedTempFile file(dir, kLargeFileSize);
  test::TestServer ts(configFor(file).withSendBufferSize(kSmallBufferSize).withMaxConnections(1));

  test::ClientConnection first(ts.port(), 1000ms, kSmallBufferSize);
  // First bytes received: the first session exists and is now suspended on backpressure.
  const std::string head = test::recvExactly(first.fd(), 1);
  ASSERT_EQ(head.size(), 1U);

  test::ClientConnection second(ts.port());
  EXPECT_TRUE(test::recvUntilClosed(second.fd()).empty());

  EXPECT_EQ(head + test::recvUntilClosed(first.fd(), 20s), file.content());

  ts.stopAndJoin();
  const ServerStats stats = ts.stats();
  EXPECT_EQ(stats.connectionsAccepted, 2U);
  EXPECT_EQ(stats.connectionsRejected, 1U);
  EXPECT_EQ(stats.sessionsCompleted, 1U);
}

TEST_F(FileServerTest, StalledTransferIsAborted) {
  test::ScopedTempFile file(dir, kLargeFileSize);
  test::TestServer ts(
      configFor(file).withSendBufferSize(kSmallBufferSize).withStalledTransferTimeout(std::chrono::milliseconds{100}));

  test::ClientConnection cnx(ts.port(), 1000ms, kSmallBufferSize);
  // Do not read: the session stays suspended until the stall timeout fires.
  std::this_thread::sleep_for(500ms);

  const std::string received = test::recvUntilClosed(cnx.fd());
  EXPECT_LT(received.size(), kLargeFileSize);
  EXPECT_EQ(received, file.content().substr(0, received.size()));

  ts.stopAndJoin();
  const ServerStats stats = ts.stats();
  EXPECT_EQ(stats.sessionsAborted, 1U);
  EXPECT_EQ(stats.sessionsFailed, 1U);
  EXPECT_EQ(stats.bytesTransferred, received.size());
}

TEST_F(FileServerTest, PeerDisconnectDoesNotAffectOtherClients) {
  test::ScopedTempFile file(dir, kLargeFileSize);
  test::TestServer ts(configFor(file).withSendBufferSize(kSmallBufferSize));
  {
    test::ClientConnection leaving(ts.port(), 1000ms, kSmallBufferSize);
    ASSERT_EQ(test::recvExactly(leaving.fd(), 1).size(), 1U);
  }
  // Unread data makes the close a reset: the server must survive it (no SIGPIPE).
  test::ClientConnection cnx(ts.port());
  EXPECT_EQ(test::recvUntilClosed(cnx.fd(), 20s), file.content());

  ts.stopAndJoin();
  const ServerStats stats = ts.stats();
  EXPECT_EQ(stats.sessionsCompleted, 1U);
  EXPECT_EQ(stats.sessionsFailed, 1U);
}

TEST_F(FileServerTest, ClientSendingDataStillReceivesWholeFile) {
  test::ScopedTempFile file(dir, std::size_t{4} << 20);
  test::TestServer ts(configFor(file));

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(cnx.connected());
  static constexpr std::string_view kRequest = "GET / HTTP/1.0\r\n\r\n";
  ASSERT_EQ(::send(cnx.fd(), kRequest.data(), kRequest.size(), 0), static_cast<ssize_t>(kRequest.size()));
  // The server finishes queueing the file while the request sits unread in its receive buffer.
  std::this_thread::sleep_for(300ms);
  const std::string received = test::recvUntilClosed(cnx.fd(), 20s);
  EXPECT_EQ(received.size(), file.content().size());
  EXPECT_EQ(received, file.content());

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsCompleted, 1U);
}

TEST_F(FileServerTest, CompletedConnectionLingersUntilPeerCloses) {
  test::ScopedTempFile file(dir, "hello");
  FileServer server(configFor(file).withPollInterval(std::chrono::milliseconds{5}));
  auto cnx = std::make_unique<test::ClientConnection>(server.port());
  ASSERT_TRUE(cnx->connected());
  ASSERT_EQ(::send(cnx->fd(), "ping", 4, 0), 4);

  bool lingered = false;
  std::string received;
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  server.runUntil([&] {
    if (!lingered && server.nbLingeringConnections() == 1U) {
      lingered = true;
      EXPECT_EQ(server.nbActiveSessions(), 0U);
      // Shut down for writing only: the client sees the end of the file, the server still reads.
      received = test::recvUntilClosed(cnx->fd());
      cnx.reset();
    }
    return (lingered && server.nbLingeringConnections() == 0U) || std::chrono::steady_clock::now() > deadline;
  });

  EXPECT_TRUE(lingered);
  EXPECT_EQ(received, "hello");
  EXPECT_EQ(server.stats().sessionsCompleted, 1U);
  EXPECT_EQ(server.stats().lingerTimeouts, 0U);
}

TEST_F(FileServerTest, CompletedConnectionClosedByPeerStopsLingering) {
  test::ScopedTempFile file(dir, "hello");
  test::TestServer ts(configFor(file).withLingerTimeout(std::chrono::milliseconds{200}));
  {
    test::ClientConnection cnx(ts.port());
    ASSERT_EQ(::send(cnx.fd(), "ping", 4, 0), 4);
    EXPECT_EQ(test::recvUntilClosed(cnx.fd()), "hello");
  }
  std::this_thread::sleep_for(400ms);

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsCompleted, 1U);
  EXPECT_EQ(ts.stats().lingerTimeouts, 0U);
}

TEST_F(FileServerTest, CompletedConnectionKeptOpenByPeerIsClosedAfterLingerTimeout) {
  test::ScopedTempFile file(dir, "hello");
  test::TestServer ts(configFor(file).withLingerTimeout(std::chrono::milliseconds{50}));

  test::ClientConnection cnx(ts.port());
  EXPECT_EQ(test::recvUntilClosed(cnx.fd()), "hello");
  // The client keeps its side open and keeps talking.
  ASSERT_EQ(::send(cnx.fd(), "more", 4, 0), 4);
  std::this_thread::sleep_for(300ms);

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsCompleted, 1U);
  EXPECT_EQ(ts.stats().lingerTimeouts, 1U);
}

TEST_F(FileServerTest, FatalTransferClosesConnection) {
  test::ScopedTempFile file(dir, "some content");
  test::TestServer ts(configFor(file), std::make_unique<AlwaysFailingDriver>());

  test::ClientConnection cnx(ts.port());
  EXPECT_TRUE(test::recvUntilClosed(cnx.fd()).empty());

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsFailed, 1U);
  EXPECT_EQ(ts.stats().sessionsAborted, 0U);
}

TEST_F(FileServerTest, StopAbortsInFlightTransfers) {
  test::ScopedTempFile file(dir, kLargeFileSize);
  test::TestServer ts(configFor(file).withSendBufferSize(kSmallBufferSize));

  test::ClientConnection cnx(ts.port(), 1000ms, kSmallBufferSize);
  ASSERT_EQ(test::recvExactly(cnx.fd(), 1).size(), 1U);

  ts.stopAndJoin();
  EXPECT_EQ(ts.stats().sessionsAborted, 1U);
  EXPECT_EQ(ts.server.nbActiveSessions(), 0U);
  EXPECT_LT(test::recvUntilClosed(cnx.fd()).size(), kLargeFileSize);
}

TEST_F(FileServerTest, StopFromAnotherThreadEndsRun) {
  test::ScopedTempFile file(dir, "abc");
  FileServer server(configFor(file).withPollInterval(std::chrono::milliseconds{10000}));

  std::jthread loop([&server] { server.run(); });
  std::this_thread::sleep_for(20ms);
  const auto before = std::chrono::steady_clock::now();
  server.stop();
  loop.join();
  // Woken up through the event fd, not by the poll timeout.
  EXPECT_LT(std::chrono::steady_clock::now() - before, 5s);
}

TEST_F(FileServerTest, StatsJsonAfterServing) {
  test::ScopedTempFile file(dir, "hello");
  test::TestServer ts(configFor(file));
  {
    test::ClientConnection cnx(ts.port());
    EXPECT_EQ(test::recvUntilClosed(cnx.fd()), "hello");
  }
  ts.stopAndJoin();
  const std::string json = ts.stats().json_str();
  EXPECT_NE(json.find(R"("sessionsCompleted":1)"), std::string::npos);
  EXPECT_NE(json.find(R"("bytesTransferred":5)"), std::string::npos);
}

}  // namespace filecast
