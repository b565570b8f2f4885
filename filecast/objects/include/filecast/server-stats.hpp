#pragma once

#include <cstdint>
#include <string>

namespace filecast {

struct ServerStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of scalar numeric fields (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("connectionsAccepted", connectionsAccepted);
    fun("connectionsRejected", connectionsRejected);
    fun("sourceOpenFailures", sourceOpenFailures);
    fun("sessionsCompleted", sessionsCompleted);
    fun("sessionsFailed", sessionsFailed);
    fun("sessionsAborted", sessionsAborted);
    fun("bytesTransferred", bytesTransferred);
    fun("writableWaits", writableWaits);
    fun("lingerTimeouts", lingerTimeouts);
    fun("epollFailures", epollFailures);
  }

  uint64_t connectionsAccepted{};
  // Closed at once because maxConnections was reached.
  uint64_t connectionsRejected{};
  uint64_t sourceOpenFailures{};
  uint64_t sessionsCompleted{};
  // Ended on a fatal transfer error (includes aborted sessions and source open failures).
  uint64_t sessionsFailed{};
  // Subset of sessionsFailed ended by an external abort (peer hang-up, stall timeout, server stop).
  uint64_t sessionsAborted{};
  uint64_t bytesTransferred{};
  // Number of times a transfer suspended on a full send buffer.
  uint64_t writableWaits{};
  // Completed connections closed because the peer did not close its side within the linger timeout.
  uint64_t lingerTimeouts{};
  uint64_t epollFailures{};
};

}  // namespace filecast
