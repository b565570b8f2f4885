#include "filecast/server-stats.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace filecast {

TEST(ServerStatsTest, DefaultJsonHasAllFieldsAtZero) {
  ServerStats stats;
  EXPECT_EQ(stats.json_str(),
            R"({"connectionsAccepted":0,"connectionsRejected":0,"sourceOpenFailures":0,"sessionsCompleted":0,)"
            R"("sessionsFailed":0,"sessionsAborted":0,"bytesTransferred":0,"writableWaits":0,"lingerTimeouts":0,)"
            R"("epollFailures":0})");
}

TEST(ServerStatsTest, JsonReflectsValues) {
  ServerStats stats;
  stats.connectionsAccepted = 3;
  stats.sessionsCompleted = 2;
  stats.bytesTransferred = std::numeric_limits<uint64_t>::max();
  const std::string json = stats.json_str();
  EXPECT_NE(json.find(R"("connectionsAccepted":3)"), std::string::npos);
  EXPECT_NE(json.find(R"("sessionsCompleted":2)"), std::string::npos);
  EXPECT_NE(json.find(R"("bytesTransferred":18446744073709551615)"), std::string::npos);
}

TEST(ServerStatsTest, ForEachFieldVisitsInSerializationOrder) {
  ServerStats stats;
  stats.epollFailures = 9;
  std::vector<std::string_view> names;
  uint64_t last = 0;
  stats.for_each_field([&](std::string_view name, uint64_t value) {
    names.push_back(name);
    last = value;
  });
  ASSERT_EQ(names.size(), 10U);
  EXPECT_EQ(names.front(), "connectionsAccepted");
  EXPECT_EQ(names.back(), "epollFailures");
  EXPECT_EQ(last, 9U);
}

}  // namespace filecast
