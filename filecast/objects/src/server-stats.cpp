#include "filecast/server-stats.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace filecast {

std::string ServerStats::json_str() const {
  std::string out;
  out.reserve(256UL);
  out.push_back('{');
  bool first = true;
  for_each_field([&out, &first](std::string_view name, uint64_t value) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    char buf[std::numeric_limits<uint64_t>::digits10 + 1];
    // buffer holds the 20 digits of uint64_t max, to_chars cannot fail
    [[maybe_unused]] const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append("\"").append(name).append("\":").append(buf, ptr);
  });
  out.push_back('}');
  return out;
}

}  // namespace filecast
