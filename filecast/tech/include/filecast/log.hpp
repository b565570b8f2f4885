#pragma once

// Logging abstraction: filecast::log is spdlog.
// spdlog is compiled against an external fmt, so the library variant is linked rather than
// forcing SPDLOG_HEADER_ONLY locally.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <string>
#include <string_view>

namespace filecast {

namespace log = spdlog;

// Set the global log level from its spdlog name ("trace", "debug", "info", "warn", "err", "critical", "off").
// Unknown names leave the level untouched and return false.
inline bool SetLogLevel(std::string_view levelName) {
  const auto lvl = spdlog::level::from_str(std::string(levelName));
  if (lvl == spdlog::level::off && levelName != "off") {
    return false;
  }
  spdlog::set_level(lvl);
  return true;
}

}  // namespace filecast
