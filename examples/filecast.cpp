#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>
#include <system_error>

#include "filecast/file-server-config.hpp"
#include "filecast/file-server.hpp"
#include "filecast/log.hpp"
#include "filecast/signal-handler.hpp"

namespace {

int Usage(std::string_view programName) {
  std::cerr << "Usage: " << programName << " <port> <path>\n"
            << "Serves the file at <path> to every TCP connection accepted on <port>.\n"
            << "Log level can be set with the FILECAST_LOG_LEVEL environment variable (default: info).\n";
  return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string_view programName = argc > 0 ? argv[0] : "filecast";
  if (argc < 3) {
    return Usage(programName);
  }

  const std::string_view portStr(argv[1]);
  uint16_t port{};
  const auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (ec != std::errc{} || ptr != portStr.data() + portStr.size()) {
    std::cerr << "Invalid port '" << portStr << "'\n";
    return Usage(programName);
  }

  if (const char* levelName = std::getenv("FILECAST_LOG_LEVEL"); levelName != nullptr) {
    if (!filecast::SetLogLevel(levelName)) {
      filecast::log::warn("Unknown log level '{}', keeping default", levelName);
    }
  }

  filecast::SignalHandler::Enable();

  try {
    filecast::FileServer server(filecast::FileServerConfig{}.withPort(port).withFilePath(argv[2]));
    server.run();
    filecast::log::info("Final stats: {}", server.stats().json_str());
  } catch (const std::exception& ex) {
    filecast::log::critical("Exception: {}", ex.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
