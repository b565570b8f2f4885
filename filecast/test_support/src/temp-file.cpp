#include "filecast/temp-file.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "filecast/base-fd.hpp"
#include "filecast/errno-throw.hpp"
#include "filecast/log.hpp"

namespace filecast::test {

std::string PatternContent(std::size_t size) {
  std::string content;
  content.reserve(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    content.push_back(static_cast<char>('a' + (pos % 26)));
  }
  return content;
}

ScopedTempDir::ScopedTempDir() {
  std::string tmpl = (std::filesystem::temp_directory_path() / "filecast-test-XXXXXX").string();
  if (::mkdtemp(tmpl.data()) == nullptr) {
    throw_errno("mkdtemp({}) failed", tmpl);
  }
  _dir = tmpl;
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::error("Unable to remove temporary directory {}: {}", _dir.string(), ec.message());
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content) : _content(content) {
  std::string tmpl = (dir.dirPath() / "file-XXXXXX").string();
  BaseFd fd(::mkstemp(tmpl.data()));
  if (!fd) {
    throw_errno("mkstemp({}) failed", tmpl);
  }
  _path = tmpl;

  for (std::string_view remaining = content; !remaining.empty();) {
    const auto nbWritten = ::write(fd.fd(), remaining.data(), remaining.size());
    if (nbWritten < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("write to {} failed", tmpl);
    }
    remaining.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::size_t size)
    : ScopedTempFile(dir, PatternContent(size)) {}

ScopedTempFile::~ScopedTempFile() {
  std::error_code ec;
  if (!std::filesystem::remove(_path, ec)) {
    log::error("Unable to remove temporary file {}: {}", _path.string(), ec ? ec.message() : "not found");
  }
}

}  // namespace filecast::test
