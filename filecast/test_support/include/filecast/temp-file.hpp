#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace filecast::test {

// Fresh directory under the system temp directory, removed recursively on destruction.
class ScopedTempDir {
 public:
  ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  std::filesystem::path _dir;
};

// File created inside a ScopedTempDir and removed on destruction, remembering what was written to it.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  // 'size' bytes of PatternContent.
  ScopedTempFile(const ScopedTempDir& dir, std::size_t size);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  std::filesystem::path _path;
  std::string _content;
};

// 'size' bytes cycling through 'a'..'z', so that a shifted or truncated copy never matches.
std::string PatternContent(std::size_t size);

}  // namespace filecast::test
