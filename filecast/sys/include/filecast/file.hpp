#pragma once

#include <string>

#include "filecast/base-fd.hpp"
#include "filecast/platform.hpp"

namespace filecast {

// Read-only file handle used as transfer source.
class File {
 public:
  File() noexcept = default;

  // Opens 'path' read-only. On failure the error is logged and the File stays unopened (falsy).
  explicit File(const std::string& path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Not owned by the caller. kInvalidHandle when unopened.
  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
};

}  // namespace filecast
