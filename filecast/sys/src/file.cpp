#include "filecast/file.hpp"

#include <fcntl.h>

#include <string>

#include "filecast/log.hpp"
#include "filecast/platform.hpp"

namespace filecast {

File::File(const std::string& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    const int err = LastSystemError();
    log::error("Unable to open '{}' for reading err={} ({})", path, err, SystemErrorMessage(err));
    return;
  }
  log::debug("'{}' opened as fd # {}", path, _fd.fd());
}

}  // namespace filecast
