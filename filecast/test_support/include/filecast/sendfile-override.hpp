#pragma once

// Replaces sendfile(2) in the test binary whose single translation unit defines
// FILECAST_WANT_SENDFILE_OVERRIDES before including this header.
// Errors scripted for a destination descriptor are returned first, in order. Other calls reach libc.

#ifdef FILECAST_WANT_SENDFILE_OVERRIDES

#include <dlfcn.h>
#include <sys/sendfile.h>
#include <sys/types.h>

#include <cerrno>
#include <cstdlib>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace filecast::test {

class SendfileErrorScript {
 public:
  static SendfileErrorScript& Instance() {
    static SendfileErrorScript script;
    return script;
  }

  void set(int outFd, std::initializer_list<int> errnoValues) {
    std::scoped_lock lock(_mutex);
    if (errnoValues.size() == 0) {
      _pending.erase(outFd);
      return;
    }
    _pending[outFd].assign(errnoValues.begin(), errnoValues.end());
  }

  [[nodiscard]] std::optional<int> next(int outFd) {
    std::scoped_lock lock(_mutex);
    const auto it = _pending.find(outFd);
    if (it == _pending.end()) {
      return std::nullopt;
    }
    const int err = it->second.front();
    it->second.pop_front();
    if (it->second.empty()) {
      _pending.erase(it);
    }
    return err;
  }

  void clear() {
    std::scoped_lock lock(_mutex);
    _pending.clear();
  }

 private:
  std::mutex _mutex;
  std::unordered_map<int, std::deque<int>> _pending;
};

// Make the next sendfile calls on 'outFd' fail with the given errno values.
inline void ScriptSendfileErrors(int outFd, std::initializer_list<int> errnoValues) {
  SendfileErrorScript::Instance().set(outFd, errnoValues);
}

// Forgets unconsumed scripted errors on destruction, so that descriptor reuse cannot leak them into another test.
struct SendfileScriptGuard {
  SendfileScriptGuard() = default;
  SendfileScriptGuard(const SendfileScriptGuard&) = delete;
  SendfileScriptGuard& operator=(const SendfileScriptGuard&) = delete;
  ~SendfileScriptGuard() { SendfileErrorScript::Instance().clear(); }
};

}  // namespace filecast::test

// NOLINTNEXTLINE
extern "C" ssize_t sendfile(int out_fd, int in_fd, off_t* offset, size_t count) noexcept {
  if (const auto err = filecast::test::SendfileErrorScript::Instance().next(out_fd)) {
    errno = *err;
    return -1;
  }
  using SendfileFn = ssize_t (*)(int, int, off_t*, size_t);
  static const auto realSendfile = reinterpret_cast<SendfileFn>(::dlsym(RTLD_NEXT, "sendfile"));
  if (realSendfile == nullptr) {
    std::abort();
  }
  return realSendfile(out_fd, in_fd, offset, count);
}

#endif  // FILECAST_WANT_SENDFILE_OVERRIDES
