#ifndef __PD_TEST_HEADERS__
#define __PD_TEST_HEADERS__

#include <catch2/catch_test_macros.hpp>

#include "Headers.hpp"

namespace pd {
/**
 * @brief Creates a unique directory under the temp directory and removes it
 * (recursively) when destroyed.
 */
class TempDirectory {
 public:
  explicit TempDirectory(const string& prefix = "pd_test") {
    string pattern = GetTempDirectory() + prefix + "_XXXXXXXX";
    char* created = mkdtemp(&pattern[0]);
    FATAL_FAIL(created == NULL ? -1 : 0);
    path = string(created);
  }

  ~TempDirectory() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  inline const string& getPath() const { return path; }

 protected:
  string path;
};

/**
 * @brief Polls `condition` until it holds or `timeoutMs` passes.
 */
inline bool waitUntil(const std::function<bool()>& condition,
                      int timeoutMs = 10000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}
}  // namespace pd

#endif  // __PD_TEST_HEADERS__
