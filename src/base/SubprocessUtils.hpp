#ifndef __PD_SUBPROCESS_UTILS__
#define __PD_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Captured result of a finished helper process.
 */
struct SubprocessResult {
  /** @brief Exit status, or 128 + signal when the child was killed. */
  int exitCode;
  /** @brief Everything the child wrote to stdout. */
  string output;
};

/**
 * @brief Utility class for executing short-lived helper commands (such as
 * tmux) and capturing their output.
 *
 * Virtual so tests can substitute canned results.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments (no shell) and captures its stdout.
   *
   * stderr of the child is discarded. Lookup of `command` follows PATH.
   * @throws std::runtime_error if the pipe or fork cannot be created.
   */
  virtual SubprocessResult run(const string& command,
                               const vector<string>& args);
};
}  // namespace pd

#endif  // __PD_SUBPROCESS_UTILS__
