#ifndef __PD_FD_UTILS__
#define __PD_FD_UTILS__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Blocking wrappers around POSIX read/write loops on raw descriptors.
 */
class FdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN/EINTR.
   * @throws std::runtime_error when the descriptor is invalid or closed.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true if data (or EOF) is ready to be read.
   */
  static bool waitForReadable(int fd, int timeoutMs);

  /** @brief Sets FD_CLOEXEC so exec'd children never inherit the
   * descriptor. */
  static void setCloseOnExec(int fd);

  /**
   * @brief Upper bound for `closeFrom`. Call before fork(): sysconf is not
   * async-signal-safe.
   */
  static long maxDescriptor();

  /**
   * @brief Closes every descriptor from `lowFd` through `maxFd`. Only makes
   * async-signal-safe calls, for use between fork() and exec().
   */
  static void closeFrom(int lowFd, long maxFd);
};
}  // namespace pd
#endif  // __PD_FD_UTILS__
