#ifndef __PD_PROCESS_HANDLE__
#define __PD_PROCESS_HANDLE__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Everything needed to launch one pty-backed child process.
 */
struct ProcessLaunchSpec {
  /** @brief Absolute path of the executable. */
  string executable;
  /** @brief Arguments, not including argv[0]. */
  vector<string> args;
  /** @brief Directory the child starts in. */
  string workingDirectory;
  /** @brief Complete environment of the child. */
  map<string, string> environment;
  int cols = 120;
  int rows = 40;
};

/**
 * @brief Event sinks for a running process.
 *
 * `onData` is called for every chunk read from the terminal, in order.
 * `onExit` is called exactly once, after the last `onData`. Both run on the
 * process's reader thread.
 */
struct ProcessCallbacks {
  std::function<void(const string&)> onData;
  std::function<void(int exitCode, int signal)> onExit;
};

/**
 * @brief Abstract pseudo-terminal-backed child process.
 */
class ProcessHandle {
 public:
  virtual ~ProcessHandle() {}

  /**
   * @brief Writes raw bytes into the terminal.
   * @throws std::runtime_error if the bytes cannot be delivered.
   */
  virtual void write(const string& data) = 0;
  /**
   * @brief Applies a new window geometry.
   * @throws std::runtime_error once the process has exited.
   */
  virtual void resize(int cols, int rows) = 0;
  /** @brief Asks the process to terminate. Safe to call more than once. */
  virtual void kill() = 0;
  virtual pid_t getPid() = 0;
  /** @brief False once the exit event has been (or is being) delivered. */
  virtual bool isRunning() = 0;
};

/**
 * @brief Factory seam that turns a launch spec into a running process.
 */
class ProcessLauncher {
 public:
  virtual ~ProcessLauncher() {}
  /**
   * @throws std::runtime_error if the process could not be spawned.
   */
  virtual shared_ptr<ProcessHandle> launch(const ProcessLaunchSpec& spec,
                                           const ProcessCallbacks& callbacks) = 0;
};
}  // namespace pd

#endif  // __PD_PROCESS_HANDLE__
