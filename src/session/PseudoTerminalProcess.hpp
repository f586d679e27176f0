#ifndef __PD_PSEUDO_TERMINAL_PROCESS__
#define __PD_PSEUDO_TERMINAL_PROCESS__

#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace pd {
/**
 * @brief Forks a pseudo-terminal, execs the requested program in it, and
 * pumps its output to the supplied callbacks from a dedicated reader thread.
 *
 * The child is reaped by the reader thread once the terminal hangs up, which
 * is also when `onExit` fires. Destroying a handle whose child is still
 * running kills the child with SIGKILL and suppresses `onExit`.
 */
class PseudoTerminalProcess : public ProcessHandle {
 public:
  /**
   * @throws std::runtime_error if forkpty fails.
   */
  PseudoTerminalProcess(const ProcessLaunchSpec& spec,
                        const ProcessCallbacks& callbacks);
  virtual ~PseudoTerminalProcess();

  virtual void write(const string& data);
  virtual void resize(int cols, int rows);
  virtual void kill();
  virtual pid_t getPid() { return childPid; }
  virtual bool isRunning() { return running; }
  inline int getMasterFd() const { return masterFd; }

 protected:
  /** @brief Reader thread body: drains the master fd until hangup. */
  void readLoop();
  /** @brief Blocks until the child is reaped and decodes its status. */
  void reapChild(int* exitCode, int* signal);

  ProcessCallbacks callbacks;
  /** @brief PID of the child spawned by `forkpty`. */
  pid_t childPid;
  /** @brief Master side of the pty. */
  int masterFd;
  /** @brief Cleared by the reader thread when the terminal hangs up. */
  std::atomic<bool> running;
  /** @brief Set by the destructor to stop the reader thread. */
  std::atomic<bool> halt;
  /** @brief Serializes writers so keystrokes from different viewers never
   * interleave mid-buffer. */
  mutex writeMutex;
  std::thread readerThread;
};

/**
 * @brief Launcher that produces real `PseudoTerminalProcess` instances.
 */
class PseudoTerminalLauncher : public ProcessLauncher {
 public:
  virtual shared_ptr<ProcessHandle> launch(const ProcessLaunchSpec& spec,
                                           const ProcessCallbacks& callbacks) {
    return make_shared<PseudoTerminalProcess>(spec, callbacks);
  }
};
}  // namespace pd

#endif  // __PD_PSEUDO_TERMINAL_PROCESS__
