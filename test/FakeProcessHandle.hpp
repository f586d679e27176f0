#ifndef __PD_FAKE_PROCESS_HANDLE__
#define __PD_FAKE_PROCESS_HANDLE__

#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace pd {
/**
 * @brief Scripted process: tests push output and exits through it and
 * inspect what was written and resized.
 */
class FakeProcessHandle : public ProcessHandle {
 public:
  FakeProcessHandle(const ProcessLaunchSpec& _spec,
                    const ProcessCallbacks& _callbacks, pid_t _pid)
      : spec(_spec),
        callbacks(_callbacks),
        pid(_pid),
        running(true),
        failWrites(false),
        exitOnKill(true),
        killCount(0),
        cols(_spec.cols),
        rows(_spec.rows) {}

  virtual void write(const string& data) {
    lock_guard<recursive_mutex> guard(fakeMutex);
    if (!running || failWrites) {
      throw std::runtime_error("Broken pipe");
    }
    written += data;
  }

  virtual void resize(int _cols, int _rows) {
    lock_guard<recursive_mutex> guard(fakeMutex);
    if (!running) {
      throw std::runtime_error("Cannot resize: process has exited");
    }
    cols = _cols;
    rows = _rows;
  }

  virtual void kill() {
    killCount++;
    if (exitOnKill && running) {
      exit(0, SIGHUP);
    }
  }

  virtual pid_t getPid() { return pid; }
  virtual bool isRunning() { return running; }

  /** @brief Delivers a chunk as if the terminal produced it. */
  void emitData(const string& chunk) {
    if (callbacks.onData) {
      callbacks.onData(chunk);
    }
  }

  /** @brief Delivers the exit event once. */
  void exit(int exitCode, int signal) {
    if (!running.exchange(false)) {
      return;
    }
    if (callbacks.onExit) {
      callbacks.onExit(exitCode, signal);
    }
  }

  string getWritten() {
    lock_guard<recursive_mutex> guard(fakeMutex);
    return written;
  }

  ProcessLaunchSpec spec;
  ProcessCallbacks callbacks;
  pid_t pid;
  std::atomic<bool> running;
  std::atomic<bool> failWrites;
  bool exitOnKill;
  std::atomic<int> killCount;
  int cols;
  int rows;

 protected:
  recursive_mutex fakeMutex;
  string written;
};

class FakeProcessLauncher : public ProcessLauncher {
 public:
  FakeProcessLauncher() : failNext(false), nextPid(1000) {}

  virtual shared_ptr<ProcessHandle> launch(const ProcessLaunchSpec& spec,
                                           const ProcessCallbacks& callbacks) {
    lock_guard<mutex> guard(launcherMutex);
    if (failNext) {
      failNext = false;
      throw std::runtime_error("forkpty failed: Resource temporarily unavailable");
    }
    auto handle = make_shared<FakeProcessHandle>(spec, callbacks, nextPid++);
    launched.push_back(handle);
    return handle;
  }

  int launchCount() {
    lock_guard<mutex> guard(launcherMutex);
    return int(launched.size());
  }

  shared_ptr<FakeProcessHandle> last() {
    lock_guard<mutex> guard(launcherMutex);
    return launched.empty() ? shared_ptr<FakeProcessHandle>()
                            : launched.back();
  }

  bool failNext;

 protected:
  mutex launcherMutex;
  pid_t nextPid;
  vector<shared_ptr<FakeProcessHandle>> launched;
};
}  // namespace pd

#endif  // __PD_FAKE_PROCESS_HANDLE__
