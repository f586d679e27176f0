#include "PseudoTerminalProcess.hpp"

#include "FdUtils.hpp"

#define BUF_SIZE (16 * 1024)

namespace pd {
PseudoTerminalProcess::PseudoTerminalProcess(const ProcessLaunchSpec& spec,
                                             const ProcessCallbacks& _callbacks)
    : callbacks(_callbacks),
      childPid(-1),
      masterFd(-1),
      running(false),
      halt(false) {
  // Everything the child needs is laid out before fork() so that the child
  // only calls async-signal-safe functions.
  vector<string> argStrings;
  argStrings.push_back(spec.executable);
  argStrings.insert(argStrings.end(), spec.args.begin(), spec.args.end());
  vector<char*> argv;
  for (auto& it : argStrings) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  vector<string> envStrings;
  for (const auto& it : spec.environment) {
    envStrings.push_back(it.first + "=" + it.second);
  }
  vector<char*> envp;
  for (auto& it : envStrings) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);

  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = spec.cols;
  win.ws_row = spec.rows;

  const char* cwd = spec.workingDirectory.c_str();
  const char* executable = spec.executable.c_str();
  long maxFd = FdUtils::maxDescriptor();

  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1: {
      string error = strerror(GetErrno());
      LOG(ERROR) << "forkpty failed: " << error;
      throw std::runtime_error("forkpty failed: " + error);
    }
    case 0: {
      if (::chdir(cwd) != 0) {
        static const char msg[] = "ptydock: cannot enter working directory\r\n";
        ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(126);
      }
      // Children of a process that ignores SIGCHLD inherit the ignored
      // disposition, which breaks anything in the child that waits on its
      // own subprocesses.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      // Descriptors the server opened on other threads (other sessions'
      // masters, subprocess pipes) stay with the server.
      FdUtils::closeFrom(STDERR_FILENO + 1, maxFd);
      execve(executable, argv.data(), envp.data());
      static const char msg[] = "ptydock: exec failed\r\n";
      ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
      _exit(127);
    }
    default: {
      // parent
      childPid = pid;
      running = true;
      FdUtils::setCloseOnExec(masterFd);
      VLOG(1) << "pty opened " << masterFd << " for pid " << childPid << " ("
              << spec.executable << ")";
      break;
    }
  }

  readerThread = std::thread(&PseudoTerminalProcess::readLoop, this);
}

PseudoTerminalProcess::~PseudoTerminalProcess() {
  halt = true;
  if (running) {
    ::kill(childPid, SIGKILL);
  }
  if (readerThread.joinable()) {
    if (readerThread.get_id() == std::this_thread::get_id()) {
      LOG(WARNING) << "Process handle " << childPid
                   << " destroyed from its own reader thread";
      readerThread.detach();
    } else {
      readerThread.join();
    }
  }
  if (masterFd >= 0) {
    ::close(masterFd);
  }
}

void PseudoTerminalProcess::readLoop() {
  el::Helpers::setThreadName(string("pty-") + to_string(childPid));
  char b[BUF_SIZE];
  while (!halt) {
    if (!FdUtils::waitForReadable(masterFd, 100)) {
      continue;
    }
    ssize_t rc = ::read(masterFd, b, BUF_SIZE);
    if (rc > 0) {
      if (callbacks.onData) {
        try {
          callbacks.onData(string(b, rc));
        } catch (const std::exception& ex) {
          STERROR << "Data handler for pid " << childPid
                  << " threw: " << ex.what();
        }
      }
      continue;
    }
    if (rc < 0 && (GetErrno() == EINTR || GetErrno() == EAGAIN)) {
      continue;
    }
    // EOF, or EIO on Linux once the slave side has no more writers.
    VLOG(1) << "Terminal for pid " << childPid << " hung up";
    break;
  }

  int exitCode = 0;
  int signal = 0;
  reapChild(&exitCode, &signal);
  running = false;
  if (halt) {
    return;
  }
  LOG(INFO) << "Process " << childPid << " exited with code " << exitCode
            << ", signal " << signal;
  if (callbacks.onExit) {
    try {
      callbacks.onExit(exitCode, signal);
    } catch (const std::exception& ex) {
      STERROR << "Exit handler for pid " << childPid << " threw: " << ex.what();
    }
  }
}

void PseudoTerminalProcess::reapChild(int* exitCode, int* signal) {
  int status = 0;
  while (true) {
    pid_t rc = waitpid(childPid, &status, 0);
    if (rc == childPid) {
      break;
    }
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (rc < 0 && GetErrno() == ECHILD) {
      // Someone else reaped it (e.g. a SIGCHLD handler in the host program)
      LOG(WARNING) << "Child " << childPid << " was already reaped";
      *exitCode = -1;
      *signal = 0;
      return;
    }
    FATAL_FAIL(rc);
  }
  if (WIFEXITED(status)) {
    *exitCode = WEXITSTATUS(status);
    *signal = 0;
  } else if (WIFSIGNALED(status)) {
    *exitCode = -1;
    *signal = WTERMSIG(status);
  }
}

void PseudoTerminalProcess::write(const string& data) {
  if (!running) {
    throw std::runtime_error("Process has exited");
  }
  lock_guard<mutex> guard(writeMutex);
  FdUtils::writeAll(masterFd, data.c_str(), data.length());
}

void PseudoTerminalProcess::resize(int cols, int rows) {
  if (!running) {
    throw std::runtime_error("Cannot resize: process has exited");
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw std::runtime_error(string("Cannot resize: ") + strerror(GetErrno()));
  }
}

void PseudoTerminalProcess::kill() {
  if (!running) {
    return;
  }
  // forkpty made the child a session leader, so signal the whole group.
  if (::kill(-childPid, SIGHUP) == -1 && ::kill(childPid, SIGHUP) == -1) {
    LOG(WARNING) << "Could not signal pid " << childPid << ": "
                 << strerror(GetErrno());
  }
}
}  // namespace pd
