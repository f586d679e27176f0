#include "SubprocessUtils.hpp"

#include "FdUtils.hpp"

namespace pd {
SubprocessResult SubprocessUtils::run(const string& command,
                                      const vector<string>& args) {
  int link[2];
  char buf[4096];
#if __APPLE__
  int rc = pipe(link);
#else
  // Close-on-exec from the start: a pty child forked by another thread must
  // not keep the write end open.
  int rc = pipe2(link, O_CLOEXEC);
#endif
  if (rc == -1) {
    throw std::runtime_error(string("pipe() failed: ") + strerror(GetErrno()));
  }
#if __APPLE__
  FdUtils::setCloseOnExec(link[0]);
  FdUtils::setCloseOnExec(link[1]);
#endif
  long maxFd = FdUtils::maxDescriptor();

  // Build argv before forking so the child only calls async-signal-safe
  // functions.
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid < 0) {
    ::close(link[0]);
    ::close(link[1]);
    throw std::runtime_error(string("fork() failed: ") + strerror(GetErrno()));
  }
  if (pid == 0) {
    // child process
    dup2(link[1], STDOUT_FILENO);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
    }
    // Also drops the pipe: dup2 cleared close-on-exec on stdout only
    FdUtils::closeFrom(STDERR_FILENO + 1, maxFd);
    execvp(command.c_str(), argv.data());
    _exit(127);
  }

  // parent process
  ::close(link[1]);
  SubprocessResult result;
  while (true) {
    ssize_t nbytes = ::read(link[0], buf, sizeof(buf));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    result.output.append(buf, nbytes);
  }
  ::close(link[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (GetErrno() != EINTR) {
      throw std::runtime_error(string("waitpid() failed: ") +
                               strerror(GetErrno()));
    }
  }
  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  } else {
    result.exitCode = -1;
  }
  VLOG(2) << "Subprocess " << command << " exited with " << result.exitCode;
  return result;
}
}  // namespace pd
