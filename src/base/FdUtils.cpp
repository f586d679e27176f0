#include "FdUtils.hpp"

namespace pd {
void FdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The pty buffer is full, give the child a moment to drain it
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(WARNING) << "Cannot write to fd " << fd << ": "
                   << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool FdUtils::waitForReadable(int fd, int timeoutMs) {
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    FATAL_FAIL(rc);
  }
  return rc > 0 && FD_ISSET(fd, &rfd);
}
void FdUtils::setCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

long FdUtils::maxDescriptor() {
  long maxFd = sysconf(_SC_OPEN_MAX);
  if (maxFd < 0) {
    maxFd = 1024;
  }
  return maxFd;
}

void FdUtils::closeFrom(int lowFd, long maxFd) {
  for (long fd = maxFd; fd >= lowFd; fd--) {
    ::close(int(fd));
  }
}
}  // namespace pd
