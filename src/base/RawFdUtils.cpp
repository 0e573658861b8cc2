#include "RawFdUtils.hpp"

namespace wb {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
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
        // The pty input queue is full, give the shell a moment to drain it
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      throw std::runtime_error(string("Cannot write to terminal: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to terminal: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::waitForData(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0) {
    // Treat EINTR as a timeout, the caller polls again
    return GetErrno() != EINTR;
  }
  return rc > 0;
}

ssize_t RawFdUtils::readSome(int fd, char* buf, size_t count) {
  while (true) {
    ssize_t rc = ::read(fd, buf, count);
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    return rc;
  }
}

void RawFdUtils::setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  if (flags != -1) {
    fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }
}

int RawFdUtils::createPipe(int fds[2]) {
#if defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__) || \
    defined(__NetBSD__)
  return ::pipe2(fds, O_CLOEXEC);
#else
  // Callers hold forkMutex() so nobody forks in between
  if (::pipe(fds) == -1) {
    return -1;
  }
  setCloseOnExec(fds[0]);
  setCloseOnExec(fds[1]);
  return 0;
#endif
}

mutex& RawFdUtils::forkMutex() {
  static mutex m;
  return m;
}
}  // namespace wb
