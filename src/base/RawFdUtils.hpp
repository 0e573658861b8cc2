#ifndef __WB_RAW_FD_UTILS__
#define __WB_RAW_FD_UTILS__

#include "Headers.hpp"

namespace wb {
/**
 * @brief Blocking wrappers around POSIX read/write loops on a pty or pipe fd.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   * @throws std::runtime_error when the descriptor rejects the write.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true when a read will not block (data, EOF or an error is ready).
   */
  static bool waitForData(int fd, int timeoutMs);

  /**
   * @brief Single read that retries on EINTR.
   * @return Bytes read, 0 on EOF, -1 on error with errno preserved.
   */
  static ssize_t readSome(int fd, char* buf, size_t count);

  static void setCloseOnExec(int fd);

  /**
   * @brief pipe() with FD_CLOEXEC on both ends, atomically where the
   * platform has pipe2.
   * @return 0 on success, -1 with errno set otherwise.
   */
  static int createPipe(int fds[2]);

  /**
   * @brief Held by every fork site in the process from the moment it creates
   * descriptors until fork returns. No child ever inherits a descriptor that
   * another thread has not yet marked close-on-exec.
   */
  static mutex& forkMutex();
};
}  // namespace wb
#endif  // __WB_RAW_FD_UTILS__
