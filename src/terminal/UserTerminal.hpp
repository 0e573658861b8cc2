#ifndef __WB_USER_TERMINAL_HPP__
#define __WB_USER_TERMINAL_HPP__

#include "Headers.hpp"

namespace wb {
/**
 * @brief A running shell attached to a terminal: the writer, the resizable
 * master and the child process of one session.
 *
 * Everything except `readOutput` is called with the owning session's lock
 * held. `readOutput` is only ever called from the session's reader thread.
 */
class UserTerminal {
 public:
  /** @brief `readOutput` result when no data arrived before the timeout. */
  static constexpr ssize_t READ_TIMEOUT = -2;

  virtual ~UserTerminal() {}

  /**
   * @brief Reads whatever output is available, waiting at most `timeoutMs`.
   * @return Bytes read, 0 at end of stream, -1 on a read error, or
   * READ_TIMEOUT.
   */
  virtual ssize_t readOutput(char *buf, size_t count, int timeoutMs) = 0;
  /**
   * @brief Writes all bytes to the terminal input.
   * @throws std::runtime_error if the terminal no longer accepts input.
   */
  virtual void writeAll(const string &data) = 0;
  /** @brief Applies new window dimensions to the terminal. */
  virtual void resize(int cols, int rows) = 0;
  /** @brief Returns the pid of the directly spawned shell. */
  virtual pid_t getPid() = 0;
  /**
   * @brief Asks the shell to exit, escalating to SIGKILL when it is still
   * alive after `grace`. A no-op once the child has been reaped.
   */
  virtual void terminate(Millis grace) = 0;
  /**
   * @brief Blocks until the shell has exited and returns 0 for a clean exit
   * or 1 for anything else. Safe to call more than once.
   */
  virtual int waitForExit() = 0;
  /**
   * @brief True once the shell has been reaped. Its pid may belong to
   * another process from then on.
   */
  virtual bool hasExited() = 0;
};
}  // namespace wb

#endif  // __WB_USER_TERMINAL_HPP__
