#ifndef __WB_PSEUDO_USER_TERMINAL_HPP__
#define __WB_PSEUDO_USER_TERMINAL_HPP__

#include "ShellCommand.hpp"
#include "TerminalTypes.hpp"
#include "UserTerminal.hpp"

namespace wb {
/**
 * @brief Opens a pty pair, runs a shell on the slave side and exposes the
 * master.
 */
class PseudoUserTerminal : public UserTerminal {
 public:
  /**
   * @brief Allocates a pty of `cols` x `rows` and execs `command` on it.
   * @throws SpawnError with PTY_ALLOCATION if no pty could be opened, or
   * PROCESS_SPAWN if fork or exec of the shell failed.
   */
  static shared_ptr<PseudoUserTerminal> spawn(const ShellCommand &command,
                                              int cols, int rows);

  virtual ~PseudoUserTerminal();

  virtual ssize_t readOutput(char *buf, size_t count, int timeoutMs);
  virtual void writeAll(const string &data);
  virtual void resize(int cols, int rows);
  virtual pid_t getPid() { return pid; }
  virtual void terminate(Millis grace);
  virtual int waitForExit();
  virtual bool hasExited() { return exited; }

  int getFd() { return masterFd; }

 protected:
  PseudoUserTerminal(int _masterFd, pid_t _pid);

  /** @brief Reaps the child without blocking, true once it has exited. */
  bool tryReap();
  void recordExit(int status);

  int masterFd;
  pid_t pid;
  bool exited;
  int exitCode;
};
}  // namespace wb

#endif  // __WB_PSEUDO_USER_TERMINAL_HPP__
