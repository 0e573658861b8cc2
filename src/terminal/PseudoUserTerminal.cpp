#include "PseudoUserTerminal.hpp"

#include "RawFdUtils.hpp"

namespace wb {
namespace {
unsigned short clampDimension(int value) {
  return (unsigned short)std::max(1, std::min(65535, value));
}

/**
 * Runs in the forked child. Only async-signal-safe calls from here on, the
 * parent may have other threads holding locks.
 */
void execShell(int slaveFd, int errorPipe, const char *program,
               char *const *argv, char *const *envp,
               const char *workingDirectory, const char *homeDirectory) {
  if (login_tty(slaveFd) == -1) {
    int err = errno;
    (void)!::write(errorPipe, &err, sizeof(err));
    _exit(127);
  }
  if (workingDirectory[0] == '\0' || chdir(workingDirectory) == -1) {
    if (homeDirectory[0] != '\0') {
      (void)!chdir(homeDirectory);
    }
  }

  // bash will not reset SIGCHLD to SIG_DFL when run, remembering the current
  // disposition as the "original value". If ours were SIG_IGN, nothing inside
  // the shell could get SIG_DFL back and programs that expect to reap their
  // own children (Python2's popen for one) break. Restore every signal the
  // host may have changed before exec'ing.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  signal(SIGQUIT, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  sigset_t emptyMask;
  sigemptyset(&emptyMask);
  sigprocmask(SIG_SETMASK, &emptyMask, NULL);

  execve(program, argv, envp);
  int err = errno;
  (void)!::write(errorPipe, &err, sizeof(err));
  _exit(127);
}
}  // namespace

shared_ptr<PseudoUserTerminal> PseudoUserTerminal::spawn(
    const ShellCommand &command, int cols, int rows) {
  winsize size;
  memset(&size, 0, sizeof(size));
  size.ws_col = clampDimension(cols);
  size.ws_row = clampDimension(rows);

  // openpty has no close-on-exec flag. Until both ends are marked, no other
  // thread may fork.
  unique_lock<mutex> forkGuard(RawFdUtils::forkMutex());
  int masterFd = -1;
  int slaveFd = -1;
  if (openpty(&masterFd, &slaveFd, NULL, NULL, &size) == -1) {
    throw SpawnError(SpawnError::PTY_ALLOCATION,
                     string("Failed to open PTY: ") + strerror(GetErrno()));
  }
  RawFdUtils::setCloseOnExec(masterFd);
  RawFdUtils::setCloseOnExec(slaveFd);

  // The write end closes on a successful exec
  int errorPipe[2];
  if (RawFdUtils::createPipe(errorPipe) == -1) {
    int err = GetErrno();
    close(masterFd);
    close(slaveFd);
    throw SpawnError(SpawnError::PROCESS_SPAWN,
                     string("Failed to spawn shell: ") + strerror(err));
  }

  // Everything the child needs is built before fork.
  vector<char *> argv;
  argv.push_back(const_cast<char *>(command.program.c_str()));
  for (const auto &arg : command.args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(NULL);
  vector<string> envStrings;
  string homeDirectory;
  for (const auto &it : command.environment) {
    envStrings.push_back(it.first + "=" + it.second);
    if (it.first == "HOME") {
      homeDirectory = it.second;
    }
  }
  vector<char *> envp;
  for (auto &it : envStrings) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    close(masterFd);
    close(errorPipe[0]);
    execShell(slaveFd, errorPipe[1], command.program.c_str(), argv.data(),
              envp.data(), command.workingDirectory.c_str(),
              homeDirectory.c_str());
  }

  int forkErrno = GetErrno();
  forkGuard.unlock();
  close(slaveFd);
  close(errorPipe[1]);
  if (pid < 0) {
    close(errorPipe[0]);
    close(masterFd);
    throw SpawnError(SpawnError::PROCESS_SPAWN,
                     string("Failed to fork shell: ") + strerror(forkErrno));
  }

  // The pipe closes on a successful exec, otherwise it carries errno.
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  close(errorPipe[0]);
  if (rc > 0) {
    int status;
    while (waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    close(masterFd);
    throw SpawnError(SpawnError::PROCESS_SPAWN,
                     "Failed to spawn shell " + command.program + ": " +
                         strerror(childErrno));
  }

  VLOG(1) << "pty opened " << masterFd << " for " << command.program
          << " pid " << pid;
#ifdef WITH_UTEMPTER
  {
    char buf[1024];
    snprintf(buf, sizeof(buf), "wbterm [%lld]", (long long)pid);
    utempter_add_record(masterFd, buf);
  }
#endif
  return shared_ptr<PseudoUserTerminal>(new PseudoUserTerminal(masterFd, pid));
}

PseudoUserTerminal::PseudoUserTerminal(int _masterFd, pid_t _pid)
    : masterFd(_masterFd), pid(_pid), exited(false), exitCode(1) {}

PseudoUserTerminal::~PseudoUserTerminal() {
  if (!exited) {
    // Never leave a zombie or an orphaned shell behind
    terminate(Millis(0));
    waitForExit();
  }
#ifdef WITH_UTEMPTER
  utempter_remove_record(masterFd);
#endif
  close(masterFd);
}

ssize_t PseudoUserTerminal::readOutput(char *buf, size_t count,
                                       int timeoutMs) {
  if (!RawFdUtils::waitForData(masterFd, timeoutMs)) {
    return READ_TIMEOUT;
  }
  ssize_t rc = RawFdUtils::readSome(masterFd, buf, count);
  if (rc < 0 && (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK)) {
    return READ_TIMEOUT;
  }
  return rc;
}

void PseudoUserTerminal::writeAll(const string &data) {
  RawFdUtils::writeAll(masterFd, data.c_str(), data.length());
}

void PseudoUserTerminal::resize(int cols, int rows) {
  winsize tmpwin;
  tmpwin.ws_row = clampDimension(rows);
  tmpwin.ws_col = clampDimension(cols);
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw std::runtime_error(string("Failed to resize terminal: ") +
                             strerror(GetErrno()));
  }
}

void PseudoUserTerminal::terminate(Millis grace) {
  if (exited || tryReap()) {
    return;
  }
  if (::kill(pid, SIGHUP) == -1) {
    VLOG(1) << "SIGHUP to " << pid << " failed: " << strerror(GetErrno());
  }
  auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (tryReap()) {
      return;
    }
    std::this_thread::sleep_for(Millis(10));
  }
  if (tryReap()) {
    return;
  }
  VLOG(1) << "Shell " << pid << " ignored SIGHUP, sending SIGKILL";
  if (::kill(pid, SIGKILL) == -1) {
    VLOG(1) << "SIGKILL to " << pid << " failed: " << strerror(GetErrno());
  }
}

int PseudoUserTerminal::waitForExit() {
  if (exited) {
    return exitCode;
  }
  int status = 0;
  while (true) {
    pid_t rc = waitpid(pid, &status, 0);
    if (rc == pid) {
      recordExit(status);
      break;
    }
    if (rc == -1 && GetErrno() == EINTR) {
      continue;
    }
    // ECHILD: somebody else reaped it, the status is gone
    LOG(WARNING) << "waitpid on " << pid
                 << " failed: " << strerror(GetErrno());
    exited = true;
    exitCode = 1;
    break;
  }
  return exitCode;
}

bool PseudoUserTerminal::tryReap() {
  int status = 0;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == pid) {
    recordExit(status);
    return true;
  }
  if (rc == -1 && GetErrno() == ECHILD) {
    exited = true;
    exitCode = 1;
    return true;
  }
  return false;
}

void PseudoUserTerminal::recordExit(int status) {
  exited = true;
  exitCode = (WIFEXITED(status) && WEXITSTATUS(status) == 0) ? 0 : 1;
  VLOG(1) << "Shell " << pid << " exited with status " << status;
}
}  // namespace wb
