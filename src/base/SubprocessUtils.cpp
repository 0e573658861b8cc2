#include "SubprocessUtils.hpp"

#include "RawFdUtils.hpp"

namespace wb {
optional<string> SubprocessUtils::runCapturingStdout(
    const string& command, const vector<string>& args,
    const string& workingDirectory) {
  int link_client[2];
  char buf_client[4096];
  unique_lock<mutex> forkGuard(RawFdUtils::forkMutex());
  if (RawFdUtils::createPipe(link_client) == -1) {
    LOG(WARNING) << "pipe() failed for " << command << ": "
                 << strerror(GetErrno());
    return nullopt;
  }

  vector<char*> argsArray;
  argsArray.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process, dup2 clears close-on-exec on the new stdout
    dup2(link_client[1], STDOUT_FILENO);
    close(link_client[0]);
    close(link_client[1]);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
      close(devNull);
    }
    if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) == -1) {
      _exit(127);
    }
    execvp(command.c_str(), argsArray.data());
    _exit(127);
  } else if (pid < 0) {
    LOG(WARNING) << "Failed to fork for " << command << ": "
                 << strerror(GetErrno());
    close(link_client[0]);
    close(link_client[1]);
    return nullopt;
  }

  // parent process
  forkGuard.unlock();
  close(link_client[1]);
  string output;
  while (true) {
    ssize_t nbytes = read(link_client[0], buf_client, sizeof(buf_client));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    output.append(buf_client, nbytes);
  }
  close(link_client[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      VLOG(1) << "waitpid failed for " << command << ": "
              << strerror(GetErrno());
      return nullopt;
    }
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    VLOG(1) << command << " exited with status " << status;
    return nullopt;
  }
  return output;
}
}  // namespace wb
