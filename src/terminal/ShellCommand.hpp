#ifndef __WB_SHELL_COMMAND__
#define __WB_SHELL_COMMAND__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"
#include "TerminalTypes.hpp"

namespace wb {
/**
 * @brief A fully resolved shell invocation: binary, argv tail, cwd and the
 * exact environment the child gets (nothing else is inherited).
 */
struct ShellCommand {
  string program;
  vector<string> args;
  string workingDirectory;
  vector<pair<string, string>> environment;
};

/** @brief $SHELL, or /bin/sh when it is unset or empty. */
string defaultShell();

/**
 * @brief Builds the curated environment for a session's shell.
 *
 * Only identity, locale and search-path variables are copied from the host,
 * terminal capabilities are fixed, and the session id plus the optional
 * side-channel address are added.
 */
vector<pair<string, string>> buildShellEnvironment(
    const string &sessionId, const string &shellPath,
    const optional<string> &hookSocketPath);

/** @brief Turns a spawn request into the command that will be exec'd. */
ShellCommand buildShellCommand(const SpawnRequest &request);

/**
 * @brief Maps a requested working directory to a canonical project path.
 */
class ProjectPathResolver {
 public:
  explicit ProjectPathResolver(shared_ptr<SubprocessUtils> _subprocessUtils)
      : subprocessUtils(_subprocessUtils) {}

  /**
   * @brief Returns the enclosing git toplevel, or nullopt when `path` is not
   * inside a work tree or git is unavailable.
   */
  optional<string> resolveRepoRoot(const string &path);

  /** @brief The repo root when known, otherwise `path` unchanged. */
  string resolveProjectPath(const string &path);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
};
}  // namespace wb

#endif  // __WB_SHELL_COMMAND__
