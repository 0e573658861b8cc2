#ifndef __WB_SUBPROCESS_UTILS__
#define __WB_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace wb {
/**
 * @brief Utility class for executing short-lived subprocesses and capturing
 * their output.
 *
 * Virtual so that tests can substitute canned results for commands such as
 * `git rev-parse`.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments (no shell) inside
   * `workingDirectory` and captures its stdout. stderr is discarded.
   * @return The captured stdout, or nullopt when the command could not be
   * started or exited with a non-zero status.
   */
  virtual optional<string> runCapturingStdout(const string& command,
                                              const vector<string>& args,
                                              const string& workingDirectory);
};
}  // namespace wb

#endif  // __WB_SUBPROCESS_UTILS__
