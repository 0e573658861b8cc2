#ifndef __WB_LOG_HANDLER__
#define __WB_LOG_HANDLER__

#include "Headers.hpp"

namespace wb {
/** @brief Where and how much the default logger writes. */
struct LogSettings {
  string directory;
  /** First part of every file name, e.g. "wbterm-host". */
  string prefix;
  /**
   * Mirror log lines on stdout. The host's stdout is its event stream, so
   * this is only for debugging by hand.
   */
  bool toStdout = false;
  /** Reopen stderr on a file next to the log. */
  bool captureStderr = false;
  /** Tag file names with the pid, several hosts can share a directory. */
  bool appendPid = false;
  int verbose = 0;
  /** Turns the default logger off entirely, no file is created. */
  bool silent = false;
  /** Bytes before easylogging++ rolls the file over. */
  string maxFileSize = "20971520";
};

/**
 * @brief easylogging++ setup shared by wbterm-host and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging++ and the plain "stdout" logger used for
   * --help and fatal startup errors.
   * @return The default logger's base configuration, to be passed to apply.
   */
  static el::Configurations init(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh file under
   * `settings.directory` and applies verbosity and rollout.
   * @return Path of the log file, empty when logging is silenced.
   * @throws std::runtime_error if the directory or file cannot be created.
   */
  static string apply(el::Configurations *conf, const LogSettings &settings);

  /**
   * @brief "<prefix>[-<kind>]-<local time>[_<pid>].log".
   */
  static string logFileName(const LogSettings &settings, const string &kind,
                            time_t when);

  /**
   * @brief Creates `directory` as needed and an empty, owner-only file in
   * it. Never follows or reuses an existing entry.
   * @throws std::runtime_error on any failure.
   */
  static string createLogFile(const string &directory, const string &filename);

  /** @brief Sets the global VLOG level, clamped to easylogging's range. */
  static void setVerbosity(int level);

 private:
  /** Pre-rollout callback. The log file is closed, nothing may log here. */
  static void removeRolledFile(const char *filename, std::size_t size);
};
}  // namespace wb
#endif  // __WB_LOG_HANDLER__
