#ifndef __WB_PTY_CONFIG__
#define __WB_PTY_CONFIG__

#include "Headers.hpp"
#include "PtyManager.hpp"
#include "SimpleIni.h"

namespace wb {
/**
 * @brief Everything wbterm-host can be configured with, before the command
 * line is applied on top.
 */
struct HostSettings {
  PtyManagerOptions manager;
  int verbose = 0;
  bool silent = false;
  // default max log file size is 20MB
  string maxLogSize = "20971520";
  string logDirectory = GetTempDirectory() + "wbterm";
};

/**
 * @brief Reads HostSettings from an INI file.
 *
 * [Terminal]
 *   shell, startup_delay_ms, quiet_window_ms, channel_capacity,
 *   read_buffer_size, fast_threshold_ms, coalesce_yield_ms, kill_grace_ms,
 *   hook_socket
 * [Debug]
 *   verbose, silent, logsize, logdir
 *
 * Keys that are absent keep their current value.
 */
class PtyConfig {
 public:
  /**
   * @throws std::runtime_error if the file cannot be read or a value is
   * malformed.
   */
  static void loadFile(const string &filename, HostSettings *settings);

  /** @throws std::runtime_error on a malformed value. */
  static void apply(const CSimpleIniA &ini, HostSettings *settings);

  /**
   * @brief Parses a whole decimal number in [minimum, maximum].
   * @throws std::runtime_error naming `section` and `key` otherwise.
   */
  static int64_t parseInteger(const string &section, const string &key,
                              const string &value, int64_t minimum,
                              int64_t maximum);
};
}  // namespace wb

#endif  // __WB_PTY_CONFIG__
