#include "PtyConfig.hpp"

namespace wb {
namespace {
const int64_t MAX_MILLIS = 24 * 60 * 60 * 1000;

bool readInteger(const CSimpleIniA &ini, const char *section, const char *key,
                 int64_t minimum, int64_t maximum, int64_t *value) {
  const char *raw = ini.GetValue(section, key, NULL);
  if (!raw) {
    return false;
  }
  *value = PtyConfig::parseInteger(section, key, raw, minimum, maximum);
  return true;
}

bool readMillis(const CSimpleIniA &ini, const char *section, const char *key,
                int64_t minimum, Millis *value) {
  int64_t ms;
  if (!readInteger(ini, section, key, minimum, MAX_MILLIS, &ms)) {
    return false;
  }
  *value = Millis(ms);
  return true;
}
}  // namespace

void PtyConfig::loadFile(const string &filename, HostSettings *settings) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  apply(ini, settings);
}

void PtyConfig::apply(const CSimpleIniA &ini, HostSettings *settings) {
  PtyManagerOptions &manager = settings->manager;
  int64_t value;

  const char *shell = ini.GetValue("Terminal", "shell", NULL);
  if (shell && string(shell).length()) {
    manager.defaultShell = shell;
  }
  const char *hookSocket = ini.GetValue("Terminal", "hook_socket", NULL);
  if (hookSocket && string(hookSocket).length()) {
    manager.hookSocketPath = string(hookSocket);
  }

  readMillis(ini, "Terminal", "startup_delay_ms", 0,
             &manager.startupCommandDelay);
  readMillis(ini, "Terminal", "kill_grace_ms", 0, &manager.killGrace);
  readMillis(ini, "Terminal", "quiet_window_ms", 1,
             &manager.pipeline.quietWindow);
  readMillis(ini, "Terminal", "fast_threshold_ms", 0,
             &manager.pipeline.fastThreshold);
  readMillis(ini, "Terminal", "coalesce_yield_ms", 0,
             &manager.pipeline.coalesceYield);
  if (readInteger(ini, "Terminal", "channel_capacity", 1, 1 << 20, &value)) {
    manager.pipeline.channelCapacity = size_t(value);
  }
  if (readInteger(ini, "Terminal", "read_buffer_size", 1, 16 * 1024 * 1024,
                  &value)) {
    manager.pipeline.readBufferSize = size_t(value);
  }

  if (readInteger(ini, "Debug", "verbose", 0, 9, &value)) {
    settings->verbose = int(value);
  }
  if (readInteger(ini, "Debug", "silent", 0, 1, &value)) {
    settings->silent = (value != 0);
  }
  if (readInteger(ini, "Debug", "logsize", 0, INT64_MAX, &value) &&
      value != 0) {
    // make sure maxlogsize is a string of int value
    settings->maxLogSize = to_string(value);
  }
  const char *logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir && string(logdir).length()) {
    settings->logDirectory = logdir;
  }
}

int64_t PtyConfig::parseInteger(const string &section, const string &key,
                                const string &value, int64_t minimum,
                                int64_t maximum) {
  string trimmed = trim(value);
  int64_t result = 0;
  size_t consumed = 0;
  try {
    result = std::stoll(trimmed, &consumed);
  } catch (const std::logic_error &) {
    consumed = 0;
  }
  if (trimmed.empty() || consumed != trimmed.length() || result < minimum ||
      result > maximum) {
    throw std::runtime_error("Invalid value for [" + section + "] " + key +
                             ": '" + value + "'");
  }
  return result;
}
}  // namespace wb
