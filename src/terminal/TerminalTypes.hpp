#ifndef __WB_TERMINAL_TYPES__
#define __WB_TERMINAL_TYPES__

#include "Headers.hpp"

namespace wb {
/** @brief Environment variable carrying the session id into the shell. */
const char *const PANE_ID_ENV = "WORKBENCH_PANE_ID";
/** @brief Environment variable carrying the side-channel address. */
const char *const HOOK_SOCKET_ENV = "WORKBENCH_HOOK_SOCKET";

/**
 * @brief Everything needed to start one shell session.
 */
struct SpawnRequest {
  /** @brief Caller-chosen unique session id. */
  string id;
  /** @brief Directory the shell starts in. */
  string projectPath;
  /** @brief Shell binary, empty for the default shell. */
  string shell;
  int cols = 80;
  int rows = 24;
  /** @brief Written to the shell (plus a newline) shortly after startup. */
  optional<string> startupCommand;
  /** @brief Exported to the shell so its children can report back. */
  optional<string> hookSocketPath;
};

struct TerminalDataEvent {
  string sessionId;
  string data;
};

struct TerminalExitEvent {
  string sessionId;
  int exitCode;
  /** @brief Reserved, the manager never fills it in. */
  optional<int> signal;
};

struct TerminalActivityEvent {
  string sessionId;
  bool active;
};

/**
 * @brief Raised when an operation names a session id that is not live.
 */
class SessionNotFoundError : public std::runtime_error {
 public:
  explicit SessionNotFoundError(const string &sessionId)
      : std::runtime_error("Session not found: " + sessionId) {}
};

/**
 * @brief Raised when spawn is called with an id that is already live.
 */
class DuplicateSessionError : public std::runtime_error {
 public:
  explicit DuplicateSessionError(const string &sessionId)
      : std::runtime_error("Session already exists: " + sessionId) {}
};

/**
 * @brief Raised when a shell session could not be started.
 */
class SpawnError : public std::runtime_error {
 public:
  enum Kind {
    /** @brief The OS refused to hand out a pty pair. */
    PTY_ALLOCATION,
    /** @brief fork or exec of the shell failed. */
    PROCESS_SPAWN,
  };

  SpawnError(Kind _kind, const string &what)
      : std::runtime_error(what), kind(_kind) {}

  Kind getKind() const { return kind; }

 protected:
  Kind kind;
};
}  // namespace wb

#endif  // __WB_TERMINAL_TYPES__
