#ifndef __WB_PTY_MANAGER__
#define __WB_PTY_MANAGER__

#include "Headers.hpp"
#include "OutputPipeline.hpp"
#include "ProcessTree.hpp"
#include "SessionRegistry.hpp"
#include "ShellCommand.hpp"
#include "SubprocessUtils.hpp"
#include "TerminalEventSink.hpp"
#include "TerminalTypes.hpp"
#include "UserTerminal.hpp"

namespace wb {
/**
 * @brief Knobs for the session manager. The defaults are what the host
 * uses when no config file overrides them.
 */
struct PtyManagerOptions {
  PipelineOptions pipeline;
  /** @brief Wait before typing the startup command into a new shell. */
  Millis startupCommandDelay = Millis(300);
  /** @brief Time a killed shell gets between SIGHUP and SIGKILL. */
  Millis killGrace = Millis(250);
  /** @brief Used when a spawn request names no shell. */
  string defaultShell;
  /** @brief Used when a spawn request carries no side-channel address. */
  optional<string> hookSocketPath;
};

/**
 * @brief Starts a shell on a new pty. Replaced in tests by scripted
 * terminals.
 */
typedef std::function<shared_ptr<UserTerminal>(const ShellCommand &command,
                                               int cols, int rows)>
    TerminalFactory;

/**
 * @brief Owns every live shell session.
 *
 * Lookups hold the registry lock only briefly, and each session has its own
 * lock, so operations on one terminal never block another. Every session
 * ends with exactly one exit event, whether its shell exited on its own or
 * it was killed.
 */
class PtyManager {
 public:
  PtyManager(shared_ptr<TerminalEventSink> _sink,
             const PtyManagerOptions &_options = PtyManagerOptions(),
             shared_ptr<ProcessTree> _processTree = nullptr,
             shared_ptr<SubprocessUtils> _subprocessUtils = nullptr,
             TerminalFactory _terminalFactory = nullptr);

  /** @brief Kills every remaining session and joins all session threads. */
  ~PtyManager();

  /**
   * @brief Starts a shell session. The session is registered before any of
   * its threads run, so it is visible to every call made after this returns.
   * @throws SpawnError if the pty or the shell could not be started.
   * @throws DuplicateSessionError if `request.id` is already live.
   */
  void spawn(const SpawnRequest &request);

  /**
   * @brief Sends keystrokes to a session's shell.
   * @throws SessionNotFoundError if the session is not live.
   */
  void write(const string &sessionId, const string &data);

  /**
   * @brief Changes a session's terminal dimensions.
   * @throws SessionNotFoundError if the session is not live.
   */
  void resize(const string &sessionId, int cols, int rows);

  /**
   * @brief Terminates a session and emits its exit event. Succeeds without
   * doing anything when the session already ended.
   */
  void kill(const string &sessionId);

  /**
   * @brief Sends SIGINT straight to every direct child of the session's
   * shell. Enumeration and delivery failures are logged and ignored.
   * @throws SessionNotFoundError if the session is not live.
   */
  void signalForeground(const string &sessionId);

  /** @brief Resolved project directory of a live session. */
  optional<string> projectPathForSession(const string &sessionId) {
    return registry.projectPathFor(sessionId);
  }

  vector<string> sessionIds() { return registry.ids(); }

 protected:
  shared_ptr<TerminalEventSink> sink;
  PtyManagerOptions options;
  shared_ptr<ProcessTree> processTree;
  ProjectPathResolver projectPathResolver;
  TerminalFactory terminalFactory;
  SessionRegistry registry;

  /** @brief Pipelines that may still have running threads. */
  mutex pipelinesMutex;
  list<shared_ptr<OutputPipeline>> pipelines;

  shared_ptr<PtySession> getSessionOrThrow(const string &sessionId);
  /** @brief Called by a pipeline once its output has ended naturally. */
  void handleEndOfStream(const string &sessionId);
  /**
   * @brief Stops and reaps a session that was just removed from the
   * registry, then emits its exit event.
   */
  void finishSession(shared_ptr<PtySession> session);
  void writeStartupCommand(shared_ptr<PtySession> session,
                           const string &command);
  /** @brief Joins and forgets pipelines whose threads have all returned. */
  void reapFinishedPipelines();
};
}  // namespace wb

#endif  // __WB_PTY_MANAGER__
