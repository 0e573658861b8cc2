#ifndef __WB_SESSION_REGISTRY__
#define __WB_SESSION_REGISTRY__

#include "Headers.hpp"
#include "UserTerminal.hpp"

namespace wb {
class OutputPipeline;

/**
 * @brief One live shell session.
 *
 * `sessionMutex` guards `terminal` as a unit (writer, master and child), so
 * writes, resizes, kills and signals on one session serialize against each
 * other but never against another session.
 */
struct PtySession {
  PtySession(const string &_id, shared_ptr<UserTerminal> _terminal)
      : id(_id), terminal(_terminal) {}

  const string id;
  mutex sessionMutex;
  shared_ptr<UserTerminal> terminal;
  /** @brief Reader/emitter/activity threads serving this session. */
  shared_ptr<OutputPipeline> pipeline;
};

/**
 * @brief Maps live session ids to their sessions and resolved project paths.
 *
 * Both maps always hold the same ids. The registry lock is only held long
 * enough to copy or move a pointer, never across I/O.
 */
class SessionRegistry {
 public:
  /**
   * @brief Registers a session.
   * @return false, leaving the registry untouched, if `id` is already live.
   */
  bool insert(const string &id, shared_ptr<PtySession> session,
              const string &projectPath);

  /** @brief Returns the session or nullptr when `id` is not live. */
  shared_ptr<PtySession> get(const string &id);

  /**
   * @brief Unregisters a session from both maps.
   * @return The removed session, or nullptr when another path got there
   * first.
   */
  shared_ptr<PtySession> remove(const string &id);

  optional<string> projectPathFor(const string &id);

  vector<string> ids();

  size_t size();

 protected:
  mutex registryMutex;
  unordered_map<string, shared_ptr<PtySession>> sessions;
  unordered_map<string, string> projectPaths;
};
}  // namespace wb

#endif  // __WB_SESSION_REGISTRY__
