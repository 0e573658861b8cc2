#include "PtyManager.hpp"

#include "PseudoUserTerminal.hpp"

namespace wb {
namespace {
shared_ptr<UserTerminal> spawnPseudoTerminal(const ShellCommand &command,
                                             int cols, int rows) {
  return PseudoUserTerminal::spawn(command, cols, rows);
}
}  // namespace

PtyManager::PtyManager(shared_ptr<TerminalEventSink> _sink,
                       const PtyManagerOptions &_options,
                       shared_ptr<ProcessTree> _processTree,
                       shared_ptr<SubprocessUtils> _subprocessUtils,
                       TerminalFactory _terminalFactory)
    : sink(_sink),
      options(_options),
      processTree(_processTree ? _processTree : ProcessTree::createNative()),
      projectPathResolver(_subprocessUtils
                              ? _subprocessUtils
                              : shared_ptr<SubprocessUtils>(
                                    new SubprocessUtils())),
      terminalFactory(_terminalFactory ? _terminalFactory
                                       : TerminalFactory(spawnPseudoTerminal)) {
}

PtyManager::~PtyManager() {
  for (const auto &id : registry.ids()) {
    kill(id);
  }
  list<shared_ptr<OutputPipeline>> remaining;
  {
    lock_guard<mutex> guard(pipelinesMutex);
    remaining.swap(pipelines);
  }
  for (auto &it : remaining) {
    it->join();
  }
}

void PtyManager::spawn(const SpawnRequest &request) {
  reapFinishedPipelines();
  if (registry.get(request.id)) {
    throw DuplicateSessionError(request.id);
  }

  SpawnRequest effective = request;
  if (effective.shell.empty()) {
    effective.shell = options.defaultShell;
  }
  if (!effective.hookSocketPath) {
    effective.hookSocketPath = options.hookSocketPath;
  }
  string projectPath =
      projectPathResolver.resolveProjectPath(request.projectPath);
  ShellCommand command = buildShellCommand(effective);

  LOG(INFO) << "Spawning " << command.program << " for " << request.id
            << " in " << request.projectPath << " (" << request.cols << "x"
            << request.rows << ")";
  shared_ptr<UserTerminal> terminal =
      terminalFactory(command, request.cols, request.rows);

  auto session = make_shared<PtySession>(request.id, terminal);
  auto pipeline = make_shared<OutputPipeline>(
      request.id, terminal, sink, options.pipeline,
      [this](const string &sessionId) { handleEndOfStream(sessionId); });
  session->pipeline = pipeline;

  if (!registry.insert(request.id, session, projectPath)) {
    // Lost a race with a concurrent spawn of the same id
    terminal->terminate(Millis(0));
    terminal->waitForExit();
    throw DuplicateSessionError(request.id);
  }
  {
    lock_guard<mutex> guard(pipelinesMutex);
    pipelines.push_back(pipeline);
  }

  if (request.startupCommand && !request.startupCommand->empty()) {
    weak_ptr<PtySession> weakSession = session;
    string startupCommand = *request.startupCommand;
    pipeline->runAfter(options.startupCommandDelay,
                       [this, weakSession, startupCommand]() {
                         auto session = weakSession.lock();
                         if (session) {
                           writeStartupCommand(session, startupCommand);
                         }
                       });
  }
  pipeline->start();
}

void PtyManager::write(const string &sessionId, const string &data) {
  auto session = getSessionOrThrow(sessionId);
  lock_guard<mutex> guard(session->sessionMutex);
  session->terminal->writeAll(data);
}

void PtyManager::resize(const string &sessionId, int cols, int rows) {
  auto session = getSessionOrThrow(sessionId);
  lock_guard<mutex> guard(session->sessionMutex);
  session->terminal->resize(cols, rows);
}

void PtyManager::kill(const string &sessionId) {
  auto session = registry.remove(sessionId);
  if (!session) {
    VLOG(1) << "Kill for " << sessionId << " after it already ended";
    return;
  }
  LOG(INFO) << "Killing session " << sessionId;
  finishSession(session);
}

void PtyManager::signalForeground(const string &sessionId) {
  auto session = getSessionOrThrow(sessionId);
  // Held throughout so the shell cannot be reaped (and its pid reused) while
  // we are signaling its children
  lock_guard<mutex> guard(session->sessionMutex);
  if (session->terminal->hasExited()) {
    // A concurrent kill reaped it before we got the lock
    VLOG(1) << "Shell of " << sessionId << " already exited, not interrupting";
    return;
  }
  pid_t shellPid = session->terminal->getPid();
  vector<pid_t> children;
  try {
    children = processTree->childrenOf(shellPid);
  } catch (const std::runtime_error &re) {
    LOG(WARNING) << "Cannot list children of " << shellPid << " for "
                 << sessionId << ": " << re.what();
    return;
  }
  if (children.empty()) {
    VLOG(1) << "No foreground process under " << shellPid << " for "
            << sessionId;
  }
  for (auto child : children) {
    if (::kill(child, SIGINT) == -1) {
      VLOG(1) << "SIGINT to " << child << " failed: " << strerror(GetErrno());
    } else {
      VLOG(1) << "Sent SIGINT to " << child << " for " << sessionId;
    }
  }
}

shared_ptr<PtySession> PtyManager::getSessionOrThrow(const string &sessionId) {
  auto session = registry.get(sessionId);
  if (!session) {
    throw SessionNotFoundError(sessionId);
  }
  return session;
}

void PtyManager::handleEndOfStream(const string &sessionId) {
  auto session = registry.remove(sessionId);
  if (!session) {
    // kill() removed it first and already reported the exit
    return;
  }
  LOG(INFO) << "Session " << sessionId << " ended";
  finishSession(session);
}

void PtyManager::finishSession(shared_ptr<PtySession> session) {
  TerminalExitEvent event;
  event.sessionId = session->id;
  {
    lock_guard<mutex> guard(session->sessionMutex);
    if (session->pipeline) {
      session->pipeline->requestStop();
    }
    session->terminal->terminate(options.killGrace);
    event.exitCode = session->terminal->waitForExit();
  }
  VLOG(1) << "Session " << session->id << " exit code " << event.exitCode;
  emitBestEffort(sink, event, &TerminalEventSink::onExit);
}

void PtyManager::writeStartupCommand(shared_ptr<PtySession> session,
                                     const string &command) {
  lock_guard<mutex> guard(session->sessionMutex);
  try {
    session->terminal->writeAll(command + "\n");
  } catch (const std::runtime_error &re) {
    LOG(WARNING) << "Startup command for " << session->id
                 << " was not delivered: " << re.what();
  }
}

void PtyManager::reapFinishedPipelines() {
  list<shared_ptr<OutputPipeline>> finished;
  {
    lock_guard<mutex> guard(pipelinesMutex);
    for (auto it = pipelines.begin(); it != pipelines.end();) {
      if ((*it)->isFinished()) {
        finished.push_back(*it);
        it = pipelines.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &it : finished) {
    it->join();
  }
}
}  // namespace wb
