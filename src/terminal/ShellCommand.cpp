#include "ShellCommand.hpp"

namespace wb {
namespace {
const char *const DEFAULT_LANG = "en_US.UTF-8";

/** @brief Host variables a shell needs to behave like a login session. */
const char *const INHERITED_ENV[] = {"PATH",   "HOME",     "USER",
                                     "LOGNAME", "TMPDIR",  "LC_ALL",
                                     "LC_CTYPE"};

optional<string> hostEnv(const char *name) {
  const char *value = ::getenv(name);
  if (value == NULL) {
    return nullopt;
  }
  return string(value);
}
}  // namespace

string defaultShell() {
  auto shell = hostEnv("SHELL");
  if (!shell || shell->empty()) {
    return "/bin/sh";
  }
  return *shell;
}

vector<pair<string, string>> buildShellEnvironment(
    const string &sessionId, const string &shellPath,
    const optional<string> &hookSocketPath) {
  vector<pair<string, string>> env;
  for (const char *name : INHERITED_ENV) {
    auto value = hostEnv(name);
    if (value) {
      env.emplace_back(name, *value);
    }
  }
  if (!hostEnv("PATH")) {
    env.emplace_back("PATH", "/usr/local/bin:/usr/bin:/bin");
  }
  env.emplace_back("SHELL", shellPath);
  env.emplace_back("LANG", hostEnv("LANG").value_or(DEFAULT_LANG));
  env.emplace_back("TERM", "xterm-256color");
  env.emplace_back("COLORTERM", "truecolor");
  env.emplace_back(PANE_ID_ENV, sessionId);
  if (hookSocketPath && !hookSocketPath->empty()) {
    env.emplace_back(HOOK_SOCKET_ENV, *hookSocketPath);
  }
  return env;
}

ShellCommand buildShellCommand(const SpawnRequest &request) {
  ShellCommand command;
  command.program = request.shell.empty() ? defaultShell() : request.shell;
  command.args.push_back("-l");
  command.workingDirectory = request.projectPath;
  command.environment = buildShellEnvironment(request.id, command.program,
                                              request.hookSocketPath);
  return command;
}

optional<string> ProjectPathResolver::resolveRepoRoot(const string &path) {
  if (path.empty()) {
    return nullopt;
  }
  auto output = subprocessUtils->runCapturingStdout(
      "git", {"rev-parse", "--show-toplevel"}, path);
  if (!output) {
    return nullopt;
  }
  string root = trim(*output);
  if (root.empty()) {
    return nullopt;
  }
  return root;
}

string ProjectPathResolver::resolveProjectPath(const string &path) {
  auto root = resolveRepoRoot(path);
  if (!root) {
    VLOG(1) << "No repository root for " << path << ", using it as is";
    return path;
  }
  return *root;
}
}  // namespace wb
