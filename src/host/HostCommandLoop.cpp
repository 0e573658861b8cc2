#include "HostCommandLoop.hpp"

namespace wb {
namespace {
string requireString(const json &command, const char *key) {
  return command.at(key).get<string>();
}

template <typename T>
T valueOr(const json &command, const char *key, T defaultValue) {
  auto it = command.find(key);
  if (it == command.end() || it->is_null()) {
    return defaultValue;
  }
  return it->get<T>();
}

// winsize holds unsigned shorts
int requireDimension(const json &command, const char *key, int defaultValue) {
  int value = valueOr<int>(command, key, defaultValue);
  if (value < 1 || value > 65535) {
    throw std::runtime_error(string("Invalid ") + key + ": " +
                             std::to_string(value));
  }
  return value;
}
}  // namespace

HostCommandLoop::HostCommandLoop(shared_ptr<PtyManager> _manager,
                                 shared_ptr<JsonLinesEventSink> _output)
    : manager(_manager), output(_output) {}

void HostCommandLoop::run(std::istream &in) {
  string line;
  while (std::getline(in, line)) {
    if (trim(line).empty()) {
      continue;
    }
    handleLine(line);
  }
  LOG(INFO) << "Command stream closed";
}

void HostCommandLoop::handleLine(const string &line) {
  json response;
  json command = json::parse(line, nullptr, false);
  if (command.is_discarded() || !command.is_object()) {
    LOG(WARNING) << "Ignoring malformed command: " << line;
    response["cmd"] = nullptr;
    response["ok"] = false;
    response["error"] = "Malformed command";
  } else {
    response = handleCommand(command);
  }
  output->writeEvent(RESPONSE_EVENT_NAME, response);
}

json HostCommandLoop::handleCommand(const json &command) {
  json response;
  auto cmdIt = command.find("cmd");
  string cmd;
  if (cmdIt != command.end() && cmdIt->is_string()) {
    cmd = cmdIt->get<string>();
    response["cmd"] = cmd;
  } else {
    response["cmd"] = nullptr;
  }
  auto requestIdIt = command.find("requestId");
  if (requestIdIt != command.end()) {
    response["requestId"] = *requestIdIt;
  }
  VLOG(1) << "Command: " << cmd;

  try {
    if (cmd == "spawn") {
      response.update(spawn(command));
    } else if (cmd == "write") {
      manager->write(requireString(command, "sessionId"),
                     requireString(command, "data"));
    } else if (cmd == "resize") {
      manager->resize(requireString(command, "sessionId"),
                      requireDimension(command, "cols", 0),
                      requireDimension(command, "rows", 0));
    } else if (cmd == "kill") {
      manager->kill(requireString(command, "sessionId"));
    } else if (cmd == "interrupt") {
      manager->signalForeground(requireString(command, "sessionId"));
    } else if (cmd == "projectPath") {
      auto path =
          manager->projectPathForSession(requireString(command, "sessionId"));
      if (path) {
        response["projectPath"] = *path;
      } else {
        response["projectPath"] = nullptr;
      }
    } else if (cmd == "list") {
      response["sessionIds"] = manager->sessionIds();
    } else {
      throw std::runtime_error("Unknown command: " + cmd);
    }
    response["ok"] = true;
  } catch (const json::exception &je) {
    LOG(WARNING) << "Bad arguments for " << cmd << ": " << je.what();
    response["ok"] = false;
    response["error"] = string("Bad arguments: ") + je.what();
  } catch (const std::runtime_error &re) {
    LOG(WARNING) << "Command " << cmd << " failed: " << re.what();
    response["ok"] = false;
    response["error"] = re.what();
  }
  return response;
}

json HostCommandLoop::spawn(const json &command) {
  SpawnRequest request;
  request.id = valueOr<string>(command, "id", "");
  if (request.id.empty()) {
    request.id = sole::uuid4().str();
  }
  request.projectPath = requireString(command, "projectPath");
  request.shell = valueOr<string>(command, "shell", "");
  request.cols = requireDimension(command, "cols", request.cols);
  request.rows = requireDimension(command, "rows", request.rows);
  string startupCommand = valueOr<string>(command, "startupCommand", "");
  if (!startupCommand.empty()) {
    request.startupCommand = startupCommand;
  }
  string hookSocketPath = valueOr<string>(command, "hookSocketPath", "");
  if (!hookSocketPath.empty()) {
    request.hookSocketPath = hookSocketPath;
  }

  manager->spawn(request);

  json result;
  result["sessionId"] = request.id;
  return result;
}
}  // namespace wb
