#include "TerminalEventSink.hpp"

namespace wb {
json toJson(const TerminalDataEvent &event) {
  json payload;
  payload["sessionId"] = event.sessionId;
  payload["data"] = event.data;
  return payload;
}

json toJson(const TerminalExitEvent &event) {
  json payload;
  payload["sessionId"] = event.sessionId;
  payload["exitCode"] = event.exitCode;
  if (event.signal) {
    payload["signal"] = *event.signal;
  } else {
    payload["signal"] = nullptr;
  }
  return payload;
}

json toJson(const TerminalActivityEvent &event) {
  json payload;
  payload["sessionId"] = event.sessionId;
  payload["active"] = event.active;
  return payload;
}

void JsonLinesEventSink::writeEvent(const string &name, const json &payload) {
  json message;
  message["event"] = name;
  message["payload"] = payload;
  // Pty output may contain bytes json refuses to encode, replace rather than
  // throw
  string line = message.dump(-1, ' ', false, json::error_handler_t::replace);
  lock_guard<mutex> guard(outMutex);
  out << line << "\n";
  out.flush();
}
}  // namespace wb
