#ifndef __WB_HOST_COMMAND_LOOP__
#define __WB_HOST_COMMAND_LOOP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PtyManager.hpp"
#include "TerminalEventSink.hpp"

namespace wb {
const char *const RESPONSE_EVENT_NAME = "response";

/**
 * @brief Drives a PtyManager from JSON commands, one per input line.
 *
 * Every command gets exactly one `response` event on the shared output sink,
 * interleaved with the terminal events of running sessions.
 */
class HostCommandLoop {
 public:
  HostCommandLoop(shared_ptr<PtyManager> _manager,
                  shared_ptr<JsonLinesEventSink> _output);

  /** @brief Handles commands until `in` reaches end of file. */
  void run(std::istream &in);

  /** @brief Parses and executes one line, then writes its response. */
  void handleLine(const string &line);

  /**
   * @brief Executes a parsed command.
   * @return The response payload, `ok` false with an `error` on failure.
   */
  json handleCommand(const json &command);

 protected:
  json spawn(const json &command);

  shared_ptr<PtyManager> manager;
  shared_ptr<JsonLinesEventSink> output;
};
}  // namespace wb

#endif  // __WB_HOST_COMMAND_LOOP__
