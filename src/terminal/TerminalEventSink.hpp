#ifndef __WB_TERMINAL_EVENT_SINK__
#define __WB_TERMINAL_EVENT_SINK__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "TerminalTypes.hpp"

namespace wb {
const char *const DATA_EVENT_NAME = "terminal:data";
const char *const EXIT_EVENT_NAME = "terminal:exit";
const char *const ACTIVITY_EVENT_NAME = "terminal:activity";

json toJson(const TerminalDataEvent &event);
json toJson(const TerminalExitEvent &event);
json toJson(const TerminalActivityEvent &event);

/**
 * @brief Receiver of the notifications produced by running sessions.
 *
 * Delivery is fire and forget. A sink may be called concurrently from the
 * threads of different sessions. For one session, data events arrive in
 * output order from a single thread.
 */
class TerminalEventSink {
 public:
  virtual ~TerminalEventSink() {}

  virtual void onData(const TerminalDataEvent &event) = 0;
  virtual void onExit(const TerminalExitEvent &event) = 0;
  virtual void onActivity(const TerminalActivityEvent &event) = 0;
};

/**
 * @brief Writes every event as one `{"event":..,"payload":..}` JSON line.
 */
class JsonLinesEventSink : public TerminalEventSink {
 public:
  explicit JsonLinesEventSink(std::ostream &_out) : out(_out) {}

  virtual void onData(const TerminalDataEvent &event) {
    writeEvent(DATA_EVENT_NAME, toJson(event));
  }
  virtual void onExit(const TerminalExitEvent &event) {
    writeEvent(EXIT_EVENT_NAME, toJson(event));
  }
  virtual void onActivity(const TerminalActivityEvent &event) {
    writeEvent(ACTIVITY_EVENT_NAME, toJson(event));
  }

  /** @brief Writes an arbitrary named payload, used for command replies. */
  void writeEvent(const string &name, const json &payload);

 protected:
  std::ostream &out;
  mutex outMutex;
};

/**
 * @brief Delivers an event to a sink, logging and dropping any failure.
 */
template <typename Event>
inline void emitBestEffort(
    const shared_ptr<TerminalEventSink> &sink, const Event &event,
    void (TerminalEventSink::*handler)(const Event &)) {
  if (!sink) {
    return;
  }
  try {
    ((*sink).*handler)(event);
  } catch (const std::exception &ex) {
    LOG(WARNING) << "Dropping terminal event for " << event.sessionId << ": "
                 << ex.what();
  }
}
}  // namespace wb

#endif  // __WB_TERMINAL_EVENT_SINK__
