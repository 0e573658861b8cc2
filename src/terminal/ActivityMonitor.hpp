#ifndef __WB_ACTIVITY_MONITOR__
#define __WB_ACTIVITY_MONITOR__

#include "Channel.hpp"
#include "Headers.hpp"
#include "TerminalEventSink.hpp"

namespace wb {
/** @brief What woke the activity monitor up. */
enum class ActivitySignal { DATA, TIMEOUT, DISCONNECTED };

/** @brief Sent by the emitter once per emitted batch. */
struct ActivityPulse {};

typedef Channel<ActivityPulse> PulseChannel;

/**
 * @brief One step of the active/inactive state machine.
 * @return The next state and the event to publish, if any.
 */
pair<bool, optional<TerminalActivityEvent>> updateActivityState(
    const string &sessionId, bool active, ActivitySignal signal);

/**
 * @brief Turns a stream of output pulses into debounced activity events.
 *
 * The session is active from its first pulse until a full quiet window
 * passes without one. `run` returns once the pulse channel is closed and
 * drained.
 */
class ActivityMonitor {
 public:
  ActivityMonitor(const string &_sessionId, shared_ptr<PulseChannel> _pulses,
                  shared_ptr<TerminalEventSink> _sink, Millis _quietWindow)
      : sessionId(_sessionId),
        pulses(_pulses),
        sink(_sink),
        quietWindow(_quietWindow),
        active(false) {}

  void run();

  bool isActive() const { return active; }

 protected:
  string sessionId;
  shared_ptr<PulseChannel> pulses;
  shared_ptr<TerminalEventSink> sink;
  Millis quietWindow;
  atomic<bool> active;
};
}  // namespace wb

#endif  // __WB_ACTIVITY_MONITOR__
