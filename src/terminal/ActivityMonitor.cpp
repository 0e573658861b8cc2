#include "ActivityMonitor.hpp"

namespace wb {
pair<bool, optional<TerminalActivityEvent>> updateActivityState(
    const string &sessionId, bool active, ActivitySignal signal) {
  if (!active && signal == ActivitySignal::DATA) {
    return make_pair(true, TerminalActivityEvent{sessionId, true});
  }
  if (active && (signal == ActivitySignal::TIMEOUT ||
                 signal == ActivitySignal::DISCONNECTED)) {
    return make_pair(false, TerminalActivityEvent{sessionId, false});
  }
  return make_pair(active, optional<TerminalActivityEvent>());
}

void ActivityMonitor::run() {
  while (true) {
    ActivityPulse pulse;
    ActivitySignal signal;
    switch (pulses->receiveFor(quietWindow, &pulse)) {
      case ReceiveStatus::RECEIVED:
        signal = ActivitySignal::DATA;
        break;
      case ReceiveStatus::TIMEOUT:
        signal = ActivitySignal::TIMEOUT;
        break;
      default:
        signal = ActivitySignal::DISCONNECTED;
        break;
    }

    auto next = updateActivityState(sessionId, active, signal);
    active = next.first;
    if (next.second) {
      VLOG(2) << sessionId << " is now "
              << (next.second->active ? "active" : "idle");
      emitBestEffort(sink, *next.second, &TerminalEventSink::onActivity);
    }

    if (signal == ActivitySignal::DISCONNECTED) {
      break;
    }
  }
}
}  // namespace wb
