#ifndef __WB_RECORDING_EVENT_SINK__
#define __WB_RECORDING_EVENT_SINK__

#include "TerminalEventSink.hpp"

namespace wb {
/**
 * Keeps every event it receives. Can be told to stall or throw on data for
 * a particular session.
 */
class RecordingEventSink : public TerminalEventSink {
 public:
  virtual void onData(const TerminalDataEvent &event) {
    Millis delay(0);
    bool fail = false;
    {
      lock_guard<mutex> guard(sinkMutex);
      auto it = dataDelays.find(event.sessionId);
      if (it != dataDelays.end()) {
        delay = it->second;
      }
      fail = failingSessions.count(event.sessionId) > 0;
    }
    if (delay.count()) {
      std::this_thread::sleep_for(delay);
    }
    {
      lock_guard<mutex> guard(sinkMutex);
      data.push_back(event);
    }
    changed.notify_all();
    if (fail) {
      throw std::runtime_error("sink rejected data");
    }
  }

  virtual void onExit(const TerminalExitEvent &event) {
    {
      lock_guard<mutex> guard(sinkMutex);
      exits.push_back(event);
    }
    changed.notify_all();
  }

  virtual void onActivity(const TerminalActivityEvent &event) {
    {
      lock_guard<mutex> guard(sinkMutex);
      activity.push_back(event);
    }
    changed.notify_all();
  }

  void setDataDelay(const string &sessionId, Millis delay) {
    lock_guard<mutex> guard(sinkMutex);
    dataDelays[sessionId] = delay;
  }

  void failDataFor(const string &sessionId) {
    lock_guard<mutex> guard(sinkMutex);
    failingSessions.insert(sessionId);
  }

  /** All output of one session, in emission order. */
  string textFor(const string &sessionId) {
    lock_guard<mutex> guard(sinkMutex);
    string text;
    for (const auto &it : data) {
      if (it.sessionId == sessionId) {
        text.append(it.data);
      }
    }
    return text;
  }

  int dataCountFor(const string &sessionId) {
    lock_guard<mutex> guard(sinkMutex);
    return int(std::count_if(data.begin(), data.end(),
                             [&](const TerminalDataEvent &it) {
                               return it.sessionId == sessionId;
                             }));
  }

  vector<TerminalExitEvent> exitsFor(const string &sessionId) {
    lock_guard<mutex> guard(sinkMutex);
    vector<TerminalExitEvent> result;
    for (const auto &it : exits) {
      if (it.sessionId == sessionId) {
        result.push_back(it);
      }
    }
    return result;
  }

  vector<bool> activityFor(const string &sessionId) {
    lock_guard<mutex> guard(sinkMutex);
    vector<bool> result;
    for (const auto &it : activity) {
      if (it.sessionId == sessionId) {
        result.push_back(it.active);
      }
    }
    return result;
  }

  bool waitForExit(const string &sessionId, Millis timeout = Millis(5000)) {
    unique_lock<mutex> guard(sinkMutex);
    return changed.wait_for(guard, timeout, [&] {
      for (const auto &it : exits) {
        if (it.sessionId == sessionId) {
          return true;
        }
      }
      return false;
    });
  }

  bool waitForText(const string &sessionId, const string &needle,
                   Millis timeout = Millis(5000)) {
    unique_lock<mutex> guard(sinkMutex);
    return changed.wait_for(guard, timeout, [&] {
      string text;
      for (const auto &it : data) {
        if (it.sessionId == sessionId) {
          text.append(it.data);
        }
      }
      return text.find(needle) != string::npos;
    });
  }

 protected:
  mutex sinkMutex;
  condition_variable changed;
  vector<TerminalDataEvent> data;
  vector<TerminalExitEvent> exits;
  vector<TerminalActivityEvent> activity;
  map<string, Millis> dataDelays;
  set<string> failingSessions;
};
}  // namespace wb

#endif  // __WB_RECORDING_EVENT_SINK__
