#include "TerminalEventSink.hpp"
#include "TestHeaders.hpp"

using namespace wb;

namespace {
class ThrowingSink : public TerminalEventSink {
 public:
  virtual void onData(const TerminalDataEvent &) {
    throw std::runtime_error("disconnected");
  }
  virtual void onExit(const TerminalExitEvent &) {
    throw std::runtime_error("disconnected");
  }
  virtual void onActivity(const TerminalActivityEvent &) {}
};

json parseOnlyLine(const string &text) {
  REQUIRE(!text.empty());
  REQUIRE(text.back() == '\n');
  REQUIRE(text.find('\n') == text.length() - 1);
  return json::parse(text);
}
}  // namespace

TEST_CASE("Data events are written as JSON lines", "[TerminalEventSink]") {
  std::ostringstream out;
  JsonLinesEventSink sink(out);
  sink.onData(TerminalDataEvent{"s1", "hi\r\n"});
  json line = parseOnlyLine(out.str());
  REQUIRE(line["event"] == "terminal:data");
  REQUIRE(line["payload"]["sessionId"] == "s1");
  REQUIRE(line["payload"]["data"] == "hi\r\n");
}

TEST_CASE("Exit events carry a null signal", "[TerminalEventSink]") {
  std::ostringstream out;
  JsonLinesEventSink sink(out);
  TerminalExitEvent event;
  event.sessionId = "s2";
  event.exitCode = 1;
  sink.onExit(event);
  json line = parseOnlyLine(out.str());
  REQUIRE(line["event"] == "terminal:exit");
  REQUIRE(line["payload"]["exitCode"] == 1);
  REQUIRE(line["payload"].contains("signal"));
  REQUIRE(line["payload"]["signal"].is_null());
}

TEST_CASE("Activity events", "[TerminalEventSink]") {
  std::ostringstream out;
  JsonLinesEventSink sink(out);
  sink.onActivity(TerminalActivityEvent{"s3", false});
  json line = parseOnlyLine(out.str());
  REQUIRE(line["event"] == "terminal:activity");
  REQUIRE(line["payload"]["active"] == false);
}

TEST_CASE("Sink failures are swallowed", "[TerminalEventSink]") {
  shared_ptr<TerminalEventSink> sink(new ThrowingSink());
  TerminalExitEvent event;
  event.sessionId = "s4";
  event.exitCode = 0;
  REQUIRE_NOTHROW(emitBestEffort(sink, event, &TerminalEventSink::onExit));
  REQUIRE_NOTHROW(emitBestEffort(sink, TerminalDataEvent{"s4", "x"},
                                 &TerminalEventSink::onData));
  shared_ptr<TerminalEventSink> none;
  REQUIRE_NOTHROW(emitBestEffort(none, event, &TerminalEventSink::onExit));
}
