#include "FakeUserTerminal.hpp"
#include "PtyManager.hpp"
#include "RecordingEventSink.hpp"
#include "TestHeaders.hpp"

using namespace wb;

namespace {
class FakeTerminalFactory {
 public:
  TerminalFactory factory() {
    return [this](const ShellCommand &command, int cols, int rows) {
      lock_guard<mutex> guard(factoryMutex);
      if (failNext) {
        failNext = false;
        throw SpawnError(SpawnError::PROCESS_SPAWN, "no such shell");
      }
      auto terminal = make_shared<FakeUserTerminal>();
      terminal->resize(cols, rows);
      string id;
      for (const auto &it : command.environment) {
        if (it.first == PANE_ID_ENV) {
          id = it.second;
        }
      }
      terminals[id] = terminal;
      commands[id] = command;
      return shared_ptr<UserTerminal>(terminal);
    };
  }

  shared_ptr<FakeUserTerminal> terminal(const string &id) {
    lock_guard<mutex> guard(factoryMutex);
    return terminals.at(id);
  }

  ShellCommand command(const string &id) {
    lock_guard<mutex> guard(factoryMutex);
    return commands.at(id);
  }

  bool failNext = false;

 protected:
  mutex factoryMutex;
  map<string, shared_ptr<FakeUserTerminal>> terminals;
  map<string, ShellCommand> commands;
};

class FakeProcessTree : public ProcessTree {
 public:
  virtual vector<pid_t> childrenOf(pid_t pid) {
    if (fail) {
      throw std::runtime_error("no process table");
    }
    queried.push_back(pid);
    return children;
  }

  vector<pid_t> children;
  vector<pid_t> queried;
  bool fail = false;
};

class NoRepoSubprocessUtils : public SubprocessUtils {
 public:
  virtual optional<string> runCapturingStdout(const string &,
                                              const vector<string> &,
                                              const string &path) {
    if (path.find("/repo/") == 0) {
      return string("/repo\n");
    }
    return nullopt;
  }
};

PtyManagerOptions testOptions() {
  PtyManagerOptions options;
  options.pipeline.quietWindow = Millis(50);
  options.pipeline.readPollMs = 10;
  options.startupCommandDelay = Millis(20);
  options.killGrace = Millis(0);
  options.defaultShell = "/bin/sh";
  return options;
}

SpawnRequest makeRequest(const string &id,
                         const string &projectPath = "/tmp") {
  SpawnRequest request;
  request.id = id;
  request.projectPath = projectPath;
  return request;
}

struct ManagerFixture {
  ManagerFixture(PtyManagerOptions options = testOptions())
      : sink(new RecordingEventSink()),
        processTree(new FakeProcessTree()),
        manager(new PtyManager(sink, options, processTree,
                               make_shared<NoRepoSubprocessUtils>(),
                               terminals.factory())) {}

  FakeTerminalFactory terminals;
  shared_ptr<RecordingEventSink> sink;
  shared_ptr<FakeProcessTree> processTree;
  shared_ptr<PtyManager> manager;
};
}  // namespace

TEST_CASE("Spawned sessions accept input and resizes", "[PtyManager]") {
  ManagerFixture fixture;
  SpawnRequest request = makeRequest("one", "/repo/src");
  request.cols = 120;
  request.rows = 40;
  fixture.manager->spawn(request);

  auto terminal = fixture.terminals.terminal("one");
  REQUIRE(terminal->getSize() == make_pair(120, 40));
  fixture.manager->write("one", "ls\r");
  REQUIRE(terminal->getInput() == "ls\r");
  fixture.manager->resize("one", 100, 30);
  REQUIRE(terminal->getSize() == make_pair(100, 30));

  REQUIRE(fixture.manager->projectPathForSession("one") ==
          optional<string>("/repo"));
  REQUIRE(fixture.manager->sessionIds() == vector<string>({"one"}));

  ShellCommand command = fixture.terminals.command("one");
  REQUIRE(command.program == "/bin/sh");
  // The shell starts where it was asked to, even inside a repository
  REQUIRE(command.workingDirectory == "/repo/src");
}

TEST_CASE("Unknown sessions are reported", "[PtyManager]") {
  ManagerFixture fixture;
  REQUIRE_THROWS_AS(fixture.manager->write("ghost", "x"),
                    SessionNotFoundError);
  REQUIRE_THROWS_AS(fixture.manager->resize("ghost", 80, 24),
                    SessionNotFoundError);
  REQUIRE_THROWS_AS(fixture.manager->signalForeground("ghost"),
                    SessionNotFoundError);
  REQUIRE_NOTHROW(fixture.manager->kill("ghost"));
  REQUIRE_FALSE(fixture.manager->projectPathForSession("ghost"));
}

TEST_CASE("Output reaches the sink", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("talky"));
  fixture.terminals.terminal("talky")->queueOutput("$ prompt");
  REQUIRE(fixture.sink->waitForText("talky", "$ prompt"));
}

TEST_CASE("A shell exiting on its own emits one exit", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("done"));
  auto terminal = fixture.terminals.terminal("done");
  terminal->queueOutput("bye");
  terminal->endOutput(0);

  REQUIRE(fixture.sink->waitForExit("done"));
  REQUIRE(waitUntil([&]() { return fixture.manager->sessionIds().empty(); }));
  auto exits = fixture.sink->exitsFor("done");
  REQUIRE(exits.size() == 1);
  REQUIRE(exits[0].exitCode == 0);
  REQUIRE_FALSE(exits[0].signal);
  REQUIRE(fixture.sink->textFor("done") == "bye");
  REQUIRE_THROWS_AS(fixture.manager->write("done", "x"),
                    SessionNotFoundError);
}

TEST_CASE("A failing shell reports exit code 1", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("crash"));
  fixture.terminals.terminal("crash")->endOutput(1);
  REQUIRE(fixture.sink->waitForExit("crash"));
  REQUIRE(fixture.sink->exitsFor("crash")[0].exitCode == 1);
}

TEST_CASE("Kill ends the session once", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("victim"));
  auto terminal = fixture.terminals.terminal("victim");

  fixture.manager->kill("victim");
  REQUIRE(terminal->getTerminateCount() >= 1);
  REQUIRE(fixture.sink->exitsFor("victim").size() == 1);
  REQUIRE(fixture.sink->exitsFor("victim")[0].exitCode == 1);
  REQUIRE(fixture.manager->sessionIds().empty());

  REQUIRE_NOTHROW(fixture.manager->kill("victim"));
  std::this_thread::sleep_for(Millis(100));
  REQUIRE(fixture.sink->exitsFor("victim").size() == 1);
}

TEST_CASE("Kill racing end of stream still emits one exit", "[PtyManager]") {
  ManagerFixture fixture;
  for (int round = 0; round < 50; round++) {
    string id = "race-" + to_string(round);
    fixture.manager->spawn(makeRequest(id));
    auto terminal = fixture.terminals.terminal(id);
    terminal->queueOutput("x");
    thread ender([&]() { terminal->endOutput(0); });
    fixture.manager->kill(id);
    ender.join();
    REQUIRE(fixture.sink->waitForExit(id));
  }
  // Let any straggling end-of-stream handling finish
  REQUIRE(waitUntil([&]() { return fixture.manager->sessionIds().empty(); }));
  std::this_thread::sleep_for(Millis(100));
  for (int round = 0; round < 50; round++) {
    REQUIRE(fixture.sink->exitsFor("race-" + to_string(round)).size() == 1);
  }
}

TEST_CASE("Duplicate live ids are rejected", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("twin"));
  REQUIRE_THROWS_AS(fixture.manager->spawn(makeRequest("twin")),
                    DuplicateSessionError);
  REQUIRE(fixture.manager->sessionIds().size() == 1);

  // Once it is gone the id can be reused
  fixture.manager->kill("twin");
  REQUIRE_NOTHROW(fixture.manager->spawn(makeRequest("twin")));
}

TEST_CASE("Spawn failures leave nothing behind", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.terminals.failNext = true;
  try {
    fixture.manager->spawn(makeRequest("broken"));
    FAIL("spawn should have thrown");
  } catch (const SpawnError &se) {
    REQUIRE(se.getKind() == SpawnError::PROCESS_SPAWN);
  }
  REQUIRE(fixture.manager->sessionIds().empty());
  REQUIRE_THROWS_AS(fixture.manager->write("broken", "x"),
                    SessionNotFoundError);
}

TEST_CASE("The startup command is typed after a delay", "[PtyManager]") {
  ManagerFixture fixture;
  SpawnRequest request = makeRequest("starter");
  request.startupCommand = "echo hello";
  fixture.manager->spawn(request);
  auto terminal = fixture.terminals.terminal("starter");
  REQUIRE(terminal->getInput().empty());
  REQUIRE(waitUntil([&]() { return terminal->getInput() == "echo hello\n"; }));
}

TEST_CASE("A startup command for a dead shell is dropped", "[PtyManager]") {
  PtyManagerOptions options = testOptions();
  options.startupCommandDelay = Millis(200);
  ManagerFixture fixture(options);
  SpawnRequest request = makeRequest("late");
  request.startupCommand = "make";
  fixture.manager->spawn(request);
  auto terminal = fixture.terminals.terminal("late");
  terminal->setFailWrites(true);
  std::this_thread::sleep_for(Millis(400));
  REQUIRE(terminal->getInput().empty());
  // The session itself is unaffected
  REQUIRE(fixture.manager->sessionIds() == vector<string>({"late"}));
}

TEST_CASE("Manager defaults fill in the spawn request", "[PtyManager]") {
  PtyManagerOptions options = testOptions();
  options.defaultShell = "/bin/custom-shell";
  options.hookSocketPath = string("/tmp/wbterm-hooks.sock");
  ManagerFixture fixture(options);
  fixture.manager->spawn(makeRequest("defaults"));

  ShellCommand command = fixture.terminals.command("defaults");
  REQUIRE(command.program == "/bin/custom-shell");
  bool sawHook = false;
  for (const auto &it : command.environment) {
    if (it.first == HOOK_SOCKET_ENV) {
      sawHook = (it.second == "/tmp/wbterm-hooks.sock");
    }
  }
  REQUIRE(sawHook);
}

TEST_CASE("Interrupt signals the shell's direct children", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("busy"));

  pid_t child = fork();
  if (child == 0) {
    signal(SIGINT, SIG_DFL);
    ::sleep(10);
    _exit(0);
  }
  REQUIRE(child > 0);
  fixture.processTree->children.push_back(child);
  // Give the child time to restore the default SIGINT action
  std::this_thread::sleep_for(Millis(50));

  fixture.manager->signalForeground("busy");
  int status = 0;
  REQUIRE(waitpid(child, &status, 0) == child);
  REQUIRE(WIFSIGNALED(status));
  REQUIRE(WTERMSIG(status) == SIGINT);
  REQUIRE(fixture.processTree->queried ==
          vector<pid_t>({fixture.terminals.terminal("busy")->getPid()}));
}

TEST_CASE("Interrupt leaves a reaped shell's old pid alone", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("gone"));
  fixture.terminals.terminal("gone")->markReaped();

  REQUIRE_NOTHROW(fixture.manager->signalForeground("gone"));
  REQUIRE(fixture.processTree->queried.empty());
}

TEST_CASE("Interrupt tolerates process table failures", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("blind"));
  fixture.processTree->fail = true;
  REQUIRE_NOTHROW(fixture.manager->signalForeground("blind"));
  fixture.processTree->fail = false;
  // No children, nothing to signal
  REQUIRE_NOTHROW(fixture.manager->signalForeground("blind"));
}

TEST_CASE("Sessions are independent", "[PtyManager]") {
  ManagerFixture fixture;
  fixture.manager->spawn(makeRequest("left"));
  fixture.manager->spawn(makeRequest("right"));
  fixture.manager->write("left", "a");
  fixture.manager->write("right", "b");
  REQUIRE(fixture.terminals.terminal("left")->getInput() == "a");
  REQUIRE(fixture.terminals.terminal("right")->getInput() == "b");

  fixture.manager->kill("left");
  REQUIRE(fixture.manager->sessionIds() == vector<string>({"right"}));
  fixture.manager->write("right", "c");
  REQUIRE(fixture.terminals.terminal("right")->getInput() == "bc");
}

TEST_CASE("Destroying the manager ends every session", "[PtyManager]") {
  auto sink = make_shared<RecordingEventSink>();
  FakeTerminalFactory terminals;
  {
    PtyManager manager(sink, testOptions(), make_shared<FakeProcessTree>(),
                       make_shared<NoRepoSubprocessUtils>(),
                       terminals.factory());
    manager.spawn(makeRequest("a"));
    manager.spawn(makeRequest("b"));
  }
  REQUIRE(sink->exitsFor("a").size() == 1);
  REQUIRE(sink->exitsFor("b").size() == 1);
}
