#include <cxxopts.hpp>

#include "HostCommandLoop.hpp"
#include "LogHandler.hpp"
#include "PtyConfig.hpp"
#include "PtyManager.hpp"

using namespace wb;

int main(int argc, char **argv) {
  el::Configurations defaultConf = LogHandler::init(&argc, &argv);

  wb::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, wb::InterruptSignalHandler);
  // A consumer that goes away shows up as a failed write, not a signal
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("wbterm-host",
                           "Runs shell sessions on pseudo-terminals, driven "
                           "by JSON commands on stdin");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell used when a spawn names none",
         cxxopts::value<std::string>())  //
        ("hooksocket", "Side-channel address exported to every shell",
         cxxopts::value<std::string>())  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>())     //
        ("logtostdout", "log to stdout")    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "wbterm-host version " << WB_VERSION << endl;
      exit(0);
    }

    HostSettings settings;
    settings.manager.defaultShell = defaultShell();
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      try {
        PtyConfig::loadFile(cfgfilename, &settings);
      } catch (const std::runtime_error &re) {
        CLOG(ERROR, "stdout") << re.what() << endl;
        exit(1);
      }
    }

    // Command line wins over the config file
    if (result.count("shell")) {
      settings.manager.defaultShell = result["shell"].as<string>();
    }
    if (result.count("hooksocket")) {
      settings.manager.hookSocketPath = result["hooksocket"].as<string>();
    }
    if (result.count("logdir")) {
      settings.logDirectory = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      settings.verbose = result["verbose"].as<int>();
    }

    LogSettings logSettings;
    logSettings.directory = settings.logDirectory;
    logSettings.prefix = "wbterm-host";
    // stdout carries the event stream, so only log there when asked to.
    // Otherwise stderr goes to disk, the parent app rarely keeps it.
    logSettings.toStdout = result.count("logtostdout") > 0;
    logSettings.captureStderr = !logSettings.toStdout;
    logSettings.appendPid = true;
    logSettings.verbose = settings.verbose;
    logSettings.silent = settings.silent;
    logSettings.maxFileSize = settings.maxLogSize;
    string logFile;
    try {
      logFile = LogHandler::apply(&defaultConf, logSettings);
    } catch (const std::runtime_error &re) {
      CLOG(ERROR, "stdout") << re.what() << endl;
      exit(1);
    }
    el::Helpers::setThreadName("wbterm-main");

    LOG(INFO) << "wbterm-host " << WB_VERSION << " started, logging to "
              << logFile;

    shared_ptr<JsonLinesEventSink> sink(new JsonLinesEventSink(std::cout));
    {
      shared_ptr<PtyManager> manager(new PtyManager(sink, settings.manager));
      HostCommandLoop commandLoop(manager, sink);
      commandLoop.run(std::cin);
      LOG(INFO) << "Shutting down " << manager->sessionIds().size()
                << " remaining sessions";
    }
    LOG(INFO) << "wbterm-host exiting";
  } catch (cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
