#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace wb {
el::Configurations LogHandler::init(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // Session threads are named reader-<id>, emitter-<id> and activity-<id>
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  // A host killed by its parent must not lose the last lines
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Nothing reaches stdout until apply() decides where logs go
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  el::Loggers::reconfigureLogger("default", conf);

  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"),
                                 stdoutConf);
  return conf;
}

string LogHandler::apply(el::Configurations *conf,
                         const LogSettings &settings) {
  setVerbosity(settings.verbose);
  if (settings.silent) {
    conf->setGlobally(el::ConfigurationType::Enabled, "false");
    el::Loggers::reconfigureLogger("default", *conf);
    return "";
  }

  time_t now = time(NULL);
  string logFile =
      createLogFile(settings.directory, logFileName(settings, "", now));
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Enabled, "true");
  conf->setGlobally(el::ConfigurationType::Filename, logFile);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                    settings.maxFileSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    settings.toStdout ? "true" : "false");
  el::Loggers::reconfigureLogger("default", *conf);
  el::Helpers::installPreRollOutCallback(LogHandler::removeRolledFile);

  if (settings.captureStderr) {
    string stderrFile = createLogFile(settings.directory,
                                      logFileName(settings, "stderr", now));
    FILE *stream = freopen(stderrFile.c_str(), "w", stderr);
    if (!stream) {
      throw std::runtime_error("Cannot redirect stderr to " + stderrFile +
                               ": " + strerror(GetErrno()));
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }
  return logFile;
}

string LogHandler::logFileName(const LogSettings &settings, const string &kind,
                               time_t when) {
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d_%H-%M-%S",
           localtime(&when));
  string name = settings.prefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  name += string("-") + timestamp;
  if (settings.appendPid) {
    name += "_" + std::to_string(getpid());
  }
  return name + ".log";
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    throw std::runtime_error("Cannot create log directory " + directory +
                             ": " + fse.what());
  }
  string path = directory + "/" + filename;
  int fd = ::open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_EXCL | O_CREAT,
                  0600);
  if (fd == -1) {
    throw std::runtime_error("Cannot create log file " + path + ": " +
                             strerror(GetErrno()));
  }
  ::close(fd);
  return path;
}

void LogHandler::setVerbosity(int level) {
  el::Loggers::setVerboseLevel(std::max(0, std::min(level, 9)));
}

void LogHandler::removeRolledFile(const char *filename, std::size_t) {
  remove(filename);
}
}  // namespace wb
