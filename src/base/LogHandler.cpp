#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ng {
namespace {
/** Mirrors every formatted log line to stderr. */
class StderrLogDispatcher : public el::LogDispatchCallback {
 protected:
  void handle(const el::LogDispatchData *data) noexcept override {
    if (data->dispatchAction() != el::base::DispatchAction::NormalLog) {
      return;
    }
    const el::LogMessage *logMessage = data->logMessage();
    cerr << logMessage->logger()->logBuilder()->build(logMessage, true)
         << flush;
  }
};
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from the flags and ini file, not from easylogging's
  // own argv parsing.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Never log to stdout, it carries the MCP stream.
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStderr, bool appendPid,
                               string maxlogsize) {
  std::time_t now = std::time(nullptr);
  ostringstream name;
  name << filenamePrefix << "-"
       << std::put_time(std::localtime(&now), "%Y-%m-%d_%H-%M-%S");
  if (appendPid) {
    name << "_" << getpid();
  }
  name << ".log";
  string fullFname = createLogFile(path, name.str());

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "false");

  if (logToStderr) {
    el::Helpers::installLogDispatchCallback<StderrLogDispatcher>(
        "StderrLogDispatcher");
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed while this runs, so nothing here may log.
  // One previous generation is kept next to the live file.
  string previous = string(filename) + ".1";
  std::remove(previous.c_str());
  std::rename(filename, previous.c_str());
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + path + ": " +
                             ec.message());
  }
  string fullFname = (fs::path(path) / filename).string();
#ifdef WIN32
  int flags = O_EXCL | O_CREAT;
#else
  int flags = O_NOFOLLOW | O_EXCL | O_CREAT;
#endif
  int fd = ::open(fullFname.c_str(), flags, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + fullFname + ": " +
                             strerror(GetErrno()));
  }
  ::close(fd);
  return fullFname;
}
}  // namespace ng
