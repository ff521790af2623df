#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ptymux {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
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
  // Log lines must never end up on the host's event stream (stdout).
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFile(el::Configurations *defaultConf,
                                const string &directory,
                                const string &filenamePrefix,
                                const string &maxLogSize) {
  string fullFname =
      createLogFile(directory, timestampedName(filenamePrefix) + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  return fullFname;
}

void LogHandler::disableLogging(el::Configurations *defaultConf) {
  defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, logging would recurse.
  remove(filename);
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

void LogHandler::stderrToFile(const string &directory, const string &prefix) {
  string fullFname =
      createLogFile(directory, timestampedName(prefix + "-stderr") + ".log");
  FILE *stderr_stream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderr_stream) {
    STFATAL << "Invalid filename " << fullFname;
  }
  setvbuf(stderr_stream, NULL, _IOLBF, BUFSIZ);  // set to line buffering
}

string LogHandler::timestampedName(const string &prefix) {
  time_t rawtime;
  struct tm timeinfo;
  char buffer[80];
  time(&rawtime);
  localtime_r(&rawtime, &timeinfo);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  return prefix + "-" + string(buffer) + "_" + std::to_string(getpid());
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

}  // namespace ptymux
