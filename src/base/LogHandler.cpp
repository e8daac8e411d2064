#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tabmux {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  // The screen is redrawn constantly, so a crash must not lose the tail
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  VERBOSE_LOG_FORMAT);
  return defaultConf;
}

string LogHandler::logFileName(const string &prefix, const string &kind,
                               bool appendPid) {
  char buffer[80];
  time_t rawtime = time(NULL);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", localtime(&rawtime));
  string name = prefix + "-";
  if (!kind.empty()) {
    name += kind + "-";
  }
  name += buffer;
  if (appendPid) {
    name += "_" + to_string(getpid());
  }
  return name + ".log";
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const LogFileOptions &options) {
  string fullFname = createLogFile(
      options.directory, logFileName(options.prefix, "", options.appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           options.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           options.logToStdout ? "true" : "false");

  if (options.redirectStderr) {
    stderrToFile(options.directory,
                 logFileName(options.prefix, "stderr", options.appendPid));
  }
  return fullFname;
}

void LogHandler::setVerbosity(el::Configurations *defaultConf, int verbose,
                              bool silent) {
  if (silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  el::Loggers::setVerboseLevel(verbose);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
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

string LogHandler::createLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    throw std::runtime_error("Cannot create log directory " + path + ": " +
                             fse.what());
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + fullFname + ": " +
                             strerror(GetErrno()));
  }
  ::close(fd);
  return fullFname;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullFname = createLogFile(path, stderrFilename);
  FILE *stderr_stream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderr_stream) {
    STFATAL << "Invalid filename " << stderrFilename;
  }
  setvbuf(stderr_stream, NULL, _IOLBF, BUFSIZ);  // set to line buffering
}
}  // namespace tabmux
