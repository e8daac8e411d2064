#ifndef __TABMUX_LOG_HANDLER__
#define __TABMUX_LOG_HANDLER__

#include "Headers.hpp"

namespace tabmux {
/** @brief Format of the default logger; every line is tagged with tabmux. */
const string LOG_FORMAT = "[tabmux %level %datetime %thread %fbase:%line] %msg";
const string VERBOSE_LOG_FORMAT =
    "[tabmux %levshort%vlevel %datetime %thread %fbase:%line] %msg";
/** @brief Largest log file before it is rolled over, in bytes. */
const string DEFAULT_MAX_LOG_SIZE = "20971520";

/** @brief Where the log files go and what else is captured with them. */
struct LogFileOptions {
  string directory;
  string prefix = "tabmux";
  /** @brief Also copy the log to stdout (--logtostdout). */
  bool logToStdout = false;
  /** @brief Send stderr to `<prefix>-stderr-*.log` so it cannot hit the screen. */
  bool redirectStderr = false;
  bool appendPid = false;
  string maxLogSize = DEFAULT_MAX_LOG_SIZE;
};

/**
 * @brief Configures easylogging++ so tabmux can keep its logs off the screen
 * it is drawing.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return The full path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const LogFileOptions &options);

  /** @brief Applies `-v LEVEL` and `[Debug] silent`. */
  static void setVerbosity(el::Configurations *defaultConf, int verbose,
                           bool silent);

  /** @brief `<prefix>-<time>[_<pid>].log` */
  static string logFileName(const string &prefix, const string &kind,
                            bool appendPid);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.  Throws
   * std::runtime_error if either cannot be created.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tabmux
#endif  // __TABMUX_LOG_HANDLER__
