#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "MuxSession.hpp"
#include "PosixConsole.hpp"
#include "PosixProcessHandle.hpp"
#include "SessionConfig.hpp"

using namespace tabmux;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tabmux::HandleTerminate();

  cxxopts::Options options = SessionConfigLoader::createOptions();
  SessionConfig config;
  try {
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tabmux version " << TABMUX_VERSION << endl;
      exit(0);
    }

    config = SessionConfigLoader::load(result);
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& ex) {
    CLOG(INFO, "stdout") << "Error: " << ex.what() << endl;
    exit(1);
  }

  LogHandler::setVerbosity(&defaultConf, config.verbose, config.silent);
  // The screen belongs to the tabs, so logs and stderr go to files
  LogFileOptions logOptions;
  logOptions.directory = GetTempDirectory() + "tabmux";
  logOptions.logToStdout = config.logToStdout;
  logOptions.redirectStderr = true;
  logOptions.appendPid = true;
  logOptions.maxLogSize = config.maxLogSize;
  string logFile;
  try {
    logFile = LogHandler::setupLogFiles(&defaultConf, logOptions);
  } catch (const std::runtime_error& ex) {
    CLOG(INFO, "stdout") << "Error: " << ex.what() << endl;
    exit(1);
  }
  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName("tabmux-main");

  LOG(INFO) << "Starting " << config.commands.size()
            << " commands, viewport " << config.viewportHeight
            << " lines, retention " << config.retention;

  shared_ptr<Console> console(new PosixConsole());
  shared_ptr<ProcessSpawner> spawner(new PosixProcessSpawner());
  int exitCode = 0;
  {
    MuxSession session(console, spawner, config.viewportHeight,
                       config.retention);
    try {
      session.start(config.commands);
      exitCode = session.run();
    } catch (const std::runtime_error& ex) {
      console->teardown();
      LOG(ERROR) << "Session failed: " << ex.what();
      CLOG(INFO, "stdout") << "Error: " << ex.what() << " (log: " << logFile
                           << ")" << endl;
      exitCode = 1;
    }
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
