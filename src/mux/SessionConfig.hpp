#ifndef __TABMUX_SESSION_CONFIG_HPP__
#define __TABMUX_SESSION_CONFIG_HPP__

#include <cxxopts.hpp>

#include "Headers.hpp"
#include "HistoryStore.hpp"
#include "MultiplexerState.hpp"
#include "ProcessHandle.hpp"

namespace tabmux {
/** @brief Sections whose name starts with this each describe one command. */
const string PROCESS_SECTION_PREFIX = "Process";

/** @brief Everything needed to start a session, after file + flags. */
struct SessionConfig {
  int viewportHeight = DEFAULT_VIEWPORT_HEIGHT;
  size_t retention = DEFAULT_RETENTION;
  vector<CommandSpec> commands;
  int verbose = 0;
  bool logToStdout = false;
  /** @brief Disables logging entirely ([Debug] silent). */
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Builds a SessionConfig from defaults, then an optional INI file
 * (SimpleIni), then the command line (cxxopts), later sources winning.
 *
 * Errors are reported as std::runtime_error with a message meant for the
 * operator.
 */
class SessionConfigLoader {
 public:
  static cxxopts::Options createOptions();

  /** @brief Applies defaults, `--cfgfile` and the flags, then validates. */
  static SessionConfig load(const cxxopts::ParseResult& result);

  /** @brief Reads an INI file; commands it lists are appended in order. */
  static void loadFile(const string& filename, SessionConfig* config);

  /** @brief Applies flags that were given explicitly. */
  static void applyCommandLine(const cxxopts::ParseResult& result,
                               SessionConfig* config);

  /** @brief Rejects a config that cannot run a session. */
  static void validate(const SessionConfig& config);

  /** @brief "exe arg1 arg2" split on spaces into a CommandSpec. */
  static CommandSpec parseCommand(const string& commandLine,
                                  const SpawnOptions& options);

  /** @brief "KEY=VALUE;OTHER=2" into a map. */
  static map<string, string> parseEnvironment(const string& s);
};
}  // namespace tabmux

#endif  // __TABMUX_SESSION_CONFIG_HPP__
