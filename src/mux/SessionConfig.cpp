#include "SessionConfig.hpp"

#include "SimpleIni.h"

namespace tabmux {
cxxopts::Options SessionConfigLoader::createOptions() {
  cxxopts::Options options(
      "tabmux", "Run several commands and watch their output in tabs");
  options.positional_help("-- \"command arg...\" [\"command arg...\" ...]");

  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("l,lines", "Number of output lines shown per tab",
       cxxopts::value<int>(), "N")  //
      ("r,retention", "Number of output chunks kept per process",
       cxxopts::value<int>(), "R")  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("merge-stderr", "Show stderr of the commands as well")  //
      ("logtostdout", "log to stdout")                         //
      ("v,verbose", "Enable verbose logging", cxxopts::value<int>(),
       "LEVEL")  //
      ("commands", "Commands to run",
       cxxopts::value<std::vector<std::string>>())  //
      ;
  options.parse_positional({"commands"});
  return options;
}

SessionConfig SessionConfigLoader::load(const cxxopts::ParseResult& result) {
  SessionConfig config;
  if (result.count("cfgfile")) {
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      loadFile(cfgfilename, &config);
    }
  }
  applyCommandLine(result, &config);
  validate(config);
  return config;
}

void SessionConfigLoader::loadFile(const string& filename,
                                   SessionConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  const char* lines = ini.GetValue("Session", "lines", NULL);
  if (lines) {
    config->viewportHeight = atoi(lines);
  }
  const char* retention = ini.GetValue("Session", "retention", NULL);
  if (retention) {
    int value = atoi(retention);
    if (value < 1) {
      throw std::runtime_error("retention must be at least 1");
    }
    config->retention = size_t(value);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = atoi(vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    config->silent = true;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    config->maxLogSize = to_string(atoi(logsize));
  }

  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  sections.sort(CSimpleIniA::Entry::LoadOrder());
  for (auto& it : sections) {
    string section(it.pItem);
    if (!startsWith(section, PROCESS_SECTION_PREFIX)) {
      continue;
    }
    const char* command = ini.GetValue(it.pItem, "command", NULL);
    if (!command || string(command).empty()) {
      throw std::runtime_error("Section [" + section + "] has no command");
    }
    SpawnOptions options;
    options.workingDirectory = ini.GetValue(it.pItem, "cwd", "");
    options.mergeStderr = ini.GetBoolValue(it.pItem, "merge_stderr", false);
    options.environment = parseEnvironment(ini.GetValue(it.pItem, "env", ""));

    CommandSpec parsed = parseCommand(command, options);
    for (auto& arg : splitNonEmpty(ini.GetValue(it.pItem, "args", ""), ' ')) {
      parsed.args.push_back(arg);
    }
    VLOG(1) << "Config file command [" << section << "]: " << parsed.toString();
    config->commands.push_back(parsed);
  }
}

void SessionConfigLoader::applyCommandLine(const cxxopts::ParseResult& result,
                                           SessionConfig* config) {
  if (result.count("lines")) {
    config->viewportHeight = result["lines"].as<int>();
  }
  if (result.count("retention")) {
    int value = result["retention"].as<int>();
    if (value < 1) {
      throw std::runtime_error("retention must be at least 1");
    }
    config->retention = size_t(value);
  }
  if (result.count("verbose")) {
    config->verbose = result["verbose"].as<int>();
  }
  if (result.count("logtostdout")) {
    config->logToStdout = true;
  }
  if (result.count("commands")) {
    SpawnOptions options;
    options.mergeStderr = result.count("merge-stderr") > 0;
    for (auto& it : result["commands"].as<vector<string>>()) {
      config->commands.push_back(parseCommand(it, options));
    }
  }
}

void SessionConfigLoader::validate(const SessionConfig& config) {
  if (config.viewportHeight < 1) {
    throw std::runtime_error("lines must be at least 1");
  }
  if (config.retention < 1) {
    throw std::runtime_error("retention must be at least 1");
  }
  if (config.commands.empty()) {
    throw std::runtime_error("No commands to run");
  }
}

CommandSpec SessionConfigLoader::parseCommand(const string& commandLine,
                                              const SpawnOptions& options) {
  vector<string> tokens = splitNonEmpty(commandLine, ' ');
  if (tokens.empty()) {
    throw std::runtime_error("Empty command");
  }
  CommandSpec parsed;
  parsed.executable = tokens[0];
  parsed.args.assign(tokens.begin() + 1, tokens.end());
  parsed.options = options;
  return parsed;
}

map<string, string> SessionConfigLoader::parseEnvironment(const string& s) {
  map<string, string> environment;
  for (auto& it : splitNonEmpty(s, ';')) {
    auto equals = it.find('=');
    if (equals == string::npos || equals == 0) {
      throw std::runtime_error("Invalid environment entry: " + it);
    }
    environment[it.substr(0, equals)] = it.substr(equals + 1);
  }
  return environment;
}
}  // namespace tabmux
