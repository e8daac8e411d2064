#include "SessionConfig.hpp"
#include "TestHeaders.hpp"

using namespace tabmux;

namespace {
cxxopts::ParseResult parseArgs(cxxopts::Options& options,
                               vector<string> args) {
  args.insert(args.begin(), "tabmux");
  vector<char*> argvStorage;
  for (auto& it : args) {
    argvStorage.push_back(&it[0]);
  }
  argvStorage.push_back(NULL);
  int argc = int(args.size());
  char** argv = &argvStorage[0];
  return options.parse(argc, argv);
}

class TempConfigFile {
 public:
  explicit TempConfigFile(const string& contents) {
    string pattern = GetTempDirectory() + "tabmux_config_XXXXXX";
    vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = ::mkstemp(&buf[0]);
    FATAL_FAIL(fd);
    ::close(fd);
    path = string(&buf[0]);
    std::ofstream out(path);
    out << contents;
  }

  ~TempConfigFile() { ::unlink(path.c_str()); }

  string path;
};
}  // namespace

TEST_CASE("SessionConfig parses command lines", "[SessionConfig]") {
  SpawnOptions options;
  options.mergeStderr = true;
  CommandSpec parsed =
      SessionConfigLoader::parseCommand("  npm  run   dev ", options);
  REQUIRE(parsed.executable == "npm");
  REQUIRE(parsed.args == vector<string>({"run", "dev"}));
  REQUIRE(parsed.options.mergeStderr);

  REQUIRE(SessionConfigLoader::parseCommand("ls", SpawnOptions()).args.empty());
  REQUIRE_THROWS_AS(SessionConfigLoader::parseCommand("   ", SpawnOptions()),
                    std::runtime_error);
}

TEST_CASE("SessionConfig parses environment lists", "[SessionConfig]") {
  auto environment =
      SessionConfigLoader::parseEnvironment("PORT=8080;MODE=dev=fast;EMPTY=");
  REQUIRE(environment.size() == 3);
  REQUIRE(environment["PORT"] == "8080");
  REQUIRE(environment["MODE"] == "dev=fast");
  REQUIRE(environment["EMPTY"] == "");
  REQUIRE(SessionConfigLoader::parseEnvironment("").empty());
  REQUIRE_THROWS_AS(SessionConfigLoader::parseEnvironment("NOVALUE"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(SessionConfigLoader::parseEnvironment("=oops"),
                    std::runtime_error);
}

TEST_CASE("SessionConfig from the command line", "[SessionConfig]") {
  auto options = SessionConfigLoader::createOptions();

  SECTION("Defaults") {
    auto result = parseArgs(options, {"echo hi", "sleep 5"});
    SessionConfig config = SessionConfigLoader::load(result);
    REQUIRE(config.viewportHeight == DEFAULT_VIEWPORT_HEIGHT);
    REQUIRE(config.retention == DEFAULT_RETENTION);
    REQUIRE(config.commands.size() == 2);
    REQUIRE(config.commands[0].executable == "echo");
    REQUIRE(config.commands[1].args == vector<string>({"5"}));
    REQUIRE(!config.commands[0].options.mergeStderr);
  }

  SECTION("Flags") {
    auto result = parseArgs(options, {"-l", "5", "--retention", "50",
                                      "--merge-stderr", "make watch"});
    SessionConfig config = SessionConfigLoader::load(result);
    REQUIRE(config.viewportHeight == 5);
    REQUIRE(config.retention == 50);
    REQUIRE(config.commands[0].options.mergeStderr);
  }

  SECTION("Invalid values") {
    REQUIRE_THROWS_AS(
        SessionConfigLoader::load(parseArgs(options, {"-l", "0", "ls"})),
        std::runtime_error);
    REQUIRE_THROWS_AS(
        SessionConfigLoader::load(parseArgs(options, {"-r", "0", "ls"})),
        std::runtime_error);
    REQUIRE_THROWS_AS(SessionConfigLoader::load(parseArgs(options, {})),
                      std::runtime_error);
  }
}

TEST_CASE("SessionConfig from a file", "[SessionConfig]") {
  TempConfigFile file(
      "[Session]\n"
      "lines=12\n"
      "retention=300\n"
      "\n"
      "[Debug]\n"
      "verbose=2\n"
      "logsize=1000\n"
      "\n"
      "[Process.server]\n"
      "command=python3 -m http.server\n"
      "args=8000\n"
      "cwd=/tmp\n"
      "env=PYTHONUNBUFFERED=1;DEBUG=yes\n"
      "merge_stderr=true\n"
      "\n"
      "[Process.tail]\n"
      "command=tail -f /var/log/syslog\n");
  auto options = SessionConfigLoader::createOptions();

  SECTION("File only") {
    auto result = parseArgs(options, {"--cfgfile", file.path});
    SessionConfig config = SessionConfigLoader::load(result);
    REQUIRE(config.viewportHeight == 12);
    REQUIRE(config.retention == 300);
    REQUIRE(config.verbose == 2);
    REQUIRE(config.maxLogSize == "1000");
    REQUIRE(config.commands.size() == 2);

    const CommandSpec& server = config.commands[0];
    REQUIRE(server.executable == "python3");
    REQUIRE(server.args == vector<string>({"-m", "http.server", "8000"}));
    REQUIRE(server.options.workingDirectory == "/tmp");
    REQUIRE(server.options.mergeStderr);
    REQUIRE(server.options.environment.at("PYTHONUNBUFFERED") == "1");
    REQUIRE(server.options.environment.at("DEBUG") == "yes");

    REQUIRE(config.commands[1].executable == "tail");
    REQUIRE(!config.commands[1].options.mergeStderr);
  }

  SECTION("Flags win over the file and commands are appended") {
    auto result = parseArgs(
        options, {"--cfgfile", file.path, "--lines", "30", "echo extra"});
    SessionConfig config = SessionConfigLoader::load(result);
    REQUIRE(config.viewportHeight == 30);
    REQUIRE(config.retention == 300);
    REQUIRE(config.commands.size() == 3);
    REQUIRE(config.commands[2].executable == "echo");
  }
}

TEST_CASE("SessionConfig rejects bad files", "[SessionConfig]") {
  SessionConfig config;

  SECTION("Missing file") {
    REQUIRE_THROWS_AS(SessionConfigLoader::loadFile(
                          "/nonexistent/tabmux.ini", &config),
                      std::runtime_error);
  }

  SECTION("Process without a command") {
    TempConfigFile file("[Process.empty]\ncwd=/tmp\n");
    REQUIRE_THROWS_AS(SessionConfigLoader::loadFile(file.path, &config),
                      std::runtime_error);
  }

  SECTION("Zero retention") {
    TempConfigFile file("[Session]\nretention=0\n");
    REQUIRE_THROWS_AS(SessionConfigLoader::loadFile(file.path, &config),
                      std::runtime_error);
  }
}
