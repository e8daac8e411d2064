#include "EmergencyHandler.hpp"
#include "PosixProcessHandle.hpp"
#include "TestHeaders.hpp"

using namespace tabmux;

namespace {
CommandSpec shellCommand(const string& script, bool mergeStderr = false) {
  CommandSpec command;
  command.executable = "/bin/sh";
  command.args = {"-c", script};
  command.options.mergeStderr = mergeStderr;
  return command;
}

// Collects output until the child has exited and its pipe is drained.
string runToExit(shared_ptr<ProcessHandle> handle, int* exitStatus) {
  string output;
  for (int attempt = 0; attempt < 5000; attempt++) {
    output += handle->readOutput();
    if (handle->pollExit(exitStatus)) {
      while (handle->getFd() >= 0) {
        string rest = handle->readOutput();
        if (rest.empty()) {
          break;
        }
        output += rest;
      }
      return output;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  FAIL("Child did not exit");
  return output;
}
}  // namespace

TEST_CASE("PosixProcessHandle captures stdout", "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;
  auto handle = spawner.spawn(shellCommand("echo hello; echo world"));
  REQUIRE(handle->getPid() > 0);
  REQUIRE(handle->getFd() >= 0);

  int exitStatus = -1;
  REQUIRE(runToExit(handle, &exitStatus) == "hello\nworld\n");
  REQUIRE(WIFEXITED(exitStatus));
  REQUIRE(WEXITSTATUS(exitStatus) == 0);

  // The exit is only reported once
  REQUIRE(!handle->pollExit(&exitStatus));
}

TEST_CASE("PosixProcessHandle exit codes", "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;
  auto handle = spawner.spawn(shellCommand("exit 3"));
  int exitStatus = -1;
  runToExit(handle, &exitStatus);
  REQUIRE(WIFEXITED(exitStatus));
  REQUIRE(WEXITSTATUS(exitStatus) == 3);
}

TEST_CASE("PosixProcessHandle stderr", "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;
  int exitStatus;

  SECTION("Dropped by default") {
    auto handle = spawner.spawn(shellCommand("echo out; echo err >&2"));
    REQUIRE(runToExit(handle, &exitStatus) == "out\n");
  }

  SECTION("Merged on request") {
    auto handle =
        spawner.spawn(shellCommand("echo out; echo err >&2", true));
    REQUIRE(runToExit(handle, &exitStatus) == "out\nerr\n");
  }
}

TEST_CASE("PosixProcessHandle spawn options", "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;
  int exitStatus;
  CommandSpec command = shellCommand("pwd; echo $TABMUX_TEST_VALUE");
  command.options.workingDirectory = "/";
  command.options.environment["TABMUX_TEST_VALUE"] = "42";
  auto handle = spawner.spawn(command);
  REQUIRE(runToExit(handle, &exitStatus) == "/\n42\n");
}

TEST_CASE("PosixProcessHandle spawn failures", "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;

  SECTION("Missing executable") {
    CommandSpec command;
    command.executable = "/nonexistent/tabmux-test-binary";
    REQUIRE_THROWS_AS(spawner.spawn(command), std::runtime_error);
  }

  SECTION("Missing working directory") {
    CommandSpec command = shellCommand("true");
    command.options.workingDirectory = "/nonexistent/directory";
    REQUIRE_THROWS_AS(spawner.spawn(command), std::runtime_error);
  }

  SECTION("Empty command") {
    REQUIRE_THROWS_AS(spawner.spawn(CommandSpec()), std::runtime_error);
  }
}

TEST_CASE("PosixProcessHandle signals", "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;
  int exitStatus = -1;

  SECTION("SIGTERM stops a long running child") {
    auto handle = spawner.spawn(shellCommand("exec sleep 30"));
    handle->sendSignal(SIGTERM);
    runToExit(handle, &exitStatus);
    REQUIRE(WIFSIGNALED(exitStatus));
    REQUIRE(WTERMSIG(exitStatus) == SIGTERM);
  }

  SECTION("SIGINT is delivered") {
    auto handle = spawner.spawn(shellCommand("exec sleep 30"));
    handle->sendSignal(SIGINT);
    runToExit(handle, &exitStatus);
    REQUIRE(WIFSIGNALED(exitStatus));
    REQUIRE(WTERMSIG(exitStatus) == SIGINT);
  }

  SECTION("Signalling an exited child is harmless") {
    auto handle = spawner.spawn(shellCommand("true"));
    runToExit(handle, &exitStatus);
    handle->sendSignal(SIGTERM);
    REQUIRE(!handle->pollExit(&exitStatus));
  }
}

TEST_CASE("PosixProcessHandle children are tracked until reaped",
          "[PosixProcessHandle]") {
  PosixProcessSpawner spawner;
  int exitStatus = -1;
  auto handle = spawner.spawn(shellCommand("exec sleep 30"));
  REQUIRE(EmergencyHandler::isTracked(handle->getPid()));

  // What SIGTERM/SIGHUP or a crash does to the children
  EmergencyHandler::signalChildren(SIGTERM);
  runToExit(handle, &exitStatus);
  REQUIRE(WIFSIGNALED(exitStatus));
  REQUIRE(WTERMSIG(exitStatus) == SIGTERM);
  REQUIRE(!EmergencyHandler::isTracked(handle->getPid()));
}
