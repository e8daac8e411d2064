#ifndef __TABMUX_PROCESS_HANDLE_HPP__
#define __TABMUX_PROCESS_HANDLE_HPP__

#include "Headers.hpp"

namespace tabmux {
/** @brief How a child command should be launched. */
struct SpawnOptions {
  /** @brief Directory the child starts in; empty inherits ours. */
  string workingDirectory;
  /** @brief Extra `KEY=VALUE` pairs added to the child environment. */
  map<string, string> environment;
  /** @brief Send the child's stderr down the same pipe as its stdout. */
  bool mergeStderr = false;
};

/** @brief An executable, its arguments, and the spawn options. */
struct CommandSpec {
  string executable;
  vector<string> args;
  SpawnOptions options;

  /** @brief Human readable command line, used in logs and errors. */
  string toString() const {
    string s = executable;
    for (auto &it : args) {
      s += " ";
      s += it;
    }
    return s;
  }
};

/**
 * @brief A running child as seen by the multiplexer: a readable output
 * stream, a target for signals and a source of one exit notification.
 */
class ProcessHandle {
 public:
  virtual ~ProcessHandle() {}

  /** @brief Descriptor that can be polled for output, -1 once closed. */
  virtual int getFd() = 0;
  /**
   * @brief Drains whatever output is ready without blocking.
   * @return The bytes read, empty if nothing was available.
   */
  virtual string readOutput() = 0;
  /**
   * @brief Checks, without blocking, whether the child has exited.
   * @param exitStatus Receives the raw wait status when it has.
   * @return true exactly once, the first time the exit is observed.
   */
  virtual bool pollExit(int *exitStatus) = 0;
  /** @brief Delivers a signal; a child that is gone makes this a no-op. */
  virtual void sendSignal(int signum) = 0;
  /** @brief OS process id, -1 when not known. */
  virtual pid_t getPid() = 0;
};

/**
 * @brief Launches commands.  Throws std::runtime_error when a command cannot
 * be started.
 */
class ProcessSpawner {
 public:
  virtual ~ProcessSpawner() {}

  virtual shared_ptr<ProcessHandle> spawn(const CommandSpec &command) = 0;
};
}  // namespace tabmux

#endif  // __TABMUX_PROCESS_HANDLE_HPP__
