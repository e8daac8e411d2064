#ifndef __TABMUX_POSIX_PROCESS_HANDLE_HPP__
#define __TABMUX_POSIX_PROCESS_HANDLE_HPP__

#include "ProcessHandle.hpp"

namespace tabmux {
/**
 * @brief Child started with fork/execvp whose stdout is a non-blocking pipe.
 */
class PosixProcessHandle : public ProcessHandle {
 public:
  PosixProcessHandle(pid_t _pid, int _outputFd);
  virtual ~PosixProcessHandle();

  virtual int getFd() { return outputFd; }
  virtual string readOutput();
  virtual bool pollExit(int* exitStatus);
  virtual void sendSignal(int signum);
  virtual pid_t getPid() { return pid; }

 protected:
  void closeOutput();

  pid_t pid;
  int outputFd;
  /** @brief Set once waitpid has reaped the child. */
  bool reaped;
  /** @brief Set once the exit has been handed to a caller of pollExit. */
  bool exitReported;
  int status;
};

/**
 * @brief Spawns real children.  Exec failures are passed back over a
 * close-on-exec pipe so that spawn() fails synchronously.
 */
class PosixProcessSpawner : public ProcessSpawner {
 public:
  virtual ~PosixProcessSpawner() {}

  virtual shared_ptr<ProcessHandle> spawn(const CommandSpec& command);
};
}  // namespace tabmux

#endif  // __TABMUX_POSIX_PROCESS_HANDLE_HPP__
