#include "PosixProcessHandle.hpp"

#include "EmergencyHandler.hpp"
#include "FdUtils.hpp"

namespace tabmux {
PosixProcessHandle::PosixProcessHandle(pid_t _pid, int _outputFd)
    : pid(_pid),
      outputFd(_outputFd),
      reaped(false),
      exitReported(false),
      status(0) {}

PosixProcessHandle::~PosixProcessHandle() { closeOutput(); }

string PosixProcessHandle::readOutput() {
  if (outputFd < 0) {
    return string();
  }
  bool eof;
  string data = FdUtils::readAvailable(outputFd, &eof);
  if (eof) {
    VLOG(1) << "Output of pid " << pid << " closed";
    closeOutput();
  }
  return data;
}

bool PosixProcessHandle::pollExit(int* exitStatus) {
  if (exitReported) {
    return false;
  }
  if (!reaped) {
    int rc = waitpid(pid, &status, WNOHANG);
    if (rc == 0) {
      return false;
    }
    if (rc < 0) {
      if (GetErrno() != ECHILD) {
        FATAL_FAIL(rc);
      }
      // Someone else reaped it; all we know is that it is gone
      status = 0;
    }
    reaped = true;
    EmergencyHandler::untrackChild(pid);
  }
  exitReported = true;
  *exitStatus = status;
  return true;
}

void PosixProcessHandle::sendSignal(int signum) {
  if (reaped) {
    VLOG(1) << "Not signalling " << pid << ", it already exited";
    return;
  }
  if (::kill(pid, signum) == -1) {
    if (GetErrno() == ESRCH) {
      return;
    }
    STERROR << "Could not send signal " << signum << " to " << pid << ": "
            << strerror(GetErrno());
  }
}

void PosixProcessHandle::closeOutput() {
  if (outputFd >= 0) {
    ::close(outputFd);
    outputFd = -1;
  }
}

shared_ptr<ProcessHandle> PosixProcessSpawner::spawn(
    const CommandSpec& command) {
  if (command.executable.empty()) {
    throw std::runtime_error("Cannot spawn an empty command");
  }

  // Build everything the child needs before forking
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.executable.c_str()));
  for (auto& it : command.args) {
    argv.push_back(const_cast<char*>(it.c_str()));
  }
  argv.push_back(NULL);

  int outputPipe[2];
  int errorPipe[2];
  FATAL_FAIL(pipe(outputPipe));
  FATAL_FAIL(pipe(errorPipe));
  FdUtils::setCloseOnExec(errorPipe[1]);

  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid == 0) {
    // child process
    ::close(outputPipe[0]);
    ::close(errorPipe[0]);
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
    }
    dup2(outputPipe[1], STDOUT_FILENO);
    if (command.options.mergeStderr) {
      dup2(outputPipe[1], STDERR_FILENO);
    } else if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
    }
    ::close(outputPipe[1]);
    if (devNull > STDERR_FILENO) {
      ::close(devNull);
    }
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGHUP, SIG_DFL);
    signal(SIGINT, SIG_DFL);

    int childErrno = 0;
    if (!command.options.workingDirectory.empty() &&
        chdir(command.options.workingDirectory.c_str()) == -1) {
      childErrno = errno;
    } else {
      for (auto& it : command.options.environment) {
        setenv(it.first.c_str(), it.second.c_str(), 1);
      }
      execvp(argv[0], &argv[0]);
      childErrno = errno;
    }
    ssize_t ignored =
        ::write(errorPipe[1], (const char*)&childErrno, sizeof(childErrno));
    (void)ignored;
    _exit(127);
  }

  // parent process
  ::close(outputPipe[1]);
  ::close(errorPipe[1]);

  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], (char*)&childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(errorPipe[0]);
  if (rc > 0) {
    ::close(outputPipe[0]);
    int throwaway;
    waitpid(pid, &throwaway, 0);
    string message = "Could not start '" + command.toString() +
                     "': " + string(strerror(childErrno));
    LOG(ERROR) << message;
    throw std::runtime_error(message);
  }

  FdUtils::setNonBlocking(outputPipe[0]);
  FdUtils::setCloseOnExec(outputPipe[0]);
  EmergencyHandler::trackChild(pid);
  LOG(INFO) << "Started '" << command.toString() << "' as pid " << pid;
  return shared_ptr<ProcessHandle>(new PosixProcessHandle(pid, outputPipe[0]));
}
}  // namespace tabmux
