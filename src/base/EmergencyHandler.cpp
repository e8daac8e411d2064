#include "EmergencyHandler.hpp"

namespace tabmux {
std::atomic<Console*> EmergencyHandler::console(nullptr);
std::atomic<pid_t> EmergencyHandler::children[MAX_TRACKED_CHILDREN];

void EmergencyHandler::install(Console* _console) {
  console = _console;

  struct sigaction action;
  memset(&action, 0, sizeof(struct sigaction));
  action.sa_handler = EmergencyHandler::onTerminationSignal;
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // LOG(FATAL) aborts, so this also covers STFATAL and FATAL_FAIL
  el::Helpers::setCrashHandler(EmergencyHandler::onCrash);
  VLOG(1) << "Emergency handlers installed";
}

void EmergencyHandler::uninstall() {
  if (console.exchange(nullptr) == nullptr) {
    return;
  }
  signal(SIGTERM, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
  VLOG(1) << "Emergency handlers removed";
}

bool EmergencyHandler::isInstalled() { return console.load() != nullptr; }

void EmergencyHandler::trackChild(pid_t pid) {
  for (int a = 0; a < MAX_TRACKED_CHILDREN; a++) {
    pid_t expected = 0;
    if (children[a].compare_exchange_strong(expected, pid)) {
      return;
    }
  }
  LOG(WARNING) << "Too many children to track, pid " << pid
               << " will not be signalled on an abnormal exit";
}

void EmergencyHandler::untrackChild(pid_t pid) {
  for (int a = 0; a < MAX_TRACKED_CHILDREN; a++) {
    pid_t expected = pid;
    if (children[a].compare_exchange_strong(expected, 0)) {
      return;
    }
  }
}

bool EmergencyHandler::isTracked(pid_t pid) {
  for (int a = 0; a < MAX_TRACKED_CHILDREN; a++) {
    if (children[a].load() == pid) {
      return true;
    }
  }
  return false;
}

void EmergencyHandler::restoreConsole() {
  Console* current = console.load();
  if (current) {
    current->emergencyRestore();
  }
}

void EmergencyHandler::signalChildren(int signum) {
  for (int a = 0; a < MAX_TRACKED_CHILDREN; a++) {
    pid_t pid = children[a].load();
    if (pid > 0) {
      ::kill(pid, signum);
    }
  }
}

void EmergencyHandler::onTerminationSignal(int signum) {
  restoreConsole();
  signalChildren(SIGTERM);
  _exit(128 + signum);
}

void EmergencyHandler::onCrash(int signum) {
  restoreConsole();
  signalChildren(SIGTERM);
  el::Helpers::logCrashReason(signum, true);
  // Must be last: hands the signal back to the default action
  el::Helpers::crashAbort(signum);
}
}  // namespace tabmux
