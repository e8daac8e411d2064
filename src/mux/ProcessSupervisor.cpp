#include "ProcessSupervisor.hpp"

namespace tabmux {
ProcessSupervisor::ProcessSupervisor(shared_ptr<MultiplexerState> _state,
                                     shared_ptr<ProcessSpawner> _spawner)
    : state(_state), spawner(_spawner) {}

void ProcessSupervisor::spawnAll(const vector<CommandSpec>& commands) {
  for (auto& command : commands) {
    shared_ptr<ProcessHandle> handle = spawner->spawn(command);
    int tabIndex = state->addProcess(command, handle);
    LOG(INFO) << "Process " << tabIndex << " is '" << command.toString()
              << "' (pid " << handle->getPid() << ")";
  }
}

bool ProcessSupervisor::print(const string& data) {
  return state->appendOutput(0, data);
}

bool ProcessSupervisor::onOutput(int tabIndex, const string& data) {
  VLOG(3) << "Process " << tabIndex << " wrote " << data.length() << " bytes";
  return state->appendOutput(tabIndex, data);
}

bool ProcessSupervisor::onExit(int tabIndex, int exitStatus) {
  ProcessRecord& record = state->getProcessForTab(tabIndex);
  if (record.status == ProcessStatus::EXITED) {
    VLOG(1) << "Ignoring repeated exit for process " << tabIndex;
    return false;
  }
  LOG(INFO) << "Process " << tabIndex << " " << describeExit(exitStatus)
            << " while " << processStatusToString(record.status);
  record.status = ProcessStatus::EXITED;
  record.lastExitStatus = exitStatus;

  string tab = to_string(tabIndex);
  bool redraw = false;
  redraw |= print("Process '" + tab + "' exited\n");
  redraw |= state->appendOutput(tabIndex, "\n");
  redraw |= state->appendOutput(tabIndex,
                                "Press 'K' to restart process '" + tab + "'\n");
  // Both notices must show even when the view is scrolled back
  int activeTab = state->getActiveTab();
  return redraw || activeTab == tabIndex || activeTab == 0;
}

bool ProcessSupervisor::interruptMain() {
  LOG(INFO) << "Interrupt on the main tab, ending the session";
  for (auto& hook : preExitHooks) {
    hook();
  }
  for (int tabIndex = 1; tabIndex < state->numTabs(); tabIndex++) {
    ProcessRecord& record = state->getProcessForTab(tabIndex);
    record.handle->sendSignal(SIGTERM);
    if (record.status == ProcessStatus::RUNNING) {
      record.status = ProcessStatus::TERMINATING;
    }
  }
  state->setStatus(SessionStatus::TERMINATING);
  return false;
}

bool ProcessSupervisor::interruptChild(int tabIndex) {
  ProcessRecord& record = state->getProcessForTab(tabIndex);
  LOG(INFO) << "Interrupting process " << tabIndex << " ("
            << processStatusToString(record.status) << ")";
  state->appendOutput(tabIndex, "\n");
  state->appendOutput(tabIndex, "Received SIGINT\n");
  if (record.status == ProcessStatus::RUNNING) {
    record.status = ProcessStatus::TERMINATING;
  }
  record.handle->sendSignal(SIGINT);
  return true;
}

bool ProcessSupervisor::restart(int tabIndex) {
  if (tabIndex < 1) {
    return false;
  }
  ProcessRecord& record = state->getProcessForTab(tabIndex);
  if (record.status != ProcessStatus::EXITED) {
    VLOG(1) << "Process " << tabIndex << " is "
            << processStatusToString(record.status) << ", not restarting";
    return false;
  }
  string tab = to_string(tabIndex);
  shared_ptr<ProcessHandle> handle;
  try {
    handle = spawner->spawn(record.command);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Restart of process " << tabIndex << " failed: " << ex.what();
    state->appendOutput(tabIndex, "\n");
    state->appendOutput(
        tabIndex,
        "Failed to restart process '" + tab + "': " + ex.what() + "\n");
    return true;
  }
  record.handle = handle;
  record.status = ProcessStatus::RUNNING;
  record.restartCount++;
  LOG(INFO) << "Restarted process " << tabIndex << " as pid "
            << handle->getPid() << " (restart #" << record.restartCount << ")";

  state->appendOutput(tabIndex, "\n");
  state->appendOutput(tabIndex, "Restarted process '" + tab + "'\n");
  print("Process '" + tab + "' restarted\n");
  return true;
}

void ProcessSupervisor::addPreExitHook(function<void()> hook) {
  preExitHooks.push_back(hook);
}

string ProcessSupervisor::describeExit(int exitStatus) {
  if (WIFEXITED(exitStatus)) {
    return "exited with code " + to_string(WEXITSTATUS(exitStatus));
  }
  if (WIFSIGNALED(exitStatus)) {
    return "was killed by signal " + to_string(WTERMSIG(exitStatus));
  }
  return "exited with status " + to_string(exitStatus);
}
}  // namespace tabmux
