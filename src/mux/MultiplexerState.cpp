#include "MultiplexerState.hpp"

namespace tabmux {
string processStatusToString(ProcessStatus status) {
  switch (status) {
    case ProcessStatus::RUNNING:
      return "RUNNING";
    case ProcessStatus::TERMINATING:
      return "TERMINATING";
    case ProcessStatus::EXITED:
      return "EXITED";
  }
  return "UNKNOWN";
}

MultiplexerState::MultiplexerState(int _viewportHeight, size_t retention)
    : viewportHeight(_viewportHeight),
      activeTab(0),
      cursor(0),
      histories(retention),
      status(SessionStatus::ACTIVE),
      exitCode(0) {
  if (viewportHeight <= 0) {
    STFATAL << "Viewport height must be positive: " << viewportHeight;
  }
}

int MultiplexerState::addProcess(const CommandSpec& command,
                                 shared_ptr<ProcessHandle> handle) {
  ProcessRecord record;
  record.command = command;
  record.handle = handle;
  record.status = ProcessStatus::RUNNING;
  processes.push_back(record);
  int tabIndex = histories.addChildTab();
  if (tabIndex != int(processes.size())) {
    STFATAL << "Tabs and processes are out of sync: " << tabIndex << " "
            << processes.size();
  }
  return tabIndex;
}

bool MultiplexerState::navigate(int direction) {
  int tabs = numTabs();
  activeTab = ((activeTab + direction) % tabs + tabs) % tabs;
  cursor = tail(activeTab);
  VLOG(1) << "Switched to tab " << activeTab << " cursor " << cursor;
  return true;
}

bool MultiplexerState::scroll(int direction) {
  int oldCursor = cursor;
  if (direction < 0) {
    cursor = max(0, cursor - 1);
  } else if (direction > 0) {
    cursor = min(tail(activeTab), cursor + 1);
  }
  return cursor != oldCursor;
}

bool MultiplexerState::appendOutput(int tabIndex, const string& data) {
  histories.append(tabIndex, data);
  if (tabIndex != activeTab) {
    return false;
  }
  int maxCursor = tail(tabIndex);
  if (cursor > maxCursor - FOLLOW_DISTANCE) {
    cursor = maxCursor;
    return true;
  }
  // The operator scrolled back; leave the view alone
  return false;
}

int MultiplexerState::tail(int tabIndex) const {
  return max(0, int(histories.get(tabIndex).size()) - viewportHeight);
}

ProcessRecord& MultiplexerState::getProcessForTab(int tabIndex) {
  fatalIfNotChildTab(tabIndex);
  return processes[tabIndex - 1];
}

const ProcessRecord& MultiplexerState::getProcessForTab(int tabIndex) const {
  fatalIfNotChildTab(tabIndex);
  return processes[tabIndex - 1];
}

void MultiplexerState::fatalIfNotChildTab(int tabIndex) const {
  if (tabIndex < 1 || tabIndex > int(processes.size())) {
    STFATAL << "Tried to get a process for a tab that doesn't have one: "
            << tabIndex;
  }
}
}  // namespace tabmux
