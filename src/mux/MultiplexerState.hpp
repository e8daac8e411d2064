#ifndef __TABMUX_MULTIPLEXER_STATE_HPP__
#define __TABMUX_MULTIPLEXER_STATE_HPP__

#include "Headers.hpp"
#include "HistoryStore.hpp"
#include "ProcessHandle.hpp"

namespace tabmux {
/** @brief Default number of history lines drawn below the tab bar. */
const int DEFAULT_VIEWPORT_HEIGHT = 20;
/** @brief Auto-follow keeps tailing while the cursor is this close to it. */
const int FOLLOW_DISTANCE = 2;

enum class ProcessStatus {
  RUNNING,
  TERMINATING,
  EXITED,
};

enum class SessionStatus {
  ACTIVE,
  TERMINATING,
};

string processStatusToString(ProcessStatus status);

/** @brief One child: how to launch it, its handle and where it is in life. */
struct ProcessRecord {
  CommandSpec command;
  shared_ptr<ProcessHandle> handle;
  ProcessStatus status = ProcessStatus::RUNNING;
  int restartCount = 0;
  /** @brief Raw wait status from the last exit, -1 while never exited. */
  int lastExitStatus = -1;
};

/**
 * @brief Everything the session knows: tabs, histories, cursor and process
 * records.
 *
 * Tab 0 is the main/log tab, tab `i` (i >= 1) shows process `i - 1`.  The
 * transition methods mutate the state and return true when the screen must
 * be redrawn; they never draw themselves.  Invariant after every
 * transition: 0 <= cursor <= tail(activeTab).
 */
class MultiplexerState {
 public:
  MultiplexerState(int _viewportHeight = DEFAULT_VIEWPORT_HEIGHT,
                   size_t retention = DEFAULT_RETENTION);

  /** @brief Registers a child and creates its tab; returns the tab index. */
  int addProcess(const CommandSpec& command, shared_ptr<ProcessHandle> handle);

  /** @brief Moves one tab left (-1) or right (+1), wrapping, then tails. */
  bool navigate(int direction);
  /** @brief Moves the cursor one line; redraw only if it actually moved. */
  bool scroll(int direction);
  /**
   * @brief Appends to a tab's history.  If that tab is active and the view
   * was following the tail, the cursor jumps to the new tail.
   */
  bool appendOutput(int tabIndex, const string& data);

  /** @brief Largest valid cursor for a tab: max(0, len - viewport). */
  int tail(int tabIndex) const;

  inline int numTabs() const { return histories.numTabs(); }
  inline int numProcesses() const { return int(processes.size()); }
  inline int getActiveTab() const { return activeTab; }
  inline int getCursor() const { return cursor; }
  inline int getViewportHeight() const { return viewportHeight; }
  inline const HistoryBuffer& getHistory(int tabIndex) const {
    return histories.get(tabIndex);
  }
  inline const HistoryBuffer& getActiveHistory() const {
    return histories.get(activeTab);
  }
  inline size_t getRetention() const { return histories.getRetention(); }

  /** @brief Record behind a child tab (tabIndex >= 1). */
  ProcessRecord& getProcessForTab(int tabIndex);
  const ProcessRecord& getProcessForTab(int tabIndex) const;

  inline SessionStatus getStatus() const { return status; }
  inline void setStatus(SessionStatus _status) { status = _status; }
  inline int getExitCode() const { return exitCode; }
  inline void setExitCode(int _exitCode) { exitCode = _exitCode; }

 protected:
  int viewportHeight;
  int activeTab;
  int cursor;
  HistoryStore histories;
  vector<ProcessRecord> processes;
  SessionStatus status;
  int exitCode;

  void fatalIfNotChildTab(int tabIndex) const;
};
}  // namespace tabmux

#endif  // __TABMUX_MULTIPLEXER_STATE_HPP__
