#ifndef __TABMUX_PROCESS_SUPERVISOR_HPP__
#define __TABMUX_PROCESS_SUPERVISOR_HPP__

#include "Headers.hpp"
#include "MultiplexerState.hpp"
#include "ProcessHandle.hpp"

namespace tabmux {
/**
 * @brief Owns the child lifecycle: spawning, routing output into histories,
 * interrupting, observing exits and restarting.
 *
 * Every operation returns true when the screen needs a redraw.  Handlers
 * always read the current active tab from the state, so an exit that
 * arrives after the operator switched tabs is still handled correctly.
 */
class ProcessSupervisor {
 public:
  ProcessSupervisor(shared_ptr<MultiplexerState> _state,
                    shared_ptr<ProcessSpawner> _spawner);

  /**
   * @brief Starts every command and creates its tab.  Throws
   * std::runtime_error if any of them cannot be started.
   */
  void spawnAll(const vector<CommandSpec>& commands);

  /** @brief Writes a message to the main tab. */
  bool print(const string& data);
  /** @brief Routes a chunk of child output to its tab. */
  bool onOutput(int tabIndex, const string& data);
  /**
   * @brief Records that a child exited and offers a restart.  A second
   * notification for the same run is ignored.  Redraws whenever the main
   * tab or the child's own tab is showing.
   */
  bool onExit(int tabIndex, int exitStatus);

  /**
   * @brief Ends the session: runs the pre-exit hooks, sends SIGTERM to every
   * child and marks the session TERMINATING.  Does not wait for children.
   */
  bool interruptMain();
  /**
   * @brief Notes the interrupt in the tab and sends SIGINT to its child.
   * Always redraws.
   */
  bool interruptChild(int tabIndex);
  /**
   * @brief Respawns an EXITED child with the command and options it was
   * started with.
   * History is kept; a marker line separates the runs.
   */
  bool restart(int tabIndex);

  /** @brief Called by interruptMain() before any child is signalled. */
  void addPreExitHook(function<void()> hook);

 protected:
  shared_ptr<MultiplexerState> state;
  shared_ptr<ProcessSpawner> spawner;
  vector<function<void()>> preExitHooks;

  static string describeExit(int exitStatus);
};
}  // namespace tabmux

#endif  // __TABMUX_PROCESS_SUPERVISOR_HPP__
