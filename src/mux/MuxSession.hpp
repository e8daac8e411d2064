#ifndef __TABMUX_MUX_SESSION_HPP__
#define __TABMUX_MUX_SESSION_HPP__

#include "Console.hpp"
#include "EventQueue.hpp"
#include "Headers.hpp"
#include "MultiplexerState.hpp"
#include "ProcessHandle.hpp"
#include "ProcessSupervisor.hpp"
#include "Renderer.hpp"

namespace tabmux {
/** @brief How long one poll waits for terminal input or child output. */
const int POLL_TIMEOUT_MS = 10;

/**
 * @brief The event loop.  Polls the console and every child, turns what it
 * reads into MuxEvents and dispatches them on the calling thread.
 */
class MuxSession {
 public:
  MuxSession(shared_ptr<Console> _console,
             shared_ptr<ProcessSpawner> _spawner,
             int viewportHeight = DEFAULT_VIEWPORT_HEIGHT,
             size_t retention = DEFAULT_RETENTION);
  virtual ~MuxSession();

  /**
   * @brief Spawns the commands, puts the console in raw mode, registers it
   * with EmergencyHandler and draws the first frame.  Throws std::runtime_error if a command cannot be started;
   * in that case the children already started are sent SIGTERM and the
   * console is left untouched.
   */
  void start(const vector<CommandSpec>& commands);

  /** @brief Runs until the session is TERMINATING; returns the exit code. */
  int run();

  /**
   * @brief Waits up to `timeoutMs` for input or output and posts one event
   * per chunk read, in the order the descriptors were checked.
   */
  void pollOnce(int timeoutMs);
  /** @brief Dispatches everything queued; see EventQueue::dispatchPending. */
  int dispatchPending() { return queue->dispatchPending(); }

  /** @brief Applies one decoded keypress or mouse report. */
  bool handleInput(const string& chunk);

  inline shared_ptr<MultiplexerState> getState() { return state; }
  inline shared_ptr<ProcessSupervisor> getSupervisor() { return supervisor; }
  inline shared_ptr<EventQueue> getQueue() { return queue; }
  inline shared_ptr<Renderer> getRenderer() { return renderer; }

 protected:
  shared_ptr<Console> console;
  shared_ptr<MultiplexerState> state;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<Renderer> renderer;
  shared_ptr<EventQueue> queue;

  void postProcessEvents(int tabIndex, ProcessRecord& record, bool readable);
  /** @brief Normal teardown; also drops the emergency registration. */
  void restoreConsole();
};
}  // namespace tabmux

#endif  // __TABMUX_MUX_SESSION_HPP__
