#ifndef __TABMUX_EMERGENCY_HANDLER_HPP__
#define __TABMUX_EMERGENCY_HANDLER_HPP__

#include "Console.hpp"
#include "Headers.hpp"

namespace tabmux {
/** @brief Upper bound on children that are signalled on an abnormal exit. */
const int MAX_TRACKED_CHILDREN = 256;

/**
 * @brief Cleans up when tabmux dies without going through its normal
 * shutdown: a fatal log or crash signal (through the easylogging++ crash
 * handler) or SIGTERM/SIGHUP.  The registered console is restored and every
 * tracked child gets SIGTERM.
 *
 * Everything reachable from the handlers is async-signal-safe: a raw console
 * pointer and a fixed table of pids.
 */
class EmergencyHandler {
 public:
  /**
   * @brief Registers the console and installs the signal and crash
   * handlers.  The console must outlive the registration.
   */
  static void install(Console* console);
  /** @brief Forgets the console and restores the default SIGTERM/SIGHUP. */
  static void uninstall();
  static bool isInstalled();

  static void trackChild(pid_t pid);
  static void untrackChild(pid_t pid);
  static bool isTracked(pid_t pid);

  /** @brief Restores the registered console, if any. */
  static void restoreConsole();
  /** @brief Sends `signum` to every tracked child. */
  static void signalChildren(int signum);

 protected:
  static void onTerminationSignal(int signum);
  static void onCrash(int signum);

  static std::atomic<Console*> console;
  static std::atomic<pid_t> children[MAX_TRACKED_CHILDREN];
};
}  // namespace tabmux

#endif  // __TABMUX_EMERGENCY_HANDLER_HPP__
