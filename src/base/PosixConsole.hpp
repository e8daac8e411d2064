#ifndef __TABMUX_POSIX_CONSOLE_HPP__
#define __TABMUX_POSIX_CONSOLE_HPP__

#include "Console.hpp"

namespace tabmux {
/** @brief Turns on UTF-8 extended coordinates and any-event mouse tracking. */
const string ENABLE_MOUSE_EVENTS = "\x1b[?1005h\x1b[?1003h";
/** @brief The "low" variants of ENABLE_MOUSE_EVENTS. */
const string DISABLE_MOUSE_EVENTS = "\x1b[?1005l\x1b[?1003l";

/**
 * @brief The process' own tty.  setup() switches stdin to raw byte-at-a-time
 * input and enables mouse reports; teardown() or emergencyRestore() undoes
 * both exactly once.
 */
class PosixConsole : public Console {
 public:
  PosixConsole();
  virtual ~PosixConsole();

  virtual void setup();
  virtual void teardown();
  virtual int getInputFd() { return STDIN_FILENO; }
  virtual int getFd() { return STDOUT_FILENO; }
  virtual void emergencyRestore();

 protected:

  static termios terminal_backup;
  static std::atomic<bool> active;
};
}  // namespace tabmux

#endif  // __TABMUX_POSIX_CONSOLE_HPP__
