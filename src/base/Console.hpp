#ifndef __TABMUX_CONSOLE_HPP__
#define __TABMUX_CONSOLE_HPP__

#include "FdUtils.hpp"
#include "Headers.hpp"

namespace tabmux {
/**
 * @brief The operator's terminal: where keystrokes come from and frames go.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Prepares the terminal (raw input, mouse reports). */
  virtual void setup() = 0;
  /** @brief Restores the terminal.  Only the first call has an effect. */
  virtual void teardown() = 0;
  /** @brief Descriptor that delivers raw keystrokes and mouse reports. */
  virtual int getInputFd() = 0;
  /** @brief Descriptor that frames are written to. */
  virtual int getFd() = 0;

  /**
   * @brief Restores the terminal from a signal handler.  Must be
   * async-signal-safe; only used when normal teardown cannot run.
   */
  virtual void emergencyRestore() {}

  /** @brief Writes bytes to the terminal. */
  virtual void write(const string& s) {
    FdUtils::writeAll(getFd(), &s[0], s.length());
  }
};
}  // namespace tabmux

#endif  // __TABMUX_CONSOLE_HPP__
