#ifndef __TABMUX_INPUT_DECODER_HPP__
#define __TABMUX_INPUT_DECODER_HPP__

#include "Headers.hpp"

namespace tabmux {
/** @brief Meaning of one raw chunk read from the terminal. */
enum class InputEventType {
  INTERRUPT,
  NAVIGATE_LEFT,
  NAVIGATE_RIGHT,
  SCROLL_UP,
  SCROLL_DOWN,
  RESTART_KEY,
  UNRECOGNIZED,
};

/** @brief Ctrl-C (ETX) as delivered by a tty in raw mode. */
const string KEY_INTERRUPT = "\x03";
const string KEY_LEFT = "\x1b[D";
const string KEY_RIGHT = "\x1b[C";
const string KEY_RESTART = "k";
/** @brief Prefix of an X10/normal mouse report: ESC [ M b x y */
const string MOUSE_REPORT_PREFIX = "\x1b[M";

/**
 * @brief Classifies raw terminal chunks.  One chunk is one keypress or one
 * mouse report; nothing is buffered across chunks, so a sequence split over
 * two reads is dropped.
 */
class InputDecoder {
 public:
  static InputEventType decode(const string& chunk);

  /**
   * @brief Inspects the button byte of a mouse report.
   * @return -1 for wheel up, +1 for wheel down, 0 if `chunk` is not a wheel
   * report.
   */
  static int scrollDirection(const string& chunk);
};

string inputEventTypeToString(InputEventType type);
}  // namespace tabmux

#endif  // __TABMUX_INPUT_DECODER_HPP__
