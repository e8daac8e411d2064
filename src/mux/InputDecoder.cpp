#include "InputDecoder.hpp"

namespace tabmux {
#define MOUSE_WHEEL_MASK (0x60)
#define MOUSE_WHEEL_DOWN_BIT (0x01)

InputEventType InputDecoder::decode(const string& chunk) {
  if (chunk == KEY_INTERRUPT) {
    return InputEventType::INTERRUPT;
  }
  if (chunk == KEY_LEFT) {
    return InputEventType::NAVIGATE_LEFT;
  }
  if (chunk == KEY_RIGHT) {
    return InputEventType::NAVIGATE_RIGHT;
  }
  if (chunk == KEY_RESTART) {
    return InputEventType::RESTART_KEY;
  }
  int direction = scrollDirection(chunk);
  if (direction < 0) {
    return InputEventType::SCROLL_UP;
  }
  if (direction > 0) {
    return InputEventType::SCROLL_DOWN;
  }
  return InputEventType::UNRECOGNIZED;
}

int InputDecoder::scrollDirection(const string& chunk) {
  if (chunk.length() < MOUSE_REPORT_PREFIX.length() + 1 ||
      !startsWith(chunk, MOUSE_REPORT_PREFIX)) {
    return 0;
  }
  unsigned char button = (unsigned char)chunk[3];
  if ((button & MOUSE_WHEEL_MASK) != MOUSE_WHEEL_MASK) {
    return 0;
  }
  return (button & MOUSE_WHEEL_DOWN_BIT) ? 1 : -1;
}

string inputEventTypeToString(InputEventType type) {
  switch (type) {
    case InputEventType::INTERRUPT:
      return "INTERRUPT";
    case InputEventType::NAVIGATE_LEFT:
      return "NAVIGATE_LEFT";
    case InputEventType::NAVIGATE_RIGHT:
      return "NAVIGATE_RIGHT";
    case InputEventType::SCROLL_UP:
      return "SCROLL_UP";
    case InputEventType::SCROLL_DOWN:
      return "SCROLL_DOWN";
    case InputEventType::RESTART_KEY:
      return "RESTART_KEY";
    case InputEventType::UNRECOGNIZED:
      return "UNRECOGNIZED";
  }
  return "UNKNOWN";
}
}  // namespace tabmux
