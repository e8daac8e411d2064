#ifndef __TABMUX_RENDERER_HPP__
#define __TABMUX_RENDERER_HPP__

#include "Console.hpp"
#include "MultiplexerState.hpp"

namespace tabmux {
/** @brief Erase the screen and home the cursor. */
const string CLEAR_SCREEN = "\x1b[2J\x1b[H";
const string HEADER_LINE =
    "Use the left and right arrow keys to navigate between processes\n";

/**
 * @brief Full-screen redraw of the header, the tab bar and the visible slice
 * of the active tab.  There is no diffing: every frame repaints everything.
 */
class Renderer {
 public:
  explicit Renderer(shared_ptr<Console> _console);

  /** @brief Builds the bytes of one frame.  Same state, same bytes. */
  static string renderFrame(const MultiplexerState& state);
  /** @brief Tab labels joined with '|', active tab marked with [*]. */
  static string renderTabBar(const MultiplexerState& state);

  /**
   * @brief Writes a frame to the console.  A failed write is logged and the
   * frame is dropped.
   */
  void render(const MultiplexerState& state);

  inline int64_t getFrameCount() const { return frameCount; }

 protected:
  shared_ptr<Console> console;
  int64_t frameCount;
};
}  // namespace tabmux

#endif  // __TABMUX_RENDERER_HPP__
