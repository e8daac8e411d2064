#ifndef __TABMUX_FD_UTILS__
#define __TABMUX_FD_UTILS__

#include "Headers.hpp"

namespace tabmux {
/**
 * @brief Blocking and non-blocking wrappers around POSIX read/write loops on
 * terminal and pipe descriptors.
 */
class FdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads whatever is available without blocking.
   * @param eof Set to true when the other side closed the descriptor.
   * @return The bytes read, empty if nothing was ready.
   */
  static string readAvailable(int fd, bool* eof);

  /** @brief Switches a descriptor to non-blocking mode. */
  static void setNonBlocking(int fd);

  /** @brief Marks a descriptor close-on-exec so children do not inherit it. */
  static void setCloseOnExec(int fd);
};
}  // namespace tabmux
#endif  // __TABMUX_FD_UTILS__
