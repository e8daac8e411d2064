#ifndef __TABMUX_HISTORY_BUFFER_HPP__
#define __TABMUX_HISTORY_BUFFER_HPP__

#include "Headers.hpp"

namespace tabmux {
/**
 * @brief Append-only record of the chunks one tab has received.
 *
 * A bounded buffer is a fixed-capacity ring: once `retention` chunks are
 * stored, every append overwrites the oldest one.  An unbounded buffer
 * (retention == UNBOUNDED) only grows.  Chunks are stored as they arrived;
 * they are not re-split on newlines.
 */
class HistoryBuffer {
 public:
  static constexpr size_t UNBOUNDED = 0;

  explicit HistoryBuffer(size_t _retention = UNBOUNDED);

  void append(const string& line);

  /** @brief Number of stored chunks, never more than the retention. */
  size_t size() const { return count; }
  bool empty() const { return count == 0; }
  bool isBounded() const { return retention != UNBOUNDED; }
  size_t getRetention() const { return retention; }

  /** @brief Chunk `index`, where 0 is the oldest one still retained. */
  const string& at(size_t index) const;

  /** @brief Chunks in `[begin, end)`, clamped to the stored range. */
  vector<string> slice(size_t begin, size_t end) const;

 protected:
  size_t retention;
  vector<string> lines;
  /** @brief Position of the oldest chunk inside `lines`. */
  size_t head;
  size_t count;
};
}  // namespace tabmux

#endif  // __TABMUX_HISTORY_BUFFER_HPP__
