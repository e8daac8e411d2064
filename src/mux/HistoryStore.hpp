#ifndef __TABMUX_HISTORY_STORE_HPP__
#define __TABMUX_HISTORY_STORE_HPP__

#include "HistoryBuffer.hpp"

namespace tabmux {
/** @brief Default number of chunks kept for each child tab. */
const size_t DEFAULT_RETENTION = 1000;

/**
 * @brief One HistoryBuffer per tab.  Tab 0 (main) is unbounded, every tab
 * added with addChildTab() keeps at most `retention` chunks.
 */
class HistoryStore {
 public:
  explicit HistoryStore(size_t _retention = DEFAULT_RETENTION);

  /** @brief Adds a bounded buffer and returns its tab index. */
  int addChildTab();
  void append(int tabIndex, const string& data);
  const HistoryBuffer& get(int tabIndex) const;
  int numTabs() const { return int(histories.size()); }
  size_t getRetention() const { return retention; }

 protected:
  size_t retention;
  vector<HistoryBuffer> histories;

  void fatalIfInvalid(int tabIndex) const;
};
}  // namespace tabmux

#endif  // __TABMUX_HISTORY_STORE_HPP__
