#include "HistoryStore.hpp"

namespace tabmux {
HistoryStore::HistoryStore(size_t _retention) : retention(_retention) {
  if (retention == HistoryBuffer::UNBOUNDED) {
    STFATAL << "Child retention must be at least 1";
  }
  histories.push_back(HistoryBuffer(HistoryBuffer::UNBOUNDED));
}

int HistoryStore::addChildTab() {
  histories.push_back(HistoryBuffer(retention));
  return int(histories.size()) - 1;
}

void HistoryStore::append(int tabIndex, const string& data) {
  fatalIfInvalid(tabIndex);
  histories[tabIndex].append(data);
}

const HistoryBuffer& HistoryStore::get(int tabIndex) const {
  fatalIfInvalid(tabIndex);
  return histories[tabIndex];
}

void HistoryStore::fatalIfInvalid(int tabIndex) const {
  if (tabIndex < 0 || tabIndex >= int(histories.size())) {
    STFATAL << "Tried to access a tab that doesn't exist: " << tabIndex;
  }
}
}  // namespace tabmux
