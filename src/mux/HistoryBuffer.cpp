#include "HistoryBuffer.hpp"

namespace tabmux {
HistoryBuffer::HistoryBuffer(size_t _retention)
    : retention(_retention), head(0), count(0) {}

void HistoryBuffer::append(const string& line) {
  if (!isBounded() || count < retention) {
    lines.push_back(line);
    count++;
    return;
  }
  // Full ring: the oldest slot becomes the newest
  lines[head] = line;
  head = (head + 1) % retention;
}

const string& HistoryBuffer::at(size_t index) const {
  if (index >= count) {
    STFATAL << "History index out of range: " << index << " >= " << count;
  }
  if (!isBounded()) {
    return lines[index];
  }
  return lines[(head + index) % retention];
}

vector<string> HistoryBuffer::slice(size_t begin, size_t end) const {
  end = min(end, count);
  vector<string> result;
  if (begin >= end) {
    return result;
  }
  result.reserve(end - begin);
  for (size_t a = begin; a < end; a++) {
    result.push_back(at(a));
  }
  return result;
}
}  // namespace tabmux
