#include "HistoryStore.hpp"
#include "TestHeaders.hpp"

using namespace tabmux;

namespace {
vector<string> contents(const HistoryBuffer& buffer) {
  return buffer.slice(0, buffer.size());
}
}  // namespace

TEST_CASE("HistoryBuffer bounded retention", "[HistoryBuffer]") {
  HistoryBuffer buffer(3);
  REQUIRE(buffer.isBounded());
  REQUIRE(buffer.empty());

  SECTION("Below capacity nothing is evicted") {
    buffer.append("a");
    buffer.append("b");
    REQUIRE(buffer.size() == 2);
    REQUIRE(contents(buffer) == vector<string>({"a", "b"}));
  }

  SECTION("Oldest lines go first") {
    for (auto& it : {"a", "b", "c", "d", "e"}) {
      buffer.append(it);
    }
    REQUIRE(buffer.size() == 3);
    REQUIRE(contents(buffer) == vector<string>({"c", "d", "e"}));
    REQUIRE(buffer.at(0) == "c");
    REQUIRE(buffer.at(2) == "e");
  }

  SECTION("Order survives many wraps") {
    for (int a = 0; a < 100; a++) {
      buffer.append(to_string(a));
    }
    REQUIRE(buffer.size() == 3);
    REQUIRE(contents(buffer) == vector<string>({"97", "98", "99"}));
  }
}

TEST_CASE("HistoryBuffer with retention one", "[HistoryBuffer]") {
  HistoryBuffer buffer(1);
  buffer.append("first");
  buffer.append("second");
  REQUIRE(buffer.size() == 1);
  REQUIRE(buffer.at(0) == "second");
}

TEST_CASE("HistoryBuffer keeps chunks as received", "[HistoryBuffer]") {
  HistoryBuffer buffer(10);
  buffer.append("two\nlines\n");
  buffer.append("partial");
  REQUIRE(buffer.size() == 2);
  REQUIRE(buffer.at(0) == "two\nlines\n");
  REQUIRE(buffer.at(1) == "partial");
}

TEST_CASE("HistoryBuffer unbounded never evicts", "[HistoryBuffer]") {
  HistoryBuffer buffer;
  REQUIRE(!buffer.isBounded());
  for (int a = 0; a < 5000; a++) {
    buffer.append(to_string(a));
  }
  REQUIRE(buffer.size() == 5000);
  REQUIRE(buffer.at(0) == "0");
  REQUIRE(buffer.at(4999) == "4999");
}

TEST_CASE("HistoryBuffer slice clamps", "[HistoryBuffer]") {
  HistoryBuffer buffer(5);
  for (auto& it : {"a", "b", "c", "d", "e", "f", "g"}) {
    buffer.append(it);
  }
  REQUIRE(buffer.slice(1, 3) == vector<string>({"d", "e"}));
  REQUIRE(buffer.slice(3, 100) == vector<string>({"f", "g"}));
  REQUIRE(buffer.slice(4, 2).empty());
  REQUIRE(buffer.slice(10, 20).empty());
}

TEST_CASE("HistoryStore tabs", "[HistoryStore]") {
  HistoryStore store(4);
  REQUIRE(store.numTabs() == 1);
  REQUIRE(store.addChildTab() == 1);
  REQUIRE(store.addChildTab() == 2);
  REQUIRE(store.numTabs() == 3);

  REQUIRE(!store.get(0).isBounded());
  REQUIRE(store.get(1).getRetention() == 4);

  for (int a = 0; a < 10; a++) {
    store.append(0, "main " + to_string(a));
    store.append(2, "child " + to_string(a));
  }
  REQUIRE(store.get(0).size() == 10);
  REQUIRE(store.get(1).size() == 0);
  REQUIRE(store.get(2).size() == 4);
  REQUIRE(store.get(2).at(0) == "child 6");
}
