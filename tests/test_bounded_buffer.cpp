#include "et/audit/bounded_buffer.h"
#include "et/error.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

void TestEvictsOldestWhenFull() { // TSK208
  et::audit::BoundedBuffer<std::string> buffer(2);
  assert(!buffer.Push("a") && "first push evicts nothing");
  assert(!buffer.Push("b") && "second push evicts nothing");
  assert(buffer.full());
  auto evicted = buffer.Push("c");
  assert(evicted && *evicted == "a" && "oldest element must be evicted");
  auto items = buffer.Snapshot();
  assert((items == std::vector<std::string>{"b", "c"}));
  assert(buffer.size() == 2 && buffer.capacity() == 2);
}

void TestCapacityOneKeepsLatest() {
  et::audit::BoundedBuffer<int> buffer(1);
  for (int i = 0; i < 10; ++i) {
    buffer.Push(i);
    assert(buffer.size() == 1);
  }
  assert(buffer.Snapshot() == std::vector<int>{9});
}

void TestSnapshotIsIndependent() {
  et::audit::BoundedBuffer<int> buffer(3);
  buffer.Push(1);
  auto before = buffer.Snapshot();
  buffer.Push(2);
  assert(before.size() == 1 && "earlier snapshot must not observe later pushes");
  before.push_back(42);
  assert(buffer.Snapshot() == (std::vector<int>{1, 2}));
}

void TestSnapshotIfKeepsOrder() {
  et::audit::BoundedBuffer<int> buffer(5);
  for (int i = 1; i <= 7; ++i) {
    buffer.Push(i);
  }
  auto even = buffer.SnapshotIf([](int v) { return v % 2 == 0; });
  assert((even == std::vector<int>{4, 6}));
}

void TestClear() {
  et::audit::BoundedBuffer<int> buffer(2);
  buffer.Push(1);
  buffer.Push(2);
  buffer.Clear();
  assert(buffer.empty());
  assert(buffer.capacity() == 2);
  buffer.Push(3);
  assert(buffer.Snapshot() == std::vector<int>{3});
}

void TestZeroCapacityRejected() {
  bool threw = false;
  try {
    et::audit::BoundedBuffer<int> buffer(0);
  } catch (const et::Error& err) {
    threw = true;
    assert(err.domain == et::ErrorDomain::Validation);
    assert(err.code == et::errors::validation::kZeroCapacity);
  }
  assert(threw && "zero capacity must be rejected");
}

} // namespace

int main() {
  TestEvictsOldestWhenFull();
  TestCapacityOneKeepsLatest();
  TestSnapshotIsIndependent();
  TestSnapshotIfKeepsOrder();
  TestClear();
  TestZeroCapacityRejected();
  std::cout << "bounded buffer test ok\n";
  return 0;
}
