#include "internal/source/change_tracker.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::source::ChangeDecision;
using resource::source::ChangeTracker;

ChangeDecision Store(ChangeTracker& tracker, const ResourceID& id, const std::string& hash) {
  auto lock     = tracker.Lock(id);
  auto decision = tracker.EvaluateStore(id, hash, "textures");
  tracker.Apply(decision, hash);
  return decision;
}

ChangeDecision Remove(ChangeTracker& tracker, const ResourceID& id) {
  auto lock     = tracker.Lock(id);
  auto decision = tracker.EvaluateRemove(id);
  tracker.Apply(decision, {});
  return decision;
}

void TestFirstStoreIsAddedAtCounterZero() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();

  const auto decision = Store(tracker, id, "h1");
  assert(decision.changed);
  assert(decision.event.kind() == CHANGE_KIND_ADDED);
  assert(decision.event.change_counter() == 0);
  assert(decision.event.resource_namespace() == "textures");
  assert(tracker.CurrentCounter(id) == 0);
}

void TestIdenticalContentKeepsCounter() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();

  Store(tracker, id, "h1");
  const auto again = Store(tracker, id, "h1");
  assert(!again.changed);
  assert(again.event.change_counter() == 0);
  assert(tracker.CurrentCounter(id) == 0);
}

void TestDifferentContentIsModified() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();

  Store(tracker, id, "h1");
  const auto modified = Store(tracker, id, "h2");
  assert(modified.changed);
  assert(modified.event.kind() == CHANGE_KIND_MODIFIED);
  assert(modified.event.change_counter() == 1);
  assert(modified.event.sequence() > 1);
}

void TestRemoveThenStoreIsAddedWithHigherCounter() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();

  Store(tracker, id, "h1");
  const auto removed = Remove(tracker, id);
  assert(removed.event.kind() == CHANGE_KIND_REMOVED);
  assert(removed.event.change_counter() == 1);

  bool threw = false;
  try {
    (void)tracker.CurrentCounter(id);
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // identical content after a remove is still a change
  const auto readded = Store(tracker, id, "h1");
  assert(readded.changed);
  assert(readded.event.kind() == CHANGE_KIND_ADDED);
  assert(readded.event.change_counter() == 2);
}

void TestRemoveUnknownThrowsNotFound() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();

  bool threw = false;
  try {
    auto lock = tracker.Lock(id);
    (void)tracker.EvaluateRemove(id);
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentStoresProduceDistinctCounters() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();
  Store(tracker, id, "initial");

  constexpr int            kThreads = 8;
  constexpr int            kStores  = 50;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kStores; ++i) {
        Store(tracker, id, std::to_string(t) + ":" + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  // every store carried new content, so every one advanced the counter
  assert(tracker.CurrentCounter(id) == static_cast<uint64_t>(kThreads * kStores));
}

void TestRestoreSeedsState() {
  ChangeTracker tracker;
  const auto    id = resource::util::NewResourceID();

  resource::source::TrackedState state;
  state.content_hash   = "h9";
  state.change_counter = 9;
  state.sequence       = 12;
  tracker.Restore(id, state);

  assert(tracker.CurrentCounter(id) == 9);
  const auto next = Store(tracker, id, "h10");
  assert(next.event.change_counter() == 10);
  assert(next.event.sequence() == 13);
}

} // namespace

int main() {
  TestFirstStoreIsAddedAtCounterZero();
  TestIdenticalContentKeepsCounter();
  TestDifferentContentIsModified();
  TestRemoveThenStoreIsAddedWithHigherCounter();
  TestRemoveUnknownThrowsNotFound();
  TestConcurrentStoresProduceDistinctCounters();
  TestRestoreSeedsState();

  std::cout << "resource_unit_change_tracker: pass\n";
  return 0;
}
