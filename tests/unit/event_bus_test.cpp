#include "internal/event/event_bus.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/uuid.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::event::EventBus;
using resource::event::EventChannel;

ChangeEvent Event(const ResourceID& id, const std::string& ns, uint64_t counter) {
  ChangeEvent event;
  *event.mutable_id() = id;
  event.set_resource_namespace(ns);
  event.set_kind(counter == 0 ? CHANGE_KIND_ADDED : CHANGE_KIND_MODIFIED);
  event.set_change_counter(counter);
  event.set_sequence(counter + 1);
  return event;
}

void TestCallbacksRunInRegistrationOrder() {
  EventBus         bus(4);
  std::vector<int> order;

  bus.Subscribe({}, [&](const ChangeEvent&) { order.push_back(1); });
  bus.Subscribe({}, [&](const ChangeEvent&) { order.push_back(2); });
  bus.Subscribe({}, [&](const ChangeEvent&) { order.push_back(3); });

  bus.Publish(Event(resource::util::NewResourceID(), "ns", 0));
  assert((order == std::vector<int>{1, 2, 3}));
}

void TestFiltersByIdAndNamespace() {
  EventBus bus(8);
  auto     a = resource::util::NewResourceID();
  auto     b = resource::util::NewResourceID();

  EventFilter by_id;
  *by_id.mutable_id() = a;
  EventFilter by_ns;
  by_ns.set_resource_namespace("audio");

  int id_hits = 0;
  int ns_hits = 0;
  bus.Subscribe(by_id, [&](const ChangeEvent&) { ++id_hits; });
  bus.Subscribe(by_ns, [&](const ChangeEvent&) { ++ns_hits; });

  bus.Publish(Event(a, "textures", 0));
  bus.Publish(Event(b, "audio", 0));
  bus.Publish(Event(b, "textures", 1));

  assert(id_hits == 1);
  assert(ns_hits == 1);

  // resync reaches every subscriber
  bus.Publish(resource::event::MakeResyncEvent());
  assert(id_hits == 2);
  assert(ns_hits == 2);
}

void TestUnsubscribe() {
  EventBus bus(4);
  int      hits = 0;
  auto     sub  = bus.Subscribe({}, [&](const ChangeEvent&) { ++hits; });

  bus.Publish(Event(resource::util::NewResourceID(), "", 0));
  bus.Unsubscribe(sub);
  bus.Publish(Event(resource::util::NewResourceID(), "", 0));
  assert(hits == 1);
  assert(bus.SubscriberCount() == 0);
}

void TestOverflowDeliversResyncFirst() {
  EventBus bus(2);
  auto     id      = resource::util::NewResourceID();
  auto     channel = bus.SubscribeQueued({});

  for (uint64_t i = 0; i < 5; ++i) bus.Publish(Event(id, "", i));
  assert(channel->Dropped() == 3);

  auto resync = channel->Pop();
  assert(resync && resync->kind() == CHANGE_KIND_RESYNC);

  // the newest events survive
  auto first  = channel->Pop();
  auto second = channel->Pop();
  assert(first && first->change_counter() == 3);
  assert(second && second->change_counter() == 4);
  assert(!channel->PopFor(std::chrono::milliseconds(10)));
}

void TestClosingOrDroppingUnsubscribes() {
  EventBus bus(4);

  auto closed = bus.SubscribeQueued({});
  {
    auto dropped = bus.SubscribeQueued({});
    assert(bus.SubscriberCount() == 2);
  }
  assert(bus.SubscriberCount() == 1);

  closed->Close();
  assert(bus.SubscriberCount() == 0);
  assert(!closed->Push(Event(resource::util::NewResourceID(), "", 0)));

  // publish prunes dead entries without error
  bus.Publish(Event(resource::util::NewResourceID(), "", 0));
}

void TestCloseAllWakesBlockedConsumer() {
  EventBus bus(4);
  auto     channel = bus.SubscribeQueued({});

  bool        finished = false;
  std::thread consumer([&] {
    auto event = channel->Pop();
    finished   = !event.has_value();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  bus.CloseAll();
  consumer.join();
  assert(finished);
  assert(channel->IsClosed());
}

void TestQueuedEventsSurviveClose() {
  EventChannel channel(4);
  channel.Push(Event(resource::util::NewResourceID(), "", 0));
  channel.Close();

  assert(channel.Pop().has_value());
  assert(!channel.Pop().has_value());
}

void TestCallbackMayUnsubscribeItself() {
  EventBus                       bus(4);
  resource::event::SubscriptionId self  = 0;
  int                            calls = 0;
  self = bus.Subscribe({}, [&](const ChangeEvent&) {
    ++calls;
    bus.Unsubscribe(self);
  });

  bus.Publish(Event(resource::util::NewResourceID(), "", 0));
  bus.Publish(Event(resource::util::NewResourceID(), "", 0));
  assert(calls == 1);
}

} // namespace

int main() {
  TestCallbacksRunInRegistrationOrder();
  TestFiltersByIdAndNamespace();
  TestUnsubscribe();
  TestOverflowDeliversResyncFirst();
  TestClosingOrDroppingUnsubscribes();
  TestCloseAllWakesBlockedConsumer();
  TestQueuedEventsSurviveClose();
  TestCallbackMayUnsubscribeItself();

  std::cout << "resource_unit_event_bus: pass\n";
  return 0;
}
