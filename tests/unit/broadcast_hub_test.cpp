#include "internal/broadcast/group_broadcast_hub.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/api/tx_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using prdchat::broadcast::GroupBroadcastHub;
using prdchat::db::model::MessageRecord;

constexpr std::chrono::milliseconds kShortWait{10};

MessageRecord MakeMessage(const std::string& id, const std::string& group_id, std::int64_t seq) {
  MessageRecord message;
  message.id           = id;
  message.session_id   = "s-" + group_id;
  message.group_id     = group_id;
  message.group_seq    = seq;
  message.role         = prdchat::v1::MESSAGE_ROLE_USER;
  message.content      = "message " + id;
  message.status       = prdchat::v1::MESSAGE_STATUS_DONE;
  message.timestamp_ms = 1000 + seq;
  return message;
}

void TestFanoutReachesOnlyTheGroup() {
  GroupBroadcastHub hub(16);
  auto              a1 = hub.Subscribe("a");
  auto              a2 = hub.Subscribe("a");
  auto              b  = hub.Subscribe("b");
  assert(hub.SubscriberCount("a") == 2);

  hub.Publish(MakeMessage("m1", "a", 1));

  for (const auto& subscription : {a1, a2}) {
    auto event = subscription->Next(kShortWait);
    assert(event.has_value());
    assert(event->type() == prdchat::v1::GROUP_EVENT_TYPE_MESSAGE);
    assert(event->message().id() == "m1");
    assert(event->message().group_seq() == 1);
  }
  assert(!b->Next(kShortWait).has_value());
}

void TestStreamingEventsKeepOrder() {
  GroupBroadcastHub hub(16);
  auto              sub = hub.Subscribe("g");

  hub.PublishDelta("g", "a1", "Hello\n", "blk", prdchat::markdown::BlockKind::kParagraph, true);
  hub.PublishDelta("g", "a1", "World\n", "blk", prdchat::markdown::BlockKind::kParagraph, false);
  hub.PublishBlockEnd("g", "a1", "blk", prdchat::markdown::BlockKind::kParagraph);

  auto first = sub->Next(kShortWait);
  assert(first->type() == prdchat::v1::GROUP_EVENT_TYPE_DELTA);
  assert(first->is_first());
  assert(first->content() == "Hello\n");

  auto second = sub->Next(kShortWait);
  assert(!second->is_first());
  assert(second->content() == "World\n");

  auto end = sub->Next(kShortWait);
  assert(end->type() == prdchat::v1::GROUP_EVENT_TYPE_BLOCK_END);
  assert(end->block_id() == "blk");
}

void TestFullQueueDropsWithoutBlocking() {
  GroupBroadcastHub hub(2);
  auto              slow = hub.Subscribe("g");
  auto              fast = hub.Subscribe("g");

  for (int i = 1; i <= 5; ++i) {
    hub.Publish(MakeMessage("m" + std::to_string(i), "g", i));
    (void)fast->Next(kShortWait);
  }

  assert(slow->Dropped() == 3);
  assert(fast->Dropped() == 0);
  assert(slow->Next(kShortWait)->message().id() == "m1");
  assert(slow->Next(kShortWait)->message().id() == "m2");
  assert(!slow->Next(kShortWait).has_value());
}

void TestUnsubscribeClosesAndWakes() {
  GroupBroadcastHub hub(4);
  auto              sub = hub.Subscribe("g");

  std::thread closer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    hub.Unsubscribe(sub);
  });
  const auto started = std::chrono::steady_clock::now();
  assert(!sub->Next(std::chrono::seconds(5)).has_value());
  closer.join();

  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
  assert(sub->Closed());
  assert(hub.SubscriberCount("g") == 0);

  hub.Publish(MakeMessage("m1", "g", 1));
  assert(!sub->Next(kShortWait).has_value());
}

void TestReplayPrecedesLiveEvents() {
  auto repository = std::make_shared<prdchat::db::memory::MemoryRepository>();
  prdchat::db::RunInTransaction(*repository, [&](prdchat::db::Transaction& tx) {
    prdchat::db::ThrowIfDbError(repository->InsertMessages(tx, {MakeMessage("m1", "g", 1), MakeMessage("m2", "g", 2), MakeMessage("m3", "g", 3)}),
                                "seed");
  });

  GroupBroadcastHub hub(8, repository);
  auto              sub = hub.Subscribe("g", 1);
  hub.Publish(MakeMessage("m4", "g", 4));

  assert(sub->Next(kShortWait)->message().id() == "m2");
  assert(sub->Next(kShortWait)->message().id() == "m3");
  assert(sub->Next(kShortWait)->message().id() == "m4");
}

void TestInvalidSubscriptions() {
  GroupBroadcastHub hub(4);

  bool empty_group = false;
  try {
    hub.Subscribe("");
  } catch (const prdchat::util::InvalidArgument&) {
    empty_group = true;
  }
  assert(empty_group);

  bool replay_without_repo = false;
  try {
    hub.Subscribe("g", 0);
  } catch (const prdchat::util::InvalidStage&) {
    replay_without_repo = true;
  }
  assert(replay_without_repo);
  assert(hub.SubscriberCount("g") == 0);
}

void TestMessagesWithoutGroupAreNotBroadcast() {
  GroupBroadcastHub hub(4);
  auto              sub = hub.Subscribe("g");

  auto direct     = MakeMessage("d1", "g", 1);
  direct.group_id = "";
  hub.Publish(direct);
  assert(!sub->Next(kShortWait).has_value());
}

void TestClosedGroupsAreForgotten() {
  GroupBroadcastHub hub(4);
  for (int i = 0; i < 3; ++i) {
    const auto group = "g" + std::to_string(i);
    auto       sub   = hub.Subscribe(group);
    sub->Close();
    hub.Publish(MakeMessage("m" + std::to_string(i), group, 1));
    assert(hub.SubscriberCount(group) == 0);
  }
  assert(hub.GroupCount() == 0);

  auto live = hub.Subscribe("g0");
  assert(hub.GroupCount() == 1);
  hub.Unsubscribe(live);
  assert(hub.GroupCount() == 0);
}

} // namespace

int main() {
  TestFanoutReachesOnlyTheGroup();
  TestStreamingEventsKeepOrder();
  TestFullQueueDropsWithoutBlocking();
  TestUnsubscribeClosesAndWakes();
  TestReplayPrecedesLiveEvents();
  TestInvalidSubscriptions();
  TestMessagesWithoutGroupAreNotBroadcast();
  TestClosedGroupsAreForgotten();

  std::cout << "prdchat_unit_broadcast_hub: pass\n";
  return 0;
}
