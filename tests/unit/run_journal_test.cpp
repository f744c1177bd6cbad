#include "internal/pipeline/run_journal.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

using prdchat::pipeline::RunJournal;
using namespace prdchat::v1;

struct FakeClock {
  RunJournal::Clock::time_point now = RunJournal::Clock::time_point{} + std::chrono::hours(1);

  void Advance(std::chrono::milliseconds by) {
    now += by;
  }
};

ChatStreamEvent Event(ChatEventType type, std::int64_t seq, const std::string& message_id = "reply-1") {
  ChatStreamEvent event;
  event.set_type(type);
  event.set_seq(seq);
  event.set_run_id("run-1");
  event.set_message_id(message_id);
  event.set_user_message_id("question-1");
  return event;
}

void TestReplaysEventsAfterSeq() {
  RunJournal journal(std::chrono::minutes(10));
  journal.Begin("run-1", "s-1");
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_START, 1));
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_BLOCK_START, 2));
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_BLOCK_DELTA, 3));

  auto info = journal.Get("run-1");
  assert(info && info->status() == RUN_STATUS_RUNNING);
  assert(info->session_id() == "s-1");
  assert(info->user_message_id() == "question-1");
  assert(info->assistant_message_id() == "reply-1");
  assert(info->last_seq() == 3);

  auto tail = journal.Read("run-1", 1, std::chrono::milliseconds(0));
  assert(tail && tail->events.size() == 2);
  assert(tail->events[0].seq() == 2);
  assert(tail->events[1].seq() == 3);
  assert(!tail->finished);

  journal.Append("run-1", Event(CHAT_EVENT_TYPE_DONE, 4));
  journal.Finish("run-1", RUN_STATUS_DONE, "");

  auto rest = journal.Read("run-1", 3, std::chrono::seconds(5));
  assert(rest && rest->finished);
  assert(rest->events.size() == 1 && rest->events[0].type() == CHAT_EVENT_TYPE_DONE);

  info = journal.Get("run-1");
  assert(info->status() == RUN_STATUS_DONE);
  assert(info->has_ended_at());

  // Nothing is accepted once the run has ended.
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_BLOCK_DELTA, 5));
  assert(journal.Get("run-1")->last_seq() == 4);
}

void TestStartAloneDoesNotNameReply() {
  RunJournal journal(std::chrono::minutes(10));
  journal.Begin("run-1", "s-1");
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_START, 1));

  auto error = Event(CHAT_EVENT_TYPE_ERROR, 2, "");
  error.set_error_code("LLM_ERROR");
  journal.Append("run-1", error);
  journal.Finish("run-1", RUN_STATUS_FAILED, "LLM_ERROR");

  const auto info = journal.Get("run-1");
  assert(info->assistant_message_id().empty());
  assert(info->status() == RUN_STATUS_FAILED);
  assert(info->error_code() == "LLM_ERROR");
}

void TestReadWaitsForLiveEvents() {
  RunJournal journal(std::chrono::minutes(10));
  journal.Begin("run-1", "s-1");
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_START, 1));

  std::thread producer([&journal] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    journal.Append("run-1", Event(CHAT_EVENT_TYPE_BLOCK_START, 2));
  });

  const auto started = std::chrono::steady_clock::now();
  auto       batch   = journal.Read("run-1", 1, std::chrono::seconds(5));
  producer.join();

  assert(batch && batch->events.size() == 1);
  assert(batch->events[0].seq() == 2);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));

  // A finished run never blocks a reader that is already caught up.
  journal.Finish("run-1", RUN_STATUS_CANCELLED, "CANCELLED");
  batch = journal.Read("run-1", 2, std::chrono::seconds(5));
  assert(batch && batch->events.empty() && batch->finished);
}

void TestFinishedRunsExpire() {
  auto       clock = std::make_shared<FakeClock>();
  RunJournal journal(std::chrono::milliseconds(100), 1024, [clock] { return clock->now; });

  journal.Begin("done", "s-1");
  journal.Finish("done", RUN_STATUS_DONE, "");
  journal.Begin("live", "s-1");

  clock->Advance(std::chrono::milliseconds(99));
  assert(journal.Get("done").has_value());

  clock->Advance(std::chrono::milliseconds(1));
  assert(!journal.Get("done").has_value());
  assert(!journal.Read("done", 0, std::chrono::milliseconds(0)).has_value());

  // Running runs never expire.
  clock->Advance(std::chrono::hours(1));
  assert(journal.Get("live").has_value());
  assert(journal.Size() == 1);
}

void TestOldestFinishedRunsAreEvicted() {
  auto       clock = std::make_shared<FakeClock>();
  RunJournal journal(std::chrono::minutes(10), 2, [clock] { return clock->now; });

  for (const char* id : {"r1", "r2", "r3"}) {
    journal.Begin(id, "s-1");
    journal.Finish(id, RUN_STATUS_DONE, "");
    clock->Advance(std::chrono::milliseconds(1));
  }

  assert(!journal.Get("r1").has_value());
  assert(journal.Get("r2").has_value());
  assert(journal.Get("r3").has_value());
}

void TestRestartedRunIdStartsFreshLog() {
  RunJournal journal(std::chrono::minutes(10));
  journal.Begin("run-1", "s-1");
  journal.Append("run-1", Event(CHAT_EVENT_TYPE_START, 1));
  journal.Finish("run-1", RUN_STATUS_DONE, "");

  journal.Begin("run-1", "s-2");
  const auto info = journal.Get("run-1");
  assert(info->status() == RUN_STATUS_RUNNING);
  assert(info->session_id() == "s-2");
  assert(info->last_seq() == 0);
  assert(journal.Read("run-1", 0, std::chrono::milliseconds(0))->events.empty());
}

} // namespace

int main() {
  TestReplaysEventsAfterSeq();
  TestStartAloneDoesNotNameReply();
  TestReadWaitsForLiveEvents();
  TestFinishedRunsExpire();
  TestOldestFinishedRunsAreEvicted();
  TestRestartedRunIdStartsFreshLog();

  std::cout << "prdchat_unit_run_journal: pass\n";
  return 0;
}
