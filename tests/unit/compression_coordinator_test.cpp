#include "internal/compression/compression_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/compression/compression_worker.hpp"
#include "internal/compression/context_summarizer.hpp"
#include "internal/db/api/tx_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "scripted_model_client.hpp"

namespace {

using prdchat::compression::CompressionOptions;
using prdchat::db::model::MessageRecord;
using prdchat::llm::ModelChunk;
using prdchat::testing::Script;
using prdchat::testing::ScriptedModelClient;

constexpr char kGroup[] = "g1";

struct Harness {
  std::shared_ptr<prdchat::db::memory::MemoryRepository>        repository = std::make_shared<prdchat::db::memory::MemoryRepository>();
  std::shared_ptr<ScriptedModelClient>                          client     = std::make_shared<ScriptedModelClient>();
  std::shared_ptr<prdchat::compression::CheckpointStore>        store;
  std::shared_ptr<prdchat::compression::CompressionScheduler>   scheduler;
  std::shared_ptr<prdchat::compression::CompressionWorker>      worker;
  std::unique_ptr<prdchat::compression::CompressionCoordinator> coordinator;

  explicit Harness(std::chrono::milliseconds max_wait = std::chrono::seconds(5), bool enabled = true) {
    store     = std::make_shared<prdchat::compression::CheckpointStore>(repository, std::chrono::minutes(1));
    scheduler = std::make_shared<prdchat::compression::CompressionScheduler>();

    auto summarizer = std::make_shared<prdchat::compression::ContextSummarizer>(client, "summary-model");
    worker          = std::make_shared<prdchat::compression::CompressionWorker>(scheduler, summarizer, store);
    worker->Start();

    CompressionOptions options;
    options.enabled                   = enabled;
    options.planner.threshold_chars   = 1000;
    options.planner.target_keep_chars = 300;
    options.planner.min_keep_count    = 4;
    options.max_wait                  = max_wait;
    coordinator = std::make_unique<prdchat::compression::CompressionCoordinator>(repository, store, scheduler, options);
  }

  ~Harness() {
    worker->Stop();
  }

  void Seed(std::int64_t count, std::size_t chars_each) {
    prdchat::db::RunInTransaction(*repository, [&](prdchat::db::Transaction& tx) {
      std::vector<MessageRecord> messages;
      for (std::int64_t seq = 1; seq <= count; ++seq) {
        MessageRecord message;
        message.id           = "m" + std::to_string(seq);
        message.session_id   = "s1";
        message.group_id     = kGroup;
        message.group_seq    = seq;
        message.role         = seq % 2 ? prdchat::v1::MESSAGE_ROLE_USER : prdchat::v1::MESSAGE_ROLE_ASSISTANT;
        message.status       = prdchat::v1::MESSAGE_STATUS_DONE;
        message.content      = std::string(chars_each, 'a' + static_cast<char>(seq % 26));
        message.timestamp_ms = 1000 + seq;
        messages.push_back(std::move(message));
      }
      prdchat::db::ThrowIfDbError(repository->InsertMessages(tx, messages), "seed");
    });
  }

  void Add(MessageRecord message) {
    prdchat::db::RunInTransaction(*repository, [&](prdchat::db::Transaction& tx) {
      prdchat::db::ThrowIfDbError(repository->InsertMessages(tx, {message}), "add");
    });
  }
};

prdchat::pipeline::RequestContext Context() {
  prdchat::pipeline::RequestContext ctx;
  ctx.run_id   = "run-1";
  ctx.group_id = kGroup;
  return ctx;
}

bool WaitUntilIdle(const prdchat::compression::CompressionCoordinator& coordinator) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (coordinator.InflightCount() != 0) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

MessageRecord CurrentTurn(std::int64_t seq) {
  MessageRecord message;
  message.id        = "current";
  message.group_id  = kGroup;
  message.group_seq = seq;
  message.role      = prdchat::v1::MESSAGE_ROLE_USER;
  message.status    = prdchat::v1::MESSAGE_STATUS_DONE;
  message.content   = "What did we decide about SSO?";
  return message;
}

void TestCompressesOldestPrefix() {
  Harness h;
  h.Seed(12, 100);
  h.Add(CurrentTurn(13));
  h.client->Enqueue(Script{{ModelChunk::Delta("- SSO is in scope\n"), ModelChunk::Delta("- MFA deferred"), ModelChunk::Done(100, 10)}});

  const auto history = h.coordinator->PrepareHistory(Context(), "current", "What did we decide about SSO?");

  assert(history.checkpoint.has_value());
  assert(history.checkpoint->from_seq == 1);
  assert(history.checkpoint->to_seq == 8);
  assert(history.checkpoint->compressed_text == "- SSO is in scope\n- MFA deferred");
  assert(history.checkpoint->original_chars == 800);
  assert(history.messages.size() == 4);
  assert(history.messages.front().group_seq == 9);
  assert(history.messages.back().group_seq == 12);

  const auto stored = h.store->Get(kGroup);
  assert(stored && stored->to_seq == 8);

  const auto requests = h.client->Requests();
  assert(requests.size() == 1);
  assert(requests[0].model == "summary-model");
  const auto& prompt = requests[0].messages.at(0).content;
  assert(prompt.find("[1] user: ") != std::string::npos);
  assert(prompt.find("[8] assistant(pm): ") != std::string::npos);
  assert(prompt.find("[9]") == std::string::npos);
  assert(prompt.find("What did we decide about SSO?") != std::string::npos);

  // The next turn starts from the checkpoint and stays under budget.
  const auto next = h.coordinator->PrepareHistory(Context(), "current", "follow up");
  assert(next.checkpoint && next.checkpoint->to_seq == 8);
  assert(next.messages.size() == 4);
  assert(h.client->Requests().size() == 1);
}

void TestCheckpointExtendsPreviousRange() {
  Harness h;
  h.Seed(12, 100);
  h.client->Enqueue(Script{{ModelChunk::Delta("first"), ModelChunk::Done(1, 1)}});
  h.client->Enqueue(Script{{ModelChunk::Delta("second"), ModelChunk::Done(1, 1)}});

  auto first = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(first.checkpoint->from_seq == 1 && first.checkpoint->to_seq == 8);

  prdchat::db::RunInTransaction(*h.repository, [&](prdchat::db::Transaction& tx) {
    std::vector<MessageRecord> more;
    for (std::int64_t seq = 13; seq <= 20; ++seq) {
      MessageRecord message;
      message.id        = "m" + std::to_string(seq);
      message.group_id  = kGroup;
      message.group_seq = seq;
      message.role      = prdchat::v1::MESSAGE_ROLE_USER;
      message.status    = prdchat::v1::MESSAGE_STATUS_DONE;
      message.content   = std::string(100, 'z');
      more.push_back(std::move(message));
    }
    prdchat::db::ThrowIfDbError(h.repository->InsertMessages(tx, more), "more");
  });

  auto second = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(second.checkpoint->compressed_text == "second");
  assert(second.checkpoint->from_seq == 1);
  assert(second.checkpoint->to_seq == 16);
  assert(second.checkpoint->original_chars == 1600);
  assert(second.messages.size() == 4);

  const auto prompt = h.client->Requests()[1].messages[0].content;
  assert(prompt.find("Existing summary of messages 1..8:\nfirst") != std::string::npos);
}

void TestUnderThresholdDoesNothing() {
  Harness h;
  h.Seed(5, 100);

  const auto history = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(!history.checkpoint.has_value());
  assert(history.messages.size() == 5);
  assert(h.client->Requests().empty());
}

void TestUnfinishedAssistantMessagesAreSkipped() {
  Harness h;
  h.Seed(3, 10);

  MessageRecord streaming;
  streaming.id        = "streaming";
  streaming.group_id  = kGroup;
  streaming.group_seq = 4;
  streaming.role      = prdchat::v1::MESSAGE_ROLE_ASSISTANT;
  streaming.status    = prdchat::v1::MESSAGE_STATUS_STREAMING;
  streaming.content   = "half an answer";
  h.Add(streaming);
  h.Add(CurrentTurn(5));

  const auto history = h.coordinator->PrepareHistory(Context(), "current", "goal");
  assert(history.messages.size() == 3);
  for (const auto& message : history.messages) {
    assert(message.id != "streaming" && message.id != "current");
  }
}

void TestSummarizerFailureFailsOpen() {
  Harness h;
  h.Seed(12, 100);
  h.client->Enqueue(Script{{ModelChunk::Error("LLM_ERROR", "overloaded")}});

  const auto history = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(!history.checkpoint.has_value());
  assert(history.messages.size() == 12);
  assert(!h.store->Get(kGroup).has_value());
  assert(WaitUntilIdle(*h.coordinator));
}

void TestBlankSummaryIsDiscarded() {
  Harness h;
  h.Seed(12, 100);
  h.client->Enqueue(Script{{ModelChunk::Delta("  \n "), ModelChunk::Done(1, 0)}});

  const auto history = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(!history.checkpoint.has_value());
  assert(history.messages.size() == 12);
}

void TestTimeoutProceedsAndCheckpointLands() {
  Harness h(std::chrono::milliseconds(10));
  h.Seed(12, 100);
  h.client->Enqueue(Script{{ModelChunk::Delta("late summary"), ModelChunk::Done(1, 1)}, false, std::chrono::milliseconds(200)});

  const auto history = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(!history.checkpoint.has_value());
  assert(history.messages.size() == 12);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  std::optional<prdchat::db::model::CompressionStateRecord> landed;
  while (!landed && std::chrono::steady_clock::now() < deadline) {
    landed = h.store->Get(kGroup);
    if (!landed) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(landed && landed->to_seq == 8);
  assert(WaitUntilIdle(*h.coordinator));
}

void TestCancelStopsWaitingForSummary() {
  Harness h(std::chrono::seconds(20));
  h.Seed(12, 100);
  h.client->Enqueue(Script{{ModelChunk::Delta("slow summary"), ModelChunk::Done(1, 1)}, false, std::chrono::milliseconds(800)});

  auto control = std::make_shared<prdchat::pipeline::RunControl>("run-1");
  std::thread canceller([control] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    control->Cancel();
  });

  const auto started   = std::chrono::steady_clock::now();
  bool       cancelled = false;
  try {
    h.coordinator->PrepareHistory(Context(), "", "goal", control);
  } catch (const prdchat::util::Cancelled&) {
    cancelled = true;
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  assert(cancelled);
  assert(elapsed < std::chrono::milliseconds(500));

  // The abandoned summary still lands and releases its slot.
  assert(WaitUntilIdle(*h.coordinator));
  const auto landed = h.store->Get(kGroup);
  assert(landed && landed->to_seq == 8);
}

void TestCancelledRunSkipsCompression() {
  Harness h(std::chrono::seconds(20));
  h.Seed(12, 100);

  auto control = std::make_shared<prdchat::pipeline::RunControl>("run-1");
  control->Cancel();

  bool cancelled = false;
  try {
    h.coordinator->PrepareHistory(Context(), "", "goal", control);
  } catch (const prdchat::util::Cancelled&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(h.client->Requests().empty());
  assert(h.coordinator->InflightCount() == 0);
}

void TestForcedCompressionWithFewLargeMessages() {
  Harness h;
  h.Seed(4, 400);
  h.client->Enqueue(Script{{ModelChunk::Delta("forced"), ModelChunk::Done(1, 1)}});

  const auto history = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(history.checkpoint && history.checkpoint->to_seq == 2);
  assert(history.messages.size() == 2);
}

void TestDisabledCompressionOnlyLoadsHistory() {
  Harness h(std::chrono::seconds(5), /*enabled=*/false);
  h.Seed(12, 100);

  const auto history = h.coordinator->PrepareHistory(Context(), "", "goal");
  assert(!history.checkpoint.has_value());
  assert(history.messages.size() == 12);
  assert(h.client->Requests().empty());
}

void TestCheckpointStoreIsForwardOnly() {
  Harness h;

  prdchat::db::model::CompressionStateRecord state;
  state.group_id        = kGroup;
  state.from_seq        = 1;
  state.to_seq          = 10;
  state.compressed_text = "ten";
  assert(h.store->Put(state));

  auto stale            = state;
  stale.to_seq          = 6;
  stale.compressed_text = "six";
  assert(!h.store->Put(stale));

  auto same = state;
  assert(!h.store->Put(same));

  auto newer            = state;
  newer.to_seq          = 14;
  newer.compressed_text = "fourteen";
  assert(h.store->Put(newer));

  h.store->Invalidate(kGroup);
  const auto stored = h.store->Get(kGroup);
  assert(stored && stored->compressed_text == "fourteen");
}

void TestConcurrentCheckpointWritesKeepNewest() {
  Harness h;

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      for (int k = 0; k < kPerThread; ++k) {
        const int step = t % 2 ? kPerThread - 1 - k : k;

        prdchat::db::model::CompressionStateRecord state;
        state.group_id        = kGroup;
        state.from_seq        = 1;
        state.to_seq          = 1 + t + kThreads * step;
        state.compressed_text = "up to " + std::to_string(state.to_seq);
        (void)h.store->Put(state);
        (void)h.store->Get(kGroup);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  const auto cached = h.store->Get(kGroup);
  assert(cached && cached->to_seq == kThreads * kPerThread);

  h.store->Invalidate(kGroup);
  const auto stored = h.store->Get(kGroup);
  assert(stored && stored->to_seq == kThreads * kPerThread);
}

} // namespace

int main() {
  TestCompressesOldestPrefix();
  TestCheckpointExtendsPreviousRange();
  TestUnderThresholdDoesNothing();
  TestUnfinishedAssistantMessagesAreSkipped();
  TestSummarizerFailureFailsOpen();
  TestBlankSummaryIsDiscarded();
  TestTimeoutProceedsAndCheckpointLands();
  TestCancelStopsWaitingForSummary();
  TestCancelledRunSkipsCompression();
  TestForcedCompressionWithFewLargeMessages();
  TestDisabledCompressionOnlyLoadsHistory();
  TestCheckpointStoreIsForwardOnly();
  TestConcurrentCheckpointWritesKeepNewest();

  std::cout << "prdchat_unit_compression_coordinator: pass\n";
  return 0;
}
