#include "internal/compression/compression_coordinator.hpp"

#include <algorithm>
#include <iterator>

#include "internal/db/api/tx_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::compression {

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{20};

bool IsReady(const std::shared_future<CheckpointResult>& pending) {
  return pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::vector<db::model::MessageRecord> After(const std::vector<db::model::MessageRecord>& messages, std::int64_t to_seq) {
  std::vector<db::model::MessageRecord> out;
  std::copy_if(messages.begin(), messages.end(), std::back_inserter(out),
               [&](const db::model::MessageRecord& m) { return m.group_seq && *m.group_seq > to_seq; });
  return out;
}

} // namespace

CompressionCoordinator::CompressionCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<CheckpointStore> store,
                                               std::shared_ptr<CompressionScheduler> scheduler, CompressionOptions options)
    : repository_(std::move(repository)), store_(std::move(store)), scheduler_(std::move(scheduler)), options_(options) {
}

std::vector<db::model::MessageRecord> CompressionCoordinator::LoadUncovered(const std::string& group_id, std::int64_t after_seq,
                                                                            const std::string& exclude_message_id) {
  auto messages = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->ListGroupMessagesAfter(tx, group_id, after_seq, std::nullopt);
  });

  // Unfinished assistant turns have no stable content yet.
  messages.erase(std::remove_if(messages.begin(), messages.end(),
                                [&](const db::model::MessageRecord& m) {
                                  if (m.id == exclude_message_id) return true;
                                  return m.role == prdchat::v1::MESSAGE_ROLE_ASSISTANT && m.status != prdchat::v1::MESSAGE_STATUS_DONE;
                                }),
                 messages.end());
  return messages;
}

GroupHistory CompressionCoordinator::PrepareHistory(const pipeline::RequestContext& ctx, const std::string& exclude_message_id,
                                                    const std::string& current_goal, const std::shared_ptr<pipeline::RunControl>& control) {
  if (control && control->IsCancelled()) {
    throw util::Cancelled("run cancelled");
  }

  GroupHistory history;
  history.checkpoint = store_->Get(ctx.group_id);

  const std::int64_t covered = history.checkpoint ? history.checkpoint->to_seq : 0;
  history.messages           = LoadUncovered(ctx.group_id, covered, exclude_message_id);
  if (!options_.enabled) {
    return history;
  }

  auto plan = PlanCompression(history.messages, options_.planner);
  if (!plan.should_compress) {
    return history;
  }
  if (plan.to_compress.empty() && !ForceCompressPrefix(plan, options_.planner)) {
    observability::Metrics::Instance().RecordCompression("skipped");
    return history;
  }

  observability::SpanScope span("compression.prepare");
  span.SetAttribute("group_id", ctx.group_id);
  span.SetAttribute("total_chars", plan.total_chars);

  auto pending = SubmitOrJoin(ctx, plan, history.checkpoint, current_goal);
  if (!pending) {
    observability::Metrics::Instance().RecordCompression("failed");
    return history;
  }

  bool ready = false;
  try {
    ready = WaitFor(*pending, control);
  } catch (const util::Cancelled&) {
    PRDCHAT_LOG_INFO("Run cancelled while compression was running",
                     {observability::StringField("group_id", ctx.group_id), observability::StringField("run_id", ctx.run_id)});
    throw;
  }
  if (!ready) {
    PRDCHAT_LOG_WARN("Compression still running, continuing with uncompressed history",
                     {observability::StringField("group_id", ctx.group_id), observability::StringField("run_id", ctx.run_id)});
    observability::Metrics::Instance().RecordCompression("timeout");
    return history;
  }

  CheckpointResult result;
  try {
    result = pending->get();
  } catch (const std::future_error& e) {
    PRDCHAT_LOG_ERROR("Compression result lost", {observability::StringField("group_id", ctx.group_id), observability::StringField("error", e.what())});
  }

  if (!result || (history.checkpoint && result->to_seq <= history.checkpoint->to_seq)) {
    observability::Metrics::Instance().RecordCompression("failed");
    return history;
  }

  observability::Metrics::Instance().RecordCompression("compressed");
  history.messages   = After(history.messages, result->to_seq);
  history.checkpoint = std::move(result);
  return history;
}

std::optional<CompressionCoordinator::PendingResult> CompressionCoordinator::SubmitOrJoin(
    const pipeline::RequestContext& ctx, CompressionPlan& plan, const std::optional<db::model::CompressionStateRecord>& previous,
    const std::string& current_goal) {
  std::lock_guard lock(inflight_->mutex);

  auto it = inflight_->by_group.find(ctx.group_id);
  if (it != inflight_->by_group.end() && !IsReady(it->second.result)) {
    PRDCHAT_LOG_DEBUG("Joining in-flight compression", {observability::StringField("group_id", ctx.group_id)});
    return it->second.result;
  }

  const std::uint64_t attempt_id = ++inflight_->next_id;

  CompressionTask task;
  task.ctx          = ctx;
  task.to_compress  = std::move(plan.to_compress);
  task.previous     = previous;
  task.current_goal = current_goal;
  task.result       = std::make_shared<std::promise<CheckpointResult>>();

  // Runs on the worker whatever the outcome, so abandoned waits leave nothing behind.
  std::weak_ptr<InflightTable> table = inflight_;
  task.on_done = [table, group_id = ctx.group_id, attempt_id] {
    auto locked = table.lock();
    if (!locked) return;
    std::lock_guard guard(locked->mutex);
    auto entry = locked->by_group.find(group_id);
    if (entry != locked->by_group.end() && entry->second.id == attempt_id) {
      locked->by_group.erase(entry);
    }
  };

  PendingResult pending = task.result->get_future().share();
  inflight_->by_group[ctx.group_id] = Attempt{attempt_id, pending};
  if (!scheduler_->Enqueue(std::move(task))) {
    inflight_->by_group.erase(ctx.group_id);
    PRDCHAT_LOG_WARN("Compression scheduler is shut down", {observability::StringField("group_id", ctx.group_id)});
    return std::nullopt;
  }
  return pending;
}

bool CompressionCoordinator::WaitFor(const PendingResult& pending, const std::shared_ptr<pipeline::RunControl>& control) const {
  if (!control) {
    return pending.wait_for(options_.max_wait) == std::future_status::ready;
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.max_wait;
  while (true) {
    if (control->IsCancelled()) {
      throw util::Cancelled("run cancelled");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return IsReady(pending);
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(kCancelPollInterval, deadline - now);
    if (pending.wait_for(slice) == std::future_status::ready) {
      return true;
    }
  }
}

std::size_t CompressionCoordinator::InflightCount() const {
  std::lock_guard lock(inflight_->mutex);
  return inflight_->by_group.size();
}

} // namespace prdchat::compression
