#include "internal/pipeline/run_journal.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/time.hpp"

namespace prdchat::pipeline {

RunJournal::RunJournal(std::chrono::milliseconds retention, std::size_t max_finished_runs, NowFn now)
    : retention_(retention), max_finished_runs_(max_finished_runs), now_(std::move(now)) {
}

void RunJournal::Begin(const std::string& run_id, const std::string& session_id) {
  auto entry = std::make_shared<Entry>();
  entry->info.set_run_id(run_id);
  entry->info.set_session_id(session_id);
  entry->info.set_status(prdchat::v1::RUN_STATUS_RUNNING);
  *entry->info.mutable_started_at() = util::MillisToProto(util::NowMillis());

  std::lock_guard lock(mutex_);
  PruneLocked();
  runs_[run_id] = std::move(entry);
}

void RunJournal::Append(const std::string& run_id, const prdchat::v1::ChatStreamEvent& event) {
  {
    std::lock_guard lock(mutex_);
    auto            it = runs_.find(run_id);
    if (it == runs_.end() || it->second->finished) return;

    auto& entry = *it->second;
    entry.events.push_back(event);
    entry.info.set_last_seq(event.seq());
    if (!event.user_message_id().empty()) {
      entry.info.set_user_message_id(event.user_message_id());
    }
    // START names the reply id before anything is stored under it.
    if (event.type() != prdchat::v1::CHAT_EVENT_TYPE_START && !event.message_id().empty()) {
      entry.info.set_assistant_message_id(event.message_id());
    }
  }
  cv_.notify_all();
}

void RunJournal::Finish(const std::string& run_id, prdchat::v1::RunStatus status, const std::string& error_code) {
  {
    std::lock_guard lock(mutex_);
    auto            it = runs_.find(run_id);
    if (it == runs_.end() || it->second->finished) return;

    auto& entry       = *it->second;
    entry.finished    = true;
    entry.finished_at = now_();
    entry.info.set_status(status);
    entry.info.set_error_code(error_code);
    *entry.info.mutable_ended_at() = util::MillisToProto(util::NowMillis());
  }
  cv_.notify_all();
}

std::optional<prdchat::v1::RunInfo> RunJournal::Get(const std::string& run_id) {
  std::lock_guard lock(mutex_);
  PruneLocked();
  auto it = runs_.find(run_id);
  if (it == runs_.end()) return std::nullopt;
  return it->second->info;
}

std::optional<RunEvents> RunJournal::Read(const std::string& run_id, std::int64_t after_seq, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  PruneLocked();
  auto it = runs_.find(run_id);
  if (it == runs_.end()) return std::nullopt;

  // Held across the wait: a restarted run id swaps the map entry.
  std::shared_ptr<Entry> entry = it->second;
  cv_.wait_for(lock, timeout, [&] { return entry->finished || (!entry->events.empty() && entry->events.back().seq() > after_seq); });

  const auto first = std::partition_point(entry->events.begin(), entry->events.end(),
                                          [&](const prdchat::v1::ChatStreamEvent& e) { return e.seq() <= after_seq; });

  RunEvents out;
  out.events.assign(first, entry->events.end());
  out.finished = entry->finished;
  return out;
}

std::size_t RunJournal::Size() const {
  std::lock_guard lock(mutex_);
  return runs_.size();
}

void RunJournal::PruneLocked() {
  const auto now = now_();

  std::vector<std::pair<Clock::time_point, std::string>> finished;
  for (auto it = runs_.begin(); it != runs_.end();) {
    const auto& entry = *it->second;
    if (entry.finished && now - entry.finished_at >= retention_) {
      it = runs_.erase(it);
      continue;
    }
    if (entry.finished) finished.emplace_back(entry.finished_at, it->first);
    ++it;
  }

  if (finished.size() <= max_finished_runs_) return;
  std::sort(finished.begin(), finished.end());
  for (std::size_t i = 0; i < finished.size() - max_finished_runs_; ++i) {
    runs_.erase(finished[i].second);
  }
}

} // namespace prdchat::pipeline
