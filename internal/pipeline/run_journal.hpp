#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "prdchat/v1/chat.pb.h"

namespace prdchat::pipeline {

// Events of one run after a given seq, oldest first.
struct RunEvents {
  std::vector<prdchat::v1::ChatStreamEvent> events;
  bool                                      finished = false; // nothing follows the last event
};

/*
  Per-run status and event log.

  A client that lost its SendMessage stream looks the run up by id and
  replays everything after the last seq it saw, then follows the run
  live. Finished runs are kept for the retention window, and only the
  newest max_finished_runs of them.
*/
class RunJournal {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit RunJournal(std::chrono::milliseconds retention, std::size_t max_finished_runs = 1024, NowFn now = [] { return Clock::now(); });

  // Starts a fresh log; a finished run with the same id is replaced.
  void Begin(const std::string& run_id, const std::string& session_id);

  // Events arrive in seq order. Unknown runs are ignored.
  void Append(const std::string& run_id, const prdchat::v1::ChatStreamEvent& event);

  void Finish(const std::string& run_id, prdchat::v1::RunStatus status, const std::string& error_code);

  std::optional<prdchat::v1::RunInfo> Get(const std::string& run_id);

  // Waits up to timeout for events after after_seq; returns early once
  // the run has finished. nullopt for unknown or expired runs.
  std::optional<RunEvents> Read(const std::string& run_id, std::int64_t after_seq, std::chrono::milliseconds timeout);

  std::size_t Size() const;

 private:
  struct Entry {
    prdchat::v1::RunInfo                      info;
    std::vector<prdchat::v1::ChatStreamEvent> events;
    bool                                      finished = false;
    Clock::time_point                         finished_at;
  };

  void PruneLocked();

  const std::chrono::milliseconds retention_;
  const std::size_t               max_finished_runs_;
  const NowFn                     now_;

  mutable std::mutex                                      mutex_;
  std::condition_variable                                 cv_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> runs_;
};

} // namespace prdchat::pipeline
