#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/compression/checkpoint_store.hpp"
#include "internal/compression/compression_planner.hpp"
#include "internal/compression/compression_scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/request_context.hpp"
#include "internal/pipeline/run_control.hpp"

namespace prdchat::compression {

struct CompressionOptions {
  bool                      enabled = true;
  PlannerOptions            planner;
  std::chrono::milliseconds max_wait{0};
};

// Context for one group turn: live checkpoint plus the raw messages after it.
struct GroupHistory {
  std::optional<db::model::CompressionStateRecord> checkpoint;
  std::vector<db::model::MessageRecord>            messages; // oldest first
};

/*
  Keeps a group's model input under budget.

  Reads the live checkpoint and the messages after it, plans, forces a
  prefix in the degenerate case and hands the summarization to the
  worker pool. Waits at most max_wait; on failure or timeout the turn
  proceeds with the history it already had and the checkpoint lands for
  a later turn. A cancelled run stops waiting at once. Concurrent turns
  of one group join the attempt already in flight instead of starting
  another.
*/
class CompressionCoordinator {
 public:
  CompressionCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<CheckpointStore> store,
                         std::shared_ptr<CompressionScheduler> scheduler, CompressionOptions options);

  // exclude_message_id is the triggering user message; current_goal its text.
  // Throws util::Cancelled when control is cancelled before the summary lands.
  GroupHistory PrepareHistory(const pipeline::RequestContext& ctx, const std::string& exclude_message_id, const std::string& current_goal,
                              const std::shared_ptr<pipeline::RunControl>& control = nullptr);

  // Summarizations submitted and not yet finished.
  std::size_t InflightCount() const;

  const CompressionOptions& Options() const {
    return options_;
  }

 private:
  using PendingResult = std::shared_future<CheckpointResult>;

  struct Attempt {
    std::uint64_t id = 0;
    PendingResult result;
  };

  // Shared with worker callbacks, which may outlive the coordinator.
  struct InflightTable {
    std::mutex                               mutex;
    std::uint64_t                            next_id = 0;
    std::unordered_map<std::string, Attempt> by_group;
  };

  std::vector<db::model::MessageRecord> LoadUncovered(const std::string& group_id, std::int64_t after_seq,
                                                      const std::string& exclude_message_id);

  std::optional<PendingResult> SubmitOrJoin(const pipeline::RequestContext& ctx, CompressionPlan& plan,
                                            const std::optional<db::model::CompressionStateRecord>& previous, const std::string& current_goal);

  // True once the result is ready within max_wait. Throws util::Cancelled
  // as soon as control is cancelled.
  bool WaitFor(const PendingResult& pending, const std::shared_ptr<pipeline::RunControl>& control) const;

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<CheckpointStore>      store_;
  std::shared_ptr<CompressionScheduler> scheduler_;
  CompressionOptions                    options_;

  std::shared_ptr<InflightTable> inflight_ = std::make_shared<InflightTable>();
};

} // namespace prdchat::compression
