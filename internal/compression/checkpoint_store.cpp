#include "internal/compression/checkpoint_store.hpp"

#include "internal/db/api/tx_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::compression {

CheckpointStore::CheckpointStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds cache_ttl)
    : repository_(std::move(repository)), cache_(cache_ttl) {
}

std::optional<db::model::CompressionStateRecord> CheckpointStore::Get(const std::string& group_id) {
  if (auto cached = cache_.Get(group_id)) {
    return cached;
  }

  auto stored = db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetCompressionState(tx, group_id); });
  if (stored) {
    CacheIfNewer(*stored);
  }
  return stored;
}

bool CheckpointStore::Put(const db::model::CompressionStateRecord& state) {
  try {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfDbError(repository_->PutCompressionState(tx, state), "store checkpoint for group " + state.group_id);
    });
  } catch (const util::InvalidStage&) {
    PRDCHAT_LOG_INFO("Stale compression checkpoint discarded",
                     {observability::StringField("group_id", state.group_id), observability::IntField("to_seq", state.to_seq)});
    cache_.Remove(state.group_id);
    return false;
  }

  CacheIfNewer(state);
  return true;
}

void CheckpointStore::CacheIfNewer(const db::model::CompressionStateRecord& state) {
  std::lock_guard lock(cache_mutex_);
  if (auto cached = cache_.Get(state.group_id); cached && cached->to_seq > state.to_seq) {
    return;
  }
  cache_.Put(state.group_id, state);
}

void CheckpointStore::Invalidate(const std::string& group_id) {
  cache_.Remove(group_id);
}

} // namespace prdchat::compression
