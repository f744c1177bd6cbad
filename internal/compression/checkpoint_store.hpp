#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/cache/ttl_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/compression_state_record.hpp"

namespace prdchat::compression {

/*
  Live compression checkpoint per group.

  The repository is authoritative; the TTL cache only saves reads. A
  checkpoint is read whole, so a turn never sees a half-written one.
  Put() is forward-only: a record that does not advance to_seq loses
  to the one already stored.
*/
class CheckpointStore {
 public:
  CheckpointStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds cache_ttl);

  std::optional<db::model::CompressionStateRecord> Get(const std::string& group_id);

  // False when a checkpoint at or beyond state.to_seq already exists.
  bool Put(const db::model::CompressionStateRecord& state);

  // Drops the cached copy, e.g. after the group history was deleted.
  void Invalidate(const std::string& group_id);

 private:
  // Readers and writers race to fill the cache; the higher to_seq wins.
  void CacheIfNewer(const db::model::CompressionStateRecord& state);

  std::shared_ptr<db::Repository>                        repository_;
  std::mutex                                             cache_mutex_;
  cache::TtlCache<db::model::CompressionStateRecord> cache_;
};

} // namespace prdchat::compression
