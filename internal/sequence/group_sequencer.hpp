#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace prdchat::sequence {

/*
  Per-group message sequence allocator.

  Numbers start at 1 and never repeat within a group. Gaps are allowed:
  a number consumed by a message that is later discarded is simply
  skipped. The counter lives in the repository, so every service
  instance sharing the store shares one sequence space per group.
*/
class GroupSequencer {
 public:
  explicit GroupSequencer(std::shared_ptr<db::Repository> repository);

  // Allocates in its own transaction, retried on commit conflicts.
  std::int64_t Next(const std::string& group_id);

  // Allocates inside the caller's transaction so the number and the
  // row that uses it commit together.
  std::int64_t Next(db::Transaction& tx, const std::string& group_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace prdchat::sequence
