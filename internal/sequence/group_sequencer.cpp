#include "internal/sequence/group_sequencer.hpp"

#include "internal/db/api/tx_runner.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::sequence {

GroupSequencer::GroupSequencer(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::int64_t GroupSequencer::Next(const std::string& group_id) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return Next(tx, group_id); });
}

std::int64_t GroupSequencer::Next(db::Transaction& tx, const std::string& group_id) {
  if (group_id.empty()) {
    throw util::InvalidArgument("group sequence requested without a group id");
  }

  std::int64_t value = 0;
  db::ThrowIfDbError(repository_->NextGroupSeq(tx, group_id, value), "allocate sequence for group " + group_id);
  return value;
}

} // namespace prdchat::sequence
