#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/compression_state_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/pipeline/request_context.hpp"

namespace prdchat::compression {

using CheckpointResult = std::optional<db::model::CompressionStateRecord>;

/*
  A scheduled summarization.

  Represents folding to_compress into the group's checkpoint. The
  promise is always fulfilled, with nullopt on failure, and on_done runs
  after it.
*/
struct CompressionTask {
  pipeline::RequestContext ctx;

  std::vector<db::model::MessageRecord> to_compress;
  CheckpointResult                      previous;
  std::string                           current_goal;

  std::shared_ptr<std::promise<CheckpointResult>> result;
  std::function<void()>                           on_done;
};

} // namespace prdchat::compression
