#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/db/model/message_record.hpp"

namespace prdchat::compression {

// Raw messages the forced fallback always leaves in place.
inline constexpr std::size_t kMinForcedKeepCount = 2;

struct PlannerOptions {
  std::int64_t threshold_chars   = 0;
  std::int64_t target_keep_chars = 0;
  std::size_t  min_keep_count    = 0;
};

struct CompressionPlan {
  bool         should_compress = false;
  std::int64_t total_chars     = 0;

  std::vector<db::model::MessageRecord> to_compress; // oldest first
  std::vector<db::model::MessageRecord> keep_raw;    // oldest first
};

// Character length used for every budget: codepoints of the content.
std::int64_t MessageChars(const db::model::MessageRecord& message);

/*
  Decides whether the uncompressed tail of a group needs folding.

  Pure. Messages are oldest first. Compression is needed when the total
  exceeds threshold_chars. keep_raw is built from the newest message
  backwards until it holds at least min_keep_count messages and at least
  target_keep_chars characters; everything older goes to to_compress.
  With fewer than min_keep_count messages, all are kept.
*/
CompressionPlan PlanCompression(const std::vector<db::model::MessageRecord>& messages, const PlannerOptions& options);

/*
  Degenerate case: over threshold but nothing eligible. Moves the
  oldest keep_raw messages into to_compress until the rest fits
  target_keep_chars, never leaving fewer than kMinForcedKeepCount raw.
  Returns false when nothing could be moved.
*/
bool ForceCompressPrefix(CompressionPlan& plan, const PlannerOptions& options);

} // namespace prdchat::compression
