#include "internal/compression/compression_planner.hpp"

#include <algorithm>

#include "internal/text/utf8.hpp"

namespace prdchat::compression {

std::int64_t MessageChars(const db::model::MessageRecord& message) {
  return static_cast<std::int64_t>(text::CodepointCount(message.content));
}

CompressionPlan PlanCompression(const std::vector<db::model::MessageRecord>& messages, const PlannerOptions& options) {
  CompressionPlan plan;
  for (const auto& message : messages) {
    plan.total_chars += MessageChars(message);
  }

  plan.should_compress = plan.total_chars > options.threshold_chars;
  if (!plan.should_compress || messages.size() < options.min_keep_count) {
    plan.keep_raw = messages;
    return plan;
  }

  std::size_t  split      = messages.size();
  std::int64_t keep_chars = 0;
  while (split > 0) {
    const std::size_t kept = messages.size() - split;
    if (kept >= options.min_keep_count && keep_chars >= options.target_keep_chars) break;
    --split;
    keep_chars += MessageChars(messages[split]);
  }

  plan.to_compress.assign(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(split));
  plan.keep_raw.assign(messages.begin() + static_cast<std::ptrdiff_t>(split), messages.end());
  return plan;
}

bool ForceCompressPrefix(CompressionPlan& plan, const PlannerOptions& options) {
  if (plan.keep_raw.size() <= kMinForcedKeepCount) return false;

  std::int64_t remaining = 0;
  for (const auto& message : plan.keep_raw) {
    remaining += MessageChars(message);
  }

  std::size_t moved = 0;
  while (plan.keep_raw.size() - moved > kMinForcedKeepCount && (moved == 0 || remaining > options.target_keep_chars)) {
    remaining -= MessageChars(plan.keep_raw[moved]);
    ++moved;
  }

  const auto cut = plan.keep_raw.begin() + static_cast<std::ptrdiff_t>(moved);
  plan.to_compress.insert(plan.to_compress.end(), plan.keep_raw.begin(), cut);
  plan.keep_raw.erase(plan.keep_raw.begin(), cut);
  return true;
}

} // namespace prdchat::compression
