#include "internal/compression/compression_planner.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using prdchat::compression::CompressionPlan;
using prdchat::compression::PlannerOptions;
using prdchat::db::model::MessageRecord;

std::vector<MessageRecord> MakeHistory(std::size_t count, std::size_t chars_each) {
  std::vector<MessageRecord> messages;
  for (std::size_t i = 0; i < count; ++i) {
    MessageRecord message;
    message.id        = "m" + std::to_string(i + 1);
    message.group_id  = "g";
    message.group_seq = static_cast<std::int64_t>(i + 1);
    message.content   = std::string(chars_each, 'x');
    messages.push_back(std::move(message));
  }
  return messages;
}

PlannerOptions DefaultOptions() {
  PlannerOptions options;
  options.threshold_chars   = 50000;
  options.target_keep_chars = 16000;
  options.min_keep_count    = 8;
  return options;
}

void TestOverThresholdKeepsNewestTail() {
  const auto history = MakeHistory(51, 1000);
  const auto plan    = prdchat::compression::PlanCompression(history, DefaultOptions());

  assert(plan.should_compress);
  assert(plan.total_chars == 51000);
  assert(plan.keep_raw.size() >= 8);
  assert(plan.keep_raw.size() == 16);
  assert(plan.keep_raw.back().id == "m51");
  assert(plan.to_compress.size() == 35);
  assert(plan.to_compress.front().id == "m1");
  assert(plan.to_compress.back().group_seq == 35);
}

void TestUnderThresholdKeepsEverything() {
  const auto history = MakeHistory(10, 100);
  const auto plan    = prdchat::compression::PlanCompression(history, DefaultOptions());

  assert(!plan.should_compress);
  assert(plan.to_compress.empty());
  assert(plan.keep_raw.size() == 10);
}

void TestExactlyAtThresholdDoesNotCompress() {
  const auto history = MakeHistory(50, 1000);
  assert(!prdchat::compression::PlanCompression(history, DefaultOptions()).should_compress);
}

void TestTooFewMessagesKeepsAll() {
  const auto history = MakeHistory(5, 20000);
  const auto plan    = prdchat::compression::PlanCompression(history, DefaultOptions());

  assert(plan.should_compress);
  assert(plan.to_compress.empty());
  assert(plan.keep_raw.size() == 5);
}

void TestCharactersAreCodepoints() {
  MessageRecord message;
  message.content = "héllo 世界";
  assert(prdchat::compression::MessageChars(message) == 8);
}

void TestForcedPrefixWhenNothingIsEligible() {
  const auto history = MakeHistory(8, 10000);
  auto       plan    = prdchat::compression::PlanCompression(history, DefaultOptions());
  assert(plan.should_compress);
  assert(plan.to_compress.empty());

  assert(prdchat::compression::ForceCompressPrefix(plan, DefaultOptions()));
  assert(plan.to_compress.size() == 6);
  assert(plan.keep_raw.size() == 2);
  assert(plan.to_compress.front().id == "m1");
  assert(plan.keep_raw.front().id == "m7");
}

void TestForcedPrefixStopsOnceUnderTarget() {
  const auto history = MakeHistory(6, 10000);
  auto       plan    = prdchat::compression::PlanCompression(history, DefaultOptions());

  auto options              = DefaultOptions();
  options.target_keep_chars = 35000;
  assert(prdchat::compression::ForceCompressPrefix(plan, options));
  assert(plan.to_compress.size() == 3);
  assert(plan.keep_raw.size() == 3);
}

void TestForcedPrefixAlwaysMovesOne() {
  const auto history = MakeHistory(3, 10);
  auto       plan    = prdchat::compression::PlanCompression(history, DefaultOptions());
  assert(prdchat::compression::ForceCompressPrefix(plan, DefaultOptions()));
  assert(plan.to_compress.size() == 1);
  assert(plan.keep_raw.size() == 2);
}

void TestForcedPrefixNeverLeavesFewerThanTwo() {
  auto plan = prdchat::compression::PlanCompression(MakeHistory(2, 40000), DefaultOptions());
  assert(plan.should_compress);
  assert(!prdchat::compression::ForceCompressPrefix(plan, DefaultOptions()));
  assert(plan.keep_raw.size() == 2);
  assert(plan.to_compress.empty());
}

} // namespace

int main() {
  TestOverThresholdKeepsNewestTail();
  TestUnderThresholdKeepsEverything();
  TestExactlyAtThresholdDoesNotCompress();
  TestTooFewMessagesKeepsAll();
  TestCharactersAreCodepoints();
  TestForcedPrefixWhenNothingIsEligible();
  TestForcedPrefixStopsOnceUnderTarget();
  TestForcedPrefixAlwaysMovesOne();
  TestForcedPrefixNeverLeavesFewerThanTwo();

  std::cout << "prdchat_unit_compression_planner: pass\n";
  return 0;
}
