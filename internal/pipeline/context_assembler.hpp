#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/compression_state_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/llm/model_client.hpp"

namespace prdchat::pipeline {

// Declaration order is the order segments reach the model.
enum class SegmentKind : std::uint8_t {
  kDocument          = 0,
  kCompressedSummary = 1,
  kHistory           = 2,
  kNewTurn           = 3,
};

struct ContextSegment {
  SegmentKind kind = SegmentKind::kHistory;
  std::string role; // "user" | "assistant"
  std::string content;
};

/*
  Builds model input from typed segments.

  Segments may be added in any order; Build() emits them as document,
  compressed summary, verbatim history, new turn. Within a kind the
  insertion order is kept. Empty segments are skipped.
*/
class ContextAssembler {
 public:
  ContextAssembler& AddDocument(const std::string& raw_markdown);
  ContextAssembler& AddSummary(const db::model::CompressionStateRecord& checkpoint);
  ContextAssembler& AddHistory(const std::vector<db::model::MessageRecord>& messages);
  ContextAssembler& AddNewTurn(const std::string& content);

  std::vector<ContextSegment> Segments() const;

  llm::ModelRequest Build(std::string model, std::string system_prompt) const;

  static std::string RenderDocument(const std::string& raw_markdown);
  static std::string RenderSummary(const db::model::CompressionStateRecord& checkpoint);

 private:
  std::vector<ContextSegment> segments_;
};

} // namespace prdchat::pipeline
