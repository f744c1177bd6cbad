#include "internal/pipeline/context_assembler.hpp"

#include <algorithm>

namespace prdchat::pipeline {

std::string ContextAssembler::RenderDocument(const std::string& raw_markdown) {
  return "[[CONTEXT:PRD]]\n<PRD>\n" + raw_markdown + "\n</PRD>\n[[/CONTEXT:PRD]]";
}

std::string ContextAssembler::RenderSummary(const db::model::CompressionStateRecord& checkpoint) {
  return "[[CONTEXT:SUMMARY]]\n"
         "Derived summary of earlier group messages " +
         std::to_string(checkpoint.from_seq) + ".." + std::to_string(checkpoint.to_seq) +
         ". Not a primary source.\n"
         "<SUMMARY>\n" +
         checkpoint.compressed_text + "\n</SUMMARY>\n[[/CONTEXT:SUMMARY]]";
}

ContextAssembler& ContextAssembler::AddDocument(const std::string& raw_markdown) {
  if (!raw_markdown.empty()) {
    segments_.push_back({SegmentKind::kDocument, "user", RenderDocument(raw_markdown)});
  }
  return *this;
}

ContextAssembler& ContextAssembler::AddSummary(const db::model::CompressionStateRecord& checkpoint) {
  if (!checkpoint.compressed_text.empty()) {
    segments_.push_back({SegmentKind::kCompressedSummary, "user", RenderSummary(checkpoint)});
  }
  return *this;
}

ContextAssembler& ContextAssembler::AddHistory(const std::vector<db::model::MessageRecord>& messages) {
  for (const auto& message : messages) {
    if (message.content.empty()) continue;
    const bool assistant = message.role == prdchat::v1::MESSAGE_ROLE_ASSISTANT;
    segments_.push_back({SegmentKind::kHistory, assistant ? "assistant" : "user", message.content});
  }
  return *this;
}

ContextAssembler& ContextAssembler::AddNewTurn(const std::string& content) {
  segments_.push_back({SegmentKind::kNewTurn, "user", content});
  return *this;
}

std::vector<ContextSegment> ContextAssembler::Segments() const {
  auto ordered = segments_;
  std::stable_sort(ordered.begin(), ordered.end(), [](const ContextSegment& a, const ContextSegment& b) { return a.kind < b.kind; });
  return ordered;
}

llm::ModelRequest ContextAssembler::Build(std::string model, std::string system_prompt) const {
  llm::ModelRequest request;
  request.model         = std::move(model);
  request.system_prompt = std::move(system_prompt);
  for (auto& segment : Segments()) {
    request.messages.push_back(llm::ChatTurn{std::move(segment.role), std::move(segment.content)});
  }
  return request;
}

} // namespace prdchat::pipeline
