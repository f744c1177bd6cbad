#include "internal/model/proto_codec.hpp"

#include "internal/util/time.hpp"

namespace prdchat::model {

prdchat::v1::Message ToProto(const db::model::MessageRecord& record) {
  prdchat::v1::Message out;
  out.set_id(record.id);
  out.set_session_id(record.session_id);
  out.set_group_id(record.group_id);
  out.set_role(record.role);
  out.set_assistant_role(record.assistant_role);
  out.set_sender_user_id(record.sender_user_id);
  out.set_content(record.content);
  if (record.group_seq) {
    out.set_group_seq(*record.group_seq);
  }
  out.set_run_id(record.run_id);
  out.set_reply_to_message_id(record.reply_to_message_id);
  out.set_status(record.status);
  *out.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  if (record.input_tokens || record.output_tokens) {
    out.mutable_token_usage()->set_input_tokens(record.input_tokens);
    out.mutable_token_usage()->set_output_tokens(record.output_tokens);
  }
  return out;
}

prdchat::v1::Citation ToProto(const citation::Citation& citation) {
  prdchat::v1::Citation out;
  out.set_heading_title(citation.heading_title);
  out.set_heading_id(citation.heading_id);
  out.set_excerpt(citation.excerpt);
  out.set_score(citation.score);
  out.set_rank(citation.rank);
  return out;
}

prdchat::v1::CompressionState ToProto(const db::model::CompressionStateRecord& record) {
  prdchat::v1::CompressionState out;
  out.set_group_id(record.group_id);
  out.set_from_seq(record.from_seq);
  out.set_to_seq(record.to_seq);
  out.set_compressed_text(record.compressed_text);
  out.set_original_chars(record.original_chars);
  out.set_compressed_chars(record.compressed_chars);
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return out;
}

prdchat::v1::BlockKind ToProto(markdown::BlockKind kind) {
  switch (kind) {
    case markdown::BlockKind::kParagraph:
      return prdchat::v1::BLOCK_KIND_PARAGRAPH;
    case markdown::BlockKind::kHeading:
      return prdchat::v1::BLOCK_KIND_HEADING;
    case markdown::BlockKind::kListItem:
      return prdchat::v1::BLOCK_KIND_LIST_ITEM;
    case markdown::BlockKind::kCodeBlock:
      return prdchat::v1::BLOCK_KIND_CODE_BLOCK;
  }
  return prdchat::v1::BLOCK_KIND_UNSPECIFIED;
}

void AppendCitations(const std::vector<citation::Citation>& citations, google::protobuf::RepeatedPtrField<prdchat::v1::Citation>* out) {
  out->Reserve(out->size() + static_cast<int>(citations.size()));
  for (const auto& citation : citations) {
    *out->Add() = ToProto(citation);
  }
}

} // namespace prdchat::model
