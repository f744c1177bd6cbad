#include "internal/compression/context_summarizer.hpp"

#include <sstream>

#include "internal/compression/compression_planner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/text/unicode.hpp"
#include "internal/text/utf8.hpp"
#include "internal/util/time.hpp"

namespace prdchat::compression {

namespace {

const char* SpeakerLabel(const db::model::MessageRecord& message) {
  if (message.role != prdchat::v1::MESSAGE_ROLE_ASSISTANT) return "user";
  switch (message.assistant_role) {
    case prdchat::v1::ASSISTANT_ROLE_DEV:
      return "assistant(dev)";
    case prdchat::v1::ASSISTANT_ROLE_QA:
      return "assistant(qa)";
    default:
      return "assistant(pm)";
  }
}

} // namespace

ContextSummarizer::ContextSummarizer(std::shared_ptr<llm::ModelClient> client, std::string model, std::uint32_t max_output_tokens)
    : client_(std::move(client)), model_(std::move(model)), max_output_tokens_(max_output_tokens) {
}

const std::string& ContextSummarizer::Instruction() {
  static const std::string kInstruction =
      "You compress the history of a group conversation about a product requirements document.\n"
      "Keep every fact, decision, constraint and open item that matters for the current goal.\n"
      "Drop greetings and small talk. Do not invent anything that was not said.\n"
      "Do not quote or restate the requirements document itself; it is supplied separately.\n"
      "Write a compact bullet list in the language of the conversation.";
  return kInstruction;
}

std::string ContextSummarizer::BuildPrompt(const std::vector<db::model::MessageRecord>&         to_compress,
                                           const std::optional<db::model::CompressionStateRecord>& previous,
                                           const std::string&                                    current_goal) {
  std::ostringstream out;
  if (previous && !previous->compressed_text.empty()) {
    out << "Existing summary of messages " << previous->from_seq << ".." << previous->to_seq << ":\n" << previous->compressed_text << "\n\n";
  }

  out << "Messages to fold in, oldest first:\n";
  for (const auto& message : to_compress) {
    out << "[" << message.group_seq.value_or(0) << "] " << SpeakerLabel(message) << ": " << message.content << "\n";
  }

  if (!current_goal.empty()) {
    out << "\nCurrent goal (the latest user message, keep whatever it depends on):\n" << current_goal << "\n";
  }
  return out.str();
}

std::optional<db::model::CompressionStateRecord> ContextSummarizer::Summarize(const pipeline::RequestContext&                       ctx,
                                                                              const std::vector<db::model::MessageRecord>&         to_compress,
                                                                              const std::optional<db::model::CompressionStateRecord>& previous,
                                                                              const std::string&                                    current_goal) const {
  if (to_compress.empty() || !to_compress.front().group_seq || !to_compress.back().group_seq) {
    return std::nullopt;
  }

  observability::SpanScope span("compression.summarize");
  span.SetAttribute("group_id", ctx.group_id);
  span.SetAttribute("message_count", static_cast<std::int64_t>(to_compress.size()));

  llm::ModelRequest request;
  request.model             = model_;
  request.system_prompt     = Instruction();
  request.max_output_tokens = max_output_tokens_;
  request.messages.push_back(llm::ChatTurn{"user", BuildPrompt(to_compress, previous, current_goal)});

  std::string summary;
  try {
    auto stream = client_->StreamGenerate(ctx, request);
    bool done   = false;
    while (auto chunk = stream->Next()) {
      if (chunk->type == llm::ChunkType::kDelta) {
        summary += chunk->content;
      } else if (chunk->type == llm::ChunkType::kDone) {
        done = true;
        break;
      } else {
        span.RecordException(chunk->error_message);
        PRDCHAT_LOG_WARN("Summarizer model call failed",
                         {observability::StringField("group_id", ctx.group_id), observability::StringField("code", chunk->error_code),
                          observability::StringField("error", chunk->error_message)});
        return std::nullopt;
      }
    }
    if (!done) {
      PRDCHAT_LOG_WARN("Summarizer stream ended without completion", {observability::StringField("group_id", ctx.group_id)});
      return std::nullopt;
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    PRDCHAT_LOG_WARN("Summarizer model call failed", {observability::StringField("group_id", ctx.group_id), observability::StringField("error", e.what())});
    return std::nullopt;
  }

  summary = text::EncodeUtf8(text::Trim(text::DecodeUtf8(summary)));
  if (summary.empty()) {
    return std::nullopt;
  }

  std::int64_t original_chars = previous ? previous->original_chars : 0;
  for (const auto& message : to_compress) {
    original_chars += MessageChars(message);
  }

  db::model::CompressionStateRecord state;
  state.group_id         = ctx.group_id;
  state.from_seq         = previous ? previous->from_seq : *to_compress.front().group_seq;
  state.to_seq           = *to_compress.back().group_seq;
  state.compressed_text  = std::move(summary);
  state.original_chars   = original_chars;
  state.compressed_chars = static_cast<std::int64_t>(text::CodepointCount(state.compressed_text));
  state.created_at_ms    = util::NowMillis();
  return state;
}

} // namespace prdchat::compression
