#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/compression_state_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/llm/model_client.hpp"
#include "internal/pipeline/request_context.hpp"

namespace prdchat::compression {

/*
  Folds a run of group messages into a compact summary with one model
  call.

  The new checkpoint covers [previous.from_seq or first.group_seq,
  last.group_seq]. Any model failure, an empty answer or messages
  without sequence numbers yield nullopt; callers fall back to
  uncompressed history.
*/
class ContextSummarizer {
 public:
  ContextSummarizer(std::shared_ptr<llm::ModelClient> client, std::string model, std::uint32_t max_output_tokens = 0);

  std::optional<db::model::CompressionStateRecord> Summarize(const pipeline::RequestContext&                       ctx,
                                                             const std::vector<db::model::MessageRecord>&         to_compress,
                                                             const std::optional<db::model::CompressionStateRecord>& previous,
                                                             const std::string&                                    current_goal) const;

  static const std::string& Instruction();

  // User turn handed to the model: prior summary, transcript, goal hint.
  static std::string BuildPrompt(const std::vector<db::model::MessageRecord>&         to_compress,
                                 const std::optional<db::model::CompressionStateRecord>& previous,
                                 const std::string&                                    current_goal);

 private:
  std::shared_ptr<llm::ModelClient> client_;
  std::string                       model_;
  std::uint32_t                     max_output_tokens_;
};

} // namespace prdchat::compression
