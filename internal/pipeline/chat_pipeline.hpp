#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/broadcast/group_broadcast_hub.hpp"
#include "internal/cache/document_store.hpp"
#include "internal/compression/compression_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/llm/model_client.hpp"
#include "internal/model/turn_state.hpp"
#include "internal/pipeline/run_control.hpp"
#include "internal/pipeline/run_journal.hpp"
#include "internal/pipeline/system_prompts.hpp"
#include "internal/sequence/group_sequencer.hpp"
#include "prdchat/v1/chat.pb.h"

namespace prdchat::pipeline {

using ChatEvent = prdchat::v1::ChatStreamEvent;

// Delivers one event to the requesting client; false once the client is gone.
using EventSink = std::function<bool(const ChatEvent&)>;

struct TurnRequest {
  std::string session_id;
  std::string user_id;
  std::string content;

  prdchat::v1::AssistantRole role = prdchat::v1::ASSISTANT_ROLE_PM;

  std::string run_id; // generated when empty
  std::string reply_to_message_id;
  bool        skip_ai_reply = false;
};

struct PipelineOptions {
  std::string   chat_model;
  std::uint32_t max_output_tokens    = 0;
  double        temperature          = 0;
  std::size_t   max_history_messages = 20;
  int           max_citations        = 12;
  std::size_t   channel_capacity     = 256;
};

struct PipelineDeps {
  std::shared_ptr<db::Repository>                      repository;
  std::shared_ptr<sequence::GroupSequencer>            sequencer;
  std::shared_ptr<broadcast::GroupBroadcastHub>        hub;
  std::shared_ptr<llm::ModelClient>                    model_client;
  std::shared_ptr<cache::DocumentStore>                documents;
  std::shared_ptr<compression::CompressionCoordinator> compression; // optional
  std::shared_ptr<RunRegistry>                         runs;
  std::shared_ptr<RunJournal>                          journal; // optional
  SystemPrompts                                        prompts;
};

struct TurnOutcome {
  model::TurnStage stage = model::TurnStage::kIdle;

  std::string run_id;
  std::string user_message_id;
  std::string assistant_message_id; // empty when nothing was persisted
  std::string error_code;
};

/*
  Runs one chat turn end to end.

    Idle -> AwaitingFirstToken -> Streaming -> Flushing -> Finalizing -> Done
    any live stage -> Errored

  The user message is sequenced, persisted and broadcast before the
  model is called. The first non-empty delta allocates the assistant
  sequence number and publishes an empty placeholder; the final write
  replaces it in place. A model reader thread feeds a bounded channel;
  this thread tokenizes, emits and broadcasts.

  Turn-level failures never escape as exceptions: they end in one
  ERROR event. Failed and cancelled turns keep whatever was already
  persisted and mark the assistant message accordingly.
*/
class ChatPipeline {
 public:
  ChatPipeline(PipelineDeps deps, PipelineOptions options);

  TurnOutcome Run(const TurnRequest& request, const EventSink& sink);

  const PipelineOptions& Options() const {
    return options_;
  }

 private:
  friend class TurnRun;

  PipelineDeps    deps_;
  PipelineOptions options_;
};

// Chat error code for an exception raised inside a turn.
const char* ErrorCodeFor(const std::exception& e);

} // namespace prdchat::pipeline
