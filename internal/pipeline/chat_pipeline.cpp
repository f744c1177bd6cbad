#include "internal/pipeline/chat_pipeline.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/citation/citation_extractor.hpp"
#include "internal/db/api/tx_runner.hpp"
#include "internal/markdown/block_tokenizer.hpp"
#include "internal/model/proto_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/bounded_channel.hpp"
#include "internal/pipeline/context_assembler.hpp"
#include "internal/text/unicode.hpp"
#include "internal/text/utf8.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace prdchat::pipeline {

using db::model::MessageRecord;
using model::TurnStage;
using observability::IntField;
using observability::StringField;

const char* ErrorCodeFor(const std::exception& e) {
  if (dynamic_cast<const util::SessionNotFound*>(&e)) return "SESSION_NOT_FOUND";
  if (dynamic_cast<const util::DocumentNotFound*>(&e)) return "DOCUMENT_NOT_FOUND";
  if (dynamic_cast<const util::InvalidArgument*>(&e)) return "INVALID_FORMAT";
  if (dynamic_cast<const util::AlreadyExists*>(&e)) return "INVALID_FORMAT";
  if (dynamic_cast<const util::LlmError*>(&e)) return "LLM_ERROR";
  if (dynamic_cast<const util::Cancelled*>(&e)) return "CANCELLED";
  return "INTERNAL_ERROR";
}

namespace {

bool IsBlankText(const std::string& s) {
  return text::Trim(text::DecodeUtf8(s)).empty();
}

// Joins the model reader thread on every exit path.
class ModelReader {
 public:
  ModelReader(std::shared_ptr<llm::ModelStream> stream, std::size_t capacity) : stream_(std::move(stream)), channel_(capacity) {
    thread_ = std::thread([this] { Pump(); });
  }

  ~ModelReader() {
    Stop();
  }

  ModelReader(const ModelReader&)            = delete;
  ModelReader& operator=(const ModelReader&) = delete;

  std::optional<llm::ModelChunk> Receive() {
    return channel_.Receive();
  }

  void Stop() {
    stream_->Cancel();
    channel_.Close();
    if (thread_.joinable()) thread_.join();
  }

 private:
  void Pump() {
    try {
      while (auto chunk = stream_->Next()) {
        const bool terminal = chunk->type != llm::ChunkType::kDelta;
        if (!channel_.Send(std::move(*chunk)) || terminal) break;
      }
    } catch (const std::exception& e) {
      channel_.Send(llm::ModelChunk::Error("LLM_ERROR", e.what()));
    }
    channel_.Close();
  }

  std::shared_ptr<llm::ModelStream> stream_;
  BoundedChannel<llm::ModelChunk>   channel_;
  std::thread                       thread_;
};

} // namespace

/*
  State of one turn. Lives on the stack of ChatPipeline::Run.
*/
class TurnRun {
 public:
  TurnRun(ChatPipeline& pipeline, const TurnRequest& request, const EventSink& sink)
      : deps_(pipeline.deps_), options_(pipeline.options_), request_(request), sink_(sink) {
    ctx_.request_id     = util::NewId();
    ctx_.run_id         = request.run_id.empty() ? util::NewId() : request.run_id;
    ctx_.session_id     = request.session_id;
    ctx_.user_id        = request.user_id;
    ctx_.received_at_ms = util::NowMillis();

    outcome_.run_id       = ctx_.run_id;
    assistant_message_id_ = util::NewId();
  }

  TurnOutcome Execute();

 private:
  void Advance(TurnStage next);

  void LoadSession();
  void LoadDocument();
  void PersistUserMessage();
  void EmitStart();
  llm::ModelRequest BuildModelRequest();
  std::vector<MessageRecord> LoadHistory();

  void Stream(const llm::ModelRequest& model_request);
  void OnDelta(const std::string& content);
  void OnFirstToken();
  void HandleTokens(const std::vector<markdown::BlockToken>& tokens);
  void Finalize();
  void Fail(const std::exception& e);

  bool Emit(ChatEvent event);
  void Stamp(ChatEvent& event);
  ChatEvent Event(prdchat::v1::ChatEventType type) const;
  void FinishJournal();

  bool IsGroup() const {
    return session_ && session_->IsGroup();
  }

  PipelineDeps&          deps_;
  const PipelineOptions& options_;
  const TurnRequest&     request_;
  const EventSink&       sink_;

  RequestContext              ctx_;
  TurnOutcome                 outcome_;
  std::shared_ptr<RunControl> control_;
  std::int64_t                event_seq_ = 0;
  bool                        journaled_ = false;

  std::optional<db::model::SessionRecord>  session_;
  std::optional<db::model::DocumentRecord> document_;

  MessageRecord                user_message_;
  std::string                  assistant_message_id_;
  std::optional<MessageRecord> placeholder_;

  markdown::BlockTokenizer tokenizer_;
  std::string              answer_;
  bool                     first_delta_published_ = false;

  std::int64_t  first_token_at_ms_ = 0;
  std::uint32_t input_tokens_      = 0;
  std::uint32_t output_tokens_     = 0;
};

void TurnRun::Advance(TurnStage next) {
  if (!model::CanTransition(outcome_.stage, next)) {
    throw util::InvalidStage(std::string("turn cannot move from ") + model::TurnStageName(outcome_.stage) + " to " + model::TurnStageName(next));
  }
  outcome_.stage = next;
}

ChatEvent TurnRun::Event(prdchat::v1::ChatEventType type) const {
  ChatEvent event;
  event.set_type(type);
  event.set_message_id(assistant_message_id_);
  event.set_run_id(ctx_.run_id);
  event.set_user_message_id(user_message_.id);
  return event;
}

// Every event gets the next run seq; registered runs also land in the journal.
void TurnRun::Stamp(ChatEvent& event) {
  event.set_seq(++event_seq_);
  if (journaled_) {
    deps_.journal->Append(ctx_.run_id, event);
  }
}

void TurnRun::FinishJournal() {
  if (!journaled_) return;

  prdchat::v1::RunStatus status = prdchat::v1::RUN_STATUS_FAILED;
  if (outcome_.stage == TurnStage::kDone) status = prdchat::v1::RUN_STATUS_DONE;
  if (outcome_.error_code == "CANCELLED") status = prdchat::v1::RUN_STATUS_CANCELLED;
  deps_.journal->Finish(ctx_.run_id, status, outcome_.error_code);
}

bool TurnRun::Emit(ChatEvent event) {
  Stamp(event);
  if (sink_(event)) return true;

  // The requesting client went away: the run is cancelled, group members keep streaming state.
  if (control_ && !control_->IsCancelled()) {
    PRDCHAT_LOG_INFO("Client disconnected, cancelling run", {StringField("run_id", ctx_.run_id)});
    control_->Cancel();
  }
  return false;
}

TurnOutcome TurnRun::Execute() {
  observability::SpanScope span("chat.turn");
  span.SetAttribute("run_id", ctx_.run_id);
  span.SetAttribute("session_id", ctx_.session_id);

  try {
    if (request_.session_id.empty()) {
      throw util::InvalidArgument("session_id is required");
    }
    if (IsBlankText(request_.content)) {
      throw util::InvalidArgument("message content is empty");
    }

    control_ = deps_.runs->Register(ctx_.run_id);
    if (deps_.journal) {
      deps_.journal->Begin(ctx_.run_id, request_.session_id);
      journaled_ = true;
    }
  } catch (const std::exception& e) {
    Fail(e);
    return outcome_;
  }

  try {
    LoadSession();
    span.SetAttribute("group_id", ctx_.group_id);
    if (!request_.skip_ai_reply) {
      LoadDocument();
    }

    PersistUserMessage();
    EmitStart();

    if (request_.skip_ai_reply) {
      // Human-only group message: no assistant turn follows.
      auto done = Event(prdchat::v1::CHAT_EVENT_TYPE_DONE);
      done.clear_message_id();
      *done.mutable_done_at() = util::MillisToProto(util::NowMillis());
      Emit(done);
      outcome_.stage = TurnStage::kDone;
    } else {
      Advance(TurnStage::kAwaitingFirstToken);
      Stream(BuildModelRequest());
      Finalize();
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    Fail(e);
  }

  FinishJournal();
  deps_.runs->Unregister(ctx_.run_id);
  return outcome_;
}

void TurnRun::LoadSession() {
  session_ = db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) { return deps_.repository->GetSession(tx, request_.session_id); });
  if (!session_) {
    throw util::SessionNotFound("session not found: " + request_.session_id);
  }
  ctx_.group_id = session_->group_id;
}

void TurnRun::LoadDocument() {
  document_ = deps_.documents->Get(session_->document_id);
  if (!document_) {
    throw util::DocumentNotFound("document not found: " + session_->document_id);
  }
}

void TurnRun::PersistUserMessage() {
  user_message_.id                  = util::NewId();
  user_message_.session_id          = session_->id;
  user_message_.group_id            = session_->group_id;
  user_message_.role                = prdchat::v1::MESSAGE_ROLE_USER;
  user_message_.sender_user_id      = request_.user_id;
  user_message_.content             = request_.content;
  user_message_.run_id              = ctx_.run_id;
  user_message_.reply_to_message_id = request_.reply_to_message_id;
  user_message_.status              = prdchat::v1::MESSAGE_STATUS_DONE;
  user_message_.timestamp_ms        = ctx_.received_at_ms;

  db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) {
    if (IsGroup()) {
      user_message_.group_seq = deps_.sequencer->Next(tx, session_->group_id);
    }
    db::ThrowIfDbError(deps_.repository->InsertMessages(tx, {user_message_}), "insert user message");
  });
  outcome_.user_message_id = user_message_.id;

  if (IsGroup()) {
    deps_.hub->Publish(user_message_);
  }
  PRDCHAT_LOG_DEBUG("User message stored", {StringField("run_id", ctx_.run_id), StringField("message_id", user_message_.id),
                                            IntField("group_seq", user_message_.group_seq.value_or(0))});
}

void TurnRun::EmitStart() {
  auto start = Event(prdchat::v1::CHAT_EVENT_TYPE_START);
  if (request_.skip_ai_reply) {
    start.clear_message_id();
  }
  if (user_message_.group_seq) {
    start.set_user_seq(*user_message_.group_seq);
  }
  *start.mutable_request_received_at() = util::MillisToProto(ctx_.received_at_ms);
  Emit(start);
}

std::vector<MessageRecord> TurnRun::LoadHistory() {
  auto unfinished = [&](const MessageRecord& m) {
    return m.id == user_message_.id || (m.role == prdchat::v1::MESSAGE_ROLE_ASSISTANT && m.status != prdchat::v1::MESSAGE_STATUS_DONE);
  };

  std::vector<MessageRecord> history;
  if (IsGroup()) {
    history = db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) {
      return deps_.repository->ListGroupMessagesBefore(tx, session_->group_id, user_message_.group_seq, options_.max_history_messages);
    });
  } else {
    history = db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) {
      return deps_.repository->ListSessionMessages(tx, session_->id, options_.max_history_messages + 1);
    });
  }

  history.erase(std::remove_if(history.begin(), history.end(), unfinished), history.end());
  if (history.size() > options_.max_history_messages) {
    history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(options_.max_history_messages));
  }
  return history;
}

llm::ModelRequest TurnRun::BuildModelRequest() {
  ContextAssembler assembler;
  assembler.AddDocument(document_->raw_content);

  bool assembled = false;
  if (IsGroup() && deps_.compression) {
    try {
      auto history = deps_.compression->PrepareHistory(ctx_, user_message_.id, request_.content, control_);
      if (history.checkpoint) {
        assembler.AddSummary(*history.checkpoint);
      }
      assembler.AddHistory(history.messages);
      assembled = true;
    } catch (const util::Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      PRDCHAT_LOG_WARN("Compression unavailable, using recent history", {StringField("run_id", ctx_.run_id), StringField("error", e.what())});
    }
  }
  if (!assembled) {
    assembler.AddHistory(LoadHistory());
  }
  assembler.AddNewTurn(request_.content);

  auto model_request              = assembler.Build(options_.chat_model, deps_.prompts.Build(request_.role));
  model_request.max_output_tokens = options_.max_output_tokens;
  model_request.temperature       = options_.temperature;
  return model_request;
}

void TurnRun::Stream(const llm::ModelRequest& model_request) {
  std::shared_ptr<llm::ModelStream> stream;
  try {
    stream = deps_.model_client->StreamGenerate(ctx_, model_request);
  } catch (const std::exception& e) {
    throw util::LlmError(e.what());
  }
  if (!stream) {
    throw util::LlmError("model client returned no stream");
  }

  control_->OnCancel([stream] { stream->Cancel(); });
  ModelReader reader(stream, options_.channel_capacity);

  while (true) {
    if (control_->IsCancelled()) {
      throw util::Cancelled("run cancelled");
    }

    auto chunk = reader.Receive();
    if (!chunk) {
      if (control_->IsCancelled()) throw util::Cancelled("run cancelled");
      throw util::LlmError("model stream ended without completion");
    }

    switch (chunk->type) {
      case llm::ChunkType::kDelta:
        if (!chunk->content.empty()) OnDelta(chunk->content);
        break;
      case llm::ChunkType::kDone:
        input_tokens_  = chunk->input_tokens;
        output_tokens_ = chunk->output_tokens;
        return;
      case llm::ChunkType::kError:
        if (control_->IsCancelled() || chunk->error_code == "CANCELLED") throw util::Cancelled("run cancelled");
        throw util::LlmError(chunk->error_message.empty() ? chunk->error_code : chunk->error_message);
    }
  }
}

void TurnRun::OnFirstToken() {
  first_token_at_ms_ = util::NowMillis();
  observability::Metrics::Instance().ObserveFirstTokenLatencyMs(static_cast<double>(first_token_at_ms_ - ctx_.received_at_ms));

  MessageRecord placeholder;
  placeholder.id                  = assistant_message_id_;
  placeholder.session_id          = session_->id;
  placeholder.group_id            = session_->group_id;
  placeholder.role                = prdchat::v1::MESSAGE_ROLE_ASSISTANT;
  placeholder.assistant_role      = request_.role;
  placeholder.run_id              = ctx_.run_id;
  placeholder.reply_to_message_id = user_message_.id;
  placeholder.status              = prdchat::v1::MESSAGE_STATUS_STREAMING;
  placeholder.timestamp_ms        = first_token_at_ms_;

  db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) {
    if (IsGroup()) {
      placeholder.group_seq = deps_.sequencer->Next(tx, session_->group_id);
    }
    db::ThrowIfDbError(deps_.repository->InsertMessages(tx, {placeholder}), "insert assistant placeholder");
  });

  placeholder_                  = std::move(placeholder);
  outcome_.assistant_message_id = assistant_message_id_;
  if (IsGroup()) {
    deps_.hub->Publish(*placeholder_);
  }
  Advance(TurnStage::kStreaming);
}

void TurnRun::OnDelta(const std::string& content) {
  if (!placeholder_) {
    OnFirstToken();
  }
  answer_ += content;
  HandleTokens(tokenizer_.Push(content));
}

void TurnRun::HandleTokens(const std::vector<markdown::BlockToken>& tokens) {
  for (const auto& token : tokens) {
    prdchat::v1::ChatEventType type = prdchat::v1::CHAT_EVENT_TYPE_BLOCK_DELTA;
    if (token.type == markdown::BlockTokenType::kStart) type = prdchat::v1::CHAT_EVENT_TYPE_BLOCK_START;
    if (token.type == markdown::BlockTokenType::kEnd) type = prdchat::v1::CHAT_EVENT_TYPE_BLOCK_END;

    auto event = Event(type);
    event.set_block_id(token.block_id);
    event.set_block_kind(model::ToProto(token.kind));
    if (token.language) event.set_language(*token.language);
    if (token.type == markdown::BlockTokenType::kDelta) event.set_content(token.content);
    Emit(event);

    if (!IsGroup()) continue;
    if (token.type == markdown::BlockTokenType::kDelta) {
      deps_.hub->PublishDelta(session_->group_id, assistant_message_id_, token.content, token.block_id, token.kind, !first_delta_published_);
      first_delta_published_ = true;
    } else if (token.type == markdown::BlockTokenType::kEnd) {
      deps_.hub->PublishBlockEnd(session_->group_id, assistant_message_id_, token.block_id, token.kind);
    }
  }
}

void TurnRun::Finalize() {
  Advance(TurnStage::kFlushing);
  HandleTokens(tokenizer_.Flush());

  Advance(TurnStage::kFinalizing);
  const auto done_at_ms = util::NowMillis();

  citation::CitationExtractor extractor(options_.max_citations);
  const auto                  citations = extractor.Extract(document_->raw_content, answer_);

  MessageRecord final_message;
  if (placeholder_) {
    final_message = *placeholder_;
  } else {
    // The model finished without a single token; the reply is stored now.
    final_message.id                  = assistant_message_id_;
    final_message.session_id          = session_->id;
    final_message.group_id            = session_->group_id;
    final_message.role                = prdchat::v1::MESSAGE_ROLE_ASSISTANT;
    final_message.assistant_role      = request_.role;
    final_message.run_id              = ctx_.run_id;
    final_message.reply_to_message_id = user_message_.id;
    final_message.timestamp_ms        = done_at_ms;
  }
  final_message.content       = answer_;
  final_message.status        = prdchat::v1::MESSAGE_STATUS_DONE;
  final_message.input_tokens  = input_tokens_;
  final_message.output_tokens = output_tokens_;

  db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) {
    if (placeholder_) {
      db::ThrowIfDbError(deps_.repository->ReplaceMessage(tx, final_message), "finalize assistant message");
      return;
    }
    if (IsGroup()) {
      final_message.group_seq = deps_.sequencer->Next(tx, session_->group_id);
    }
    db::ThrowIfDbError(deps_.repository->InsertMessages(tx, {final_message}), "insert assistant message");
  });
  outcome_.assistant_message_id = assistant_message_id_;

  if (IsGroup()) {
    if (placeholder_) {
      deps_.hub->PublishUpdated(final_message);
    } else {
      deps_.hub->Publish(final_message);
    }
    if (!citations.empty()) {
      deps_.hub->PublishCitations(session_->group_id, assistant_message_id_, citations);
    }
  }
  placeholder_ = final_message;

  if (!citations.empty()) {
    auto event = Event(prdchat::v1::CHAT_EVENT_TYPE_CITATIONS);
    model::AppendCitations(citations, event.mutable_citations());
    Emit(event);
  }

  auto done = Event(prdchat::v1::CHAT_EVENT_TYPE_DONE);
  if (final_message.group_seq) done.set_assistant_seq(*final_message.group_seq);
  if (user_message_.group_seq) done.set_user_seq(*user_message_.group_seq);
  done.mutable_token_usage()->set_input_tokens(input_tokens_);
  done.mutable_token_usage()->set_output_tokens(output_tokens_);
  *done.mutable_request_received_at() = util::MillisToProto(ctx_.received_at_ms);
  if (first_token_at_ms_) *done.mutable_first_token_at() = util::MillisToProto(first_token_at_ms_);
  *done.mutable_done_at() = util::MillisToProto(done_at_ms);
  Emit(done);

  Advance(TurnStage::kDone);
  PRDCHAT_LOG_INFO("Chat turn completed",
                   {StringField("run_id", ctx_.run_id), StringField("session_id", ctx_.session_id), StringField("group_id", ctx_.group_id),
                    IntField("answer_bytes", static_cast<std::int64_t>(answer_.size())), IntField("citations", static_cast<std::int64_t>(citations.size())),
                    IntField("latency_ms", done_at_ms - ctx_.received_at_ms)});
}

void TurnRun::Fail(const std::exception& e) {
  const char* code      = ErrorCodeFor(e);
  const bool  cancelled = dynamic_cast<const util::Cancelled*>(&e) != nullptr;

  outcome_.error_code = code;
  if (!model::IsTerminal(outcome_.stage)) {
    outcome_.stage = TurnStage::kErrored;
  }

  if (cancelled) {
    PRDCHAT_LOG_INFO("Chat turn cancelled", {StringField("run_id", ctx_.run_id), StringField("session_id", ctx_.session_id)});
  } else {
    PRDCHAT_LOG_WARN("Chat turn failed", {StringField("run_id", ctx_.run_id), StringField("session_id", ctx_.session_id),
                                          StringField("group_id", ctx_.group_id), StringField("code", code), StringField("error", e.what())});
  }

  // Other participants already saw the placeholder; record how the turn ended.
  if (placeholder_ && placeholder_->status == prdchat::v1::MESSAGE_STATUS_STREAMING) {
    auto ended    = *placeholder_;
    ended.content = answer_ + (cancelled ? "\n\n[cancelled]" : std::string("\n\n[error: ") + e.what() + "]");
    ended.status  = cancelled ? prdchat::v1::MESSAGE_STATUS_CANCELLED : prdchat::v1::MESSAGE_STATUS_FAILED;
    try {
      db::RunInTransaction(*deps_.repository, [&](db::Transaction& tx) {
        db::ThrowIfDbError(deps_.repository->ReplaceMessage(tx, ended), "record ended assistant message");
      });
      placeholder_ = ended;
      if (IsGroup()) deps_.hub->PublishUpdated(ended);
    } catch (const std::exception& persist_error) {
      PRDCHAT_LOG_ERROR("Failed to record ended assistant message",
                        {StringField("run_id", ctx_.run_id), StringField("message_id", ended.id), StringField("error", persist_error.what())});
    }
  }

  auto event = Event(prdchat::v1::CHAT_EVENT_TYPE_ERROR);
  if (!placeholder_) event.clear_message_id();
  event.set_error_code(code);
  event.set_error_message(e.what());
  Stamp(event);
  sink_(event);
}

ChatPipeline::ChatPipeline(PipelineDeps deps, PipelineOptions options) : deps_(std::move(deps)), options_(std::move(options)) {
  if (!deps_.repository || !deps_.sequencer || !deps_.hub || !deps_.model_client || !deps_.documents || !deps_.runs) {
    throw std::invalid_argument("chat pipeline is missing a dependency");
  }
}

TurnOutcome ChatPipeline::Run(const TurnRequest& request, const EventSink& sink) {
  TurnRun run(*this, request, sink);
  return run.Execute();
}

} // namespace prdchat::pipeline
