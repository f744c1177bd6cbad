#include "internal/llm/grpc_model_client.hpp"

#include "internal/observability/logging.hpp"

namespace prdchat::llm {

namespace {

class GrpcModelStream final : public ModelStream {
 public:
  GrpcModelStream(prdchat::llm::v1::ModelGateway::Stub& stub, const pipeline::RequestContext& ctx, const prdchat::llm::v1::GenerateRequest& request,
                  std::chrono::milliseconds timeout)
      : run_id_(ctx.run_id) {
    context_.set_deadline(std::chrono::system_clock::now() + timeout);
    if (!ctx.request_id.empty()) context_.AddMetadata("x-request-id", ctx.request_id);
    if (!ctx.run_id.empty()) context_.AddMetadata("x-run-id", ctx.run_id);
    if (!ctx.group_id.empty()) context_.AddMetadata("x-group-id", ctx.group_id);
    if (!ctx.session_id.empty()) context_.AddMetadata("x-session-id", ctx.session_id);

    reader_ = stub.Generate(&context_, request);
  }

  ~GrpcModelStream() override {
    if (!finished_) {
      context_.TryCancel();
      Finish();
    }
  }

  std::optional<ModelChunk> Next() override {
    if (finished_) return std::nullopt;

    prdchat::llm::v1::GenerateChunk chunk;
    if (reader_->Read(&chunk)) {
      switch (chunk.kind_case()) {
        case prdchat::llm::v1::GenerateChunk::kDelta:
          return ModelChunk::Delta(chunk.delta());
        case prdchat::llm::v1::GenerateChunk::kDone:
          saw_terminal_ = true;
          return ModelChunk::Done(chunk.done().input_tokens(), chunk.done().output_tokens());
        case prdchat::llm::v1::GenerateChunk::kError:
          saw_terminal_ = true;
          return ModelChunk::Error(chunk.error().code(), chunk.error().message());
        default:
          return ModelChunk::Delta({});
      }
    }

    const auto status = Finish();
    if (saw_terminal_) return std::nullopt;

    saw_terminal_ = true;
    if (status.error_code() == ::grpc::StatusCode::CANCELLED) {
      return ModelChunk::Error("CANCELLED", "model stream cancelled");
    }
    if (!status.ok()) {
      PRDCHAT_LOG_WARN("Model gateway stream failed", {observability::StringField("run_id", run_id_),
                                                       observability::IntField("grpc_code", static_cast<std::int64_t>(status.error_code())),
                                                       observability::StringField("error", status.error_message())});
      return ModelChunk::Error("LLM_ERROR", status.error_message());
    }
    return ModelChunk::Error("LLM_ERROR", "model stream ended without completion");
  }

  void Cancel() override {
    context_.TryCancel();
  }

 private:
  ::grpc::Status Finish() {
    finished_ = true;
    return reader_->Finish();
  }

  std::string                                                         run_id_;
  ::grpc::ClientContext                                               context_;
  std::unique_ptr<::grpc::ClientReader<prdchat::llm::v1::GenerateChunk>> reader_;
  bool                                                                finished_     = false;
  bool                                                                saw_terminal_ = false;
};

} // namespace

GrpcModelClient::GrpcModelClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(prdchat::llm::v1::ModelGateway::NewStub(std::move(channel))), timeout_(timeout) {
}

std::unique_ptr<ModelStream> GrpcModelClient::StreamGenerate(const pipeline::RequestContext& ctx, const ModelRequest& request) {
  prdchat::llm::v1::GenerateRequest wire;
  wire.set_model(request.model);
  wire.set_system_prompt(request.system_prompt);
  wire.set_max_output_tokens(request.max_output_tokens);
  wire.set_temperature(request.temperature);
  for (const auto& turn : request.messages) {
    auto* out = wire.add_messages();
    out->set_role(turn.role);
    out->set_content(turn.content);
  }

  return std::make_unique<GrpcModelStream>(*stub_, ctx, wire, timeout_);
}

} // namespace prdchat::llm
