#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/pipeline/request_context.hpp"

namespace prdchat::llm {

struct ChatTurn {
  std::string role; // "user" | "assistant"
  std::string content;
};

struct ModelRequest {
  std::string           model;
  std::string           system_prompt;
  std::vector<ChatTurn> messages;
  std::uint32_t         max_output_tokens = 0;
  double                temperature       = 0;
};

enum class ChunkType {
  kDelta,
  kDone,
  kError,
};

struct ModelChunk {
  ChunkType type = ChunkType::kDelta;

  std::string content; // kDelta

  std::uint32_t input_tokens  = 0; // kDone
  std::uint32_t output_tokens = 0;

  std::string error_code; // kError
  std::string error_message;

  static ModelChunk Delta(std::string text) {
    ModelChunk chunk;
    chunk.content = std::move(text);
    return chunk;
  }

  static ModelChunk Done(std::uint32_t input_tokens, std::uint32_t output_tokens) {
    ModelChunk chunk;
    chunk.type          = ChunkType::kDone;
    chunk.input_tokens  = input_tokens;
    chunk.output_tokens = output_tokens;
    return chunk;
  }

  static ModelChunk Error(std::string code, std::string message) {
    ModelChunk chunk;
    chunk.type          = ChunkType::kError;
    chunk.error_code    = std::move(code);
    chunk.error_message = std::move(message);
    return chunk;
  }
};

/*
  One in-flight generation.

  Next() blocks until a chunk is available and returns nullopt once the
  stream is exhausted. A well-behaved stream ends with exactly one kDone
  or kError chunk. Cancel() may be called from any thread and makes a
  blocked Next() return promptly.
*/
class ModelStream {
 public:
  virtual ~ModelStream() = default;

  virtual std::optional<ModelChunk> Next() = 0;
  virtual void                      Cancel() = 0;
};

// Streaming text generation, used by chat turns and the summarizer.
class ModelClient {
 public:
  virtual ~ModelClient() = default;

  virtual std::unique_ptr<ModelStream> StreamGenerate(const pipeline::RequestContext& ctx, const ModelRequest& request) = 0;
};

} // namespace prdchat::llm
