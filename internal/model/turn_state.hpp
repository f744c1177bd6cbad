#pragma once

#include <cstdint>

namespace prdchat::model {

// Stages of one chat turn; kErrored is reachable from every live stage.
enum class TurnStage : std::uint8_t {
  kIdle               = 0,
  kAwaitingFirstToken = 1,
  kStreaming          = 2,
  kFlushing           = 3,
  kFinalizing         = 4,
  kDone               = 5,
  kErrored            = 6,
};

constexpr bool IsTerminal(TurnStage stage) {
  return stage == TurnStage::kDone || stage == TurnStage::kErrored;
}

constexpr bool CanTransition(TurnStage from, TurnStage to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TurnStage::kErrored) {
    return true;
  }
  if (to == TurnStage::kDone) {
    return from == TurnStage::kFinalizing;
  }

  // The model may finish without producing a token.
  if (from == TurnStage::kAwaitingFirstToken && to == TurnStage::kFlushing) {
    return true;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr const char* TurnStageName(TurnStage stage) {
  switch (stage) {
    case TurnStage::kIdle:
      return "idle";
    case TurnStage::kAwaitingFirstToken:
      return "awaiting_first_token";
    case TurnStage::kStreaming:
      return "streaming";
    case TurnStage::kFlushing:
      return "flushing";
    case TurnStage::kFinalizing:
      return "finalizing";
    case TurnStage::kDone:
      return "done";
    case TurnStage::kErrored:
      return "errored";
  }
  return "unknown";
}

} // namespace prdchat::model
