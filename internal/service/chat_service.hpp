#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "internal/broadcast/group_broadcast_hub.hpp"
#include "internal/pipeline/chat_pipeline.hpp"
#include "internal/pipeline/run_journal.hpp"
#include "prdchat/services/v1/chat_service.pb.h"
#include "service_context.hpp"

namespace prdchat::service {

class ChatService {
 public:
  explicit ChatService(ServiceContext ctx);

  // Runs one turn; every outcome, including failures, reaches the sink.
  pipeline::TurnOutcome SendMessage(const prdchat::services::v1::SendMessageRequest& req, const pipeline::EventSink& sink);

  void CancelRun(const prdchat::services::v1::CancelRunRequest& req);

  // Active runs and runs finished within the retention window.
  prdchat::v1::RunInfo GetRun(const prdchat::services::v1::GetRunRequest& req);

  // One poll of a StreamRun call: the run's events after after_seq.
  pipeline::RunEvents ReadRunEvents(const std::string& run_id, std::int64_t after_seq, std::chrono::milliseconds timeout);

  std::shared_ptr<broadcast::Subscription> SubscribeGroup(const prdchat::services::v1::SubscribeGroupRequest& req);
  void                                     Unsubscribe(const std::shared_ptr<broadcast::Subscription>& subscription);

  prdchat::services::v1::ListMessagesResponse ListMessages(const prdchat::services::v1::ListMessagesRequest& req);

  prdchat::v1::CompressionState GetCompressionState(const prdchat::services::v1::GetCompressionStateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace prdchat::service
