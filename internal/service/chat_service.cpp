#include "chat_service.hpp"

#include <algorithm>
#include <optional>

#include "internal/compression/checkpoint_store.hpp"
#include "internal/db/api/tx_runner.hpp"
#include "internal/model/proto_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/run_control.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace prdchat::service {

using namespace prdchat::services::v1;

ChatService::ChatService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

pipeline::TurnOutcome ChatService::SendMessage(const SendMessageRequest& req, const pipeline::EventSink& sink) {
  return ObserveRpc("ChatService.SendMessage", "session_id", req.session_id(), [&] {
    pipeline::TurnRequest turn;
    turn.session_id          = req.session_id();
    turn.user_id             = req.user_id();
    turn.content             = req.content();
    turn.role                = req.role() == prdchat::v1::ASSISTANT_ROLE_UNSPECIFIED ? prdchat::v1::ASSISTANT_ROLE_PM : req.role();
    turn.run_id              = req.run_id();
    turn.reply_to_message_id = req.reply_to_message_id();
    turn.skip_ai_reply       = req.skip_ai_reply();

    auto outcome = ctx_.pipeline->Run(turn, sink);
    PRDCHAT_LOG_DEBUG("SendMessage finished", {observability::StringField("run_id", outcome.run_id),
                                               observability::StringField("stage", model::TurnStageName(outcome.stage)),
                                               observability::StringField("error_code", outcome.error_code)});
    return outcome;
  });
}

void ChatService::CancelRun(const CancelRunRequest& req) {
  ObserveRpc("ChatService.CancelRun", "run_id", req.run_id(), [&] {
    if (req.run_id().empty()) {
      throw util::InvalidArgument("run_id is required");
    }
    if (!ctx_.runs->Cancel(req.run_id())) {
      throw util::NotFound("run not active: " + req.run_id());
    }
  });
}

prdchat::v1::RunInfo ChatService::GetRun(const GetRunRequest& req) {
  return ObserveRpc("ChatService.GetRun", "run_id", req.run_id(), [&] {
    if (req.run_id().empty()) {
      throw util::InvalidArgument("run_id is required");
    }
    auto info = ctx_.journal->Get(req.run_id());
    if (!info) {
      throw util::NotFound("run not found or expired: " + req.run_id());
    }
    return *info;
  });
}

pipeline::RunEvents ChatService::ReadRunEvents(const std::string& run_id, std::int64_t after_seq, std::chrono::milliseconds timeout) {
  if (run_id.empty()) {
    throw util::InvalidArgument("run_id is required");
  }
  auto events = ctx_.journal->Read(run_id, after_seq, timeout);
  if (!events) {
    throw util::NotFound("run not found or expired: " + run_id);
  }
  return std::move(*events);
}

std::shared_ptr<broadcast::Subscription> ChatService::SubscribeGroup(const SubscribeGroupRequest& req) {
  return ObserveRpc("ChatService.SubscribeGroup", "group_id", req.group_id(), [&] {
    std::optional<std::int64_t> after_seq;
    if (req.after_seq() > 0) {
      after_seq = req.after_seq();
    }
    return ctx_.hub->Subscribe(req.group_id(), after_seq);
  });
}

void ChatService::Unsubscribe(const std::shared_ptr<broadcast::Subscription>& subscription) {
  ctx_.hub->Unsubscribe(subscription);
}

ListMessagesResponse ChatService::ListMessages(const ListMessagesRequest& req) {
  return ObserveRpc("ChatService.ListMessages", "session_id", req.session_id(), [&] {
    const std::size_t limit = req.limit() == 0 ? kDefaultListLimit : std::min<std::size_t>(req.limit(), kMaxListLimit);

    std::string group_id = req.group_id();
    std::string session_id;
    if (group_id.empty()) {
      if (req.session_id().empty()) {
        throw util::InvalidArgument("either group_id or session_id is required");
      }
      auto session = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) { return ctx_.repository->GetSession(tx, req.session_id()); });
      if (!session) {
        throw util::SessionNotFound("session not found: " + req.session_id());
      }
      group_id   = session->group_id;
      session_id = session->id;
    }

    auto records = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      if (!group_id.empty()) {
        std::optional<std::int64_t> before;
        if (req.before_seq() > 0) before = req.before_seq();
        return ctx_.repository->ListGroupMessagesBefore(tx, group_id, before, limit);
      }
      return ctx_.repository->ListSessionMessages(tx, session_id, limit);
    });

    ListMessagesResponse resp;
    for (const auto& record : records) {
      *resp.add_messages() = model::ToProto(record);
    }
    return resp;
  });
}

prdchat::v1::CompressionState ChatService::GetCompressionState(const GetCompressionStateRequest& req) {
  return ObserveRpc("ChatService.GetCompressionState", "group_id", req.group_id(), [&] {
    if (req.group_id().empty()) {
      throw util::InvalidArgument("group_id is required");
    }
    auto state = ctx_.checkpoints->Get(req.group_id());
    if (!state) {
      throw util::NotFound("no compression checkpoint for group " + req.group_id());
    }
    return model::ToProto(*state);
  });
}

} // namespace prdchat::service
