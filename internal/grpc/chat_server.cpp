#include "chat_server.hpp"

#include <chrono>
#include <cstdint>

#include "grpc_error.hpp"

namespace prdchat::grpc {

namespace {

constexpr std::chrono::milliseconds kSubscribePollInterval{500};

} // namespace

ChatServer::ChatServer(std::shared_ptr<prdchat::service::ChatService> svc) : service_(std::move(svc)) {
}

::grpc::Status ChatServer::SendMessage(::grpc::ServerContext* ctx, const prdchat::services::v1::SendMessageRequest* req,
                                       ::grpc::ServerWriter<prdchat::v1::ChatStreamEvent>* writer) {
  try {
    // A failed write or a cancelled call stops the turn.
    service_->SendMessage(*req, [ctx, writer](const prdchat::v1::ChatStreamEvent& event) {
      if (ctx->IsCancelled()) {
        return false;
      }
      return writer->Write(event);
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChatServer::CancelRun(::grpc::ServerContext*, const prdchat::services::v1::CancelRunRequest* req, google::protobuf::Empty*) {
  try {
    service_->CancelRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChatServer::GetRun(::grpc::ServerContext*, const prdchat::services::v1::GetRunRequest* req, prdchat::v1::RunInfo* resp) {
  try {
    *resp = service_->GetRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChatServer::StreamRun(::grpc::ServerContext* ctx, const prdchat::services::v1::StreamRunRequest* req,
                                     ::grpc::ServerWriter<prdchat::v1::ChatStreamEvent>* writer) {
  std::int64_t after_seq = req->after_seq();
  while (!ctx->IsCancelled()) {
    prdchat::pipeline::RunEvents batch;
    try {
      batch = service_->ReadRunEvents(req->run_id(), after_seq, kSubscribePollInterval);
    } catch (const std::exception& e) {
      return ToStatus(e);
    }

    for (const auto& event : batch.events) {
      if (!writer->Write(event)) {
        return ::grpc::Status::OK;
      }
      after_seq = event.seq();
    }
    if (batch.finished) {
      break;
    }
  }
  return ::grpc::Status::OK;
}

::grpc::Status ChatServer::SubscribeGroup(::grpc::ServerContext* ctx, const prdchat::services::v1::SubscribeGroupRequest* req,
                                          ::grpc::ServerWriter<prdchat::v1::GroupStreamEvent>* writer) {
  std::shared_ptr<prdchat::broadcast::Subscription> subscription;
  try {
    subscription = service_->SubscribeGroup(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!ctx->IsCancelled() && !subscription->Closed()) {
    auto event = subscription->Next(kSubscribePollInterval);
    if (!event) {
      continue;
    }
    if (!writer->Write(*event)) {
      break;
    }
  }

  service_->Unsubscribe(subscription);
  return ::grpc::Status::OK;
}

::grpc::Status ChatServer::ListMessages(::grpc::ServerContext*, const prdchat::services::v1::ListMessagesRequest* req,
                                        prdchat::services::v1::ListMessagesResponse* resp) {
  try {
    *resp = service_->ListMessages(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChatServer::GetCompressionState(::grpc::ServerContext*, const prdchat::services::v1::GetCompressionStateRequest* req,
                                               prdchat::v1::CompressionState* resp) {
  try {
    *resp = service_->GetCompressionState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace prdchat::grpc
