#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/chat_service.hpp"
#include "prdchat/services/v1/chat_service.grpc.pb.h"
#include "prdchat/v1.hpp"

namespace prdchat::grpc {

class ChatServer final : public prdchat::services::v1::ChatService::Service {
 public:
  explicit ChatServer(std::shared_ptr<prdchat::service::ChatService> svc);

  ::grpc::Status SendMessage(::grpc::ServerContext*, const prdchat::services::v1::SendMessageRequest*,
                             ::grpc::ServerWriter<prdchat::v1::ChatStreamEvent>*) override;

  ::grpc::Status CancelRun(::grpc::ServerContext*, const prdchat::services::v1::CancelRunRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetRun(::grpc::ServerContext*, const prdchat::services::v1::GetRunRequest*, prdchat::v1::RunInfo*) override;

  ::grpc::Status StreamRun(::grpc::ServerContext*, const prdchat::services::v1::StreamRunRequest*,
                           ::grpc::ServerWriter<prdchat::v1::ChatStreamEvent>*) override;

  ::grpc::Status SubscribeGroup(::grpc::ServerContext*, const prdchat::services::v1::SubscribeGroupRequest*,
                                ::grpc::ServerWriter<prdchat::v1::GroupStreamEvent>*) override;

  ::grpc::Status ListMessages(::grpc::ServerContext*, const prdchat::services::v1::ListMessagesRequest*,
                              prdchat::services::v1::ListMessagesResponse*) override;

  ::grpc::Status GetCompressionState(::grpc::ServerContext*, const prdchat::services::v1::GetCompressionStateRequest*,
                                     prdchat::v1::CompressionState*) override;

 private:
  std::shared_ptr<prdchat::service::ChatService> service_;
};

} // namespace prdchat::grpc
