#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "prdchat/services/v1/admin_service.grpc.pb.h"

namespace prdchat::grpc {

class AdminServer final : public prdchat::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<prdchat::service::AdminService> svc);

  ::grpc::Status UpsertDocument(::grpc::ServerContext*, const prdchat::services::v1::UpsertDocumentRequest*, google::protobuf::Empty*) override;

  ::grpc::Status UpsertSession(::grpc::ServerContext*, const prdchat::services::v1::UpsertSessionRequest*, google::protobuf::Empty*) override;

  ::grpc::Status DeleteGroupHistory(::grpc::ServerContext*, const prdchat::services::v1::DeleteGroupHistoryRequest*,
                                    google::protobuf::Empty*) override;

 private:
  std::shared_ptr<prdchat::service::AdminService> service_;
};

} // namespace prdchat::grpc
