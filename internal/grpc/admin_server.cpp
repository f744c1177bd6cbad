#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace prdchat::grpc {

AdminServer::AdminServer(std::shared_ptr<prdchat::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::UpsertDocument(::grpc::ServerContext*, const prdchat::services::v1::UpsertDocumentRequest* req,
                                           google::protobuf::Empty*) {
  try {
    service_->UpsertDocument(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::UpsertSession(::grpc::ServerContext*, const prdchat::services::v1::UpsertSessionRequest* req,
                                          google::protobuf::Empty*) {
  try {
    service_->UpsertSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::DeleteGroupHistory(::grpc::ServerContext*, const prdchat::services::v1::DeleteGroupHistoryRequest* req,
                                               google::protobuf::Empty*) {
  try {
    service_->DeleteGroupHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace prdchat::grpc
