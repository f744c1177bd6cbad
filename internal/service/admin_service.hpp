#pragma once

#include "prdchat/services/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace prdchat::service {

/*
  Seeds the collaborators the chat core reads: documents and sessions.
  Also tears down a group's history.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  void UpsertDocument(const prdchat::services::v1::UpsertDocumentRequest& req);
  void UpsertSession(const prdchat::services::v1::UpsertSessionRequest& req);
  void DeleteGroupHistory(const prdchat::services::v1::DeleteGroupHistoryRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace prdchat::service
