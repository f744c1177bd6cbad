#include "admin_service.hpp"

#include "internal/cache/document_store.hpp"
#include "internal/compression/checkpoint_store.hpp"
#include "internal/db/api/tx_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace prdchat::service {

using namespace prdchat::services::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AdminService::UpsertDocument(const UpsertDocumentRequest& req) {
  ObserveRpc("AdminService.UpsertDocument", "document_id", req.document_id(), [&] {
    if (req.document_id().empty()) {
      throw util::InvalidArgument("document_id is required");
    }

    db::model::DocumentRecord document;
    document.id            = req.document_id();
    document.title         = req.title();
    document.raw_content   = req.raw_content();
    document.created_at_ms = util::NowMillis();
    ctx_.documents->Put(document);
  });
}

void AdminService::UpsertSession(const UpsertSessionRequest& req) {
  ObserveRpc("AdminService.UpsertSession", "session_id", req.session_id(), [&] {
    if (req.session_id().empty() || req.document_id().empty()) {
      throw util::InvalidArgument("session_id and document_id are required");
    }
    if (!ctx_.documents->Get(req.document_id())) {
      throw util::DocumentNotFound("document not found: " + req.document_id());
    }

    db::model::SessionRecord session;
    session.id            = req.session_id();
    session.group_id      = req.group_id();
    session.document_id   = req.document_id();
    session.owner_user_id = req.owner_user_id();
    session.created_at_ms = util::NowMillis();

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      db::ThrowIfDbError(ctx_.repository->UpsertSession(tx, session), "upsert session " + session.id);
    });
  });
}

void AdminService::DeleteGroupHistory(const DeleteGroupHistoryRequest& req) {
  ObserveRpc("AdminService.DeleteGroupHistory", "group_id", req.group_id(), [&] {
    if (req.group_id().empty()) {
      throw util::InvalidArgument("group_id is required");
    }

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      db::ThrowIfDbError(ctx_.repository->DeleteGroupHistory(tx, req.group_id()), "delete history of group " + req.group_id());
    });
    ctx_.checkpoints->Invalidate(req.group_id());
    PRDCHAT_LOG_INFO("Group history deleted", {observability::StringField("group_id", req.group_id())});
  });
}

} // namespace prdchat::service
