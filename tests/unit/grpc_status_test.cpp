#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/broadcast/group_broadcast_hub.hpp"
#include "internal/cache/document_store.hpp"
#include "internal/compression/checkpoint_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/chat_server.hpp"
#include "internal/pipeline/run_control.hpp"
#include "internal/pipeline/run_journal.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/chat_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

prdchat::service::ServiceContext BuildServiceContext() {
  prdchat::service::ServiceContext ctx;
  auto repository = std::make_shared<prdchat::db::memory::MemoryRepository>();
  ctx.repository  = repository;
  ctx.runs        = std::make_shared<prdchat::pipeline::RunRegistry>();
  ctx.journal     = std::make_shared<prdchat::pipeline::RunJournal>(std::chrono::minutes(1));
  ctx.hub         = std::make_shared<prdchat::broadcast::GroupBroadcastHub>(16, repository);
  ctx.checkpoints = std::make_shared<prdchat::compression::CheckpointStore>(repository, std::chrono::minutes(1));
  ctx.documents   = std::make_shared<prdchat::cache::DocumentStore>(repository, std::chrono::minutes(1));
  return ctx;
}

void TestCancelUnknownRunReturnsNotFound() {
  prdchat::grpc::ChatServer server(std::make_shared<prdchat::service::ChatService>(BuildServiceContext()));

  prdchat::services::v1::CancelRunRequest req;
  google::protobuf::Empty                 resp;
  ::grpc::ServerContext                   grpc_ctx;

  req.set_run_id("run-that-never-started");
  assert(server.CancelRun(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.clear_run_id();
  assert(server.CancelRun(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestGetRunStatuses() {
  auto ctx = BuildServiceContext();
  prdchat::grpc::ChatServer server(std::make_shared<prdchat::service::ChatService>(ctx));

  prdchat::services::v1::GetRunRequest req;
  prdchat::v1::RunInfo                 resp;
  ::grpc::ServerContext                grpc_ctx;

  assert(server.GetRun(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_run_id("run-1");
  assert(server.GetRun(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  ctx.journal->Begin("run-1", "s-1");
  prdchat::v1::ChatStreamEvent start;
  start.set_type(prdchat::v1::CHAT_EVENT_TYPE_START);
  start.set_seq(1);
  start.set_user_message_id("question-1");
  ctx.journal->Append("run-1", start);
  ctx.journal->Finish("run-1", prdchat::v1::RUN_STATUS_DONE, "");

  assert(server.GetRun(&grpc_ctx, &req, &resp).ok());
  assert(resp.status() == prdchat::v1::RUN_STATUS_DONE);
  assert(resp.user_message_id() == "question-1");
  assert(resp.last_seq() == 1);

  prdchat::service::ChatService service(ctx);
  const auto                    replay = service.ReadRunEvents("run-1", 0, std::chrono::milliseconds(0));
  assert(replay.finished && replay.events.size() == 1);

  bool missing = false;
  try {
    (void)service.ReadRunEvents("run-unknown", 0, std::chrono::milliseconds(0));
  } catch (const prdchat::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestListMessagesStatuses() {
  auto ctx = BuildServiceContext();
  prdchat::grpc::AdminServer admin(std::make_shared<prdchat::service::AdminService>(ctx));
  prdchat::grpc::ChatServer  chat(std::make_shared<prdchat::service::ChatService>(ctx));

  prdchat::services::v1::ListMessagesRequest  req;
  prdchat::services::v1::ListMessagesResponse resp;
  ::grpc::ServerContext                       grpc_ctx;

  assert(chat.ListMessages(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_session_id("missing-session");
  assert(chat.ListMessages(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  prdchat::services::v1::UpsertDocumentRequest doc;
  doc.set_document_id("doc-1");
  doc.set_title("Checkout");
  doc.set_raw_content("# Overview\n");
  google::protobuf::Empty empty;
  assert(admin.UpsertDocument(&grpc_ctx, &doc, &empty).ok());

  prdchat::services::v1::UpsertSessionRequest session;
  session.set_session_id("s-1");
  session.set_document_id("doc-1");
  assert(admin.UpsertSession(&grpc_ctx, &session, &empty).ok());

  req.set_session_id("s-1");
  assert(chat.ListMessages(&grpc_ctx, &req, &resp).ok());
  assert(resp.messages_size() == 0);
}

void TestAdminValidation() {
  prdchat::grpc::AdminServer server(std::make_shared<prdchat::service::AdminService>(BuildServiceContext()));
  google::protobuf::Empty    resp;
  ::grpc::ServerContext      grpc_ctx;

  prdchat::services::v1::UpsertSessionRequest session;
  session.set_session_id("s-1");
  session.set_group_id("g-1");
  session.set_document_id("missing-doc");
  assert(server.UpsertSession(&grpc_ctx, &session, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  prdchat::services::v1::UpsertDocumentRequest doc;
  assert(server.UpsertDocument(&grpc_ctx, &doc, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  prdchat::services::v1::DeleteGroupHistoryRequest del;
  assert(server.DeleteGroupHistory(&grpc_ctx, &del, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  del.set_group_id("g-1");
  assert(server.DeleteGroupHistory(&grpc_ctx, &del, &resp).ok());
}

void TestMissingCheckpointReturnsNotFound() {
  prdchat::grpc::ChatServer server(std::make_shared<prdchat::service::ChatService>(BuildServiceContext()));

  prdchat::services::v1::GetCompressionStateRequest req;
  prdchat::v1::CompressionState                     resp;
  ::grpc::ServerContext                             grpc_ctx;

  req.set_group_id("g-without-history");
  assert(server.GetCompressionState(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestCancelUnknownRunReturnsNotFound();
  TestGetRunStatuses();
  TestListMessagesStatuses();
  TestAdminValidation();
  TestMissingCheckpointReturnsNotFound();

  std::cout << "prdchat_unit_grpc_status: pass\n";
  return 0;
}
