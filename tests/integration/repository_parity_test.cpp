#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using prdchat::db::ErrorCode;
using prdchat::db::Repository;
using prdchat::db::memory::MemoryRepository;
using prdchat::db::model::CompressionStateRecord;
using prdchat::db::model::DocumentRecord;
using prdchat::db::model::MessageRecord;
using prdchat::db::model::SessionRecord;

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

MessageRecord GroupMessage(const std::string& id, const std::string& group, std::int64_t seq, std::int64_t ts) {
  MessageRecord m;
  m.id             = id;
  m.session_id     = group + "-session";
  m.group_id       = group;
  m.group_seq      = seq;
  m.role           = prdchat::v1::MESSAGE_ROLE_USER;
  m.sender_user_id = "alice";
  m.content        = "message " + std::to_string(seq);
  m.status         = prdchat::v1::MESSAGE_STATUS_DONE;
  m.timestamp_ms   = ts;
  return m;
}

void VerifyMessageLifecycle(Repository& repo, const std::string& group) {
  auto tx = repo.Begin();

  auto user = GroupMessage(group + "-u1", group, 1, 100);
  assert(repo.InsertMessages(*tx, {user}));

  auto placeholder           = GroupMessage(group + "-a1", group, 2, 101);
  placeholder.role           = prdchat::v1::MESSAGE_ROLE_ASSISTANT;
  placeholder.assistant_role = prdchat::v1::ASSISTANT_ROLE_QA;
  placeholder.content        = "";
  placeholder.status         = prdchat::v1::MESSAGE_STATUS_STREAMING;
  placeholder.run_id         = "run-" + group;
  assert(repo.InsertMessages(*tx, {placeholder}));

  auto duplicate = repo.InsertMessages(*tx, {user});
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto same_seq = GroupMessage(group + "-u2", group, 1, 102);
  auto taken    = repo.InsertMessages(*tx, {same_seq});
  assert(!taken);
  assert(taken.code == ErrorCode::ConstraintViolation);

  auto final_answer          = placeholder;
  final_answer.group_seq     = std::nullopt;
  final_answer.content       = "Final answer";
  final_answer.status        = prdchat::v1::MESSAGE_STATUS_DONE;
  final_answer.input_tokens  = 12;
  final_answer.output_tokens = 3;
  assert(repo.ReplaceMessage(*tx, final_answer));

  auto stored = repo.GetMessage(*tx, placeholder.id);
  assert(stored.has_value());
  assert(stored->group_seq == 2);
  assert(stored->content == "Final answer");
  assert(stored->status == prdchat::v1::MESSAGE_STATUS_DONE);
  assert(stored->assistant_role == prdchat::v1::ASSISTANT_ROLE_QA);
  assert(stored->run_id == "run-" + group);
  assert(stored->output_tokens == 3);

  auto moved      = final_answer;
  moved.group_seq = 7;
  auto conflict   = repo.ReplaceMessage(*tx, moved);
  assert(!conflict);
  assert(conflict.code == ErrorCode::Conflict);

  assert(!repo.GetMessage(*tx, group + "-missing").has_value());
  tx->Commit();
}

void VerifyGroupListings(Repository& repo, const std::string& group) {
  {
    auto                       tx = repo.Begin();
    std::vector<MessageRecord> batch;
    // Inserted out of order; listings follow group_seq.
    for (std::int64_t seq : {3, 1, 5, 2, 4, 6}) {
      batch.push_back(GroupMessage(group + "-" + std::to_string(seq), group, seq, 1000 - seq));
    }
    assert(repo.InsertMessages(*tx, batch));
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto after = repo.ListGroupMessagesAfter(*tx, group, 2, std::nullopt);
  assert(after.size() == 4);
  assert(after.front().group_seq == 3 && after.back().group_seq == 6);

  auto limited = repo.ListGroupMessagesAfter(*tx, group, 0, 2);
  assert(limited.size() == 2);
  assert(limited[0].group_seq == 1 && limited[1].group_seq == 2);

  auto latest = repo.ListGroupMessagesBefore(*tx, group, std::nullopt, 3);
  assert(latest.size() == 3);
  assert(latest[0].group_seq == 4 && latest[2].group_seq == 6);

  auto page = repo.ListGroupMessagesBefore(*tx, group, 4, 2);
  assert(page.size() == 2);
  assert(page[0].group_seq == 2 && page[1].group_seq == 3);

  assert(repo.ListGroupMessagesAfter(*tx, group + "-other", 0, std::nullopt).empty());
  tx->Commit();
}

void VerifySessionListing(Repository& repo, const std::string& session) {
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 5; ++i) {
      MessageRecord m;
      m.id           = session + "-" + std::to_string(i);
      m.session_id   = session;
      m.role         = i % 2 ? prdchat::v1::MESSAGE_ROLE_ASSISTANT : prdchat::v1::MESSAGE_ROLE_USER;
      m.content      = "turn " + std::to_string(i);
      m.status       = prdchat::v1::MESSAGE_STATUS_DONE;
      m.timestamp_ms = 500 + i / 2; // pairs share a timestamp
      assert(repo.InsertMessages(*tx, {m}));
    }
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto history = repo.ListSessionMessages(*tx, session, 3);
  assert(history.size() == 3);
  assert(history[0].id == session + "-2");
  assert(history[1].id == session + "-3");
  assert(history[2].id == session + "-4");
  for (const auto& m : history) {
    assert(!m.group_seq.has_value());
  }
  tx->Commit();
}

void VerifySequencesAndDeletion(Repository& repo, const std::string& group) {
  {
    auto         tx    = repo.Begin();
    std::int64_t value = 0;
    for (std::int64_t expected = 1; expected <= 3; ++expected) {
      assert(repo.NextGroupSeq(*tx, group, value));
      assert(value == expected);
    }
    assert(repo.InsertMessages(*tx, {GroupMessage(group + "-m", group, 3, 1)}));

    CompressionStateRecord state;
    state.group_id        = group;
    state.from_seq        = 1;
    state.to_seq          = 2;
    state.compressed_text = "summary";
    assert(repo.PutCompressionState(*tx, state));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteGroupHistory(*tx, group));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.ListGroupMessagesAfter(*tx, group, 0, std::nullopt).empty());
  assert(!repo.GetCompressionState(*tx, group).has_value());

  std::int64_t value = 0;
  assert(repo.NextGroupSeq(*tx, group, value));
  assert(value == 4);
  tx->Commit();
}

void VerifyCheckpointForwardOnly(Repository& repo, const std::string& group) {
  auto tx = repo.Begin();
  assert(!repo.GetCompressionState(*tx, group).has_value());

  CompressionStateRecord state;
  state.group_id         = group;
  state.from_seq         = 1;
  state.to_seq           = 10;
  state.compressed_text  = "first ten";
  state.original_chars   = 5000;
  state.compressed_chars = 9;
  state.created_at_ms    = 42;
  assert(repo.PutCompressionState(*tx, state));

  auto stale   = state;
  stale.to_seq = 10;
  auto result  = repo.PutCompressionState(*tx, stale);
  assert(!result);
  assert(result.code == ErrorCode::Conflict);

  auto newer            = state;
  newer.to_seq          = 20;
  newer.compressed_text = "first twenty";
  assert(repo.PutCompressionState(*tx, newer));

  auto stored = repo.GetCompressionState(*tx, group);
  assert(stored.has_value());
  assert(stored->from_seq == 1);
  assert(stored->to_seq == 20);
  assert(stored->compressed_text == "first twenty");
  assert(stored->original_chars == 5000);
  tx->Commit();
}

void VerifySessionsAndDocuments(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  DocumentRecord doc;
  doc.id            = prefix + "-doc";
  doc.title         = "Checkout PRD";
  doc.raw_content   = "# Overview\n\n支付系统 handles payments.\n";
  doc.created_at_ms = 7;
  assert(repo.UpsertDocument(*tx, doc));

  doc.title = "Checkout PRD v2";
  assert(repo.UpsertDocument(*tx, doc));

  auto loaded = repo.GetDocument(*tx, doc.id);
  assert(loaded.has_value());
  assert(loaded->title == "Checkout PRD v2");
  assert(loaded->raw_content == doc.raw_content);

  SessionRecord group_session;
  group_session.id            = prefix + "-group";
  group_session.group_id      = prefix + "-g";
  group_session.document_id   = doc.id;
  group_session.owner_user_id = "alice";
  assert(repo.UpsertSession(*tx, group_session));

  SessionRecord direct;
  direct.id          = prefix + "-direct";
  direct.document_id = doc.id;
  assert(repo.UpsertSession(*tx, direct));

  auto g = repo.GetSession(*tx, group_session.id);
  assert(g && g->IsGroup() && g->group_id == prefix + "-g" && g->owner_user_id == "alice");
  auto d = repo.GetSession(*tx, direct.id);
  assert(d && !d->IsGroup());

  assert(!repo.GetSession(*tx, prefix + "-none").has_value());
  assert(!repo.GetDocument(*tx, prefix + "-none").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& group) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertMessages(*tx, {GroupMessage(group + "-1", group, 1, 1)}));
    std::int64_t value = 0;
    assert(repo.NextGroupSeq(*tx, group, value));
    tx->Rollback();
    assert(!tx->IsCommitted());
  }

  auto tx = repo.Begin();
  assert(!repo.GetMessage(*tx, group + "-1").has_value());
  std::int64_t value = 0;
  assert(repo.NextGroupSeq(*tx, group, value));
  assert(value == 1);
  tx->Commit();
  assert(tx->IsCommitted());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& group) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertMessages(*tx, {GroupMessage(group + "-1", group, 1, NowMs())}));
    std::int64_t value = 0;
    assert(repo->NextGroupSeq(*tx, group, value));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto message = repo->GetMessage(*tx, group + "-1");
  assert(message.has_value());
  assert(message->group_seq == 1);

  std::int64_t value = 0;
  assert(repo->NextGroupSeq(*tx, group, value));
  assert(value == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("prdchat_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<prdchat::db::sqlite::SqliteDB>(db_path);
    prdchat::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<prdchat::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyMessageLifecycle(*repo, backend.name + "-life");
    VerifyGroupListings(*repo, backend.name + "-listing");
    VerifySessionListing(*repo, backend.name + "-direct");
    VerifySequencesAndDeletion(*repo, backend.name + "-delete");
    VerifyCheckpointForwardOnly(*repo, backend.name + "-checkpoint");
    VerifySessionsAndDocuments(*repo, backend.name + "-seed");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "prdchat_integration_repository_parity: pass\n";
  return 0;
}
