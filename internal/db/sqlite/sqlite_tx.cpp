#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace prdchat::db::sqlite {

namespace {

bool IsBusy(int rc) {
  return (rc & 0xFF) == SQLITE_BUSY || (rc & 0xFF) == SQLITE_LOCKED;
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->WriterMutex()) {
  std::string error;
  const int   rc = db_->TryExec("BEGIN IMMEDIATE;", &error);
  if (IsBusy(rc)) {
    throw util::TransactionConflict("sqlite begin: " + error);
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite begin: " + error);
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  std::string error;
  if (db_->TryExec("ROLLBACK;", &error) != SQLITE_OK) {
    PRDCHAT_LOG_WARN("sqlite rollback failed", {observability::StringField("error", error)});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::InvalidStage("sqlite transaction already finished");
  }
  std::string error;
  const int   rc = db_->TryExec("COMMIT;", &error);
  if (rc != SQLITE_OK) {
    std::string rollback_error;
    if (db_->TryExec("ROLLBACK;", &rollback_error) != SQLITE_OK) {
      PRDCHAT_LOG_WARN("sqlite rollback after failed commit", {observability::StringField("error", rollback_error)});
    }
    finished_ = true;
    if (IsBusy(rc)) {
      throw util::TransactionConflict("sqlite commit: " + error);
    }
    throw std::runtime_error("sqlite commit: " + error);
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace prdchat::db::sqlite
