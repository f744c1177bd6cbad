#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

namespace prdchat::db::sqlite {

using prdchat::db::ErrorCode;
using prdchat::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

// Reads must not silently return empty on a broken statement.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kMessageColumns =
    "id,session_id,group_id,role,assistant_role,sender_user_id,content,group_seq,run_id,reply_to_message_id,status,timestamp_ms,"
    "input_tokens,output_tokens";

std::string SelectMessages(const char* where_and_order) {
  return std::string("SELECT ") + kMessageColumns + " FROM messages " + where_and_order;
}

void BindMessage(sqlite3_stmt* st, const model::MessageRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.session_id);
  BindText(st, 3, r.group_id);
  BindI32(st, 4, static_cast<int>(r.role));
  BindI32(st, 5, static_cast<int>(r.assistant_role));
  BindText(st, 6, r.sender_user_id);
  BindText(st, 7, r.content);
  BindOptionalI64(st, 8, r.group_seq);
  BindText(st, 9, r.run_id);
  BindText(st, 10, r.reply_to_message_id);
  BindI32(st, 11, static_cast<int>(r.status));
  BindI64(st, 12, r.timestamp_ms);
  BindI64(st, 13, r.input_tokens);
  BindI64(st, 14, r.output_tokens);
}

model::MessageRecord ReadMessage(sqlite3_stmt* st) {
  model::MessageRecord r;
  r.id             = ColText(st, 0);
  r.session_id     = ColText(st, 1);
  r.group_id       = ColText(st, 2);
  r.role           = static_cast<prdchat::v1::MessageRole>(ColI32(st, 3));
  r.assistant_role = static_cast<prdchat::v1::AssistantRole>(ColI32(st, 4));
  r.sender_user_id = ColText(st, 5);
  r.content        = ColText(st, 6);
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) {
    r.group_seq = ColI64(st, 7);
  }
  r.run_id              = ColText(st, 8);
  r.reply_to_message_id = ColText(st, 9);
  r.status              = static_cast<prdchat::v1::MessageStatus>(ColI32(st, 10));
  r.timestamp_ms        = ColI64(st, 11);
  r.input_tokens        = static_cast<std::uint32_t>(ColI64(st, 12));
  r.output_tokens       = static_cast<std::uint32_t>(ColI64(st, 13));
  return r;
}

std::vector<model::MessageRecord> CollectMessages(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::MessageRecord> out;
  int                               rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadMessage(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS documents (id TEXT PRIMARY KEY, title TEXT NOT NULL, raw_content TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sessions (id TEXT PRIMARY KEY, group_id TEXT NOT NULL, document_id TEXT NOT NULL, owner_user_id TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS messages (id TEXT PRIMARY KEY, session_id TEXT NOT NULL, group_id TEXT NOT NULL, role INTEGER NOT NULL, "
      "assistant_role INTEGER NOT NULL, sender_user_id TEXT NOT NULL, content TEXT NOT NULL, group_seq INTEGER, run_id TEXT NOT NULL, "
      "reply_to_message_id TEXT NOT NULL, status INTEGER NOT NULL, timestamp_ms INTEGER NOT NULL, input_tokens INTEGER NOT NULL, "
      "output_tokens INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS messages_group_seq ON messages(group_id, group_seq) WHERE group_seq IS NOT NULL;",
      "CREATE INDEX IF NOT EXISTS messages_session_time ON messages(session_id, timestamp_ms);",
      "CREATE TABLE IF NOT EXISTS group_seq_counters (group_id TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS group_compression_state (group_id TEXT PRIMARY KEY, from_seq INTEGER NOT NULL, to_seq INTEGER NOT NULL, "
      "compressed_text TEXT NOT NULL, original_chars INTEGER NOT NULL, compressed_chars INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);"};

  std::lock_guard<std::mutex> lock(db.WriterMutex());
  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessages(Transaction& t, const std::vector<model::MessageRecord>& records) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO messages(") + kMessageColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  auto              st  = Prepare(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  // Checked up front: the group_seq index can fire before the primary key.
  for (const auto& r : records) {
    if (GetMessage(t, r.id)) return Result::Err(ErrorCode::AlreadyExists, "message " + r.id);
  }

  for (const auto& r : records) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindMessage(st.get(), r);
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
      if ((rc & 0xFF) == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, "message " + r.id);
      }
      return Translate(db, rc);
    }
  }
  return Result::Ok();
}

Result SqliteRepository::ReplaceMessage(Transaction& t, const model::MessageRecord& r) {
  auto* db = TX(t).Handle();

  auto existing = GetMessage(t, r.id);
  if (existing && existing->group_seq && r.group_seq && *existing->group_seq != *r.group_seq) {
    return Result::Err(ErrorCode::Conflict, "group_seq is immutable once assigned");
  }

  const std::string sql = std::string("INSERT INTO messages(") + kMessageColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                          "ON CONFLICT(id) DO UPDATE SET session_id=excluded.session_id, group_id=excluded.group_id, role=excluded.role, "
                          "assistant_role=excluded.assistant_role, sender_user_id=excluded.sender_user_id, content=excluded.content, "
                          "group_seq=COALESCE(messages.group_seq, excluded.group_seq), run_id=excluded.run_id, "
                          "reply_to_message_id=excluded.reply_to_message_id, status=excluded.status, timestamp_ms=excluded.timestamp_ms, "
                          "input_tokens=excluded.input_tokens, output_tokens=excluded.output_tokens;";
  auto st = Prepare(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindMessage(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MessageRecord> SqliteRepository::GetMessage(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const auto sql = SelectMessages("WHERE id=?;");
  auto       st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, id);

  auto rows = CollectMessages(db, st.get());
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::MessageRecord> SqliteRepository::ListGroupMessagesAfter(Transaction& t, const std::string& group_id, std::int64_t after_seq,
                                                                           std::optional<std::size_t> limit) {
  auto* db = TX(t).Handle();

  const auto sql = SelectMessages("WHERE group_id=? AND group_seq IS NOT NULL AND group_seq>? ORDER BY group_seq ASC LIMIT ?;");
  auto       st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, group_id);
  BindI64(st.get(), 2, after_seq);
  BindI64(st.get(), 3, limit ? static_cast<std::int64_t>(*limit) : -1); // -1: no limit

  return CollectMessages(db, st.get());
}

std::vector<model::MessageRecord> SqliteRepository::ListGroupMessagesBefore(Transaction& t, const std::string& group_id,
                                                                            std::optional<std::int64_t> before_seq, std::size_t limit) {
  auto* db = TX(t).Handle();

  const auto sql = SelectMessages("WHERE group_id=? AND group_seq IS NOT NULL AND group_seq<? ORDER BY group_seq DESC LIMIT ?;");
  auto       st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, group_id);
  BindI64(st.get(), 2, before_seq.value_or(std::numeric_limits<std::int64_t>::max()));
  BindI64(st.get(), 3, static_cast<std::int64_t>(limit));

  auto rows = CollectMessages(db, st.get());
  std::reverse(rows.begin(), rows.end());
  return rows;
}

std::vector<model::MessageRecord> SqliteRepository::ListSessionMessages(Transaction& t, const std::string& session_id, std::size_t limit) {
  auto* db = TX(t).Handle();

  const auto sql = SelectMessages("WHERE session_id=? ORDER BY timestamp_ms DESC, rowid DESC LIMIT ?;");
  auto       st  = PrepareOrThrow(db, sql.c_str());
  BindText(st.get(), 1, session_id);
  BindI64(st.get(), 2, static_cast<std::int64_t>(limit));

  auto rows = CollectMessages(db, st.get());
  std::reverse(rows.begin(), rows.end());
  return rows;
}

Result SqliteRepository::DeleteGroupHistory(Transaction& t, const std::string& group_id) {
  auto* db = TX(t).Handle();

  for (const char* sql : {"DELETE FROM messages WHERE group_id=?;", "DELETE FROM group_compression_state WHERE group_id=?;"}) {
    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, group_id);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Group sequence counters
// ------------------------------------------------------------------

Result SqliteRepository::NextGroupSeq(Transaction& t, const std::string& group_id, std::int64_t& value) {
  if (group_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "group id is empty");
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO group_seq_counters(group_id,value) VALUES(?,1) "
      "ON CONFLICT(group_id) DO UPDATE SET value=value+1 RETURNING value;";
  auto st = Prepare(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, group_id);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  value = ColI64(st.get(), 0);

  // Drain so the statement completes before finalize.
  const int done = sqlite3_step(st.get());
  if (done != SQLITE_DONE) return Translate(db, done);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Compression checkpoints
// ------------------------------------------------------------------

std::optional<model::CompressionStateRecord> SqliteRepository::GetCompressionState(Transaction& t, const std::string& group_id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db,
                           "SELECT group_id,from_seq,to_seq,compressed_text,original_chars,compressed_chars,created_at_ms "
                           "FROM group_compression_state WHERE group_id=?;");
  BindText(st.get(), 1, group_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

  model::CompressionStateRecord r;
  r.group_id         = ColText(st.get(), 0);
  r.from_seq         = ColI64(st.get(), 1);
  r.to_seq           = ColI64(st.get(), 2);
  r.compressed_text  = ColText(st.get(), 3);
  r.original_chars   = ColI64(st.get(), 4);
  r.compressed_chars = ColI64(st.get(), 5);
  r.created_at_ms    = ColI64(st.get(), 6);
  return r;
}

Result SqliteRepository::PutCompressionState(Transaction& t, const model::CompressionStateRecord& r) {
  auto* db = TX(t).Handle();

  auto current = GetCompressionState(t, r.group_id);
  if (current && r.to_seq <= current->to_seq) {
    return Result::Err(ErrorCode::Conflict, "checkpoint does not advance to_seq");
  }

  auto st = Prepare(db,
                    "INSERT OR REPLACE INTO group_compression_state"
                    "(group_id,from_seq,to_seq,compressed_text,original_chars,compressed_chars,created_at_ms) VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.group_id);
  BindI64(st.get(), 2, r.from_seq);
  BindI64(st.get(), 3, r.to_seq);
  BindText(st.get(), 4, r.compressed_text);
  BindI64(st.get(), 5, r.original_chars);
  BindI64(st.get(), 6, r.compressed_chars);
  BindI64(st.get(), 7, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Sessions and documents
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT OR REPLACE INTO sessions(id,group_id,document_id,owner_user_id,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.group_id);
  BindText(st.get(), 3, r.document_id);
  BindText(st.get(), 4, r.owner_user_id);
  BindI64(st.get(), 5, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT id,group_id,document_id,owner_user_id,created_at_ms FROM sessions WHERE id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

  model::SessionRecord r;
  r.id            = ColText(st.get(), 0);
  r.group_id      = ColText(st.get(), 1);
  r.document_id   = ColText(st.get(), 2);
  r.owner_user_id = ColText(st.get(), 3);
  r.created_at_ms = ColI64(st.get(), 4);
  return r;
}

Result SqliteRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT OR REPLACE INTO documents(id,title,raw_content,created_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.title);
  BindText(st.get(), 3, r.raw_content);
  BindI64(st.get(), 4, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocument(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrThrow(db, "SELECT id,title,raw_content,created_at_ms FROM documents WHERE id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

  model::DocumentRecord r;
  r.id            = ColText(st.get(), 0);
  r.title         = ColText(st.get(), 1);
  r.raw_content   = ColText(st.get(), 2);
  r.created_at_ms = ColI64(st.get(), 3);
  return r;
}

} // namespace prdchat::db::sqlite
