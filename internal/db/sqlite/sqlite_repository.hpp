#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace prdchat::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates tables and indexes if missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMessages(Transaction&, const std::vector<model::MessageRecord>&) override;
  Result ReplaceMessage(Transaction&, const model::MessageRecord&) override;
  std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string& id) override;
  std::vector<model::MessageRecord> ListGroupMessagesAfter(Transaction&, const std::string& group_id, std::int64_t after_seq,
                                                           std::optional<std::size_t> limit) override;
  std::vector<model::MessageRecord> ListGroupMessagesBefore(Transaction&, const std::string& group_id,
                                                            std::optional<std::int64_t> before_seq, std::size_t limit) override;
  std::vector<model::MessageRecord> ListSessionMessages(Transaction&, const std::string& session_id, std::size_t limit) override;
  Result DeleteGroupHistory(Transaction&, const std::string& group_id) override;

  Result NextGroupSeq(Transaction&, const std::string& group_id, std::int64_t& value) override;

  std::optional<model::CompressionStateRecord> GetCompressionState(Transaction&, const std::string& group_id) override;
  Result PutCompressionState(Transaction&, const model::CompressionStateRecord&) override;

  Result UpsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) override;
  Result UpsertDocument(Transaction&, const model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& id) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace prdchat::db::sqlite
