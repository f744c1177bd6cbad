#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/compression_state_record.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/session_record.hpp"

namespace prdchat::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - NextGroupSeq is a single serialization point per group, shared by
    every process using the same store
  - Compression state only moves forward in to_seq

  The DB is the source of truth for:
    message order (group_seq, never insertion order)
    compression checkpoints
    sessions and documents
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Messages
  // ---------------------------------------------------------------------

  virtual Result InsertMessages(Transaction&, const std::vector<model::MessageRecord>&) = 0;

  // Idempotent upsert keyed by id; used for placeholder -> final.
  virtual Result ReplaceMessage(Transaction&, const model::MessageRecord&) = 0;

  virtual std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string& id) = 0;

  // group_seq > after_seq, ascending.
  virtual std::vector<model::MessageRecord> ListGroupMessagesAfter(Transaction&, const std::string& group_id, std::int64_t after_seq,
                                                                   std::optional<std::size_t> limit) = 0;

  // Latest `limit` messages with group_seq < before_seq (all when unset), ascending.
  virtual std::vector<model::MessageRecord> ListGroupMessagesBefore(Transaction&, const std::string& group_id,
                                                                    std::optional<std::int64_t> before_seq, std::size_t limit) = 0;

  // Latest `limit` messages of a session by timestamp, ascending.
  virtual std::vector<model::MessageRecord> ListSessionMessages(Transaction&, const std::string& session_id, std::size_t limit) = 0;

  // Removes messages and the checkpoint; the sequence counter is kept.
  virtual Result DeleteGroupHistory(Transaction&, const std::string& group_id) = 0;

  // ---------------------------------------------------------------------
  // Group sequence counters
  // ---------------------------------------------------------------------

  virtual Result NextGroupSeq(Transaction&, const std::string& group_id, std::int64_t& value) = 0;

  // ---------------------------------------------------------------------
  // Compression checkpoints
  // ---------------------------------------------------------------------

  virtual std::optional<model::CompressionStateRecord> GetCompressionState(Transaction&, const std::string& group_id) = 0;

  // Conflict when record.to_seq does not exceed the stored to_seq.
  virtual Result PutCompressionState(Transaction&, const model::CompressionStateRecord&) = 0;

  // ---------------------------------------------------------------------
  // Sessions and documents
  // ---------------------------------------------------------------------

  virtual Result UpsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  virtual Result UpsertDocument(Transaction&, const model::DocumentRecord&) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& id) = 0;
};

} // namespace prdchat::db
