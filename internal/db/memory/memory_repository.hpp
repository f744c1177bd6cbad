#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace prdchat::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::MessageRecord> messages;
    // Insertion order, used as the tie-breaker for equal timestamps.
    std::unordered_map<std::string, std::uint64_t> message_rowid;
    std::uint64_t                                  next_rowid = 1;

    std::unordered_map<std::string, std::map<std::int64_t, std::string>> group_index; // group -> seq -> message id

    std::unordered_map<std::string, std::int64_t>                          group_seq_counters;
    std::unordered_map<std::string, model::CompressionStateRecord>         compression_states;
    std::unordered_map<std::string, model::SessionRecord>                  sessions;
    std::unordered_map<std::string, model::DocumentRecord>                 documents;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace prdchat::db::memory
