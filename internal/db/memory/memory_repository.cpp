#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace prdchat::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------

Result MemoryRepository::InsertMessages(Transaction& t, const std::vector<model::MessageRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    if (s.messages.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "message " + r.id);
    if (r.group_seq && s.group_index[r.group_id].contains(*r.group_seq)) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate group_seq in group " + r.group_id);
    }
  }
  for (const auto& r : records) {
    s.messages[r.id]      = r;
    s.message_rowid[r.id] = s.next_rowid++;
    if (r.group_seq) s.group_index[r.group_id][*r.group_seq] = r.id;
  }
  return Result::Ok();
}

Result MemoryRepository::ReplaceMessage(Transaction& t, const model::MessageRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.messages.find(r.id);
  if (it != s.messages.end()) {
    const auto& existing = it->second;
    if (existing.group_seq && r.group_seq && *existing.group_seq != *r.group_seq) {
      return Result::Err(ErrorCode::Conflict, "group_seq is immutable once assigned");
    }
    if (existing.group_seq && !r.group_seq) {
      auto stored      = r;
      stored.group_seq = existing.group_seq;
      it->second       = std::move(stored);
      return Result::Ok();
    }
  } else {
    s.message_rowid[r.id] = s.next_rowid++;
  }
  if (r.group_seq) {
    auto& index = s.group_index[r.group_id];
    auto  owner = index.find(*r.group_seq);
    if (owner != index.end() && owner->second != r.id) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate group_seq in group " + r.group_id);
    }
    index[*r.group_seq] = r.id;
  }
  s.messages[r.id] = r;
  return Result::Ok();
}

std::optional<model::MessageRecord> MemoryRepository::GetMessage(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.messages.find(id);
  if (it == s.messages.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MessageRecord> MemoryRepository::ListGroupMessagesAfter(Transaction& t, const std::string& group_id, std::int64_t after_seq,
                                                                           std::optional<std::size_t> limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::MessageRecord> out;
  auto                              group = s.group_index.find(group_id);
  if (group == s.group_index.end()) return out;

  for (auto it = group->second.upper_bound(after_seq); it != group->second.end(); ++it) {
    if (limit && out.size() >= *limit) break;
    out.push_back(s.messages.at(it->second));
  }
  return out;
}

std::vector<model::MessageRecord> MemoryRepository::ListGroupMessagesBefore(Transaction& t, const std::string& group_id,
                                                                            std::optional<std::int64_t> before_seq, std::size_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::MessageRecord> out;
  auto                              group = s.group_index.find(group_id);
  if (group == s.group_index.end() || limit == 0) return out;

  const auto& index = group->second;
  auto        end   = before_seq ? index.lower_bound(*before_seq) : index.end();
  while (end != index.begin() && out.size() < limit) {
    --end;
    out.push_back(s.messages.at(end->second));
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<model::MessageRecord> MemoryRepository::ListSessionMessages(Transaction& t, const std::string& session_id, std::size_t limit) {
  const auto&                       s = TX(t).View();
  std::vector<model::MessageRecord> out;
  for (const auto& [_, record] : s.messages) {
    if (record.session_id == session_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [&s](const model::MessageRecord& a, const model::MessageRecord& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
    return s.message_rowid.at(a.id) < s.message_rowid.at(b.id);
  });
  if (out.size() > limit) {
    out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return out;
}

Result MemoryRepository::DeleteGroupHistory(Transaction& t, const std::string& group_id) {
  auto& s = TX(t).Mutable();
  for (auto it = s.messages.begin(); it != s.messages.end();) {
    if (it->second.group_id == group_id) {
      s.message_rowid.erase(it->first);
      it = s.messages.erase(it);
    } else {
      ++it;
    }
  }
  s.group_index.erase(group_id);
  s.compression_states.erase(group_id);
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Group sequence counters
// ---------------------------------------------------------------------

Result MemoryRepository::NextGroupSeq(Transaction& t, const std::string& group_id, std::int64_t& value) {
  if (group_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "group id is empty");
  auto& s = TX(t).Mutable();
  value   = ++s.group_seq_counters[group_id];
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Compression checkpoints
// ---------------------------------------------------------------------

std::optional<model::CompressionStateRecord> MemoryRepository::GetCompressionState(Transaction& t, const std::string& group_id) {
  const auto& s  = TX(t).View();
  auto        it = s.compression_states.find(group_id);
  if (it == s.compression_states.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutCompressionState(Transaction& t, const model::CompressionStateRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.compression_states.find(r.group_id);
  if (it != s.compression_states.end() && r.to_seq <= it->second.to_seq) {
    return Result::Err(ErrorCode::Conflict, "checkpoint does not advance to_seq");
  }
  s.compression_states[r.group_id] = r;
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Sessions and documents
// ---------------------------------------------------------------------

Result MemoryRepository::UpsertSession(Transaction& t, const model::SessionRecord& r) {
  TX(t).Mutable().sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertDocument(Transaction& t, const model::DocumentRecord& r) {
  TX(t).Mutable().documents[r.id] = r;
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(id);
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

} // namespace prdchat::db::memory
