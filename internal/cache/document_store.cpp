#include "internal/cache/document_store.hpp"

#include "internal/db/api/tx_runner.hpp"

namespace prdchat::cache {

DocumentStore::DocumentStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds ttl)
    : repository_(std::move(repository)), cache_(ttl) {
}

std::optional<db::model::DocumentRecord> DocumentStore::Get(const std::string& document_id) {
  if (auto cached = cache_.Get(document_id)) {
    return cached;
  }

  auto stored = db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetDocument(tx, document_id); });
  if (stored) {
    cache_.Put(document_id, *stored);
  }
  return stored;
}

void DocumentStore::Put(const db::model::DocumentRecord& document) {
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->UpsertDocument(tx, document), "upsert document " + document.id);
  });
  cache_.Put(document.id, document);
}

void DocumentStore::Invalidate(const std::string& document_id) {
  cache_.Remove(document_id);
}

} // namespace prdchat::cache
