#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/ttl_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/document_record.hpp"

namespace prdchat::cache {

// Read-through document lookup; the repository stays authoritative.
class DocumentStore {
 public:
  DocumentStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds ttl);

  std::optional<db::model::DocumentRecord> Get(const std::string& document_id);

  // Writes through to the repository, then refreshes the cache.
  void Put(const db::model::DocumentRecord& document);

  void Invalidate(const std::string& document_id);

 private:
  std::shared_ptr<db::Repository>       repository_;
  TtlCache<db::model::DocumentRecord> cache_;
};

} // namespace prdchat::cache
