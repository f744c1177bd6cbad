#pragma once

#include <cstdint>
#include <string>

namespace prdchat::db::model {

struct SessionRecord {
  std::string  id;
  std::string  group_id; // empty for 1:1 sessions
  std::string  document_id;
  std::string  owner_user_id;
  std::int64_t created_at_ms = 0;

  bool IsGroup() const {
    return !group_id.empty();
  }
};

} // namespace prdchat::db::model
