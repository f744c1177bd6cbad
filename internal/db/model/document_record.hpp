#pragma once

#include <cstdint>
#include <string>

namespace prdchat::db::model {

// Raw markdown is the only representation the chat core depends on.
struct DocumentRecord {
  std::string  id;
  std::string  title;
  std::string  raw_content;
  std::int64_t created_at_ms = 0;
};

} // namespace prdchat::db::model
