#pragma once

#include <cstdint>
#include <string>

namespace prdchat::db::model {

/*
  Live compression checkpoint for one group.

  [from_seq, to_seq] is the inclusive range of group sequence numbers
  folded into compressed_text. to_seq only moves forward.
*/

struct CompressionStateRecord {
  std::string  group_id;
  std::int64_t from_seq = 0;
  std::int64_t to_seq   = 0;

  std::string compressed_text;

  std::int64_t original_chars   = 0;
  std::int64_t compressed_chars = 0;
  std::int64_t created_at_ms    = 0;
};

} // namespace prdchat::db::model
