#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "prdchat/v1/chat.pb.h"

namespace prdchat::db::model {

/*
  Persistent chat message row.

  group_seq is assigned once by the group sequencer and never changes.
  content only changes while an assistant turn is streaming; the final
  write replaces the placeholder row in place.
*/

struct MessageRecord {
  std::string id;
  std::string session_id;
  std::string group_id; // empty for 1:1 sessions

  prdchat::v1::MessageRole   role           = prdchat::v1::MESSAGE_ROLE_UNSPECIFIED;
  prdchat::v1::AssistantRole assistant_role = prdchat::v1::ASSISTANT_ROLE_UNSPECIFIED;

  std::string sender_user_id;
  std::string content;

  std::optional<std::int64_t> group_seq;

  std::string run_id;
  std::string reply_to_message_id;

  prdchat::v1::MessageStatus status = prdchat::v1::MESSAGE_STATUS_UNSPECIFIED;

  // Assistant turns carry the first-token time, not completion time.
  std::int64_t timestamp_ms = 0;

  std::uint32_t input_tokens  = 0;
  std::uint32_t output_tokens = 0;
};

} // namespace prdchat::db::model
