#pragma once

#include <vector>

#include "internal/citation/citation_extractor.hpp"
#include "internal/db/model/compression_state_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/markdown/block_tokenizer.hpp"
#include "prdchat/v1/chat.pb.h"

namespace prdchat::model {

/*
  Conversions between internal records and wire messages.
*/

prdchat::v1::Message          ToProto(const db::model::MessageRecord& record);
prdchat::v1::Citation         ToProto(const citation::Citation& citation);
prdchat::v1::CompressionState ToProto(const db::model::CompressionStateRecord& record);
prdchat::v1::BlockKind        ToProto(markdown::BlockKind kind);

void AppendCitations(const std::vector<citation::Citation>& citations, google::protobuf::RepeatedPtrField<prdchat::v1::Citation>* out);

} // namespace prdchat::model
