#pragma once

#include "prdchat/v1/chat.pb.h"
#include "prdchat/llm/v1/model_gateway.pb.h"
#include "prdchat/services/v1/chat_service.pb.h"
#include "prdchat/services/v1/admin_service.pb.h"

namespace prdchat::v1 {
using namespace ::prdchat::services::v1;
}
