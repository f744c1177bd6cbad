#pragma once

#include <cstdint>
#include <string>

namespace prdchat::pipeline {

/*
  Identifiers of the request being served.

  Passed explicitly down the call chain into logging and model
  invocation; nothing here is ambient or thread-local.
*/
struct RequestContext {
  std::string request_id;
  std::string run_id;
  std::string session_id;
  std::string group_id;
  std::string user_id;

  std::int64_t received_at_ms = 0;
};

} // namespace prdchat::pipeline
