#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace prdchat::util {

/*
  Time utilities. Every timestamp in the service comes from Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
int64_t   NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(int64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixMillis(TimePoint tp);

} // namespace prdchat::util
