#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace shipyard::util {

/*
  Wall-clock helpers. Deploy and audit rows store unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

google::protobuf::Timestamp TimestampFromMillis(uint64_t ms);

// RFC 3339 in UTC, second precision. Used for webhook embeds.
std::string ToIso8601(TimePoint tp);

} // namespace shipyard::util
