#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace codegraph::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 text, the form created_at/updated_at are persisted in
std::string ToRfc3339(TimePoint tp);

double ElapsedMs(std::chrono::steady_clock::time_point started_at);

} // namespace codegraph::util
