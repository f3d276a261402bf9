#pragma once

#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace flotilla::util {

// Records and the core keep wall-clock time as unix milliseconds; protobuf
// Timestamps appear only at the API edge.

uint64_t NowMillis();

google::protobuf::Timestamp MillisToProto(uint64_t ms);

// Sub-millisecond precision is truncated; times before the epoch clamp to 0.
uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts);

} // namespace flotilla::util
