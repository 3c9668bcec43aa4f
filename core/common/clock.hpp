#pragma once

#include <chrono>
#include <cstdint>

namespace grafdiff {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline int64_t toEpochMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline Timestamp fromEpochMillis(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace grafdiff
