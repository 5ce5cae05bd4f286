#ifndef MESHWORK_COMMON_TYPES_H_
#define MESHWORK_COMMON_TYPES_H_

#include <chrono>
#include <cstdint>
#include <string>

namespace Meshwork {

using UnitId = uint32_t;
using SnapshotId = uint64_t;
using CycleId = uint64_t;

// Writer id recorded for mutations that arrive through the ingest API.
constexpr UnitId kExternalWriter = 0;
constexpr char kExternalWriterName[] = "external";

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

inline int64_t ToMicros(WallTime t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

inline int64_t MicrosBetween(SteadyTime start, SteadyTime end) {
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

} // namespace Meshwork

#endif // MESHWORK_COMMON_TYPES_H_
