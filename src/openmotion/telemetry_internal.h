#pragma once

#include "openmotion/box_reader.h"
#include "openmotion/telemetry.h"

#include <cstdint>

// Status mapping and calendar arithmetic shared by the telemetry extractors.

namespace openmotion {

inline TelemetryStatus
telemetry_status_from_box(BoxStatus status) noexcept
{
    switch (status) {
    case BoxStatus::Ok: return TelemetryStatus::Ok;
    case BoxStatus::NotFound: return TelemetryStatus::NotFound;
    case BoxStatus::IoError: return TelemetryStatus::IoError;
    default: return TelemetryStatus::Malformed;
    }
}


// Days from 1970-01-01 to the given proleptic Gregorian date.
inline int64_t
days_from_civil(int64_t y, int64_t m, int64_t d) noexcept
{
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

}  // namespace openmotion
