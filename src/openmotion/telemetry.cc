#include "openmotion/telemetry.h"

#include <algorithm>

namespace openmotion {

double
measurement_time(const TelemetryMeasurement& m) noexcept
{
    return std::visit([](const auto& v) { return v.time; }, m);
}


void
set_measurement_time(TelemetryMeasurement* m, double time) noexcept
{
    if (!m) {
        return;
    }
    std::visit([time](auto& v) { v.time = time; }, *m);
}


const char*
telemetry_status_name(TelemetryStatus status) noexcept
{
    switch (status) {
    case TelemetryStatus::Ok: return "ok";
    case TelemetryStatus::NotFound: return "not_found";
    case TelemetryStatus::Malformed: return "malformed";
    case TelemetryStatus::IoError: return "io_error";
    }
    return "unknown";
}


void
sort_measurements_by_time(std::vector<TelemetryMeasurement>* measurements)
{
    if (!measurements) {
        return;
    }
    std::stable_sort(measurements->begin(), measurements->end(),
                     [](const TelemetryMeasurement& a,
                        const TelemetryMeasurement& b) {
                         return measurement_time(a) < measurement_time(b);
                     });
}

}  // namespace openmotion
