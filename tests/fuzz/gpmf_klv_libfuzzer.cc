#include "openmotion/gpmf.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace openmotion {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

static void
verify_rows(const std::vector<std::vector<double>>& rows) noexcept
{
    size_t width = 0;
    for (const std::vector<double>& row : rows) {
        if (row.empty() || (width != 0 && row.size() != width)) {
            fuzz_trap();
        }
        width = row.size();
    }
}

}  // namespace openmotion

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace openmotion;

    const std::span<const std::byte> bytes(
        reinterpret_cast<const std::byte*>(data), size);

    std::vector<GpmfDevice> devices;
    if (decode_gpmf_payload(bytes, &devices) == TelemetryStatus::Ok) {
        for (const GpmfDevice& device : devices) {
            for (const GpsPoint& p : device.gps) {
                if (p.time != 0.0) {
                    fuzz_trap();
                }
            }
            verify_rows(device.accl);
            verify_rows(device.gyro);
            verify_rows(device.magn);
        }
    } else if (!devices.empty()) {
        fuzz_trap();
    }

    std::vector<GpsPoint> points;
    if (parse_gpmf_gps_frames(bytes, &points) == TelemetryStatus::Ok) {
        for (const GpsPoint& p : points) {
            if (std::isnan(p.time)) {
                fuzz_trap();
            }
        }
    }
    return 0;
}
