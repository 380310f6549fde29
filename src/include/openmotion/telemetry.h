#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

/**
 * \file telemetry.h
 * \brief Telemetry measurement types shared by the CAMM, GPMF and BlackVue codecs.
 *
 * Every measurement carries `time` in seconds relative to the start of the
 * video; it orders measurements of different kinds in one track.
 */

namespace openmotion {

/// GNSS fix quality.
enum class GpsFix : uint8_t {
    NoFix = 0,
    Fix2D = 2,
    Fix3D = 3,
};

/// Plain geographic sample.
struct Point final {
    double time = 0.0;
    double lat  = 0.0;
    double lon  = 0.0;
    /// Meters; absent when unknown.
    std::optional<double> alt;
    /// Heading in degrees.
    std::optional<double> angle;
};

/// GPS sample with receiver quality fields (GoPro, BlackVue).
struct GpsPoint final {
    double time = 0.0;
    double lat  = 0.0;
    double lon  = 0.0;
    std::optional<double> alt;
    std::optional<double> angle;
    /// Seconds since the Unix epoch.
    std::optional<double> epoch_time;
    std::optional<GpsFix> fix;
    /// Dilution of precision times 100.
    std::optional<double> precision;
    /// Meters per second.
    std::optional<double> ground_speed;
};

/// Full CAMM type 6 GPS record.
struct CammGpsPoint final {
    double time = 0.0;
    double lat  = 0.0;
    double lon  = 0.0;
    std::optional<double> alt;
    std::optional<double> angle;
    /// Seconds since the GPS epoch.
    double time_gps_epoch      = 0.0;
    int32_t gps_fix_type       = 0;
    double horizontal_accuracy = 0.0;
    double vertical_accuracy   = 0.0;
    double velocity_east       = 0.0;
    double velocity_north      = 0.0;
    double velocity_up         = 0.0;
    double speed_accuracy      = 0.0;
};

/// Accelerometer reading in m/s^2 along the camera XYZ axes.
struct AccelerationData final {
    double time = 0.0;
    double x    = 0.0;
    double y    = 0.0;
    double z    = 0.0;
};

/// Angular velocity in rad/s around the camera XYZ axes.
struct GyroscopeData final {
    double time = 0.0;
    double x    = 0.0;
    double y    = 0.0;
    double z    = 0.0;
};

/// Ambient magnetic field in microtesla.
struct MagnetometerData final {
    double time = 0.0;
    double x    = 0.0;
    double y    = 0.0;
    double z    = 0.0;
};

using TelemetryMeasurement
    = std::variant<Point, GpsPoint, CammGpsPoint, AccelerationData,
                   GyroscopeData, MagnetometerData>;

/// Returns the `time` of any measurement.
double
measurement_time(const TelemetryMeasurement& m) noexcept;

/// Sets the `time` of any measurement.
void
set_measurement_time(TelemetryMeasurement* m, double time) noexcept;

/// Status of telemetry extraction from a container.
enum class TelemetryStatus : uint8_t {
    Ok,
    /// The expected track or box is absent.
    NotFound,
    /// The container or telemetry payload is corrupt.
    Malformed,
    /// The underlying stream failed.
    IoError,
};

/// Returns a stable lowercase name for \p status.
const char*
telemetry_status_name(TelemetryStatus status) noexcept;

/// Camera identity and telemetry extracted from one video.
struct VideoTelemetry final {
    std::string make;
    std::string model;
    std::vector<GpsPoint> gps;
    std::vector<AccelerationData> accl;
    std::vector<GyroscopeData> gyro;
    std::vector<MagnetometerData> magn;
};

/// Stable sort by `time`, keeping the input order of equal times.
void
sort_measurements_by_time(std::vector<TelemetryMeasurement>* measurements);

}  // namespace openmotion
