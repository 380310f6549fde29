#pragma once

#include "openmotion/box_schema.h"
#include "openmotion/movie_box.h"
#include "openmotion/telemetry.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

/**
 * \file camm.h
 * \brief Camera Motion Metadata (CAMM) sample codec and track reader.
 *
 * A CAMM sample is `[2 bytes reserved][u16le type][payload]`; every payload
 * field is little-endian. Types 0..7 follow the public CAMM layout, 1030 is
 * a GoPro GPS extension this library writes but does not read back.
 */

namespace openmotion {

enum class CammType : uint16_t {
    AngleAxis     = 0,
    ExposureTime  = 1,
    Gyro          = 2,
    Acceleration  = 3,
    Position      = 4,
    MinGps        = 5,
    Gps           = 6,
    MagneticField = 7,
    /// lat/lon f64, alt f32, epoch f64, fix i32, precision f32, speed f32.
    GoProGps = 1024 + 6,
};

/// Payload size in bytes of \p type (excluding the 4-byte prefix); 0 for unknown types.
size_t
camm_payload_size(uint16_t type) noexcept;

/// Altitude written for an absent \ref Point::alt and read back as absent.
inline constexpr double kCammUnknownAltitude = -1.0;

/// One decoded CAMM sample.
struct CammRawSample final {
    uint16_t type = 0;
    /// Set for the measurement types 2, 3, 5, 6 and 7.
    std::optional<TelemetryMeasurement> measurement;
    /// Angle-axis (type 0) or position (type 4) vector.
    std::array<float, 3> vector {};
    /// Exposure time (type 1), nanoseconds.
    int32_t pixel_exposure_time       = 0;
    int32_t rolling_shutter_skew_time = 0;
};

/**
 * \brief Decodes one CAMM sample; measurement times are set to \p time.
 *
 * Unknown types and type 1030 decode with no measurement. A payload shorter
 * than its type requires is \ref TelemetryStatus::Malformed.
 */
TelemetryStatus
decode_camm_sample(std::span<const std::byte> data, double time,
                   CammRawSample* out) noexcept;

/// CAMM type used to serialize \p m.
CammType
camm_type_of(const TelemetryMeasurement& m) noexcept;

/**
 * \brief Appends the CAMM encoding of \p m to \p out.
 *
 * \ref Point maps to MIN_GPS, \ref CammGpsPoint to GPS, \ref GpsPoint to the
 * GoPro extension. Absent altitude is written as
 * \ref kCammUnknownAltitude; other absent fields as 0.
 */
void
encode_camm_sample(const TelemetryMeasurement& m, std::vector<std::byte>* out);

/// Edit-list entry converted to seconds; `media_time == -1` is an empty edit.
struct EditSegment final {
    double media_time = 0.0;
    double duration   = 0.0;
};

/// Converts an `elst` entry with the movie and media timescales (both non-zero).
EditSegment
edit_segment_from_entry(const EditListEntry& entry, uint32_t movie_timescale,
                        uint32_t media_timescale) noexcept;

/**
 * \brief Applies edit segments to time-ordered measurements.
 *
 * The duration of the last empty segment shifts every kept measurement.
 * Without non-empty segments everything is kept; otherwise only
 * measurements with `media_time <= t <= media_time + duration` for some
 * segment (walked in media time order) are kept.
 */
std::vector<TelemetryMeasurement>
filter_by_edit_segments(std::span<const TelemetryMeasurement> measurements,
                        std::span<const EditSegment> segments);

/// True for \ref Point, \ref GpsPoint and \ref CammGpsPoint.
bool
is_gps_measurement(const TelemetryMeasurement& m) noexcept;

/**
 * \brief Reads every measurement of the first track carrying a `camm`
 * sample description, edit-list corrected.
 *
 * \ref TelemetryStatus::NotFound when no such track exists.
 */
TelemetryStatus
extract_camm_telemetry(ByteSource& stream,
                       std::vector<TelemetryMeasurement>* out,
                       const Mp4ReadOptions& options = Mp4ReadOptions {});

/// As \ref extract_camm_telemetry, keeping GPS measurements only.
TelemetryStatus
extract_camm_points(ByteSource& stream, std::vector<TelemetryMeasurement>* out,
                    const Mp4ReadOptions& options = Mp4ReadOptions {});

/**
 * \brief Reads camera make and model from `moov/udta`.
 *
 * Recognizes `\xA9mak`/`\xA9mod` (length-prefixed) and `@mak`/`manu`,
 * `@mod`/`modl` (raw text). Undecodable values are left empty; only a
 * failing stream is reported.
 */
TelemetryStatus
extract_camera_make_and_model(ByteSource& stream, std::string* make,
                              std::string* model);

}  // namespace openmotion
