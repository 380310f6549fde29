#pragma once

#include "openmotion/byte_source.h"
#include "openmotion/movie_box.h"
#include "openmotion/telemetry.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file gpmf.h
 * \brief GoPro Metadata Format (GPMF) decoding.
 *
 * GPMF payloads are walked with GoPro's gpmf-parser library, which handles
 * the big-endian KLV layout, the type table, nesting and `SCAL` scaling.
 * This module adds the telemetry view on top: GPS and sensor series,
 * per-device grouping, timing and the camera model.
 */

namespace openmotion {

/// Telemetry of one `DEVC` entry of a GPMF payload.
struct GpmfDevice final {
    /// `DVID` value (FourCC ids as their big-endian code), or 2^32 when absent.
    uint64_t id = uint64_t { 1 } << 32;
    /// `DVNM` with trailing NUL bytes removed.
    std::string name;
    /// Points of the first `STRM` holding GPS9 or GPS5 data; times are left 0.
    std::vector<GpsPoint> gps;
    /// Scaled and re-oriented `(z, x, y)` rows of the first stream of a kind.
    std::vector<std::vector<double>> accl;
    std::vector<std::vector<double>> gyro;
    std::vector<std::vector<double>> magn;
};

/**
 * \brief Decodes every `DEVC` of one GPMF payload (a `gpmd` sample).
 *
 * The payload is rejected as \ref TelemetryStatus::Malformed when the
 * library does not validate its structure; unknown types are tolerated.
 * GPS9 is tried before GPS5 and a GPS9 stream whose `TYPE` does not list 9
 * fields is Malformed. GPS streams need a `SCAL` without zero divisors.
 * Sensor rows are re-oriented by a calibration `MTRX` or, failing that, the
 * `ORIN`/`ORIO` matrix; a zero `SCAL` divisor leaves the sensor empty.
 */
TelemetryStatus
decode_gpmf_payload(std::span<const std::byte> payload,
                    std::vector<GpmfDevice>* out);

/// Parses a `GPSU` timestamp (`yymmddhhmmss.sss`, years 2000..2099) into Unix seconds.
std::optional<double>
parse_gpmf_utc(std::string_view text) noexcept;

/// Builds a 3x3 orientation matrix from `ORIN`/`ORIO` axis letters (row major).
std::vector<double>
gpmf_orientation_matrix(std::string_view orin, std::string_view orio);

/**
 * \brief Fills missing `epoch_time` values forwards and then backwards from
 * the nearest point that has one, shifted by the video time difference.
 */
void
backfill_gps_epoch_times(std::vector<GpsPoint>* points) noexcept;

/**
 * \brief Decodes a flat GPMF dump into GPS points.
 *
 * Every item is visited in stream order, nested ones included. `DVID`
 * starts a new frame, `GPSU` sets its start time, `GPS5` rows are scaled by
 * the `SCAL` before them and `GPSF`/`GPSP` attach fix and precision to the
 * frame. Points of a frame
 * are spread linearly up to the next frame's start time (one second for the
 * last frame). Frames without `GPSU` are dropped. `time` is relative to the
 * first point; `epoch_time` is absolute.
 */
TelemetryStatus
parse_gpmf_gps_frames(std::span<const std::byte> data,
                      std::vector<GpsPoint>* out) noexcept;

/**
 * \brief Reads telemetry of the first `gpmd` track that yields GPS points.
 *
 * Points of one sample are spread evenly over the sample duration. Only the
 * first device reporting a kind of data contributes it. Make and model are
 * left untouched. \ref TelemetryStatus::NotFound when no track has GPS.
 */
TelemetryStatus
extract_gpmf_telemetry(ByteSource& stream, VideoTelemetry* out,
                       const Mp4ReadOptions& options = Mp4ReadOptions {});

/// As \ref extract_gpmf_telemetry, returning the GPS points only.
TelemetryStatus
extract_gpmf_points(ByteSource& stream, std::vector<GpsPoint>* out,
                    const Mp4ReadOptions& options = Mp4ReadOptions {});

/**
 * \brief Picks the camera model among the `DVNM` device names.
 *
 * Names containing "hero" win, then names containing "gopro", then the
 * first name in sorted order; empty when no name decodes as UTF-8.
 */
std::string
select_gpmf_camera_model(std::vector<std::string> names);

/// Reads `DVNM` names of the first `gpmd` track and applies \ref select_gpmf_camera_model.
TelemetryStatus
extract_gpmf_camera_model(ByteSource& stream, std::string* model,
                          const Mp4ReadOptions& options = Mp4ReadOptions {});

}  // namespace openmotion
