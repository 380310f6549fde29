#pragma once

#include "openmotion/box_reader.h"
#include "openmotion/byte_source.h"
#include "openmotion/telemetry.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file blackvue.h
 * \brief BlackVue dashcam GPS and camera identification.
 *
 * BlackVue stores NMEA sentences as text lines `[epoch_ms]$GPGGA,...` inside
 * `free/gps ` and a camera record inside `free/cprt`.
 */

namespace openmotion {

/// Line counters of one `gps ` payload.
struct NmeaParseStats final {
    uint32_t lines = 0;
    /// Lines of the form `[epoch_ms]$XXXXX...`.
    uint32_t sentences = 0;
    uint32_t bad_checksum = 0;
    /// Sentences that are not GGA, lack a position or report no fix.
    uint32_t skipped = 0;
    uint32_t points = 0;
    /// Seconds added to the camera clock (0 when no sentence fixes it).
    double clock_offset = 0.0;
};

struct BlackVueInfo final {
    std::string make = "BlackVue";
    std::string model;
    /// Sorted by time; `time` starts at 0 and `epoch_time` is UTC.
    std::vector<GpsPoint> gps;
};

/// True when \p sentence has no `*hh` suffix or the XOR checksum matches it.
bool
nmea_checksum_ok(std::string_view sentence) noexcept;

/**
 * \brief Decodes one `$..GGA` sentence (any talker id).
 *
 * Sets latitude, longitude, altitude (when present) and a 3D fix; `time` and
 * `epoch_time` are left unset. Returns nullopt for other sentence types,
 * missing coordinates or a zero fix quality. The checksum is not verified.
 */
std::optional<GpsPoint>
parse_nmea_gga(std::string_view sentence);

/**
 * \brief Decodes the GGA lines of a `gps ` payload.
 *
 * The bracketed camera clock runs in local time. It is corrected to UTC by
 * the offset to the date and time of the first valid RMC sentence or, when
 * there is none, to the time of day of the first valid GGA sentence on the
 * camera's date (shifted a day when the clocks are more than 12 hours
 * apart). `time` and `epoch_time` are the corrected clock in seconds. Lines
 * that do not match, fail their checksum or do not decode are skipped.
 */
std::vector<GpsPoint>
parse_blackvue_gps_lines(std::span<const std::byte> data,
                         NmeaParseStats* stats = nullptr);

/**
 * \brief Camera model from a `cprt` payload.
 *
 * Accepts a JSON object with a `model` member or a `;` separated record whose
 * second field is the model. Returns an empty string otherwise.
 */
std::string
blackvue_model_from_cprt(std::span<const std::byte> data);

/**
 * \brief Reads GPS points and the camera model of a BlackVue file.
 *
 * \ref TelemetryStatus::NotFound when the file has no `free/gps ` box. A
 * missing or unreadable `cprt` leaves the model empty.
 */
TelemetryStatus
extract_blackvue_info(ByteSource& stream, BlackVueInfo* out,
                      const BoxParseLimits& limits = BoxParseLimits {},
                      NmeaParseStats* stats = nullptr);

/// Camera model only; empty when `free/cprt` is absent or unreadable.
std::string
extract_blackvue_camera_model(ByteSource& stream,
                              const BoxParseLimits& limits = BoxParseLimits {});

}  // namespace openmotion
