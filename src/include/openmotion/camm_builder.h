#pragma once

#include "openmotion/box_schema.h"
#include "openmotion/mp4_builder.h"
#include "openmotion/telemetry.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

/**
 * \file camm_builder.h
 * \brief Builds a CAMM metadata track from telemetry and plugs it into
 * \ref transform_mp4.
 */

namespace openmotion {

/// Telemetry to embed; every list may be empty.
struct CammInfo final {
    /// Written as MIN_GPS (type 5).
    std::vector<Point> mini_gps;
    /// Written as GPS (type 6).
    std::vector<CammGpsPoint> gps;
    /// Written as the GoPro GPS extension (type 1030).
    std::vector<GpsPoint> gopro_gps;
    std::vector<AccelerationData> accl;
    std::vector<GyroscopeData> gyro;
    std::vector<MagnetometerData> magn;
    /// Stored in `moov/udta/@mak` when not empty.
    std::string make;
    /// Stored in `moov/udta/@mod` when not empty.
    std::string model;
};

struct CammBuildOptions final {
    /// Lower bound of the media timescale (1000 keeps millisecond deltas).
    uint32_t min_media_timescale = 1000;
};

/// Time span of one contiguous run of points, in seconds.
struct TimeRun final {
    double first = 0.0;
    double last  = 0.0;
};

/**
 * \brief Edit-list entries for a track built from \p runs.
 *
 * The first run only contributes an empty edit covering its leading gap
 * (when its first time is positive); each later run maps its media span to
 * the same movie span. Empty result means no `edts` is needed.
 */
std::vector<EditListEntry>
camm_edit_entries(std::span<const TimeRun> runs, uint32_t movie_timescale,
                  uint32_t media_timescale);

/// All measurements of \p info ordered by time, negative times dropped.
std::vector<TelemetryMeasurement>
collect_camm_measurements(const CammInfo& info);

/**
 * \brief Converts ordered measurements to samples laid out from offset 0.
 *
 * Each delta is the truncated `(next.time - time) * timescale`; the last one
 * is 0. A delta that does not fit 32 bits is \ref BoxStatus::SizeOverflow.
 */
BoxStatus
camm_raw_samples(std::span<const TelemetryMeasurement> measurements,
                 uint32_t media_timescale, std::vector<RawSample>* out);

/**
 * \brief Builds the `trak` box of a CAMM track (track id left 0).
 *
 * `stbl` is encoded opaque. \p edits become `edts/elst` when not empty.
 */
BoxStatus
build_camm_trak(std::span<const RawSample> raw_samples,
                uint32_t media_timescale,
                std::span<const EditListEntry> edits, Box* out);

/// \ref SampleGenerator appending a CAMM track and the make/model `udta`.
class CammSampleGenerator final : public SampleGenerator {
public:
    explicit CammSampleGenerator(CammInfo info,
                                 const CammBuildOptions& options
                                 = CammBuildOptions {});

    BoxStatus
    generate(ByteSource& source, std::vector<Box>* moov_children,
             std::vector<std::unique_ptr<ByteSource>>* sample_readers) override;

private:
    CammInfo info_;
    CammBuildOptions options_;
};

std::unique_ptr<SampleGenerator>
make_camm_sample_generator(CammInfo info,
                           const CammBuildOptions& options = CammBuildOptions {});

}  // namespace openmotion
