#pragma once

#include "openmotion/telemetry.h"

#include <cstddef>
#include <span>
#include <vector>

/**
 * \file gps_filter.h
 * \brief GPS noise and outlier removal for receiver tracks.
 *
 * Pipeline of \ref remove_noisy_points:
 * 1. drop points without a fix or with a fix that is not accepted,
 * 2. drop points without a DOP or with a DOP above the ceiling,
 * 3. split the track where consecutive points jump further than the
 *    distance whisker, greedily merge pieces whose ends are reachable at the
 *    ground-speed whisker, and keep the largest merged group.
 */

namespace openmotion {

struct GpsFilterOptions final {
    std::vector<GpsFix> accepted_fixes = { GpsFix::Fix2D, GpsFix::Fix3D };
    /// Ceiling for \ref GpsPoint::precision (DOP x 100).
    double max_dop100 = 1000.0;
    /// Receiver accuracy in meters; twice this is the minimum split distance.
    double gps_precision_m = 15.0;
};

/// Per-stage counters of \ref remove_noisy_points.
struct GpsFilterStats final {
    size_t removed_by_fix = 0;
    size_t removed_by_dop = 0;
    size_t removed_outliers = 0;
    size_t sequences_after_split = 0;
    size_t groups_after_merge    = 0;
};

using GpsSequence = std::vector<GpsPoint>;

/**
 * \brief Q3 + 1.5 x IQR of \p values.
 *
 * Q1 is the median of the lower half and Q3 of the upper half (the middle
 * element of an odd count belongs to neither). Returns false for fewer than
 * 2 values.
 */
bool
upper_whisker(std::span<const double> values, double* out);

/// Splits \p points wherever two consecutive points are more than \p max_distance meters apart.
std::vector<GpsSequence>
split_by_distance(std::span<const GpsPoint> points, double max_distance);

/**
 * \brief Greedy reachability merge of time-ordered sequences.
 *
 * For each sequence in order, the first later sequence not yet merged whose
 * first point is reachable from this sequence's last point at a speed
 * `<= max_speed` joins this sequence's group. Groups are returned in order
 * of their first sequence.
 */
std::vector<GpsSequence>
merge_reachable_sequences(std::span<const GpsSequence> sequences,
                          double max_speed);

/// The largest group (the first one on ties); empty input gives an empty sequence.
GpsSequence
find_majority(std::span<const GpsSequence> groups);

/// Distance split plus speed merge plus majority vote.
GpsSequence
remove_outliers(std::span<const GpsPoint> points,
                const GpsFilterOptions& options = GpsFilterOptions {},
                GpsFilterStats* stats             = nullptr);

/// Full filter pipeline; \p stats (optional) receives per-stage counts.
GpsSequence
remove_noisy_points(std::span<const GpsPoint> points,
                    const GpsFilterOptions& options = GpsFilterOptions {},
                    GpsFilterStats* stats             = nullptr);

}  // namespace openmotion
