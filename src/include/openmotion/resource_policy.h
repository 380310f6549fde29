#pragma once

#include "openmotion/box_reader.h"
#include "openmotion/camm_builder.h"
#include "openmotion/gps_filter.h"
#include "openmotion/movie_box.h"
#include "openmotion/mp4_builder.h"
#include "openmotion/sample_table.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for OpenMotion read and rewrite workflows.
 */

namespace openmotion {

/**
 * \brief Storage-agnostic limits for untrusted video input.
 *
 * Budgets bound parsing work rather than file size, so long recordings with
 * large `mdat` boxes stay readable.
 */
struct OpenMotionResourcePolicy final {
    /// Optional input size cap (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Box tree decoding budgets.
    BoxParseLimits box_limits;

    /// `stbl` expansion budgets.
    SampleTableLimits sample_limits;

    CammBuildOptions camm_build;
    GpsFilterOptions gps_filter;
};

/// Defaults used by the command line tools.
inline OpenMotionResourcePolicy
recommended_resource_policy()
{
    return OpenMotionResourcePolicy {};
}

inline void
apply_resource_policy(const OpenMotionResourcePolicy& policy,
                      Mp4ReadOptions* read,
                      Mp4TransformOptions* transform) noexcept
{
    if (read) {
        read->box_limits    = policy.box_limits;
        read->sample_limits = policy.sample_limits;
    }
    if (transform) {
        transform->box_limits    = policy.box_limits;
        transform->sample_limits = policy.sample_limits;
    }
}

inline void
apply_resource_policy(const OpenMotionResourcePolicy& policy,
                      CammBuildOptions* camm, GpsFilterOptions* filter)
{
    if (camm) {
        *camm = policy.camm_build;
    }
    if (filter) {
        *filter = policy.gps_filter;
    }
}

}  // namespace openmotion
