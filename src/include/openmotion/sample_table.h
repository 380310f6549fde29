#pragma once

#include "openmotion/box_schema.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file sample_table.h
 * \brief Conversion between `stbl` run-length tables and flat per-sample records.
 */

namespace openmotion {

/// One media sample before timescale resolution.
struct RawSample final {
    /// 1-based index into the track's sample descriptions.
    uint32_t description_idx = 1;
    /// Absolute byte offset in the file.
    uint64_t offset = 0;
    uint32_t size   = 0;
    /// Decode-time delta to the next sample (media timescale units).
    uint32_t timedelta = 0;
    /// Presentation-time delta from decode time (media timescale units).
    int64_t composition_offset = 0;
    bool is_sync               = true;
};

/// A \ref RawSample with times resolved to seconds.
struct Sample final {
    RawSample raw;
    /// Accumulated decode time, DT(n) / timescale.
    double exact_time = 0.0;
    /// STTS(n) / timescale.
    double exact_timedelta = 0.0;
    /// (DT(n) + CTTS(n)) / timescale.
    double exact_composition_time = 0.0;
    /// Entry in the owning description list (valid while that list lives).
    const SampleEntry* description = nullptr;
};

/// Budget for `stbl` expansion.
struct SampleTableLimits final {
    uint32_t max_samples = 1U << 24;
};

/// Result of \ref extract_raw_samples_from_stbl_data.
struct StblSamples final {
    std::vector<SampleEntry> descriptions;
    std::vector<RawSample> samples;
};

/**
 * \brief Expands the children of an `stbl` box into per-sample records.
 *
 * \p stbl_data is the `stbl` payload (its child boxes). Missing `stts`/`ctts`
 * entries are padded with 0, a missing `stss` marks every sample as sync.
 * When `stsc` covers fewer samples than `stsz`, the last entry repeats for
 * the following chunks. A chunk index past the chunk offset table, or a
 * zero `samples_per_chunk` while samples remain, is
 * \ref BoxStatus::Malformed.
 */
BoxStatus
extract_raw_samples_from_stbl_data(
    std::span<const std::byte> stbl_data, StblSamples* out,
    const SampleTableLimits& limits = SampleTableLimits {}) noexcept;

/// Same as \ref extract_raw_samples_from_stbl_data for already decoded `stbl` children.
BoxStatus
extract_raw_samples_from_stbl_boxes(
    const std::vector<Box>& stbl_children, StblSamples* out,
    const SampleTableLimits& limits = SampleTableLimits {}) noexcept;

/**
 * \brief Resolves sample times with \p timescale.
 *
 * Descriptions are looked up by `description_idx`; an index outside
 * \p descriptions leaves \ref Sample::description null.
 */
std::vector<Sample>
resolve_samples(std::span<const RawSample> raw_samples,
                std::span<const SampleEntry> descriptions, uint32_t timescale);

/// One `stsc` chunk: a maximal byte-contiguous run with one description.
struct SampleChunk final {
    uint32_t samples_per_chunk        = 0;
    uint32_t sample_description_index = 0;
    uint64_t offset                   = 0;
};

/// Groups samples into chunks: a new chunk starts on a description change or a byte gap.
std::vector<SampleChunk>
build_chunks(std::span<const RawSample> raw_samples);

/**
 * \brief Builds `stbl` children from flat samples.
 *
 * Emits `stsd`, `stts`, `stsc`, `stsz` and `co64` (never `stco`, so the
 * encoded size does not depend on offset values), then `ctts` only if some
 * composition offset is non-zero and `stss` only if some sample is not sync.
 */
std::vector<Box>
build_stbl_from_raw_samples(std::span<const SampleEntry> descriptions,
                            std::span<const RawSample> raw_samples);

}  // namespace openmotion
