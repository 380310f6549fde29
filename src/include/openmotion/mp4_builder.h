#pragma once

#include "openmotion/box_schema.h"
#include "openmotion/sample_table.h"
#include "openmotion/virtual_stream.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

/**
 * \file mp4_builder.h
 * \brief Rewrites an MP4 file as a lazily composed stream: copied video tracks
 * plus generated tracks, with every sample offset resolved in two passes.
 */

namespace openmotion {

/// Budgets applied while rewriting a file.
struct Mp4TransformOptions final {
    BoxParseLimits box_limits;
    SampleTableLimits sample_limits;
};

/**
 * \brief Producer of an additional track for \ref transform_mp4.
 *
 * Implementations append one or more `trak` boxes (with an opaque `stbl`
 * whose samples are laid out back to back from offset 0) to
 * \p moov_children and push one reader per sample, in sample order, to
 * \p sample_readers.
 */
class SampleGenerator {
public:
    virtual ~SampleGenerator() = default;

    virtual BoxStatus
    generate(ByteSource& source, std::vector<Box>* moov_children,
             std::vector<std::unique_ptr<ByteSource>>* sample_readers)
        = 0;
};

/**
 * \brief Collects the raw samples of every `trak` in \p moov_children.
 *
 * Tracks are visited in order; a `trak` without `mdia/minf/stbl` is
 * \ref BoxStatus::NotFound.
 */
BoxStatus
iterate_samples(const std::vector<Box>& moov_children,
                std::vector<RawSample>* out,
                const SampleTableLimits& limits = SampleTableLimits {}) noexcept;

/// Reads `mvhd.timescale`; \ref BoxStatus::NotFound without `mvhd`.
BoxStatus
find_movie_timescale(const std::vector<Box>& moov_children,
                     uint32_t* out) noexcept;

/// Encodes the `mdat` header for a body of \p body_size bytes (16 bytes when a 32-bit size cannot hold it).
std::vector<std::byte>
build_mdat_header(uint64_t body_size);

/**
 * \brief Composes a complete MP4 stream.
 *
 * The output is `[ftyp][moov][mdat header][sample readers...]`. Sample
 * offsets of every track in \p moov_children are rewritten to their final
 * position: `moov` is encoded once with offsets starting at 0 to learn its
 * size and again with the real offsets; a different second length is
 * \ref BoxStatus::InternalError and no stream is produced.
 *
 * \p moov_children is modified in place. The readers must yield the samples
 * of all tracks in track order.
 */
BoxStatus
build_mp4(std::span<const std::byte> ftyp_data,
          std::vector<Box>* moov_children,
          std::vector<std::unique_ptr<ByteSource>> sample_readers,
          ChainedIO* out,
          const SampleTableLimits& limits = SampleTableLimits {});

/**
 * \brief Rewrites \p source keeping `mvhd` and video tracks only.
 *
 * Samples of the kept tracks are exposed as \ref SlicedIO views into
 * \p source, so \p source must outlive \p out and must not be read by anyone
 * else while \p out is consumed. A `trak` without a handler is dropped.
 * Track IDs are renumbered from 1 after \p generator ran, and
 * `mvhd.next_track_id` is set past the last one.
 */
BoxStatus
transform_mp4(ByteSource& source, SampleGenerator* generator, ChainedIO* out,
              const Mp4TransformOptions& options = Mp4TransformOptions {});

}  // namespace openmotion
