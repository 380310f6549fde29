#pragma once

#include "openmotion/box_schema.h"
#include "openmotion/sample_table.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file movie_box.h
 * \brief Read-only views over a decoded `moov` box and its tracks.
 */

namespace openmotion {

/// Seconds between 1904-01-01 (MP4 epoch) and 1970-01-01 (Unix epoch).
inline constexpr int64_t kMp4EpochOffsetSeconds = 2082844800;

/// Converts MP4 `creation_time`/`modification_time` seconds to Unix seconds.
constexpr int64_t
mp4_time_to_unix_seconds(uint64_t seconds_since_1904) noexcept
{
    return static_cast<int64_t>(seconds_since_1904) - kMp4EpochOffsetSeconds;
}

/// Budgets for reading tracks and samples of an existing file.
struct Mp4ReadOptions final {
    BoxParseLimits box_limits;
    SampleTableLimits sample_limits;
};

/**
 * \brief View over the children of one `trak` box.
 *
 * Borrows the tree of the \ref MovieBox (or any decoded `trak` children list)
 * it was created from; it must not outlive it. `stbl` is expected to be
 * opaque, as produced by \ref moov_without_stbl_schema.
 */
class TrackBox final {
public:
    TrackBox() noexcept = default;
    explicit TrackBox(const std::vector<Box>* trak_children) noexcept;

    bool valid() const noexcept { return children_ != nullptr; }

    const TrackHeader* tkhd() const noexcept;
    const MediaHeader* mdhd() const noexcept;
    const HandlerReference* hdlr() const noexcept;
    /// Null when the track has no `edts/elst`.
    const EditList* elst() const noexcept;

    /// True when `mdia/hdlr` declares a `vide` handler.
    bool is_video_track() const noexcept;

    /// Raw `mdia/minf/stbl` payload; \ref BoxStatus::NotFound when absent.
    BoxStatus stbl_data(std::span<const std::byte>* out) const noexcept;

    BoxStatus sample_descriptions(std::vector<SampleEntry>* out) const noexcept;

    BoxStatus raw_samples(StblSamples* out,
                          const SampleTableLimits& limits
                          = SampleTableLimits {}) const noexcept;

    /**
     * \brief Samples resolved with the `mdhd` timescale.
     *
     * \p table receives the descriptions the samples point into and must
     * outlive \p out.
     */
    BoxStatus samples(StblSamples* table, std::vector<Sample>* out,
                      const SampleTableLimits& limits
                      = SampleTableLimits {}) const;

    const std::vector<Box>& children() const noexcept { return *children_; }

private:
    const std::vector<Box>* children_ = nullptr;
};

/// Decoded `moov` (sample tables left opaque).
class MovieBox final {
public:
    /// Decodes the payload of a `moov` box.
    BoxStatus parse(std::span<const std::byte> moov_data,
                    const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

    /// Locates the top-level `moov` of \p stream and decodes it.
    BoxStatus parse_stream(ByteSource& stream,
                           const BoxParseLimits& limits
                           = BoxParseLimits {}) noexcept;

    /// Null when `moov` has no `mvhd`.
    const MovieHeader* mvhd() const noexcept;

    size_t track_count() const noexcept;
    std::vector<TrackBox> tracks() const;

    /// Track by stream index (order of `trak` boxes); \ref BoxStatus::OutOfRange past the end.
    BoxStatus track_at(size_t index, TrackBox* out) const noexcept;

    const std::vector<Box>& children() const noexcept { return children_; }
    std::vector<Box>& children() noexcept { return children_; }

private:
    std::vector<Box> children_;
};

/**
 * \brief Reads the bytes of \p sample from \p stream.
 *
 * A sample larger than `limits.max_box_data_bytes` is
 * \ref BoxStatus::LimitExceeded; a short read is \ref BoxStatus::OutOfRange.
 */
BoxStatus
read_sample_data(ByteSource& stream, const RawSample& sample,
                 std::vector<std::byte>* out,
                 const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

}  // namespace openmotion
