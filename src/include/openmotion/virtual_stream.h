#pragma once

#include "openmotion/byte_source.h"

#include <cstdint>
#include <memory>
#include <vector>

/**
 * \file virtual_stream.h
 * \brief Zero-copy stream composition: byte-range views and concatenation.
 */

namespace openmotion {

/**
 * \brief Read-only view over `[offset, offset + size)` of another source.
 *
 * The view does not own \p source. Each read seeks the source to the absolute
 * position first, so several views may share one underlying source as long
 * as nothing reads that source concurrently. Reads past `size` return zero
 * bytes. Relative and end seeks clamp negative results to 0; an absolute
 * seek to a negative offset is rejected with \ref IoStatus::InvalidArgument.
 */
class SlicedIO final : public ByteSource {
public:
    SlicedIO(ByteSource* source, uint64_t offset, uint64_t size) noexcept;

    IoStatus read(std::span<std::byte> out,
                  uint64_t* read_bytes) noexcept override;
    IoStatus seek(int64_t offset, SeekWhence whence,
                  uint64_t* new_pos) noexcept override;
    uint64_t tell() const noexcept override;

    uint64_t offset() const noexcept { return begin_offset_; }
    uint64_t size() const noexcept { return size_; }

private:
    ByteSource* source_    = nullptr;
    uint64_t begin_offset_ = 0;
    uint64_t rel_offset_   = 0;
    uint64_t size_         = 0;
};

/**
 * \brief Concatenation of several sources into one logical stream.
 *
 * Owns its parts. Construction rewinds every part to offset 0. Absolute and
 * end seeks re-walk the parts from the first one. Relative seeks only move
 * forward: a negative offset with `Cur` or `End` fails with
 * \ref IoStatus::Unsupported.
 * Seeking past the last part is allowed and subsequent reads return zero
 * bytes.
 */
class ChainedIO final : public ByteSource {
public:
    ChainedIO() noexcept = default;
    explicit ChainedIO(std::vector<std::unique_ptr<ByteSource>> streams) noexcept;

    ChainedIO(const ChainedIO&)            = delete;
    ChainedIO& operator=(const ChainedIO&) = delete;
    ChainedIO(ChainedIO&&) noexcept            = default;
    ChainedIO& operator=(ChainedIO&&) noexcept = default;

    IoStatus read(std::span<std::byte> out,
                  uint64_t* read_bytes) noexcept override;
    IoStatus seek(int64_t offset, SeekWhence whence,
                  uint64_t* new_pos) noexcept override;
    uint64_t tell() const noexcept override;

    size_t stream_count() const noexcept { return streams_.size(); }

    /// First error seen while rewinding parts in the constructor.
    IoStatus init_status() const noexcept { return init_status_; }

private:
    IoStatus seek_next_stream() noexcept;
    IoStatus seek_forward(uint64_t offset) noexcept;

    std::vector<std::unique_ptr<ByteSource>> streams_;
    // Absolute offset at which streams_[idx_] starts.
    uint64_t begin_offset_ = 0;
    // Distance past the end of the last part after an overshooting seek.
    uint64_t offset_after_seek_end_ = 0;
    size_t idx_                     = 0;
    IoStatus init_status_           = IoStatus::Ok;
};

}  // namespace openmotion
