#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file byte_source.h
 * \brief Seekable, readable byte stream interface and in-memory sources.
 */

namespace openmotion {

/// Status code for \ref ByteSource operations.
enum class IoStatus : uint8_t {
    Ok,
    /// The underlying device reported an error.
    IoError,
    /// The request is invalid (e.g. seeking before offset 0).
    InvalidArgument,
    /// The stream does not support the request (e.g. backward relative seek).
    Unsupported,
};

/// Origin for \ref ByteSource::seek.
enum class SeekWhence : uint8_t {
    Set,
    Cur,
    End,
};

/**
 * \brief Readable, seekable byte stream with a single cursor.
 *
 * Reads return fewer bytes than requested only at end of stream. Every
 * composed stream (see \ref ChainedIO) needs its own cursor, so a source
 * must not be shared between two compositions that read independently.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads up to `out.size()` bytes at the cursor; `*read_bytes == 0` means end of stream.
    virtual IoStatus read(std::span<std::byte> out,
                          uint64_t* read_bytes) noexcept
        = 0;

    /// Moves the cursor and reports the new absolute position in \p new_pos (optional).
    virtual IoStatus seek(int64_t offset, SeekWhence whence,
                          uint64_t* new_pos) noexcept
        = 0;

    /// Current absolute cursor position.
    virtual uint64_t tell() const noexcept = 0;
};

/// Reads until \p out is full or the stream ends; \p read_bytes receives the total.
IoStatus
read_fully(ByteSource& source, std::span<std::byte> out,
           uint64_t* read_bytes) noexcept;

/// Reads everything from the cursor to the end of \p source into \p out.
IoStatus
read_to_end(ByteSource& source, std::vector<std::byte>* out) noexcept;

/// Returns the total stream size (restores the cursor afterwards).
IoStatus
stream_size(ByteSource& source, uint64_t* out) noexcept;

/// \ref ByteSource over bytes it owns.
class MemorySource final : public ByteSource {
public:
    MemorySource() noexcept = default;
    explicit MemorySource(std::vector<std::byte> bytes) noexcept;

    IoStatus read(std::span<std::byte> out,
                  uint64_t* read_bytes) noexcept override;
    IoStatus seek(int64_t offset, SeekWhence whence,
                  uint64_t* new_pos) noexcept override;
    uint64_t tell() const noexcept override;

    std::span<const std::byte> bytes() const noexcept;

private:
    std::vector<std::byte> bytes_;
    uint64_t pos_ = 0;
};

/// \ref ByteSource over caller-owned bytes (the bytes must outlive the source).
class SpanSource final : public ByteSource {
public:
    SpanSource() noexcept = default;
    explicit SpanSource(std::span<const std::byte> bytes) noexcept;

    IoStatus read(std::span<std::byte> out,
                  uint64_t* read_bytes) noexcept override;
    IoStatus seek(int64_t offset, SeekWhence whence,
                  uint64_t* new_pos) noexcept override;
    uint64_t tell() const noexcept override;

private:
    std::span<const std::byte> bytes_;
    uint64_t pos_ = 0;
};

}  // namespace openmotion
