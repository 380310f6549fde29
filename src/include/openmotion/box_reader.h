#pragma once

#include "openmotion/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file box_reader.h
 * \brief Streaming ISO-BMFF box header parser, box iteration and path lookup.
 *
 * All functions operate on a \ref ByteSource positioned at the first box
 * header to parse. Sizes passed around as `int64_t max_size` are either
 * \ref kUnboundedSize or the number of bytes the enclosing box still has.
 */

namespace openmotion {

/// `max_size` value meaning "no enclosing bound" (read to end of stream).
inline constexpr int64_t kUnboundedSize = -1;

/// Builds a big-endian four-character code.
constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Renders a four-character code as 4 characters (non-printable bytes as '.').
std::string
fourcc_to_string(uint32_t code);

/// Status code shared by the box reader, schema codec and MP4 builder.
enum class BoxStatus : uint8_t {
    Ok,
    /// A declared size exceeds the bytes available in the enclosing box or stream.
    OutOfRange,
    /// A required box path is absent.
    NotFound,
    /// The payload does not match the expected layout.
    Malformed,
    /// The underlying \ref ByteSource failed.
    IoError,
    /// An encoded box would need a 64-bit size header.
    SizeOverflow,
    /// A configured \ref BoxParseLimits budget was exceeded.
    LimitExceeded,
    /// Internal consistency check failed (e.g. unstable `moov` size).
    InternalError,
};

/// Returns a stable lowercase name for \p status (e.g. "out_of_range").
const char*
box_status_name(BoxStatus status) noexcept;

/// Budgets for recursive box walks and in-memory box reads.
struct BoxParseLimits final {
    uint32_t max_depth          = 32;
    uint32_t max_boxes          = 1U << 20;
    uint64_t max_box_data_bytes = 256ULL * 1024ULL * 1024ULL;
};

/// Parsed box header.
struct BoxHeader final {
    /// Absolute stream offset of the first header byte.
    uint64_t offset = 0;
    /// 8 or 16; 0 means the stream (or enclosing box) has no more boxes.
    uint32_t header_size = 0;
    uint32_t type        = 0;
    /// Raw 32-bit size field (1 means a 64-bit size follows, 0 means "to EOF").
    uint32_t size32 = 0;
    /// Declared box size including the header (0 for EOF-extended boxes).
    uint64_t box_size = 0;
    /// Payload bytes available to a nested parse, or \ref kUnboundedSize.
    int64_t maxsize = kUnboundedSize;
};

/**
 * \brief Parses one box header at the current stream position.
 *
 * Reads are clipped to \p max_size. When the stream (or bound) is exhausted
 * before any byte is read, returns Ok with `header_size == 0`. With
 * \p extend_eof a `size32 == 0` box keeps the remaining \p max_size as its
 * payload bound; otherwise a declared size smaller than the header or larger
 * than \p max_size is \ref BoxStatus::OutOfRange.
 */
BoxStatus
parse_box_header(ByteSource& stream, int64_t max_size, bool extend_eof,
                 BoxHeader* out) noexcept;

/**
 * \brief Sequential iteration over sibling boxes.
 *
 * Each call to \ref next first seeks past the previously returned box (to
 * its declared end, or to the end of the bound for an EOF-extended box),
 * so callers may read any part of the current box's payload in between.
 */
class BoxIterator final {
public:
    BoxIterator(ByteSource& stream, int64_t max_size, bool extend_eof) noexcept;

    /// Parses the next header; `*has_box` is false once iteration is complete.
    BoxStatus next(BoxHeader* out, bool* has_box) noexcept;

private:
    ByteSource* stream_ = nullptr;
    int64_t max_size_   = kUnboundedSize;
    bool extend_eof_    = false;
    bool started_       = false;
    bool finished_      = false;
    BoxHeader current_;
};

/// Callback interface for recursive box walks.
class BoxVisitor {
public:
    virtual ~BoxVisitor() = default;

    /**
     * \brief Called once per box in depth-first order.
     *
     * \p stream is positioned right after the header and may be read; the
     * walker restores the position it needs. Return false to stop the walk.
     */
    virtual bool on_box(const BoxHeader& header, uint32_t depth,
                        ByteSource& stream) noexcept
        = 0;
};

/**
 * \brief Depth-first walk that descends into boxes whose type is in
 * \p container_types.
 *
 * EOF extension only applies at depth 0.
 */
BoxStatus
parse_boxes_recursive(ByteSource& stream, int64_t max_size,
                      std::span<const uint32_t> container_types,
                      BoxVisitor& visitor,
                      const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

/// One path segment: the set of acceptable box types at that depth.
using BoxPathSegment = std::vector<uint32_t>;

/**
 * \brief Visits every box matching \p path (each segment a set of types).
 *
 * \p depth 0 means \p stream is at the top level of a file (EOF extension
 * enabled for the first segment).
 */
BoxStatus
parse_path(ByteSource& stream, std::span<const BoxPathSegment> path,
           int64_t max_size, uint32_t depth, BoxVisitor& visitor) noexcept;

/**
 * \brief Locates the first box matching \p path, starting at nesting depth 1
 * (no EOF extension).
 *
 * On success the stream is positioned at the matched box payload and
 * `*found` is set.
 */
BoxStatus
parse_box_path_first(ByteSource& stream, std::span<const uint32_t> path,
                     int64_t max_size, BoxHeader* out, bool* found) noexcept;

/// As \ref parse_box_path_first, but a missing path is \ref BoxStatus::NotFound.
BoxStatus
parse_box_path_firstx(ByteSource& stream, std::span<const uint32_t> path,
                      int64_t max_size, BoxHeader* out) noexcept;

/**
 * \brief Reads the payload of the first box matching \p path in a file
 * (top-level lookup with EOF extension).
 */
BoxStatus
parse_mp4_data_first(ByteSource& stream, std::span<const uint32_t> path,
                     std::vector<std::byte>* out, bool* found,
                     int64_t max_size              = kUnboundedSize,
                     const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

/// As \ref parse_mp4_data_first, but a missing path is \ref BoxStatus::NotFound.
BoxStatus
parse_mp4_data_firstx(ByteSource& stream, std::span<const uint32_t> path,
                      std::vector<std::byte>* out,
                      int64_t max_size              = kUnboundedSize,
                      const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

/// Reads the payload of the first box matching \p path inside a box payload.
BoxStatus
parse_box_data_first(ByteSource& stream, std::span<const uint32_t> path,
                     std::vector<std::byte>* out, bool* found,
                     int64_t max_size              = kUnboundedSize,
                     const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

/// As \ref parse_box_data_first, but a missing path is \ref BoxStatus::NotFound.
BoxStatus
parse_box_data_firstx(ByteSource& stream, std::span<const uint32_t> path,
                      std::vector<std::byte>* out,
                      int64_t max_size              = kUnboundedSize,
                      const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

/**
 * \brief Reads the payload described by \p header from the current position.
 *
 * A payload bound of \ref kUnboundedSize reads to the end of the stream.
 * Fewer bytes than declared is \ref BoxStatus::OutOfRange.
 */
BoxStatus
read_box_payload(ByteSource& stream, const BoxHeader& header,
                 std::vector<std::byte>* out,
                 const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

}  // namespace openmotion
