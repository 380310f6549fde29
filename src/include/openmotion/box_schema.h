#pragma once

#include "openmotion/box_reader.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

/**
 * \file box_schema.h
 * \brief Table-driven box schema: typed leaf layouts, a decoded box tree,
 * a parse-only decoder and a 32-bit-only encoder.
 *
 * All integer fields are big-endian. Version 1 of `mvhd`/`tkhd`/`mdhd`/`elst`
 * selects 64-bit time and duration fields.
 */

namespace openmotion {

/// Identity transform used by `mvhd` and `tkhd`.
inline constexpr std::array<int32_t, 9> kUnityMatrix = {
    0x10000, 0, 0, 0, 0x10000, 0, 0, 0, 0x40000000,
};

/// `mvhd`
struct MovieHeader final {
    uint8_t version            = 1;
    uint32_t flags             = 0;
    uint64_t creation_time     = 0;
    uint64_t modification_time = 0;
    uint32_t timescale         = 0;
    uint64_t duration          = 0;
    int32_t rate               = 0x00010000;
    int16_t volume             = 0x0100;
    std::array<int32_t, 9> matrix = kUnityMatrix;
    uint32_t next_track_id        = 0xFFFFFFFFU;
};

/// `tkhd` (flag 0x000001 marks the track as enabled).
struct TrackHeader final {
    uint8_t version            = 1;
    uint32_t flags             = 1;
    uint64_t creation_time     = 0;
    uint64_t modification_time = 0;
    uint32_t track_id          = 1;
    uint64_t duration          = 0;
    int16_t layer              = 0;
    int16_t alternate_group    = 0;
    int16_t volume             = 0;
    std::array<int32_t, 9> matrix = kUnityMatrix;
    uint32_t width                = 0;
    uint32_t height               = 0;
};

/// One `elst` entry; `media_time == -1` is an empty edit.
struct EditListEntry final {
    /// Movie timescale units.
    int64_t segment_duration = 0;
    /// Media timescale units.
    int64_t media_time          = 0;
    int16_t media_rate_integer  = 1;
    int16_t media_rate_fraction = 0;
};

/// `elst`
struct EditList final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<EditListEntry> entries;
};

/// `mdhd`
struct MediaHeader final {
    uint8_t version            = 1;
    uint32_t flags             = 0;
    uint64_t creation_time     = 0;
    uint64_t modification_time = 0;
    uint32_t timescale         = 0;
    uint64_t duration          = 0;
    /// Packed ISO-639-2/T language code.
    uint16_t language = 0;
};

/// `hdlr`
struct HandlerReference final {
    uint8_t version      = 0;
    uint32_t flags       = 0;
    uint32_t pre_defined = 0;
    uint32_t handler_type = 0;
    std::array<uint32_t, 3> reserved {};
    std::string name;
};

/// `url ` / `urn ` data entry (location bytes kept verbatim).
struct DataEntry final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<std::byte> data;
};

/**
 * \brief One `dref` entry.
 *
 * For `url `/`urn ` entries `entry` holds the decoded full-box fields; any
 * other entry type keeps its whole payload in `entry.data` with version and
 * flags left at 0.
 */
struct DataReferenceEntry final {
    uint32_t type = 0;
    DataEntry entry;
};

/// `dref`
struct DataReference final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<DataReferenceEntry> entries;
};

/// One `stsd` entry: format code plus the opaque codec-specific payload.
struct SampleEntry final {
    uint32_t format                = 0;
    uint16_t data_reference_index = 1;
    std::vector<std::byte> data;
};

/// `stsd`
struct SampleDescription final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<SampleEntry> entries;
};

/// `stsz` (`sample_size != 0` means every sample has that size and `entries` is empty).
struct SampleSize final {
    uint8_t version       = 0;
    uint32_t flags        = 0;
    uint32_t sample_size  = 0;
    uint32_t sample_count = 0;
    std::vector<uint32_t> entries;
};

/// `stco` or `co64`; the box type decides the on-disk width.
struct ChunkOffsets final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<uint64_t> entries;
};

struct TimeToSampleEntry final {
    uint32_t sample_count = 0;
    uint32_t sample_delta = 0;
};

/// `stts`
struct TimeToSample final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<TimeToSampleEntry> entries;
};

struct CompositionOffsetEntry final {
    uint32_t sample_count = 0;
    /// Unsigned on disk for version 0, signed for version 1.
    int64_t sample_offset = 0;
};

/// `ctts`
struct CompositionOffset final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<CompositionOffsetEntry> entries;
};

struct SampleToChunkEntry final {
    uint32_t first_chunk              = 0;
    uint32_t samples_per_chunk        = 0;
    uint32_t sample_description_index = 0;
};

/// `stsc`
struct SampleToChunk final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<SampleToChunkEntry> entries;
};

/// `stss` (1-based sample numbers in increasing order).
struct SyncSample final {
    uint8_t version = 0;
    uint32_t flags  = 0;
    std::vector<uint32_t> entries;
};

/// Decoded payload of a leaf box.
using LeafData
    = std::variant<MovieHeader, TrackHeader, EditList, MediaHeader,
                   HandlerReference, DataReference, DataEntry,
                   SampleDescription, SampleSize, ChunkOffsets, TimeToSample,
                   CompositionOffset, SampleToChunk, SyncSample>;

/// Leaf field layouts known to the schema.
enum class LeafLayout : uint8_t {
    MovieHeader,
    TrackHeader,
    EditList,
    MediaHeader,
    HandlerReference,
    DataReference,
    DataEntryUrl,
    DataEntryUrn,
    SampleDescription,
    SampleSize,
    ChunkOffset,
    ChunkLargeOffset,
    TimeToSample,
    CompositionOffset,
    SampleToChunk,
    SyncSample,
};

enum class BoxKind : uint8_t {
    /// Unrecognized or unparsed; payload kept as bytes.
    Opaque,
    Container,
    Leaf,
};

/// Node of a decoded box tree.
struct Box final {
    uint32_t type = 0;
    BoxKind kind  = BoxKind::Opaque;
    /// Children of a container box.
    std::vector<Box> children;
    /// Payload of a leaf box.
    LeafData leaf;
    /// Payload of an opaque box.
    std::vector<std::byte> data;
};

Box
make_container_box(uint32_t type, std::vector<Box> children);

Box
make_leaf_box(uint32_t type, LeafData leaf);

Box
make_opaque_box(uint32_t type, std::vector<std::byte> data);

/// Returns the leaf payload as `T`, or nullptr for another kind/alternative.
template<typename T>
const T*
leaf_as(const Box& box) noexcept
{
    if (box.kind != BoxKind::Leaf) {
        return nullptr;
    }
    return std::get_if<T>(&box.leaf);
}

template<typename T>
T*
leaf_as(Box& box) noexcept
{
    if (box.kind != BoxKind::Leaf) {
        return nullptr;
    }
    return std::get_if<T>(&box.leaf);
}

struct BoxSchema;

/// One schema row: a box type mapped to a container or a leaf layout.
struct BoxSchemaEntry final {
    uint32_t type = 0;
    BoxKind kind  = BoxKind::Opaque;
    /// Valid when `kind == Leaf`.
    LeafLayout layout = LeafLayout::MovieHeader;
    /// Valid when `kind == Container`.
    const BoxSchema* children = nullptr;
};

/// One nesting level of the schema; types not listed decode as opaque.
struct BoxSchema final {
    std::span<const BoxSchemaEntry> entries;

    const BoxSchemaEntry* find(uint32_t type) const noexcept;
};

/// Top level of a file: `moov` with full sample tables.
const BoxSchema&
mp4_schema() noexcept;

/// Top level of a file: `moov` with `stbl` left opaque.
const BoxSchema&
mp4_without_stbl_schema() noexcept;

/// Children of `moov` (full sample tables).
const BoxSchema&
moov_schema() noexcept;

/// Children of `moov` with `stbl` left opaque.
const BoxSchema&
moov_without_stbl_schema() noexcept;

/// Children of `stbl`.
const BoxSchema&
stbl_schema() noexcept;

/// Decodes a leaf payload (no box header). Trailing bytes are ignored.
BoxStatus
decode_leaf_payload(LeafLayout layout, std::span<const std::byte> payload,
                    LeafData* out) noexcept;

/// Appends the encoded leaf payload (no box header) to \p out.
BoxStatus
encode_leaf_payload(LeafLayout layout, const LeafData& leaf,
                    std::vector<std::byte>* out) noexcept;

/**
 * \brief Parse-only decoder.
 *
 * Accepts 32-bit, 64-bit and (at the top level, when requested) EOF-extended
 * box sizes. Trees it produces are meant for inspection; re-encoding goes
 * through \ref BoxEncoder, which recomputes every size.
 */
class BoxDecoder final {
public:
    explicit BoxDecoder(const BoxSchema& schema,
                        const BoxParseLimits& limits = BoxParseLimits {}) noexcept;

    /**
     * \brief Decodes consecutive boxes filling \p bytes.
     *
     * Fewer trailing bytes than a box header are ignored (common `udta`
     * terminator). A declared size beyond the available bytes is
     * \ref BoxStatus::OutOfRange; a leaf payload that does not match its
     * layout is \ref BoxStatus::Malformed.
     */
    BoxStatus decode_box_list(std::span<const std::byte> bytes,
                              bool extend_eof, std::vector<Box>* out) const
        noexcept;

    /// Decodes the first box in \p bytes.
    BoxStatus decode_box(std::span<const std::byte> bytes, bool extend_eof,
                         Box* out) const noexcept;

private:
    BoxStatus decode_list(std::span<const std::byte> bytes,
                          const BoxSchema& schema, bool extend_eof,
                          uint32_t depth, uint32_t* count,
                          std::vector<Box>* out) const noexcept;

    const BoxSchema* schema_ = nullptr;
    BoxParseLimits limits_;
};

/**
 * \brief Encoder that emits 32-bit box headers only.
 *
 * Each box must agree with the schema: listed containers must be
 * \ref BoxKind::Container, listed leaves must carry the matching \ref LeafData
 * alternative, unlisted types must be \ref BoxKind::Opaque; otherwise
 * \ref BoxStatus::Malformed. A box longer than `UINT32_MAX` bytes is
 * \ref BoxStatus::SizeOverflow.
 */
class BoxEncoder final {
public:
    explicit BoxEncoder(const BoxSchema& schema) noexcept;

    /// Appends the encoded box to \p out.
    BoxStatus encode_box(const Box& box, std::vector<std::byte>* out) const
        noexcept;

    /// Appends every box of \p boxes to \p out.
    BoxStatus encode_box_list(std::span<const Box> boxes,
                              std::vector<std::byte>* out) const noexcept;

private:
    const BoxSchema* schema_ = nullptr;
};

/**
 * \brief Finds the first box matching \p path in a decoded tree.
 *
 * Unlike the stream lookups, siblings are retried when a matching subtree
 * does not contain the rest of the path.
 */
const Box*
find_box_at_path(const std::vector<Box>& boxes,
                 std::span<const uint32_t> path) noexcept;

Box*
find_box_at_path(std::vector<Box>& boxes,
                 std::span<const uint32_t> path) noexcept;

/// As \ref find_box_at_path, but a missing path is \ref BoxStatus::NotFound.
BoxStatus
find_box_at_pathx(const std::vector<Box>& boxes,
                  std::span<const uint32_t> path, const Box** out) noexcept;

}  // namespace openmotion
