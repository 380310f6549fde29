#include "openmotion/box_reader.h"

#include "byte_io_internal.h"

#include <algorithm>
#include <limits>

namespace openmotion {

std::string
fourcc_to_string(uint32_t code)
{
    std::string s(4, '.');
    for (uint32_t i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>((code >> (24 - 8 * i)) & 0xFF);
        if (c >= 0x20 && c < 0x7F) {
            s[i] = static_cast<char>(c);
        }
    }
    return s;
}


const char*
box_status_name(BoxStatus status) noexcept
{
    switch (status) {
    case BoxStatus::Ok: return "ok";
    case BoxStatus::OutOfRange: return "out_of_range";
    case BoxStatus::NotFound: return "not_found";
    case BoxStatus::Malformed: return "malformed";
    case BoxStatus::IoError: return "io_error";
    case BoxStatus::SizeOverflow: return "size_overflow";
    case BoxStatus::LimitExceeded: return "limit_exceeded";
    case BoxStatus::InternalError: return "internal_error";
    }
    return "unknown";
}

namespace {

    // Reads up to `want` bytes, clipped against `*remain` (-1 = unbounded),
    // and charges what was read to `*remain`.
    static BoxStatus read_clipped(ByteSource& stream, std::byte* dst,
                                  uint64_t want, int64_t* remain,
                                  uint64_t* got) noexcept
    {
        if (*remain != kUnboundedSize) {
            want = std::min<uint64_t>(want, static_cast<uint64_t>(*remain));
        }
        *got = 0;
        if (want == 0) {
            return BoxStatus::Ok;
        }
        if (read_fully(stream, std::span<std::byte>(dst, want), got)
            != IoStatus::Ok) {
            return BoxStatus::IoError;
        }
        if (*remain != kUnboundedSize) {
            *remain -= static_cast<int64_t>(*got);
        }
        return BoxStatus::Ok;
    }


    static bool contains_type(std::span<const uint32_t> types,
                              uint32_t type) noexcept
    {
        return std::find(types.begin(), types.end(), type) != types.end();
    }


    static BoxStatus seek_to(ByteSource& stream, uint64_t pos) noexcept
    {
        if (pos > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return BoxStatus::OutOfRange;
        }
        return stream.seek(static_cast<int64_t>(pos), SeekWhence::Set, nullptr)
                       == IoStatus::Ok
                   ? BoxStatus::Ok
                   : BoxStatus::IoError;
    }

}  // namespace

BoxStatus
parse_box_header(ByteSource& stream, int64_t max_size, bool extend_eof,
                 BoxHeader* out) noexcept
{
    if (!out || max_size < kUnboundedSize) {
        return BoxStatus::Malformed;
    }

    BoxHeader h;
    h.offset       = stream.tell();
    int64_t remain = max_size;

    std::byte buf[8];
    uint64_t got     = 0;
    BoxStatus status = read_clipped(stream, buf, 4, &remain, &got);
    if (status != BoxStatus::Ok) {
        return status;
    }
    if (got == 0) {
        *out = h;
        return BoxStatus::Ok;
    }
    if (got < 4) {
        return BoxStatus::OutOfRange;
    }
    const std::span<const std::byte> view(buf, sizeof(buf));
    (void)read_u32be(view, 0, &h.size32);

    status = read_clipped(stream, buf, 4, &remain, &got);
    if (status != BoxStatus::Ok) {
        return status;
    }
    if (got < 4) {
        return BoxStatus::OutOfRange;
    }
    (void)read_u32be(view, 0, &h.type);

    h.header_size = 8;
    h.box_size    = h.size32;
    if (h.size32 == 1) {
        status = read_clipped(stream, buf, 8, &remain, &got);
        if (status != BoxStatus::Ok) {
            return status;
        }
        if (got < 8) {
            return BoxStatus::OutOfRange;
        }
        (void)read_u64be(view, 0, &h.box_size);
        h.header_size = 16;
    }

    if (extend_eof && h.size32 == 0) {
        h.maxsize = remain;
    } else {
        if (h.box_size < h.header_size) {
            return BoxStatus::OutOfRange;
        }
        const uint64_t data_size = h.box_size - h.header_size;
        if (data_size > static_cast<uint64_t>(
                            std::numeric_limits<int64_t>::max())) {
            return BoxStatus::OutOfRange;
        }
        if (remain != kUnboundedSize
            && data_size > static_cast<uint64_t>(remain)) {
            return BoxStatus::OutOfRange;
        }
        h.maxsize = static_cast<int64_t>(data_size);
    }

    *out = h;
    return BoxStatus::Ok;
}


BoxIterator::BoxIterator(ByteSource& stream, int64_t max_size,
                         bool extend_eof) noexcept
    : stream_(&stream)
    , max_size_(max_size)
    , extend_eof_(extend_eof)
{
}


BoxStatus
BoxIterator::next(BoxHeader* out, bool* has_box) noexcept
{
    if (!out || !has_box) {
        return BoxStatus::Malformed;
    }
    *has_box = false;
    if (finished_) {
        return BoxStatus::Ok;
    }

    if (started_) {
        BoxStatus status = BoxStatus::Ok;
        if (extend_eof_ && current_.size32 == 0) {
            if (max_size_ == kUnboundedSize) {
                status = stream_->seek(0, SeekWhence::End, nullptr)
                                 == IoStatus::Ok
                             ? BoxStatus::Ok
                             : BoxStatus::IoError;
            } else {
                status = seek_to(*stream_, current_.offset
                                               + static_cast<uint64_t>(
                                                   max_size_));
            }
            max_size_ = 0;
        } else {
            status = seek_to(*stream_, current_.offset + current_.box_size);
            if (status == BoxStatus::Ok && max_size_ != kUnboundedSize) {
                if (current_.box_size > static_cast<uint64_t>(max_size_)) {
                    status = BoxStatus::OutOfRange;
                } else {
                    max_size_ -= static_cast<int64_t>(current_.box_size);
                }
            }
        }
        if (status != BoxStatus::Ok) {
            finished_ = true;
            return status;
        }
    }
    started_ = true;

    BoxHeader h;
    const BoxStatus status = parse_box_header(*stream_, max_size_, extend_eof_,
                                              &h);
    if (status != BoxStatus::Ok) {
        finished_ = true;
        return status;
    }
    if (h.header_size == 0) {
        finished_ = true;
        return BoxStatus::Ok;
    }

    current_ = h;
    *out     = h;
    *has_box = true;
    return BoxStatus::Ok;
}

namespace {

    struct WalkState final {
        std::span<const uint32_t> container_types;
        BoxVisitor* visitor = nullptr;
        BoxParseLimits limits;
        uint32_t boxes = 0;
        bool stopped   = false;
    };


    static BoxStatus walk_boxes(ByteSource& stream, int64_t max_size,
                                uint32_t depth, WalkState* state) noexcept
    {
        if (depth > state->limits.max_depth) {
            return BoxStatus::LimitExceeded;
        }

        BoxIterator it(stream, max_size, depth == 0);
        for (;;) {
            BoxHeader h;
            bool has_box     = false;
            BoxStatus status = it.next(&h, &has_box);
            if (status != BoxStatus::Ok) {
                return status;
            }
            if (!has_box) {
                return BoxStatus::Ok;
            }
            state->boxes += 1;
            if (state->boxes > state->limits.max_boxes) {
                return BoxStatus::LimitExceeded;
            }

            if (!state->visitor->on_box(h, depth, stream)) {
                state->stopped = true;
                return BoxStatus::Ok;
            }
            if (contains_type(state->container_types, h.type)) {
                status = seek_to(stream, h.offset + h.header_size);
                if (status != BoxStatus::Ok) {
                    return status;
                }
                status = walk_boxes(stream, h.maxsize, depth + 1, state);
                if (status != BoxStatus::Ok || state->stopped) {
                    return status;
                }
            }
        }
    }


    static BoxStatus walk_path(ByteSource& stream,
                               std::span<const BoxPathSegment> path,
                               int64_t max_size, uint32_t depth,
                               BoxVisitor& visitor, bool* stopped) noexcept
    {
        if (path.empty()) {
            return BoxStatus::Ok;
        }

        BoxIterator it(stream, max_size, depth == 0);
        for (;;) {
            BoxHeader h;
            bool has_box     = false;
            BoxStatus status = it.next(&h, &has_box);
            if (status != BoxStatus::Ok) {
                return status;
            }
            if (!has_box) {
                return BoxStatus::Ok;
            }
            if (!contains_type(path.front(), h.type)) {
                continue;
            }
            if (path.size() == 1) {
                if (!visitor.on_box(h, depth, stream)) {
                    *stopped = true;
                    return BoxStatus::Ok;
                }
                continue;
            }
            status = seek_to(stream, h.offset + h.header_size);
            if (status != BoxStatus::Ok) {
                return status;
            }
            status = walk_path(stream, path.subspan(1), h.maxsize, depth + 1,
                               visitor, stopped);
            if (status != BoxStatus::Ok || *stopped) {
                return status;
            }
        }
    }


    // First match only: once the first segment matches, the lookup commits
    // to that box and does not retry later siblings.
    static BoxStatus path_first(ByteSource& stream,
                                std::span<const uint32_t> path,
                                int64_t max_size, uint32_t depth,
                                BoxHeader* out, bool* found) noexcept
    {
        *found = false;
        if (path.empty()) {
            return BoxStatus::Ok;
        }

        BoxIterator it(stream, max_size, depth == 0);
        for (;;) {
            BoxHeader h;
            bool has_box     = false;
            BoxStatus status = it.next(&h, &has_box);
            if (status != BoxStatus::Ok) {
                return status;
            }
            if (!has_box) {
                return BoxStatus::Ok;
            }
            if (h.type != path.front()) {
                continue;
            }
            status = seek_to(stream, h.offset + h.header_size);
            if (status != BoxStatus::Ok) {
                return status;
            }
            if (path.size() == 1) {
                *out   = h;
                *found = true;
                return BoxStatus::Ok;
            }
            return path_first(stream, path.subspan(1), h.maxsize, depth + 1,
                              out, found);
        }
    }


    static BoxStatus data_first(ByteSource& stream,
                                std::span<const uint32_t> path,
                                int64_t max_size, uint32_t depth,
                                std::vector<std::byte>* out, bool* found,
                                const BoxParseLimits& limits) noexcept
    {
        if (!out || !found) {
            return BoxStatus::Malformed;
        }
        BoxHeader h;
        const BoxStatus status = path_first(stream, path, max_size, depth, &h,
                                            found);
        if (status != BoxStatus::Ok || !*found) {
            return status;
        }
        return read_box_payload(stream, h, out, limits);
    }

}  // namespace

BoxStatus
parse_boxes_recursive(ByteSource& stream, int64_t max_size,
                      std::span<const uint32_t> container_types,
                      BoxVisitor& visitor,
                      const BoxParseLimits& limits) noexcept
{
    WalkState state;
    state.container_types = container_types;
    state.visitor         = &visitor;
    state.limits          = limits;
    return walk_boxes(stream, max_size, 0, &state);
}


BoxStatus
parse_path(ByteSource& stream, std::span<const BoxPathSegment> path,
           int64_t max_size, uint32_t depth, BoxVisitor& visitor) noexcept
{
    bool stopped = false;
    return walk_path(stream, path, max_size, depth, visitor, &stopped);
}


BoxStatus
parse_box_path_first(ByteSource& stream, std::span<const uint32_t> path,
                     int64_t max_size, BoxHeader* out, bool* found) noexcept
{
    if (!out || !found) {
        return BoxStatus::Malformed;
    }
    return path_first(stream, path, max_size, 1, out, found);
}


BoxStatus
parse_box_path_firstx(ByteSource& stream, std::span<const uint32_t> path,
                      int64_t max_size, BoxHeader* out) noexcept
{
    bool found             = false;
    const BoxStatus status = parse_box_path_first(stream, path, max_size, out,
                                                  &found);
    if (status != BoxStatus::Ok) {
        return status;
    }
    return found ? BoxStatus::Ok : BoxStatus::NotFound;
}


BoxStatus
parse_mp4_data_first(ByteSource& stream, std::span<const uint32_t> path,
                     std::vector<std::byte>* out, bool* found,
                     int64_t max_size, const BoxParseLimits& limits) noexcept
{
    return data_first(stream, path, max_size, 0, out, found, limits);
}


BoxStatus
parse_mp4_data_firstx(ByteSource& stream, std::span<const uint32_t> path,
                      std::vector<std::byte>* out, int64_t max_size,
                      const BoxParseLimits& limits) noexcept
{
    bool found             = false;
    const BoxStatus status = data_first(stream, path, max_size, 0, out, &found,
                                        limits);
    if (status != BoxStatus::Ok) {
        return status;
    }
    return found ? BoxStatus::Ok : BoxStatus::NotFound;
}


BoxStatus
parse_box_data_first(ByteSource& stream, std::span<const uint32_t> path,
                     std::vector<std::byte>* out, bool* found,
                     int64_t max_size, const BoxParseLimits& limits) noexcept
{
    return data_first(stream, path, max_size, 1, out, found, limits);
}


BoxStatus
parse_box_data_firstx(ByteSource& stream, std::span<const uint32_t> path,
                      std::vector<std::byte>* out, int64_t max_size,
                      const BoxParseLimits& limits) noexcept
{
    bool found             = false;
    const BoxStatus status = data_first(stream, path, max_size, 1, out, &found,
                                        limits);
    if (status != BoxStatus::Ok) {
        return status;
    }
    return found ? BoxStatus::Ok : BoxStatus::NotFound;
}


BoxStatus
read_box_payload(ByteSource& stream, const BoxHeader& header,
                 std::vector<std::byte>* out,
                 const BoxParseLimits& limits) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }

    uint64_t want = 0;
    if (header.maxsize == kUnboundedSize) {
        uint64_t total = 0;
        if (stream_size(stream, &total) != IoStatus::Ok) {
            return BoxStatus::IoError;
        }
        const uint64_t pos = stream.tell();
        want               = total > pos ? total - pos : 0;
    } else {
        want = static_cast<uint64_t>(header.maxsize);
    }
    if (want > limits.max_box_data_bytes) {
        return BoxStatus::LimitExceeded;
    }

    out->resize(static_cast<size_t>(want));
    uint64_t got = 0;
    if (read_fully(stream, std::span<std::byte>(out->data(), out->size()),
                   &got)
        != IoStatus::Ok) {
        out->clear();
        return BoxStatus::IoError;
    }
    if (got < want) {
        out->resize(static_cast<size_t>(got));
        return BoxStatus::OutOfRange;
    }
    return BoxStatus::Ok;
}

}  // namespace openmotion
