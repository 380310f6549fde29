#include "openmotion/movie_box.h"

#include <array>
#include <utility>

namespace openmotion {
namespace {

    static constexpr uint32_t kTrak = fourcc('t', 'r', 'a', 'k');

    template<typename T, size_t N>
    static const T* find_leaf(const std::vector<Box>& boxes,
                              const std::array<uint32_t, N>& path) noexcept
    {
        const Box* box = find_box_at_path(boxes, path);
        return box ? leaf_as<T>(*box) : nullptr;
    }

}  // namespace


TrackBox::TrackBox(const std::vector<Box>* trak_children) noexcept
    : children_(trak_children)
{
}


const TrackHeader*
TrackBox::tkhd() const noexcept
{
    if (!children_) {
        return nullptr;
    }
    static constexpr std::array<uint32_t, 1> kPath = {
        fourcc('t', 'k', 'h', 'd'),
    };
    return find_leaf<TrackHeader>(*children_, kPath);
}


const MediaHeader*
TrackBox::mdhd() const noexcept
{
    if (!children_) {
        return nullptr;
    }
    static constexpr std::array<uint32_t, 2> kPath = {
        fourcc('m', 'd', 'i', 'a'),
        fourcc('m', 'd', 'h', 'd'),
    };
    return find_leaf<MediaHeader>(*children_, kPath);
}


const HandlerReference*
TrackBox::hdlr() const noexcept
{
    if (!children_) {
        return nullptr;
    }
    static constexpr std::array<uint32_t, 2> kPath = {
        fourcc('m', 'd', 'i', 'a'),
        fourcc('h', 'd', 'l', 'r'),
    };
    return find_leaf<HandlerReference>(*children_, kPath);
}


const EditList*
TrackBox::elst() const noexcept
{
    if (!children_) {
        return nullptr;
    }
    static constexpr std::array<uint32_t, 2> kPath = {
        fourcc('e', 'd', 't', 's'),
        fourcc('e', 'l', 's', 't'),
    };
    return find_leaf<EditList>(*children_, kPath);
}


bool
TrackBox::is_video_track() const noexcept
{
    const HandlerReference* h = hdlr();
    return h && h->handler_type == fourcc('v', 'i', 'd', 'e');
}


BoxStatus
TrackBox::stbl_data(std::span<const std::byte>* out) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    *out = {};
    if (!children_) {
        return BoxStatus::NotFound;
    }
    static constexpr std::array<uint32_t, 3> kPath = {
        fourcc('m', 'd', 'i', 'a'),
        fourcc('m', 'i', 'n', 'f'),
        fourcc('s', 't', 'b', 'l'),
    };
    const Box* stbl = find_box_at_path(*children_, kPath);
    if (!stbl) {
        return BoxStatus::NotFound;
    }
    if (stbl->kind != BoxKind::Opaque) {
        return BoxStatus::Malformed;
    }
    *out = stbl->data;
    return BoxStatus::Ok;
}


BoxStatus
TrackBox::sample_descriptions(std::vector<SampleEntry>* out) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    out->clear();
    std::span<const std::byte> data;
    BoxStatus status = stbl_data(&data);
    if (status != BoxStatus::Ok) {
        return status;
    }

    // Only stsd is needed; leave the large tables opaque.
    static constexpr BoxSchemaEntry kStsdOnly[] = {
        BoxSchemaEntry { fourcc('s', 't', 's', 'd'), BoxKind::Leaf,
                         LeafLayout::SampleDescription, nullptr },
    };
    static constexpr BoxSchema kStsdSchema { kStsdOnly };

    std::vector<Box> boxes;
    const BoxDecoder decoder(kStsdSchema);
    status = decoder.decode_box_list(data, false, &boxes);
    if (status != BoxStatus::Ok) {
        return status;
    }
    static constexpr std::array<uint32_t, 1> kPath = {
        fourcc('s', 't', 's', 'd'),
    };
    const SampleDescription* stsd = find_leaf<SampleDescription>(boxes,
                                                                 kPath);
    if (!stsd) {
        return BoxStatus::NotFound;
    }
    *out = stsd->entries;
    return BoxStatus::Ok;
}


BoxStatus
TrackBox::raw_samples(StblSamples* out,
                      const SampleTableLimits& limits) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    std::span<const std::byte> data;
    const BoxStatus status = stbl_data(&data);
    if (status != BoxStatus::Ok) {
        return status;
    }
    return extract_raw_samples_from_stbl_data(data, out, limits);
}


BoxStatus
TrackBox::samples(StblSamples* table, std::vector<Sample>* out,
                  const SampleTableLimits& limits) const
{
    if (!table || !out) {
        return BoxStatus::Malformed;
    }
    out->clear();
    const MediaHeader* media = mdhd();
    if (!media) {
        return BoxStatus::NotFound;
    }
    const BoxStatus status = raw_samples(table, limits);
    if (status != BoxStatus::Ok) {
        return status;
    }
    *out = resolve_samples(table->samples, table->descriptions,
                           media->timescale);
    return BoxStatus::Ok;
}


BoxStatus
MovieBox::parse(std::span<const std::byte> moov_data,
                const BoxParseLimits& limits) noexcept
{
    children_.clear();
    const BoxDecoder decoder(moov_without_stbl_schema(), limits);
    const BoxStatus status = decoder.decode_box_list(moov_data, false,
                                                     &children_);
    if (status != BoxStatus::Ok) {
        children_.clear();
    }
    return status;
}


BoxStatus
MovieBox::parse_stream(ByteSource& stream,
                       const BoxParseLimits& limits) noexcept
{
    static constexpr std::array<uint32_t, 1> kMoov = {
        fourcc('m', 'o', 'o', 'v'),
    };
    std::vector<std::byte> moov;
    const BoxStatus status = parse_mp4_data_firstx(stream, kMoov, &moov,
                                                   kUnboundedSize, limits);
    if (status != BoxStatus::Ok) {
        children_.clear();
        return status;
    }
    return parse(moov, limits);
}


const MovieHeader*
MovieBox::mvhd() const noexcept
{
    static constexpr std::array<uint32_t, 1> kPath = {
        fourcc('m', 'v', 'h', 'd'),
    };
    return find_leaf<MovieHeader>(children_, kPath);
}


size_t
MovieBox::track_count() const noexcept
{
    size_t n = 0;
    for (const Box& b : children_) {
        if (b.type == kTrak && b.kind == BoxKind::Container) {
            n += 1;
        }
    }
    return n;
}


std::vector<TrackBox>
MovieBox::tracks() const
{
    std::vector<TrackBox> out;
    for (const Box& b : children_) {
        if (b.type == kTrak && b.kind == BoxKind::Container) {
            out.emplace_back(&b.children);
        }
    }
    return out;
}


BoxStatus
MovieBox::track_at(size_t index, TrackBox* out) const noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    size_t n = 0;
    for (const Box& b : children_) {
        if (b.type != kTrak || b.kind != BoxKind::Container) {
            continue;
        }
        if (n == index) {
            *out = TrackBox(&b.children);
            return BoxStatus::Ok;
        }
        n += 1;
    }
    return BoxStatus::OutOfRange;
}


BoxStatus
read_sample_data(ByteSource& stream, const RawSample& sample,
                 std::vector<std::byte>* out,
                 const BoxParseLimits& limits) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    out->clear();
    if (sample.size > limits.max_box_data_bytes) {
        return BoxStatus::LimitExceeded;
    }
    if (sample.offset > static_cast<uint64_t>(INT64_MAX)
        || stream.seek(static_cast<int64_t>(sample.offset), SeekWhence::Set,
                       nullptr)
               != IoStatus::Ok) {
        return BoxStatus::IoError;
    }
    out->resize(sample.size);
    uint64_t got = 0;
    if (read_fully(stream, *out, &got) != IoStatus::Ok) {
        out->clear();
        return BoxStatus::IoError;
    }
    if (got != sample.size) {
        out->clear();
        return BoxStatus::OutOfRange;
    }
    return BoxStatus::Ok;
}

}  // namespace openmotion
