#include "openmotion/mp4_builder.h"

#include "byte_io_internal.h"

#include <array>
#include <utility>

namespace openmotion {
namespace {

    static constexpr uint32_t kTrak = fourcc('t', 'r', 'a', 'k');
    static constexpr uint32_t kMoov = fourcc('m', 'o', 'o', 'v');

    static constexpr std::array<uint32_t, 3> kStblPath = {
        fourcc('m', 'd', 'i', 'a'),
        fourcc('m', 'i', 'n', 'f'),
        fourcc('s', 't', 'b', 'l'),
    };


    static bool is_trak(const Box& box) noexcept
    {
        return box.type == kTrak && box.kind == BoxKind::Container;
    }


    static BoxStatus trak_samples(const Box& trak, StblSamples* out,
                                  const SampleTableLimits& limits) noexcept
    {
        const Box* stbl = find_box_at_path(trak.children, kStblPath);
        if (!stbl) {
            return BoxStatus::NotFound;
        }
        if (stbl->kind != BoxKind::Opaque) {
            return BoxStatus::Malformed;
        }
        return extract_raw_samples_from_stbl_data(stbl->data, out, limits);
    }


    // Lays the samples of one trak out back to back from *sample_offset and
    // re-encodes its stbl.
    static BoxStatus reposition_samples(Box* trak, uint64_t* sample_offset,
                                        const SampleTableLimits& limits)
    {
        StblSamples table;
        BoxStatus status = trak_samples(*trak, &table, limits);
        if (status != BoxStatus::Ok) {
            return status;
        }
        for (RawSample& s : table.samples) {
            s.offset = *sample_offset;
            *sample_offset += s.size;
        }

        const std::vector<Box> stbl_children
            = build_stbl_from_raw_samples(table.descriptions, table.samples);
        std::vector<std::byte> encoded;
        const BoxEncoder encoder(stbl_schema());
        status = encoder.encode_box_list(stbl_children, &encoded);
        if (status != BoxStatus::Ok) {
            return status;
        }

        Box* stbl = find_box_at_path(trak->children, kStblPath);
        if (!stbl) {
            return BoxStatus::NotFound;
        }
        stbl->data = std::move(encoded);
        return BoxStatus::Ok;
    }


    static BoxStatus encode_moov(const std::vector<Box>& moov_children,
                                 std::vector<std::byte>* out)
    {
        out->clear();
        const Box moov = make_container_box(kMoov, moov_children);
        const BoxEncoder encoder(mp4_without_stbl_schema());
        return encoder.encode_box(moov, out);
    }


    static BoxStatus rebuild_moov(uint64_t moov_offset,
                                  std::vector<Box>* moov_children,
                                  uint64_t mdat_header_size,
                                  std::vector<std::byte>* out,
                                  const SampleTableLimits& limits)
    {
        // Pass 1: placeholder offsets from 0, to learn the encoded size.
        uint64_t sample_offset = 0;
        for (Box& box : *moov_children) {
            if (!is_trak(box)) {
                continue;
            }
            const BoxStatus status = reposition_samples(&box, &sample_offset,
                                                        limits);
            if (status != BoxStatus::Ok) {
                return status;
            }
        }
        std::vector<std::byte> measured;
        BoxStatus status = encode_moov(*moov_children, &measured);
        if (status != BoxStatus::Ok) {
            return status;
        }

        // Pass 2: real offsets. co64 entries are fixed width, so the size
        // must not change.
        sample_offset = moov_offset + measured.size() + mdat_header_size;
        for (Box& box : *moov_children) {
            if (!is_trak(box)) {
                continue;
            }
            status = reposition_samples(&box, &sample_offset, limits);
            if (status != BoxStatus::Ok) {
                return status;
            }
        }
        status = encode_moov(*moov_children, out);
        if (status != BoxStatus::Ok) {
            return status;
        }
        if (out->size() != measured.size()) {
            out->clear();
            return BoxStatus::InternalError;
        }
        return BoxStatus::Ok;
    }


    static bool keep_moov_child(const Box& box) noexcept
    {
        if (box.type == fourcc('m', 'v', 'h', 'd')) {
            return true;
        }
        if (!is_trak(box)) {
            return false;
        }
        static constexpr std::array<uint32_t, 2> kHdlrPath = {
            fourcc('m', 'd', 'i', 'a'),
            fourcc('h', 'd', 'l', 'r'),
        };
        const Box* hdlr = find_box_at_path(box.children, kHdlrPath);
        const HandlerReference* h = hdlr ? leaf_as<HandlerReference>(*hdlr)
                                         : nullptr;
        return h && h->handler_type == fourcc('v', 'i', 'd', 'e');
    }


    static BoxStatus renumber_tracks(std::vector<Box>* moov_children) noexcept
    {
        static constexpr std::array<uint32_t, 1> kTkhdPath = {
            fourcc('t', 'k', 'h', 'd'),
        };
        static constexpr std::array<uint32_t, 1> kMvhdPath = {
            fourcc('m', 'v', 'h', 'd'),
        };

        // Track IDs are never 0 and never reused.
        uint32_t track_id = 1;
        for (Box& box : *moov_children) {
            if (!is_trak(box)) {
                continue;
            }
            Box* tkhd_box = find_box_at_path(box.children, kTkhdPath);
            TrackHeader* tkhd = tkhd_box ? leaf_as<TrackHeader>(*tkhd_box)
                                         : nullptr;
            if (!tkhd) {
                return BoxStatus::NotFound;
            }
            tkhd->track_id = track_id;
            track_id += 1;
        }

        Box* mvhd_box     = find_box_at_path(*moov_children, kMvhdPath);
        MovieHeader* mvhd = mvhd_box ? leaf_as<MovieHeader>(*mvhd_box)
                                     : nullptr;
        if (!mvhd) {
            return BoxStatus::NotFound;
        }
        mvhd->next_track_id = track_id;
        return BoxStatus::Ok;
    }

}  // namespace


BoxStatus
iterate_samples(const std::vector<Box>& moov_children,
                std::vector<RawSample>* out,
                const SampleTableLimits& limits) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    out->clear();
    for (const Box& box : moov_children) {
        if (!is_trak(box)) {
            continue;
        }
        StblSamples table;
        const BoxStatus status = trak_samples(box, &table, limits);
        if (status != BoxStatus::Ok) {
            return status;
        }
        out->insert(out->end(), table.samples.begin(), table.samples.end());
    }
    return BoxStatus::Ok;
}


BoxStatus
find_movie_timescale(const std::vector<Box>& moov_children,
                     uint32_t* out) noexcept
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    static constexpr std::array<uint32_t, 1> kMvhdPath = {
        fourcc('m', 'v', 'h', 'd'),
    };
    const Box* box          = find_box_at_path(moov_children, kMvhdPath);
    const MovieHeader* mvhd = box ? leaf_as<MovieHeader>(*box) : nullptr;
    if (!mvhd) {
        return BoxStatus::NotFound;
    }
    *out = mvhd->timescale;
    return BoxStatus::Ok;
}


std::vector<std::byte>
build_mdat_header(uint64_t body_size)
{
    std::vector<std::byte> out;
    if (body_size + 8 > UINT32_MAX) {
        append_u32be(&out, 1);
        append_u32be(&out, fourcc('m', 'd', 'a', 't'));
        append_u64be(&out, body_size + 16);
    } else {
        append_u32be(&out, static_cast<uint32_t>(body_size + 8));
        append_u32be(&out, fourcc('m', 'd', 'a', 't'));
    }
    return out;
}


BoxStatus
build_mp4(std::span<const std::byte> ftyp_data,
          std::vector<Box>* moov_children,
          std::vector<std::unique_ptr<ByteSource>> sample_readers,
          ChainedIO* out, const SampleTableLimits& limits)
{
    if (!moov_children || !out) {
        return BoxStatus::Malformed;
    }

    std::vector<std::byte> ftyp;
    const BoxEncoder encoder(mp4_without_stbl_schema());
    BoxStatus status = encoder.encode_box(
        make_opaque_box(fourcc('f', 't', 'y', 'p'),
                        std::vector<std::byte>(ftyp_data.begin(),
                                               ftyp_data.end())),
        &ftyp);
    if (status != BoxStatus::Ok) {
        return status;
    }

    std::vector<RawSample> samples;
    status = iterate_samples(*moov_children, &samples, limits);
    if (status != BoxStatus::Ok) {
        return status;
    }
    uint64_t mdat_body_size = 0;
    for (const RawSample& s : samples) {
        mdat_body_size += s.size;
    }
    std::vector<std::byte> mdat_header = build_mdat_header(mdat_body_size);

    std::vector<std::byte> moov;
    status = rebuild_moov(ftyp.size(), moov_children, mdat_header.size(),
                          &moov, limits);
    if (status != BoxStatus::Ok) {
        return status;
    }

    std::vector<std::unique_ptr<ByteSource>> parts;
    parts.reserve(3 + sample_readers.size());
    parts.push_back(std::make_unique<MemorySource>(std::move(ftyp)));
    parts.push_back(std::make_unique<MemorySource>(std::move(moov)));
    parts.push_back(std::make_unique<MemorySource>(std::move(mdat_header)));
    for (std::unique_ptr<ByteSource>& reader : sample_readers) {
        parts.push_back(std::move(reader));
    }

    ChainedIO chained(std::move(parts));
    if (chained.init_status() != IoStatus::Ok) {
        return BoxStatus::IoError;
    }
    *out = std::move(chained);
    return BoxStatus::Ok;
}


BoxStatus
transform_mp4(ByteSource& source, SampleGenerator* generator, ChainedIO* out,
              const Mp4TransformOptions& options)
{
    if (!out) {
        return BoxStatus::Malformed;
    }

    static constexpr std::array<uint32_t, 1> kFtypPath = {
        fourcc('f', 't', 'y', 'p'),
    };
    static constexpr std::array<uint32_t, 1> kMoovPath = { kMoov };

    if (source.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return BoxStatus::IoError;
    }
    std::vector<std::byte> ftyp_data;
    BoxStatus status = parse_mp4_data_firstx(source, kFtypPath, &ftyp_data,
                                             kUnboundedSize,
                                             options.box_limits);
    if (status != BoxStatus::Ok) {
        return status;
    }

    if (source.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return BoxStatus::IoError;
    }
    std::vector<std::byte> moov_data;
    status = parse_mp4_data_firstx(source, kMoovPath, &moov_data,
                                   kUnboundedSize, options.box_limits);
    if (status != BoxStatus::Ok) {
        return status;
    }

    std::vector<Box> decoded;
    const BoxDecoder decoder(moov_without_stbl_schema(), options.box_limits);
    status = decoder.decode_box_list(moov_data, false, &decoded);
    if (status != BoxStatus::Ok) {
        return status;
    }

    std::vector<Box> moov_children;
    for (Box& box : decoded) {
        if (keep_moov_child(box)) {
            moov_children.push_back(std::move(box));
        }
    }

    std::vector<RawSample> source_samples;
    status = iterate_samples(moov_children, &source_samples,
                             options.sample_limits);
    if (status != BoxStatus::Ok) {
        return status;
    }
    std::vector<std::unique_ptr<ByteSource>> sample_readers;
    sample_readers.reserve(source_samples.size());
    for (const RawSample& s : source_samples) {
        sample_readers.push_back(
            std::make_unique<SlicedIO>(&source, s.offset, s.size));
    }

    if (generator) {
        status = generator->generate(source, &moov_children, &sample_readers);
        if (status != BoxStatus::Ok) {
            return status;
        }
    }

    status = renumber_tracks(&moov_children);
    if (status != BoxStatus::Ok) {
        return status;
    }

    return build_mp4(ftyp_data, &moov_children, std::move(sample_readers), out,
                     options.sample_limits);
}

}  // namespace openmotion
