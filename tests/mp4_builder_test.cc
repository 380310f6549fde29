#include "openmotion/mp4_builder.h"

#include "openmotion/movie_box.h"

#include "mp4_fixture.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace openmotion {
namespace {

    using fixture::fixture_bytes;

    static uint32_t read_u32be(std::span<const std::byte> bytes, size_t offset)
    {
        return (static_cast<uint32_t>(bytes[offset + 0]) << 24)
               | (static_cast<uint32_t>(bytes[offset + 1]) << 16)
               | (static_cast<uint32_t>(bytes[offset + 2]) << 8)
               | (static_cast<uint32_t>(bytes[offset + 3]) << 0);
    }


    static uint64_t read_u64be(std::span<const std::byte> bytes, size_t offset)
    {
        return (static_cast<uint64_t>(read_u32be(bytes, offset)) << 32)
               | read_u32be(bytes, offset + 4);
    }


    // Zero-filled stream of any length without backing storage.
    class ZeroSource final : public ByteSource {
    public:
        explicit ZeroSource(uint64_t size) noexcept
            : size_(size)
        {
        }

        IoStatus read(std::span<std::byte> out,
                      uint64_t* read_bytes) noexcept override
        {
            const uint64_t avail = pos_ < size_ ? size_ - pos_ : 0;
            const uint64_t n     = avail < out.size() ? avail : out.size();
            for (uint64_t i = 0; i < n; ++i) {
                out[i] = std::byte { 0 };
            }
            pos_ += n;
            *read_bytes = n;
            return IoStatus::Ok;
        }

        IoStatus seek(int64_t offset, SeekWhence whence,
                      uint64_t* new_pos) noexcept override
        {
            int64_t base = 0;
            if (whence == SeekWhence::Cur) {
                base = static_cast<int64_t>(pos_);
            } else if (whence == SeekWhence::End) {
                base = static_cast<int64_t>(size_);
            }
            if (base + offset < 0) {
                return IoStatus::InvalidArgument;
            }
            pos_ = static_cast<uint64_t>(base + offset);
            if (new_pos) {
                *new_pos = pos_;
            }
            return IoStatus::Ok;
        }

        uint64_t tell() const noexcept override { return pos_; }

    private:
        uint64_t size_ = 0;
        uint64_t pos_  = 0;
    };


    static Box track_with_samples(uint32_t handler,
                                  const std::vector<RawSample>& samples)
    {
        SampleEntry entry;
        entry.format = fourcc('t', 'e', 's', 't');
        const std::vector<SampleEntry> descriptions = { entry };
        std::vector<std::byte> stbl;
        EXPECT_EQ(BoxEncoder(stbl_schema())
                      .encode_box_list(build_stbl_from_raw_samples(descriptions,
                                                                   samples),
                                       &stbl),
                  BoxStatus::Ok);

        MediaHeader mdhd;
        mdhd.timescale = 1000;
        HandlerReference hdlr;
        hdlr.handler_type = handler;
        return make_container_box(
            fourcc('t', 'r', 'a', 'k'),
            { make_leaf_box(fourcc('t', 'k', 'h', 'd'), TrackHeader {}),
              make_container_box(
                  fourcc('m', 'd', 'i', 'a'),
                  { make_leaf_box(fourcc('m', 'd', 'h', 'd'), mdhd),
                    make_leaf_box(fourcc('h', 'd', 'l', 'r'), hdlr),
                    make_container_box(
                        fourcc('m', 'i', 'n', 'f'),
                        { make_opaque_box(fourcc('s', 't', 'b', 'l'),
                                          stbl) }) }) });
    }


    static std::vector<Box> movie_with(std::vector<Box> traks)
    {
        MovieHeader mvhd;
        mvhd.timescale = 1000;
        std::vector<Box> out = { make_leaf_box(fourcc('m', 'v', 'h', 'd'),
                                               mvhd) };
        for (Box& t : traks) {
            out.push_back(std::move(t));
        }
        return out;
    }


    static std::vector<std::byte> head_bytes(ByteSource& source, size_t n)
    {
        std::vector<std::byte> out(n);
        uint64_t got = 0;
        EXPECT_EQ(source.seek(0, SeekWhence::Set, nullptr), IoStatus::Ok);
        EXPECT_EQ(read_fully(source, out, &got), IoStatus::Ok);
        out.resize(static_cast<size_t>(got));
        return out;
    }


    // Appends the samples of a track produced from memory.
    class MemoryTrackGenerator final : public SampleGenerator {
    public:
        BoxStatus
        generate(ByteSource&, std::vector<Box>* moov_children,
                 std::vector<std::unique_ptr<ByteSource>>* readers) override
        {
            std::vector<RawSample> raw;
            for (const char* s : { "gen-1", "gen-22" }) {
                const std::vector<std::byte> bytes = fixture_bytes(s);
                RawSample r;
                r.size      = static_cast<uint32_t>(bytes.size());
                r.timedelta = 500;
                raw.push_back(r);
                readers->push_back(std::make_unique<MemorySource>(bytes));
            }
            moov_children->push_back(
                track_with_samples(fourcc('m', 'e', 't', 'a'), raw));
            return BoxStatus::Ok;
        }
    };

}  // namespace

TEST(Mp4Builder, MdatHeaderWidth)
{
    std::vector<std::byte> h = build_mdat_header(0);
    ASSERT_EQ(h.size(), 8U);
    EXPECT_EQ(read_u32be(h, 0), 8U);
    EXPECT_EQ(read_u32be(h, 4), fourcc('m', 'd', 'a', 't'));

    h = build_mdat_header(0xFFFFFFFFULL - 8);
    ASSERT_EQ(h.size(), 8U);
    EXPECT_EQ(read_u32be(h, 0), 0xFFFFFFFFU);

    h = build_mdat_header(0xFFFFFFFFULL - 7);
    ASSERT_EQ(h.size(), 16U);
    EXPECT_EQ(read_u32be(h, 0), 1U);
    EXPECT_EQ(read_u32be(h, 4), fourcc('m', 'd', 'a', 't'));
    EXPECT_EQ(read_u64be(h, 8), 0xFFFFFFFFULL - 7 + 16);
}


TEST(Mp4Builder, IteratesSamplesInTrackOrder)
{
    RawSample a;
    a.offset = 100;
    a.size   = 3;
    RawSample b;
    b.offset = 50;
    b.size   = 7;
    const std::vector<Box> moov
        = movie_with({ track_with_samples(fourcc('v', 'i', 'd', 'e'), { a }),
                       track_with_samples(fourcc('s', 'o', 'u', 'n'),
                                          { b }) });

    std::vector<RawSample> samples;
    ASSERT_EQ(iterate_samples(moov, &samples), BoxStatus::Ok);
    ASSERT_EQ(samples.size(), 2U);
    EXPECT_EQ(samples[0].offset, 100U);
    EXPECT_EQ(samples[1].size, 7U);

    uint32_t timescale = 0;
    ASSERT_EQ(find_movie_timescale(moov, &timescale), BoxStatus::Ok);
    EXPECT_EQ(timescale, 1000U);
    EXPECT_EQ(find_movie_timescale({}, &timescale), BoxStatus::NotFound);

    const std::vector<Box> no_stbl = {
        make_container_box(fourcc('t', 'r', 'a', 'k'), {}),
    };
    EXPECT_EQ(iterate_samples(no_stbl, &samples), BoxStatus::NotFound);
}


TEST(Mp4Builder, EmptyMovie)
{
    std::vector<Box> moov = movie_with(
        { track_with_samples(fourcc('v', 'i', 'd', 'e'), {}) });
    ChainedIO out;
    ASSERT_EQ(build_mp4(fixture::fixture_ftyp_payload(), &moov, {}, &out),
              BoxStatus::Ok);

    std::vector<std::byte> bytes;
    ASSERT_EQ(read_to_end(out, &bytes), IoStatus::Ok);
    ASSERT_GE(bytes.size(), 8U);
    EXPECT_EQ(read_u32be(bytes, 4), fourcc('f', 't', 'y', 'p'));
    const size_t moov_at = read_u32be(bytes, 0);
    EXPECT_EQ(read_u32be(bytes, moov_at + 4), fourcc('m', 'o', 'o', 'v'));
    const size_t mdat_at = moov_at + read_u32be(bytes, moov_at);
    ASSERT_EQ(bytes.size(), mdat_at + 8);
    EXPECT_EQ(read_u32be(bytes, mdat_at), 8U);
    EXPECT_EQ(read_u32be(bytes, mdat_at + 4), fourcc('m', 'd', 'a', 't'));
}


TEST(Mp4Builder, OffsetsPointIntoMdat)
{
    RawSample a;
    a.size = 3;
    RawSample b;
    b.size = 5;
    std::vector<Box> moov = movie_with(
        { track_with_samples(fourcc('v', 'i', 'd', 'e'), { a, b }) });
    std::vector<std::unique_ptr<ByteSource>> readers;
    readers.push_back(std::make_unique<MemorySource>(fixture_bytes("abc")));
    readers.push_back(std::make_unique<MemorySource>(fixture_bytes("defgh")));

    ChainedIO out;
    ASSERT_EQ(build_mp4(fixture::fixture_ftyp_payload(), &moov,
                        std::move(readers), &out),
              BoxStatus::Ok);
    std::vector<std::byte> bytes;
    ASSERT_EQ(read_to_end(out, &bytes), IoStatus::Ok);
    MemorySource file(bytes);

    MovieBox parsed;
    ASSERT_EQ(parsed.parse_stream(file), BoxStatus::Ok);
    TrackBox track;
    ASSERT_EQ(parsed.track_at(0, &track), BoxStatus::Ok);
    StblSamples table;
    ASSERT_EQ(track.raw_samples(&table), BoxStatus::Ok);
    ASSERT_EQ(table.samples.size(), 2U);
    EXPECT_EQ(table.samples[0].offset + 3 + 5, bytes.size());
    EXPECT_EQ(table.samples[1].offset, table.samples[0].offset + 3);

    std::vector<std::byte> data;
    ASSERT_EQ(read_sample_data(file, table.samples[1], &data), BoxStatus::Ok);
    EXPECT_EQ(data, fixture_bytes("defgh"));
}


TEST(Mp4Builder, LargeMdatUsesExtendedHeader)
{
    RawSample a;
    a.size = 3000000000U;
    RawSample b;
    b.size = 2000000000U;
    std::vector<Box> moov = movie_with(
        { track_with_samples(fourcc('v', 'i', 'd', 'e'), { a, b }) });
    std::vector<std::unique_ptr<ByteSource>> readers;
    readers.push_back(std::make_unique<ZeroSource>(a.size));
    readers.push_back(std::make_unique<ZeroSource>(b.size));

    ChainedIO out;
    ASSERT_EQ(build_mp4(fixture::fixture_ftyp_payload(), &moov,
                        std::move(readers), &out),
              BoxStatus::Ok);

    const std::vector<std::byte> head = head_bytes(out, 4096);
    const size_t moov_at = read_u32be(head, 0);
    const size_t mdat_at = moov_at + read_u32be(head, moov_at);
    ASSERT_LT(mdat_at + 16, head.size());
    EXPECT_EQ(read_u32be(head, mdat_at), 1U);
    EXPECT_EQ(read_u32be(head, mdat_at + 4), fourcc('m', 'd', 'a', 't'));
    EXPECT_EQ(read_u64be(head, mdat_at + 8), 5000000000ULL + 16);

    uint64_t total = 0;
    ASSERT_EQ(stream_size(out, &total), IoStatus::Ok);
    EXPECT_EQ(total, mdat_at + 16 + 5000000000ULL);

    MovieBox parsed;
    ASSERT_EQ(parsed.parse(std::span<const std::byte>(head).subspan(
                  moov_at + 8, read_u32be(head, moov_at) - 8)),
              BoxStatus::Ok);
    TrackBox track;
    ASSERT_EQ(parsed.track_at(0, &track), BoxStatus::Ok);
    StblSamples table;
    ASSERT_EQ(track.raw_samples(&table), BoxStatus::Ok);
    ASSERT_EQ(table.samples.size(), 2U);
    EXPECT_EQ(table.samples[0].offset, mdat_at + 16);
    EXPECT_EQ(table.samples[1].offset, mdat_at + 16 + 3000000000ULL);
}


TEST(Mp4Builder, TransformKeepsVideoTracks)
{
    fixture::FixtureFile file;
    fixture::FixtureTrack audio;
    audio.handler = fourcc('s', 'o', 'u', 'n');
    audio.samples = { fixture_bytes("aaaa") };
    file.tracks.push_back(audio);
    fixture::FixtureTrack video;
    video.samples = { fixture_bytes("v-one"), fixture_bytes("v-two") };
    file.tracks.push_back(video);
    file.extra_moov_children.push_back(make_container_box(
        fourcc('t', 'r', 'a', 'k'),
        { make_leaf_box(fourcc('t', 'k', 'h', 'd'), TrackHeader {}) }));
    file.extra_moov_children.push_back(
        make_container_box(fourcc('u', 'd', 't', 'a'), {}));
    MemorySource source(fixture::build_fixture_mp4(file));

    ChainedIO out;
    ASSERT_EQ(transform_mp4(source, nullptr, &out), BoxStatus::Ok);
    std::vector<std::byte> bytes;
    ASSERT_EQ(read_to_end(out, &bytes), IoStatus::Ok);
    MemorySource rewritten(bytes);

    MovieBox moov;
    ASSERT_EQ(moov.parse_stream(rewritten), BoxStatus::Ok);
    ASSERT_EQ(moov.children().size(), 2U);
    ASSERT_EQ(moov.track_count(), 1U);
    EXPECT_EQ(moov.mvhd()->next_track_id, 2U);
    TrackBox track;
    ASSERT_EQ(moov.track_at(0, &track), BoxStatus::Ok);
    EXPECT_TRUE(track.is_video_track());
    EXPECT_EQ(track.tkhd()->track_id, 1U);

    StblSamples table;
    ASSERT_EQ(track.raw_samples(&table), BoxStatus::Ok);
    ASSERT_EQ(table.samples.size(), 2U);
    std::vector<std::byte> data;
    ASSERT_EQ(read_sample_data(rewritten, table.samples[0], &data),
              BoxStatus::Ok);
    EXPECT_EQ(data, fixture_bytes("v-one"));
    ASSERT_EQ(read_sample_data(rewritten, table.samples[1], &data),
              BoxStatus::Ok);
    EXPECT_EQ(data, fixture_bytes("v-two"));
}


TEST(Mp4Builder, TransformAppendsGeneratedTrack)
{
    fixture::FixtureFile file;
    fixture::FixtureTrack video;
    video.samples = { fixture_bytes("frame") };
    file.tracks.push_back(video);
    MemorySource source(fixture::build_fixture_mp4(file));

    MemoryTrackGenerator generator;
    ChainedIO out;
    ASSERT_EQ(transform_mp4(source, &generator, &out), BoxStatus::Ok);
    std::vector<std::byte> bytes;
    ASSERT_EQ(read_to_end(out, &bytes), IoStatus::Ok);
    MemorySource rewritten(bytes);

    MovieBox moov;
    ASSERT_EQ(moov.parse_stream(rewritten), BoxStatus::Ok);
    ASSERT_EQ(moov.track_count(), 2U);
    EXPECT_EQ(moov.mvhd()->next_track_id, 3U);

    TrackBox generated;
    ASSERT_EQ(moov.track_at(1, &generated), BoxStatus::Ok);
    EXPECT_EQ(generated.tkhd()->track_id, 2U);
    StblSamples table;
    std::vector<Sample> samples;
    ASSERT_EQ(generated.samples(&table, &samples), BoxStatus::Ok);
    ASSERT_EQ(samples.size(), 2U);
    EXPECT_DOUBLE_EQ(samples[1].exact_time, 0.5);
    std::vector<std::byte> data;
    ASSERT_EQ(read_sample_data(rewritten, samples[1].raw, &data),
              BoxStatus::Ok);
    EXPECT_EQ(data, fixture_bytes("gen-22"));
}


TEST(Mp4Builder, TransformNeedsMoov)
{
    std::vector<std::byte> bytes;
    fixture::fixture_append_box(&bytes, fourcc('f', 't', 'y', 'p'),
                                fixture::fixture_ftyp_payload());
    MemorySource source(bytes);
    ChainedIO out;
    EXPECT_EQ(transform_mp4(source, nullptr, &out), BoxStatus::NotFound);

    MemorySource empty;
    EXPECT_EQ(transform_mp4(empty, nullptr, &out), BoxStatus::NotFound);
}

}  // namespace openmotion
