#include "openmotion/camm_builder.h"

#include "openmotion/camm.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace openmotion {
namespace {

    static constexpr uint32_t kCammFormat = fourcc('c', 'a', 'm', 'm');

    // Packed ISO-639-2/T "und".
    static constexpr uint16_t kUndeterminedLanguage = 21956;

    static bool by_time(const TelemetryMeasurement& a,
                        const TelemetryMeasurement& b) noexcept
    {
        return measurement_time(a) < measurement_time(b);
    }


    template<typename T>
    static void append_all(const std::vector<T>& in,
                           std::vector<TelemetryMeasurement>* out)
    {
        for (const T& m : in) {
            out->emplace_back(m);
        }
    }


    static std::vector<double> gps_times(const CammInfo& info)
    {
        std::vector<double> out;
        for (const CammGpsPoint& p : info.gps) {
            out.push_back(p.time);
        }
        for (const Point& p : info.mini_gps) {
            out.push_back(p.time);
        }
        for (const GpsPoint& p : info.gopro_gps) {
            out.push_back(p.time);
        }
        std::sort(out.begin(), out.end());
        if (!out.empty() && out.front() < 0.0) {
            out.erase(out.begin(),
                      std::lower_bound(out.begin(), out.end(), 0.0));
        }
        return out;
    }


    static Box self_reference_dinf()
    {
        DataReferenceEntry url;
        url.type        = fourcc('u', 'r', 'l', ' ');
        url.entry.flags = 1;
        DataReference dref;
        dref.entries.push_back(std::move(url));
        return make_container_box(
            fourcc('d', 'i', 'n', 'f'),
            { make_leaf_box(fourcc('d', 'r', 'e', 'f'), std::move(dref)) });
    }


    static Box udta_for(const CammInfo& info)
    {
        std::vector<Box> children;
        if (!info.make.empty()) {
            std::vector<std::byte> data(info.make.size());
            std::transform(info.make.begin(), info.make.end(), data.begin(),
                           [](char c) { return static_cast<std::byte>(c); });
            children.push_back(
                make_opaque_box(fourcc('@', 'm', 'a', 'k'), std::move(data)));
        }
        if (!info.model.empty()) {
            std::vector<std::byte> data(info.model.size());
            std::transform(info.model.begin(), info.model.end(), data.begin(),
                           [](char c) { return static_cast<std::byte>(c); });
            children.push_back(
                make_opaque_box(fourcc('@', 'm', 'o', 'd'), std::move(data)));
        }
        return make_container_box(fourcc('u', 'd', 't', 'a'),
                                  std::move(children));
    }

}  // namespace


std::vector<EditListEntry>
camm_edit_entries(std::span<const TimeRun> runs, uint32_t movie_timescale,
                  uint32_t media_timescale)
{
    std::vector<EditListEntry> out;
    for (size_t i = 0; i < runs.size(); ++i) {
        const TimeRun& run = runs[i];
        if (i == 0) {
            if (run.first > 0.0) {
                EditListEntry gap;
                gap.media_time       = -1;
                gap.segment_duration = static_cast<int64_t>(
                    run.first * movie_timescale);
                out.push_back(gap);
            }
            continue;
        }
        EditListEntry e;
        e.media_time = static_cast<int64_t>(run.first * media_timescale);
        e.segment_duration = static_cast<int64_t>((run.last - run.first)
                                                  * movie_timescale);
        out.push_back(e);
    }
    return out;
}


std::vector<TelemetryMeasurement>
collect_camm_measurements(const CammInfo& info)
{
    std::vector<TelemetryMeasurement> out;
    out.reserve(info.gps.size() + info.mini_gps.size() + info.gopro_gps.size()
                + info.accl.size() + info.gyro.size() + info.magn.size());
    append_all(info.gps, &out);
    append_all(info.mini_gps, &out);
    append_all(info.gopro_gps, &out);
    append_all(info.accl, &out);
    append_all(info.gyro, &out);
    append_all(info.magn, &out);
    std::stable_sort(out.begin(), out.end(), by_time);
    if (!out.empty() && measurement_time(out.front()) < 0.0) {
        std::erase_if(out, [](const TelemetryMeasurement& m) {
            return measurement_time(m) < 0.0;
        });
    }
    return out;
}


BoxStatus
camm_raw_samples(std::span<const TelemetryMeasurement> measurements,
                 uint32_t media_timescale, std::vector<RawSample>* out)
{
    if (!out) {
        return BoxStatus::Malformed;
    }
    out->clear();
    out->reserve(measurements.size());
    std::vector<std::byte> buf;
    uint64_t offset = 0;
    for (size_t i = 0; i < measurements.size(); ++i) {
        buf.clear();
        encode_camm_sample(measurements[i], &buf);

        double delta = 0.0;
        if (i + 1 < measurements.size()) {
            delta = (measurement_time(measurements[i + 1])
                     - measurement_time(measurements[i]))
                    * media_timescale;
        }
        if (!(delta >= 0.0)
            || delta >= static_cast<double>(
                   std::numeric_limits<uint32_t>::max()) + 1.0) {
            out->clear();
            return BoxStatus::SizeOverflow;
        }

        RawSample s;
        s.description_idx = 1;
        s.offset          = offset;
        s.size            = static_cast<uint32_t>(buf.size());
        s.timedelta       = static_cast<uint32_t>(delta);
        out->push_back(s);
        offset += buf.size();
    }
    return BoxStatus::Ok;
}


BoxStatus
build_camm_trak(std::span<const RawSample> raw_samples,
                uint32_t media_timescale,
                std::span<const EditListEntry> edits, Box* out)
{
    if (!out) {
        return BoxStatus::Malformed;
    }

    SampleEntry description;
    description.format               = kCammFormat;
    description.data_reference_index = 1;
    const std::vector<SampleEntry> descriptions = { description };

    std::vector<std::byte> stbl_data;
    const BoxEncoder encoder(stbl_schema());
    const BoxStatus status = encoder.encode_box_list(
        build_stbl_from_raw_samples(descriptions, raw_samples), &stbl_data);
    if (status != BoxStatus::Ok) {
        return status;
    }

    uint64_t media_duration = 0;
    for (const RawSample& s : raw_samples) {
        media_duration += s.timedelta;
    }

    // Fixed timestamps keep the output reproducible.
    TrackHeader tkhd;
    tkhd.version  = 0;
    tkhd.track_id = 0;
    tkhd.duration = 0xFFFFFFFFU;
    tkhd.layer    = 0;

    MediaHeader mdhd;
    mdhd.version   = 1;
    mdhd.timescale = media_timescale;
    mdhd.duration  = media_duration;
    mdhd.language  = kUndeterminedLanguage;

    HandlerReference hdlr;
    hdlr.handler_type = kCammFormat;
    hdlr.name         = "CameraMetadataMotionHandler";

    std::vector<Box> trak;
    trak.push_back(make_leaf_box(fourcc('t', 'k', 'h', 'd'), tkhd));
    trak.push_back(make_container_box(
        fourcc('m', 'd', 'i', 'a'),
        {
            make_leaf_box(fourcc('m', 'd', 'h', 'd'), mdhd),
            make_leaf_box(fourcc('h', 'd', 'l', 'r'), std::move(hdlr)),
            make_container_box(
                fourcc('m', 'i', 'n', 'f'),
                {
                    self_reference_dinf(),
                    make_opaque_box(fourcc('s', 't', 'b', 'l'),
                                    std::move(stbl_data)),
                }),
        }));
    if (!edits.empty()) {
        EditList elst;
        elst.entries.assign(edits.begin(), edits.end());
        trak.push_back(make_container_box(
            fourcc('e', 'd', 't', 's'),
            { make_leaf_box(fourcc('e', 'l', 's', 't'), std::move(elst)) }));
    }
    *out = make_container_box(fourcc('t', 'r', 'a', 'k'), std::move(trak));
    return BoxStatus::Ok;
}


CammSampleGenerator::CammSampleGenerator(CammInfo info,
                                         const CammBuildOptions& options)
    : info_(std::move(info))
    , options_(options)
{
}


BoxStatus
CammSampleGenerator::generate(
    ByteSource& source, std::vector<Box>* moov_children,
    std::vector<std::unique_ptr<ByteSource>>* sample_readers)
{
    (void)source;
    if (!moov_children || !sample_readers) {
        return BoxStatus::Malformed;
    }

    uint32_t movie_timescale = 0;
    BoxStatus status = find_movie_timescale(*moov_children, &movie_timescale);
    if (status != BoxStatus::Ok) {
        return status;
    }
    const uint32_t media_timescale = std::max(options_.min_media_timescale,
                                              movie_timescale);

    std::vector<EditListEntry> edits;
    const std::vector<double> times = gps_times(info_);
    if (!times.empty()) {
        const TimeRun run { times.front(), times.back() };
        edits = camm_edit_entries(std::span<const TimeRun>(&run, 1),
                                  movie_timescale, media_timescale);
    }

    const std::vector<TelemetryMeasurement> measurements
        = collect_camm_measurements(info_);
    std::vector<RawSample> raw;
    status = camm_raw_samples(measurements, media_timescale, &raw);
    if (status != BoxStatus::Ok) {
        return status;
    }

    Box trak;
    status = build_camm_trak(raw, media_timescale, edits, &trak);
    if (status != BoxStatus::Ok) {
        return status;
    }
    moov_children->push_back(std::move(trak));
    if (!info_.make.empty() || !info_.model.empty()) {
        moov_children->push_back(udta_for(info_));
    }

    for (const TelemetryMeasurement& m : measurements) {
        std::vector<std::byte> data;
        encode_camm_sample(m, &data);
        sample_readers->push_back(
            std::make_unique<MemorySource>(std::move(data)));
    }
    return BoxStatus::Ok;
}


std::unique_ptr<SampleGenerator>
make_camm_sample_generator(CammInfo info, const CammBuildOptions& options)
{
    return std::make_unique<CammSampleGenerator>(std::move(info), options);
}

}  // namespace openmotion
