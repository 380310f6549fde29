#include "openmotion/camm.h"

#include "byte_io_internal.h"
#include "telemetry_internal.h"

#include <algorithm>
#include <utility>
#include <variant>

namespace openmotion {
namespace {

    static constexpr uint32_t kCammFormat = fourcc('c', 'a', 'm', 'm');

    // Smallest sample that can carry a GPS-family payload.
    static constexpr uint64_t kMinGpsSampleSize = 17;

    static std::optional<double> alt_from_wire(double v) noexcept
    {
        if (v == kCammUnknownAltitude) {
            return std::nullopt;
        }
        return v;
    }


    static bool read_vec3(std::span<const std::byte> p, float* x, float* y,
                          float* z) noexcept
    {
        return read_f32le(p, 0, x) && read_f32le(p, 4, y)
               && read_f32le(p, 8, z);
    }


    template<typename T>
    static T make_vec3_measurement(double time, float x, float y, float z)
    {
        T m;
        m.time = time;
        m.x    = x;
        m.y    = y;
        m.z    = z;
        return m;
    }


    static bool decode_gps(std::span<const std::byte> p, double time,
                           CammGpsPoint* out) noexcept
    {
        uint32_t fix = 0;
        float alt    = 0.0F;
        float f[6]   = {};
        if (!read_f64le(p, 0, &out->time_gps_epoch) || !read_u32le(p, 8, &fix)
            || !read_f64le(p, 12, &out->lat) || !read_f64le(p, 20, &out->lon)
            || !read_f32le(p, 28, &alt)) {
            return false;
        }
        for (uint32_t i = 0; i < 6; ++i) {
            if (!read_f32le(p, 32 + 4 * i, &f[i])) {
                return false;
            }
        }
        out->time                = time;
        out->gps_fix_type        = static_cast<int32_t>(fix);
        out->alt                 = alt_from_wire(alt);
        out->horizontal_accuracy = f[0];
        out->vertical_accuracy   = f[1];
        out->velocity_east       = f[2];
        out->velocity_north      = f[3];
        out->velocity_up         = f[4];
        out->speed_accuracy      = f[5];
        return true;
    }


    static void encode_vec3(std::vector<std::byte>* out, double x, double y,
                            double z)
    {
        append_f32le(out, static_cast<float>(x));
        append_f32le(out, static_cast<float>(y));
        append_f32le(out, static_cast<float>(z));
    }


    static bool has_camm_description(const TrackBox& track) noexcept
    {
        std::vector<SampleEntry> descriptions;
        if (track.sample_descriptions(&descriptions) != BoxStatus::Ok) {
            return false;
        }
        for (const SampleEntry& e : descriptions) {
            if (e.format == kCammFormat) {
                return true;
            }
        }
        return false;
    }


    static TelemetryStatus
    filter_by_track_edits(const MovieBox& moov, const TrackBox& track,
                          std::vector<TelemetryMeasurement>* measurements)
    {
        const EditList* elst = track.elst();
        if (!elst || elst->entries.empty()) {
            return TelemetryStatus::Ok;
        }
        const MediaHeader* mdhd = track.mdhd();
        const MovieHeader* mvhd = moov.mvhd();
        if (!mdhd || !mvhd || mdhd->timescale == 0 || mvhd->timescale == 0) {
            return TelemetryStatus::Malformed;
        }
        std::vector<EditSegment> segments;
        segments.reserve(elst->entries.size());
        for (const EditListEntry& e : elst->entries) {
            segments.push_back(
                edit_segment_from_entry(e, mvhd->timescale, mdhd->timescale));
        }
        *measurements = filter_by_edit_segments(*measurements, segments);
        return TelemetryStatus::Ok;
    }


    static TelemetryStatus
    extract_camm(ByteSource& stream, bool gps_only,
                 std::vector<TelemetryMeasurement>* out,
                 const Mp4ReadOptions& options)
    {
        if (!out) {
            return TelemetryStatus::Malformed;
        }
        out->clear();

        if (stream.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
            return TelemetryStatus::IoError;
        }
        MovieBox moov;
        BoxStatus status = moov.parse_stream(stream, options.box_limits);
        if (status != BoxStatus::Ok) {
            return telemetry_status_from_box(status);
        }

        for (const TrackBox& track : moov.tracks()) {
            if (!has_camm_description(track)) {
                continue;
            }

            StblSamples table;
            std::vector<Sample> samples;
            status = track.samples(&table, &samples, options.sample_limits);
            if (status != BoxStatus::Ok) {
                return telemetry_status_from_box(status);
            }

            std::vector<std::byte> data;
            for (const Sample& s : samples) {
                if (!s.description || s.description->format != kCammFormat) {
                    continue;
                }
                if (gps_only && s.raw.size < kMinGpsSampleSize) {
                    continue;
                }
                status = read_sample_data(stream, s.raw, &data,
                                          options.box_limits);
                if (status != BoxStatus::Ok) {
                    return telemetry_status_from_box(status);
                }
                CammRawSample decoded;
                const TelemetryStatus ts = decode_camm_sample(data,
                                                              s.exact_time,
                                                              &decoded);
                if (ts != TelemetryStatus::Ok) {
                    return ts;
                }
                if (!decoded.measurement) {
                    continue;
                }
                if (gps_only && !is_gps_measurement(*decoded.measurement)) {
                    continue;
                }
                out->push_back(std::move(*decoded.measurement));
            }
            return filter_by_track_edits(moov, track, out);
        }
        return TelemetryStatus::NotFound;
    }


    class MakeModelVisitor final : public BoxVisitor {
    public:
        bool on_box(const BoxHeader& header, uint32_t depth,
                    ByteSource& stream) noexcept override
        {
            (void)depth;
            std::vector<std::byte> data;
            const BoxStatus status = read_box_payload(stream, header, &data);
            if (status == BoxStatus::IoError) {
                io_failed = true;
                return false;
            }
            if (status != BoxStatus::Ok) {
                return true;
            }

            switch (header.type) {
            case fourcc('\xA9', 'm', 'a', 'k'):
                make = text_from_counted(data);
                break;
            case fourcc('\xA9', 'm', 'o', 'd'):
                model = text_from_counted(data);
                break;
            case fourcc('@', 'm', 'a', 'k'):
            case fourcc('m', 'a', 'n', 'u'): make = utf8_or_empty(data); break;
            case fourcc('@', 'm', 'o', 'd'):
            case fourcc('m', 'o', 'd', 'l'): model = utf8_or_empty(data); break;
            default: break;
            }
            return make.empty() || model.empty();
        }

        std::string make;
        std::string model;
        bool io_failed = false;

    private:
        // [u16be length][2 bytes reserved][text], NUL padded.
        static std::string text_from_counted(std::span<const std::byte> data)
        {
            uint16_t size = 0;
            if (!read_u16be(data, 0, &size)
                || static_cast<uint64_t>(size) + 4 > data.size()) {
                return std::string();
            }
            std::span<const std::byte> text = data.subspan(4, size);
            while (!text.empty() && text.back() == std::byte { 0 }) {
                text = text.first(text.size() - 1);
            }
            return utf8_or_empty(text);
        }
    };

}  // namespace


size_t
camm_payload_size(uint16_t type) noexcept
{
    switch (static_cast<CammType>(type)) {
    case CammType::AngleAxis:
    case CammType::Gyro:
    case CammType::Acceleration:
    case CammType::Position:
    case CammType::MagneticField: return 12;
    case CammType::ExposureTime: return 8;
    case CammType::MinGps: return 24;
    case CammType::Gps: return 56;
    case CammType::GoProGps: return 40;
    }
    return 0;
}


TelemetryStatus
decode_camm_sample(std::span<const std::byte> data, double time,
                   CammRawSample* out) noexcept
{
    if (!out) {
        return TelemetryStatus::Malformed;
    }
    *out = CammRawSample {};
    uint16_t type = 0;
    if (!read_u16le(data, 2, &type)) {
        return TelemetryStatus::Malformed;
    }
    out->type           = type;
    const size_t needed = camm_payload_size(type);
    if (needed == 0) {
        return TelemetryStatus::Ok;
    }
    if (data.size() < 4 + needed) {
        return TelemetryStatus::Malformed;
    }
    const std::span<const std::byte> p = data.subspan(4);

    float x = 0.0F;
    float y = 0.0F;
    float z = 0.0F;
    switch (static_cast<CammType>(type)) {
    case CammType::AngleAxis:
    case CammType::Position:
        if (!read_vec3(p, &out->vector[0], &out->vector[1],
                       &out->vector[2])) {
            return TelemetryStatus::Malformed;
        }
        return TelemetryStatus::Ok;
    case CammType::ExposureTime: {
        uint32_t exposure = 0;
        uint32_t skew     = 0;
        if (!read_u32le(p, 0, &exposure) || !read_u32le(p, 4, &skew)) {
            return TelemetryStatus::Malformed;
        }
        out->pixel_exposure_time       = static_cast<int32_t>(exposure);
        out->rolling_shutter_skew_time = static_cast<int32_t>(skew);
        return TelemetryStatus::Ok;
    }
    case CammType::Gyro:
        if (!read_vec3(p, &x, &y, &z)) {
            return TelemetryStatus::Malformed;
        }
        out->measurement = make_vec3_measurement<GyroscopeData>(time, x, y, z);
        return TelemetryStatus::Ok;
    case CammType::Acceleration:
        if (!read_vec3(p, &x, &y, &z)) {
            return TelemetryStatus::Malformed;
        }
        out->measurement = make_vec3_measurement<AccelerationData>(time, x, y,
                                                                   z);
        return TelemetryStatus::Ok;
    case CammType::MagneticField:
        if (!read_vec3(p, &x, &y, &z)) {
            return TelemetryStatus::Malformed;
        }
        out->measurement = make_vec3_measurement<MagnetometerData>(time, x, y,
                                                                   z);
        return TelemetryStatus::Ok;
    case CammType::MinGps: {
        Point pt;
        double alt = 0.0;
        if (!read_f64le(p, 0, &pt.lat) || !read_f64le(p, 8, &pt.lon)
            || !read_f64le(p, 16, &alt)) {
            return TelemetryStatus::Malformed;
        }
        pt.time          = time;
        pt.alt           = alt_from_wire(alt);
        out->measurement = pt;
        return TelemetryStatus::Ok;
    }
    case CammType::Gps: {
        CammGpsPoint gps;
        if (!decode_gps(p, time, &gps)) {
            return TelemetryStatus::Malformed;
        }
        out->measurement = gps;
        return TelemetryStatus::Ok;
    }
    case CammType::GoProGps:
        // Written for downstream consumers only.
        return TelemetryStatus::Ok;
    }
    return TelemetryStatus::Ok;
}


namespace {

    // One overload per measurement kind; a new alternative fails to compile.
    struct CammTypeOf final {
        CammType operator()(const Point&) const noexcept
        {
            return CammType::MinGps;
        }
        CammType operator()(const GpsPoint&) const noexcept
        {
            return CammType::GoProGps;
        }
        CammType operator()(const CammGpsPoint&) const noexcept
        {
            return CammType::Gps;
        }
        CammType operator()(const AccelerationData&) const noexcept
        {
            return CammType::Acceleration;
        }
        CammType operator()(const GyroscopeData&) const noexcept
        {
            return CammType::Gyro;
        }
        CammType operator()(const MagnetometerData&) const noexcept
        {
            return CammType::MagneticField;
        }
    };

}  // namespace


CammType
camm_type_of(const TelemetryMeasurement& m) noexcept
{
    return std::visit(CammTypeOf {}, m);
}


void
encode_camm_sample(const TelemetryMeasurement& m, std::vector<std::byte>* out)
{
    if (!out) {
        return;
    }
    append_u16le(out, 0);
    append_u16le(out, static_cast<uint16_t>(camm_type_of(m)));

    if (const Point* p = std::get_if<Point>(&m)) {
        append_f64le(out, p->lat);
        append_f64le(out, p->lon);
        append_f64le(out, p->alt.value_or(kCammUnknownAltitude));
    } else if (const GpsPoint* g = std::get_if<GpsPoint>(&m)) {
        append_f64le(out, g->lat);
        append_f64le(out, g->lon);
        append_f32le(out, static_cast<float>(
                              g->alt.value_or(kCammUnknownAltitude)));
        append_f64le(out, g->epoch_time.value_or(0.0));
        append_u32le(out, static_cast<uint32_t>(
                              g->fix.value_or(GpsFix::NoFix)));
        append_f32le(out, static_cast<float>(g->precision.value_or(0.0)));
        append_f32le(out, static_cast<float>(g->ground_speed.value_or(0.0)));
    } else if (const CammGpsPoint* c = std::get_if<CammGpsPoint>(&m)) {
        append_f64le(out, c->time_gps_epoch);
        append_u32le(out, static_cast<uint32_t>(c->gps_fix_type));
        append_f64le(out, c->lat);
        append_f64le(out, c->lon);
        append_f32le(out, static_cast<float>(
                              c->alt.value_or(kCammUnknownAltitude)));
        append_f32le(out, static_cast<float>(c->horizontal_accuracy));
        append_f32le(out, static_cast<float>(c->vertical_accuracy));
        append_f32le(out, static_cast<float>(c->velocity_east));
        append_f32le(out, static_cast<float>(c->velocity_north));
        append_f32le(out, static_cast<float>(c->velocity_up));
        append_f32le(out, static_cast<float>(c->speed_accuracy));
    } else if (const AccelerationData* a = std::get_if<AccelerationData>(&m)) {
        encode_vec3(out, a->x, a->y, a->z);
    } else if (const GyroscopeData* gy = std::get_if<GyroscopeData>(&m)) {
        encode_vec3(out, gy->x, gy->y, gy->z);
    } else if (const MagnetometerData* mg = std::get_if<MagnetometerData>(&m)) {
        encode_vec3(out, mg->x, mg->y, mg->z);
    }
}


EditSegment
edit_segment_from_entry(const EditListEntry& entry, uint32_t movie_timescale,
                        uint32_t media_timescale) noexcept
{
    EditSegment s;
    s.media_time = entry.media_time == -1
                       ? -1.0
                       : static_cast<double>(entry.media_time)
                             / static_cast<double>(media_timescale);
    s.duration = static_cast<double>(entry.segment_duration)
                 / static_cast<double>(movie_timescale);
    return s;
}


std::vector<TelemetryMeasurement>
filter_by_edit_segments(std::span<const TelemetryMeasurement> measurements,
                        std::span<const EditSegment> segments)
{
    double offset = 0.0;
    std::vector<EditSegment> edits;
    for (const EditSegment& s : segments) {
        if (s.media_time == -1.0) {
            offset = s.duration;
        } else {
            edits.push_back(s);
        }
    }

    std::vector<TelemetryMeasurement> out;
    out.reserve(measurements.size());
    if (edits.empty()) {
        for (const TelemetryMeasurement& m : measurements) {
            out.push_back(m);
            set_measurement_time(&out.back(), measurement_time(m) + offset);
        }
        return out;
    }

    std::stable_sort(edits.begin(), edits.end(),
                     [](const EditSegment& a, const EditSegment& b) {
                         return a.media_time < b.media_time;
                     });
    size_t idx = 0;
    for (const TelemetryMeasurement& m : measurements) {
        const double t = measurement_time(m);
        while (idx < edits.size()
               && t > edits[idx].media_time + edits[idx].duration) {
            idx += 1;
        }
        if (idx >= edits.size()) {
            break;
        }
        if (t < edits[idx].media_time) {
            continue;
        }
        out.push_back(m);
        set_measurement_time(&out.back(), t + offset);
    }
    return out;
}


bool
is_gps_measurement(const TelemetryMeasurement& m) noexcept
{
    return std::holds_alternative<Point>(m)
           || std::holds_alternative<GpsPoint>(m)
           || std::holds_alternative<CammGpsPoint>(m);
}


TelemetryStatus
extract_camm_telemetry(ByteSource& stream,
                       std::vector<TelemetryMeasurement>* out,
                       const Mp4ReadOptions& options)
{
    return extract_camm(stream, false, out, options);
}


TelemetryStatus
extract_camm_points(ByteSource& stream, std::vector<TelemetryMeasurement>* out,
                    const Mp4ReadOptions& options)
{
    return extract_camm(stream, true, out, options);
}


TelemetryStatus
extract_camera_make_and_model(ByteSource& stream, std::string* make,
                              std::string* model)
{
    if (!make || !model) {
        return TelemetryStatus::Malformed;
    }
    make->clear();
    model->clear();
    if (stream.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return TelemetryStatus::IoError;
    }

    const std::vector<BoxPathSegment> path = {
        { fourcc('m', 'o', 'o', 'v') },
        { fourcc('u', 'd', 't', 'a') },
        {
            fourcc('\xA9', 'm', 'a', 'k'),
            fourcc('\xA9', 'm', 'o', 'd'),
            fourcc('@', 'm', 'o', 'd'),
            fourcc('@', 'm', 'a', 'k'),
            fourcc('m', 'a', 'n', 'u'),
            fourcc('m', 'o', 'd', 'l'),
        },
    };
    MakeModelVisitor visitor;
    const BoxStatus status = parse_path(stream, path, kUnboundedSize, 0,
                                        visitor);
    if (status == BoxStatus::IoError || visitor.io_failed) {
        return TelemetryStatus::IoError;
    }
    // Parse errors past the values found so far are not fatal.
    *make  = trim_ascii(visitor.make);
    *model = trim_ascii(visitor.model);
    return TelemetryStatus::Ok;
}

}  // namespace openmotion
