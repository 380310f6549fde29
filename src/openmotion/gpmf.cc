#include "openmotion/gpmf.h"

#include "byte_io_internal.h"
#include "telemetry_internal.h"

#include <GPMF_parser.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <utility>

namespace openmotion {
namespace {

    static constexpr uint32_t kGpmd = fourcc('g', 'p', 'm', 'd');

    // gpmf-parser compares keys in their in-memory byte order.
    static constexpr uint32_t kDevc = STR2FOURCC("DEVC");
    static constexpr uint32_t kStrm = STR2FOURCC("STRM");
    static constexpr uint32_t kDvid = STR2FOURCC("DVID");
    static constexpr uint32_t kDvnm = STR2FOURCC("DVNM");
    static constexpr uint32_t kGps5 = STR2FOURCC("GPS5");
    static constexpr uint32_t kGps9 = STR2FOURCC("GPS9");
    static constexpr uint32_t kGpsf = STR2FOURCC("GPSF");
    static constexpr uint32_t kGpsp = STR2FOURCC("GPSP");
    static constexpr uint32_t kGpsu = STR2FOURCC("GPSU");
    static constexpr uint32_t kScal = STR2FOURCC("SCAL");
    static constexpr uint32_t kType = STR2FOURCC("TYPE");
    static constexpr uint32_t kMtrx = STR2FOURCC("MTRX");
    static constexpr uint32_t kOrin = STR2FOURCC("ORIN");
    static constexpr uint32_t kOrio = STR2FOURCC("ORIO");
    static constexpr uint32_t kAccl = STR2FOURCC("ACCL");
    static constexpr uint32_t kGyro = STR2FOURCC("GYRO");
    static constexpr uint32_t kMagn = STR2FOURCC("MAGN");

    static constexpr uint64_t kNoDeviceId = uint64_t { 1 } << 32;

    // 2000-01-01T00:00:00Z
    static constexpr double kUnixTimeOf2000 = 946684800.0;

    static constexpr uint32_t kGps5Fields = 5;
    static constexpr uint32_t kGps9Fields = 9;

    static const GPMF_LEVELS kSameLevel = static_cast<GPMF_LEVELS>(
        GPMF_CURRENT_LEVEL | GPMF_TOLERANT);
    static const GPMF_LEVELS kAllLevels = static_cast<GPMF_LEVELS>(
        GPMF_RECURSE_LEVELS | GPMF_TOLERANT);

    // Word-aligned copy of a payload, walked in place by gpmf-parser.
    class GpmfPayload final {
    public:
        GpmfPayload() = default;
        GpmfPayload(const GpmfPayload&)            = delete;
        GpmfPayload& operator=(const GpmfPayload&) = delete;

        ~GpmfPayload()
        {
            if (initialized_) {
                GPMF_Free(&stream_);
            }
        }

        bool init(std::span<const std::byte> data)
        {
            if (data.empty()
                || data.size() > std::numeric_limits<uint32_t>::max()) {
                return false;
            }
            words_.assign((data.size() + 3) / 4, 0U);
            std::memcpy(words_.data(), data.data(), data.size());
            if (GPMF_Init(&stream_, words_.data(),
                          static_cast<uint32_t>(data.size()))
                != GPMF_OK) {
                return false;
            }
            initialized_ = true;
            return true;
        }

        GPMF_stream* stream() noexcept { return &stream_; }

    private:
        std::vector<uint32_t> words_;
        GPMF_stream stream_ {};
        bool initialized_ = false;
    };


    // Calls `fn(item)` for \p first and every later item on its nesting
    // level until `fn` returns false.
    template<typename Fn>
    static void for_each_sibling(GPMF_stream* first, Fn&& fn)
    {
        GPMF_stream item;
        if (GPMF_CopyState(first, &item) != GPMF_OK) {
            return;
        }
        const uint32_t level = item.nest_level;
        do {
            if (item.nest_level != level || !fn(&item)) {
                break;
            }
        } while (GPMF_Next(&item, kSameLevel) == GPMF_OK);
    }


    static bool find_last(GPMF_stream* first, uint32_t key,
                          GPMF_stream* found)
    {
        bool hit = false;
        for_each_sibling(first, [&](GPMF_stream* item) {
            if (GPMF_Key(item) == key
                && GPMF_CopyState(item, found) == GPMF_OK) {
                hit = true;
            }
            return true;
        });
        return hit;
    }


    // Positions \p child on the first item inside the nest \p parent.
    static bool enter_nest(GPMF_stream* parent, GPMF_stream* child)
    {
        if (GPMF_Type(parent) != GPMF_TYPE_NEST
            || GPMF_CopyState(parent, child) != GPMF_OK) {
            return false;
        }
        return GPMF_Next(child, kAllLevels) == GPMF_OK
               && child->nest_level == parent->nest_level + 1;
    }


    static std::string item_text(GPMF_stream* item)
    {
        const char* data = static_cast<const char*>(GPMF_RawData(item));
        if (!data) {
            return std::string();
        }
        size_t size = GPMF_RawDataSize(item);
        while (size > 0 && data[size - 1] == '\0') {
            size -= 1;
        }
        return std::string(data, size);
    }


    // Every element of \p item as a double, row after row, with the `SCAL`
    // of its level applied.
    static bool scaled_values(GPMF_stream* item, std::vector<double>* out)
    {
        const uint32_t elements = GPMF_ElementsInStruct(item);
        const uint32_t samples  = GPMF_Repeat(item);
        out->assign(static_cast<size_t>(elements) * samples, 0.0);
        const uint64_t bytes = out->size() * sizeof(double);
        if (out->empty() || bytes > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        return GPMF_ScaledData(item, out->data(),
                               static_cast<uint32_t>(bytes), 0, samples,
                               GPMF_TYPE_DOUBLE)
               == GPMF_OK;
    }


    static std::optional<double> first_value(GPMF_stream* item)
    {
        std::vector<double> values;
        if (!scaled_values(item, &values)) {
            return std::nullopt;
        }
        return values[0];
    }


    static bool scale_has_zero(GPMF_stream* scal)
    {
        const uint32_t size = GPMF_SizeofType(
            static_cast<GPMF_SampleType>(GPMF_Type(scal)));
        const auto* data  = static_cast<const uint8_t*>(GPMF_RawData(scal));
        const uint32_t total = GPMF_RawDataSize(scal);
        if (size == 0 || !data || total < size) {
            return true;
        }
        for (uint32_t off = 0; off + size <= total; off += size) {
            if (std::all_of(data + off, data + off + size,
                            [](uint8_t b) { return b == 0; })) {
                return true;
            }
        }
        return false;
    }


    static std::optional<GpsFix> fix_from_value(double v) noexcept
    {
        if (v == 0.0) {
            return GpsFix::NoFix;
        }
        if (v == 2.0) {
            return GpsFix::Fix2D;
        }
        if (v == 3.0) {
            return GpsFix::Fix3D;
        }
        return std::nullopt;
    }


    static void gps5_points(GPMF_stream* first, GPMF_stream* gps5,
                            std::vector<GpsPoint>* out)
    {
        out->clear();
        GPMF_stream item;
        if (!find_last(first, kScal, &item) || scale_has_zero(&item)) {
            return;
        }
        const uint32_t fields = GPMF_ElementsInStruct(gps5);
        std::vector<double> values;
        if (fields < kGps5Fields || !scaled_values(gps5, &values)) {
            return;
        }

        std::optional<GpsFix> fix;
        if (find_last(first, kGpsf, &item)) {
            if (const std::optional<double> v = first_value(&item)) {
                fix = fix_from_value(*v);
            }
        }
        std::optional<double> epoch;
        if (find_last(first, kGpsu, &item)) {
            epoch = parse_gpmf_utc(item_text(&item));
        }
        std::optional<double> precision;
        if (find_last(first, kGpsp, &item)) {
            precision = first_value(&item);
        }

        for (size_t row = 0; row + fields <= values.size(); row += fields) {
            const double* v = values.data() + row;
            GpsPoint p;
            p.lat          = v[0];
            p.lon          = v[1];
            p.alt          = v[2];
            p.ground_speed = v[3];
            p.epoch_time   = epoch;
            p.fix          = fix;
            p.precision    = precision;
            out->push_back(p);
        }
    }


    static TelemetryStatus gps9_points(GPMF_stream* first, GPMF_stream* gps9,
                                       std::vector<GpsPoint>* out)
    {
        out->clear();
        GPMF_stream item;
        if (!find_last(first, kScal, &item) || scale_has_zero(&item)) {
            return TelemetryStatus::Ok;
        }
        if (!find_last(first, kType, &item)) {
            return TelemetryStatus::Ok;
        }
        const std::string types = item_text(&item);
        if (types.empty()) {
            return TelemetryStatus::Ok;
        }
        std::vector<double> values;
        if (types.size() != kGps9Fields
            || GPMF_ElementsInStruct(gps9) != kGps9Fields
            || !scaled_values(gps9, &values)) {
            return TelemetryStatus::Malformed;
        }

        for (size_t row = 0; row + kGps9Fields <= values.size();
             row += kGps9Fields) {
            const double* v = values.data() + row;
            GpsPoint p;
            p.lat          = v[0];
            p.lon          = v[1];
            p.alt          = v[2];
            p.ground_speed = v[3];
            p.epoch_time   = kUnixTimeOf2000 + v[5] * 86400.0 + v[6];
            p.precision    = v[7] * 100.0;
            p.fix          = fix_from_value(v[8]);
            out->push_back(p);
        }
        return TelemetryStatus::Ok;
    }


    static TelemetryStatus stream_gps(GPMF_stream* first,
                                      std::vector<GpsPoint>* out)
    {
        GPMF_stream item;
        if (find_last(first, kGps9, &item)) {
            const TelemetryStatus status = gps9_points(first, &item, out);
            if (status != TelemetryStatus::Ok || !out->empty()) {
                return status;
            }
        }
        if (find_last(first, kGps5, &item)) {
            gps5_points(first, &item, out);
        }
        return TelemetryStatus::Ok;
    }


    static bool is_matrix_calibration(const std::vector<double>& m) noexcept
    {
        for (double v : m) {
            if (v != 0.0 && v != 1.0 && v != -1.0) {
                return true;
            }
        }
        return false;
    }


    static std::vector<double> sensor_matrix(GPMF_stream* first)
    {
        GPMF_stream item;
        std::vector<double> m;
        if (find_last(first, kMtrx, &item) && scaled_values(&item, &m)
            && is_matrix_calibration(m)) {
            return m;
        }
        GPMF_stream orio;
        if (find_last(first, kOrin, &item) && find_last(first, kOrio, &orio)) {
            return gpmf_orientation_matrix(item_text(&item), item_text(&orio));
        }
        return {};
    }


    static std::vector<std::vector<double>> sensor_rows(GPMF_stream* first,
                                                        uint32_t key)
    {
        GPMF_stream item;
        GPMF_stream scal;
        if (!find_last(first, key, &item)
            || (find_last(first, kScal, &scal) && scale_has_zero(&scal))) {
            return {};
        }
        const size_t n = GPMF_ElementsInStruct(&item);
        std::vector<double> values;
        if (n == 0 || !scaled_values(&item, &values)) {
            return {};
        }
        const std::vector<double> matrix = sensor_matrix(first);

        std::vector<std::vector<double>> rows;
        for (size_t r = 0; r + n <= values.size(); r += n) {
            std::vector<double> row(values.begin() + r,
                                    values.begin() + r + n);
            if (matrix.size() == n * n) {
                std::vector<double> rotated(n, 0.0);
                for (size_t y = 0; y < n; ++y) {
                    for (size_t x = 0; x < n; ++x) {
                        rotated[y] += matrix[y * n + x] * row[x];
                    }
                }
                row = std::move(rotated);
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }


    static uint64_t device_id_of(GPMF_stream* dvid)
    {
        const auto* data = static_cast<const std::byte*>(GPMF_RawData(dvid));
        uint32_t code    = 0;
        // FourCC device ids.
        if (GPMF_Type(dvid) == GPMF_TYPE_FOURCC && data
            && read_u32be(std::span<const std::byte>(data,
                                                     GPMF_RawDataSize(dvid)),
                          0, &code)) {
            return code;
        }
        if (const std::optional<double> v = first_value(dvid)) {
            return static_cast<uint64_t>(*v);
        }
        return kNoDeviceId;
    }


    static TelemetryStatus decode_device(GPMF_stream* devc,
                                         GpmfDevice* device)
    {
        GPMF_stream first;
        if (!enter_nest(devc, &first)) {
            return TelemetryStatus::Ok;
        }
        GPMF_stream item;
        if (find_last(&first, kDvid, &item)) {
            device->id = device_id_of(&item);
        }
        if (find_last(&first, kDvnm, &item)) {
            device->name = item_text(&item);
        }

        TelemetryStatus status = TelemetryStatus::Ok;
        for_each_sibling(&first, [&](GPMF_stream* strm) {
            GPMF_stream inner;
            if (GPMF_Key(strm) != kStrm || !enter_nest(strm, &inner)) {
                return true;
            }
            if (device->gps.empty()) {
                status = stream_gps(&inner, &device->gps);
                if (status != TelemetryStatus::Ok) {
                    return false;
                }
            }
            if (device->accl.empty()) {
                device->accl = sensor_rows(&inner, kAccl);
            }
            if (device->gyro.empty()) {
                device->gyro = sensor_rows(&inner, kGyro);
            }
            if (device->magn.empty()) {
                device->magn = sensor_rows(&inner, kMagn);
            }
            return true;
        });
        return status;
    }


    template<typename T>
    static std::vector<T>& series_for(
        std::vector<std::pair<uint64_t, std::vector<T>>>* by_device,
        uint64_t id)
    {
        for (auto& entry : *by_device) {
            if (entry.first == id) {
                return entry.second;
            }
        }
        by_device->emplace_back(id, std::vector<T>());
        return by_device->back().second;
    }


    static std::string& name_for(
        std::vector<std::pair<uint64_t, std::string>>* names, uint64_t id)
    {
        for (auto& entry : *names) {
            if (entry.first == id) {
                return entry.second;
            }
        }
        names->emplace_back(id, std::string());
        return names->back().second;
    }


    template<typename T>
    static void append_sensor(
        const std::vector<std::vector<double>>& rows, const Sample& sample,
        uint64_t id,
        std::vector<std::pair<uint64_t, std::vector<T>>>* by_device)
    {
        if (rows.empty()) {
            return;
        }
        const double step = sample.exact_timedelta
                            / static_cast<double>(rows.size());
        std::vector<T>& series = series_for(by_device, id);
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i].size() < 3) {
                continue;
            }
            // Rows are stored as (z, x, y).
            T m;
            m.time = sample.exact_time + step * static_cast<double>(i);
            m.x    = rows[i][1];
            m.y    = rows[i][2];
            m.z    = rows[i][0];
            series.push_back(m);
        }
    }


    template<typename T>
    static std::vector<T> first_series(
        std::vector<std::pair<uint64_t, std::vector<T>>>* by_device)
    {
        if (by_device->empty()) {
            return {};
        }
        return std::move(by_device->front().second);
    }


    static bool has_gpmd_description(const TrackBox& track) noexcept
    {
        std::vector<SampleEntry> descriptions;
        if (track.sample_descriptions(&descriptions) != BoxStatus::Ok) {
            return false;
        }
        for (const SampleEntry& e : descriptions) {
            if (e.format == kGpmd) {
                return true;
            }
        }
        return false;
    }


    // Calls `fn(sample, devices)` for every `gpmd` sample of \p track.
    template<typename Fn>
    static TelemetryStatus for_each_gpmd_sample(ByteSource& stream,
                                                const TrackBox& track,
                                                const Mp4ReadOptions& options,
                                                Fn&& fn)
    {
        StblSamples table;
        std::vector<Sample> samples;
        BoxStatus status = track.samples(&table, &samples,
                                         options.sample_limits);
        if (status != BoxStatus::Ok) {
            return telemetry_status_from_box(status);
        }
        std::vector<std::byte> data;
        for (const Sample& s : samples) {
            if (!s.description || s.description->format != kGpmd) {
                continue;
            }
            status = read_sample_data(stream, s.raw, &data, options.box_limits);
            if (status != BoxStatus::Ok) {
                return telemetry_status_from_box(status);
            }
            std::vector<GpmfDevice> devices;
            TelemetryStatus ts = decode_gpmf_payload(data, &devices);
            if (ts != TelemetryStatus::Ok) {
                return ts;
            }
            ts = fn(s, devices);
            if (ts != TelemetryStatus::Ok) {
                return ts;
            }
        }
        return TelemetryStatus::Ok;
    }


    static TelemetryStatus telemetry_from_track(ByteSource& stream,
                                                const TrackBox& track,
                                                const Mp4ReadOptions& options,
                                                VideoTelemetry* out)
    {
        std::vector<std::pair<uint64_t, std::vector<GpsPoint>>> gps;
        std::vector<std::pair<uint64_t, std::vector<AccelerationData>>> accl;
        std::vector<std::pair<uint64_t, std::vector<GyroscopeData>>> gyro;
        std::vector<std::pair<uint64_t, std::vector<MagnetometerData>>> magn;

        const TelemetryStatus status = for_each_gpmd_sample(
            stream, track, options,
            [&](const Sample& sample, std::vector<GpmfDevice>& devices) {
                for (GpmfDevice& device : devices) {
                    std::vector<GpsPoint>& points = device.gps;
                    if (!points.empty()) {
                        const double step = sample.exact_timedelta
                                            / static_cast<double>(
                                                points.size());
                        for (size_t i = 0; i < points.size(); ++i) {
                            points[i].time = sample.exact_time
                                             + step * static_cast<double>(i);
                        }
                        std::vector<GpsPoint>& series = series_for(&gps,
                                                                   device.id);
                        series.insert(series.end(), points.begin(),
                                      points.end());
                    }
                    append_sensor(device.accl, sample, device.id, &accl);
                    append_sensor(device.gyro, sample, device.id, &gyro);
                    append_sensor(device.magn, sample, device.id, &magn);
                }
                return TelemetryStatus::Ok;
            });
        if (status != TelemetryStatus::Ok) {
            return status;
        }

        out->gps  = first_series(&gps);
        out->accl = first_series(&accl);
        out->gyro = first_series(&gyro);
        out->magn = first_series(&magn);
        backfill_gps_epoch_times(&out->gps);
        return TelemetryStatus::Ok;
    }


    static void backfill_range(std::vector<GpsPoint*>& points) noexcept
    {
        size_t i = 0;
        while (i < points.size() && !points[i]->epoch_time) {
            i += 1;
        }
        if (i == points.size()) {
            return;
        }
        const GpsPoint* last = points[i];
        for (i += 1; i < points.size(); ++i) {
            GpsPoint* p = points[i];
            if (!p->epoch_time) {
                p->epoch_time = *last->epoch_time + (p->time - last->time);
            }
            last = p;
        }
    }


    static bool two_digits(std::string_view s, size_t pos, int* out) noexcept
    {
        if (pos + 2 > s.size()
            || !std::isdigit(static_cast<unsigned char>(s[pos]))
            || !std::isdigit(static_cast<unsigned char>(s[pos + 1]))) {
            return false;
        }
        *out = (s[pos] - '0') * 10 + (s[pos + 1] - '0');
        return true;
    }


    struct FlatFrame final {
        std::optional<double> start;
        std::optional<GpsFix> fix;
        std::optional<double> precision;
        std::vector<GpsPoint> points;
    };

}  // namespace


TelemetryStatus
decode_gpmf_payload(std::span<const std::byte> payload,
                    std::vector<GpmfDevice>* out)
{
    if (!out) {
        return TelemetryStatus::Malformed;
    }
    out->clear();
    if (payload.empty()) {
        return TelemetryStatus::Ok;
    }
    GpmfPayload gpmf;
    if (!gpmf.init(payload)) {
        return TelemetryStatus::Malformed;
    }
    GPMF_stream* ms         = gpmf.stream();
    const GPMF_ERR validity = GPMF_Validate(ms, GPMF_RECURSE_LEVELS);
    GPMF_ResetState(ms);
    if (validity != GPMF_OK && validity != GPMF_ERROR_UNKNOWN_TYPE) {
        return TelemetryStatus::Malformed;
    }

    TelemetryStatus status = TelemetryStatus::Ok;
    for_each_sibling(ms, [&](GPMF_stream* devc) {
        if (GPMF_Key(devc) != kDevc) {
            return true;
        }
        GpmfDevice device;
        status = decode_device(devc, &device);
        if (status != TelemetryStatus::Ok) {
            return false;
        }
        out->push_back(std::move(device));
        return true;
    });
    if (status != TelemetryStatus::Ok) {
        out->clear();
    }
    return status;
}


std::optional<double>
parse_gpmf_utc(std::string_view text) noexcept
{
    int yy = 0;
    int mo = 0;
    int dd = 0;
    int hh = 0;
    int mi = 0;
    int ss = 0;
    if (!two_digits(text, 0, &yy) || !two_digits(text, 2, &mo)
        || !two_digits(text, 4, &dd) || !two_digits(text, 6, &hh)
        || !two_digits(text, 8, &mi) || !two_digits(text, 10, &ss)) {
        return std::nullopt;
    }
    if (text.size() < 14 || text[12] != '.') {
        return std::nullopt;
    }
    double fraction = 0.0;
    double unit     = 0.1;
    for (size_t i = 13; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
        fraction += (text[i] - '0') * unit;
        unit /= 10.0;
    }

    static constexpr int kDaysInMonth[12] = { 31, 28, 31, 30, 31, 30,
                                              31, 31, 30, 31, 30, 31 };
    const int year = 2000 + yy;
    if (mo < 1 || mo > 12 || hh > 23 || mi > 59 || ss > 61) {
        return std::nullopt;
    }
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    const int month_days = kDaysInMonth[mo - 1] + (mo == 2 && leap ? 1 : 0);
    if (dd < 1 || dd > month_days) {
        return std::nullopt;
    }
    const int64_t days = days_from_civil(year, mo, dd);
    return static_cast<double>(days * 86400 + hh * 3600 + mi * 60 + ss)
           + fraction;
}


std::vector<double>
gpmf_orientation_matrix(std::string_view orin, std::string_view orio)
{
    std::vector<double> m;
    m.reserve(orin.size() * orio.size());
    for (char out_c : orin) {
        for (char in_c : orio) {
            if (in_c == out_c) {
                m.push_back(1.0);
            } else if (in_c - 'a' == out_c - 'A' || in_c - 'A' == out_c - 'a') {
                m.push_back(-1.0);
            } else {
                m.push_back(0.0);
            }
        }
    }
    return m;
}


void
backfill_gps_epoch_times(std::vector<GpsPoint>* points) noexcept
{
    if (!points || points->empty()) {
        return;
    }
    std::vector<GpsPoint*> order;
    order.reserve(points->size());
    for (GpsPoint& p : *points) {
        order.push_back(&p);
    }
    backfill_range(order);
    std::reverse(order.begin(), order.end());
    backfill_range(order);
}


TelemetryStatus
parse_gpmf_gps_frames(std::span<const std::byte> data,
                      std::vector<GpsPoint>* out) noexcept
{
    if (!out) {
        return TelemetryStatus::Malformed;
    }
    out->clear();
    if (data.empty()) {
        return TelemetryStatus::Ok;
    }
    GpmfPayload gpmf;
    if (!gpmf.init(data)) {
        return TelemetryStatus::Malformed;
    }
    GPMF_stream* ms = gpmf.stream();

    std::vector<FlatFrame> frames;
    FlatFrame frame;
    std::vector<double> values;
    do {
        const uint32_t key = GPMF_Key(ms);
        if (key == kDvid) {
            if (!frame.points.empty()) {
                frames.push_back(std::move(frame));
            }
            frame = FlatFrame {};
        } else if (key == kGps5) {
            if (GPMF_ElementsInStruct(ms) != kGps5Fields
                || !scaled_values(ms, &values)) {
                return TelemetryStatus::Malformed;
            }
            for (size_t row = 0; row + kGps5Fields <= values.size();
                 row += kGps5Fields) {
                GpsPoint p;
                p.lat          = values[row + 0];
                p.lon          = values[row + 1];
                p.alt          = values[row + 2];
                p.ground_speed = values[row + 3];
                frame.points.push_back(p);
            }
        } else if (key == kGpsu) {
            frame.start = parse_gpmf_utc(item_text(ms));
        } else if (key == kGpsf) {
            const std::optional<double> v = first_value(ms);
            if (!v) {
                return TelemetryStatus::Malformed;
            }
            frame.fix = fix_from_value(*v);
        } else if (key == kGpsp) {
            frame.precision = first_value(ms);
            if (!frame.precision) {
                return TelemetryStatus::Malformed;
            }
        }
    } while (GPMF_Next(ms, kAllLevels) == GPMF_OK);
    if (!frame.points.empty()) {
        frames.push_back(std::move(frame));
    }

    std::erase_if(frames, [](const FlatFrame& f) { return !f.start; });
    for (size_t i = 0; i < frames.size(); ++i) {
        const double start = *frames[i].start;
        const double until = i + 1 < frames.size() ? *frames[i + 1].start
                                                   : start + 1.0;
        const double step = (until - start)
                            / static_cast<double>(frames[i].points.size());
        for (size_t j = 0; j < frames[i].points.size(); ++j) {
            GpsPoint p   = frames[i].points[j];
            p.epoch_time = start + step * static_cast<double>(j);
            p.fix        = frames[i].fix;
            p.precision  = frames[i].precision;
            out->push_back(p);
        }
    }
    if (!out->empty()) {
        const double first = *out->front().epoch_time;
        for (GpsPoint& p : *out) {
            p.time = *p.epoch_time - first;
        }
    }
    return TelemetryStatus::Ok;
}


TelemetryStatus
extract_gpmf_telemetry(ByteSource& stream, VideoTelemetry* out,
                       const Mp4ReadOptions& options)
{
    if (!out) {
        return TelemetryStatus::Malformed;
    }
    out->gps.clear();
    out->accl.clear();
    out->gyro.clear();
    out->magn.clear();

    if (stream.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return TelemetryStatus::IoError;
    }
    MovieBox moov;
    const BoxStatus status = moov.parse_stream(stream, options.box_limits);
    if (status != BoxStatus::Ok) {
        return telemetry_status_from_box(status);
    }
    for (const TrackBox& track : moov.tracks()) {
        if (!has_gpmd_description(track)) {
            continue;
        }
        VideoTelemetry telemetry;
        const TelemetryStatus ts = telemetry_from_track(stream, track, options,
                                                        &telemetry);
        if (ts != TelemetryStatus::Ok) {
            return ts;
        }
        if (!telemetry.gps.empty()) {
            out->gps  = std::move(telemetry.gps);
            out->accl = std::move(telemetry.accl);
            out->gyro = std::move(telemetry.gyro);
            out->magn = std::move(telemetry.magn);
            return TelemetryStatus::Ok;
        }
    }
    return TelemetryStatus::NotFound;
}


TelemetryStatus
extract_gpmf_points(ByteSource& stream, std::vector<GpsPoint>* out,
                    const Mp4ReadOptions& options)
{
    if (!out) {
        return TelemetryStatus::Malformed;
    }
    out->clear();
    VideoTelemetry telemetry;
    const TelemetryStatus status = extract_gpmf_telemetry(stream, &telemetry,
                                                          options);
    if (status == TelemetryStatus::Ok) {
        *out = std::move(telemetry.gps);
    }
    return status;
}


std::string
select_gpmf_camera_model(std::vector<std::string> names)
{
    if (names.empty()) {
        return std::string();
    }
    std::sort(names.begin(), names.end());
    const auto lower_contains = [](const std::string& s,
                                   std::string_view needle) {
        std::string lower(s);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        return lower.find(needle) != std::string::npos;
    };
    for (const std::string& n : names) {
        if (lower_contains(n, "hero")) {
            return trim_ascii(n);
        }
    }
    for (const std::string& n : names) {
        if (lower_contains(n, "gopro")) {
            return trim_ascii(n);
        }
    }
    return trim_ascii(names.front());
}


TelemetryStatus
extract_gpmf_camera_model(ByteSource& stream, std::string* model,
                          const Mp4ReadOptions& options)
{
    if (!model) {
        return TelemetryStatus::Malformed;
    }
    model->clear();
    if (stream.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return TelemetryStatus::IoError;
    }
    MovieBox moov;
    const BoxStatus status = moov.parse_stream(stream, options.box_limits);
    if (status != BoxStatus::Ok) {
        return telemetry_status_from_box(status);
    }

    for (const TrackBox& track : moov.tracks()) {
        if (!has_gpmd_description(track)) {
            continue;
        }
        std::vector<std::pair<uint64_t, std::string>> names;
        const TelemetryStatus ts = for_each_gpmd_sample(
            stream, track, options,
            [&](const Sample& sample, std::vector<GpmfDevice>& devices) {
                (void)sample;
                for (const GpmfDevice& device : devices) {
                    if (!device.name.empty()) {
                        name_for(&names, device.id) = device.name;
                    }
                }
                return TelemetryStatus::Ok;
            });
        if (ts != TelemetryStatus::Ok) {
            return ts;
        }
        if (names.empty()) {
            continue;
        }
        std::vector<std::string> valid;
        for (const auto& entry : names) {
            const std::span<const std::byte> bytes(
                reinterpret_cast<const std::byte*>(entry.second.data()),
                entry.second.size());
            if (bytes_valid_utf8(bytes)) {
                valid.push_back(entry.second);
            }
        }
        *model = select_gpmf_camera_model(std::move(valid));
        return TelemetryStatus::Ok;
    }
    return TelemetryStatus::NotFound;
}

}  // namespace openmotion
