#include "openmotion/blackvue.h"

#include "byte_io_internal.h"
#include "telemetry_internal.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <regex>
#include <utility>

namespace openmotion {
namespace {

    static constexpr uint32_t kFree = fourcc('f', 'r', 'e', 'e');
    static constexpr uint32_t kGps  = fourcc('g', 'p', 's', ' ');
    static constexpr uint32_t kCprt = fourcc('c', 'p', 'r', 't');

    // [1623057074211]$GPGGA,...*61 with an optional trailing [timestamp].
    static const std::regex& nmea_line_regex()
    {
        static const std::regex re(
            R"(^\s*\[(\d+)\]\s*(\$\w{5}.*?)\s*(\[\d+\])?\s*$)");
        return re;
    }


    static int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        return -1;
    }


    static bool all_digits(std::string_view s) noexcept
    {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return c >= '0' && c <= '9';
        });
    }


    static std::optional<double> parse_double(std::string_view s) noexcept
    {
        double v = 0.0;
        const auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return v;
    }


    // NMEA (d)ddmm.mmmm to signed decimal degrees.
    static std::optional<double> degrees_from_dm(std::string_view dm,
                                                 std::string_view hemisphere)
    {
        const size_t dot = dm.find('.');
        if (dot == std::string_view::npos || dot < 3
            || !all_digits(dm.substr(0, dot))
            || !all_digits(dm.substr(dot + 1))) {
            return std::nullopt;
        }
        const std::optional<double> d = parse_double(dm.substr(0, dot - 2));
        const std::optional<double> m = parse_double(dm.substr(dot - 2));
        if (!d || !m) {
            return std::nullopt;
        }
        const double v = *d + *m / 60.0;
        return hemisphere == "S" || hemisphere == "W" ? -v : v;
    }


    static std::vector<std::string_view> split(std::string_view s, char sep)
    {
        std::vector<std::string_view> out;
        size_t start = 0;
        while (true) {
            const size_t pos = s.find(sep, start);
            if (pos == std::string_view::npos) {
                out.push_back(s.substr(start));
                return out;
            }
            out.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
    }


    static std::string_view strip_bytes(std::string_view s,
                                        std::string_view chars) noexcept
    {
        const size_t b = s.find_first_not_of(chars);
        if (b == std::string_view::npos) {
            return std::string_view();
        }
        const size_t e = s.find_last_not_of(chars);
        return s.substr(b, e - b + 1);
    }


    static int two_digits(std::string_view s, size_t pos) noexcept
    {
        return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
    }


    static std::vector<std::string_view> sentence_fields(
        std::string_view sentence)
    {
        const size_t star = sentence.find('*');
        if (star != std::string_view::npos) {
            sentence = sentence.substr(0, star);
        }
        return split(sentence, ',');
    }


    // NMEA hhmmss[.sss] to seconds since midnight.
    static std::optional<double> nmea_time_of_day(std::string_view s) noexcept
    {
        if (s.size() < 6 || !all_digits(s.substr(0, 6))) {
            return std::nullopt;
        }
        const int hh = two_digits(s, 0);
        const int mm = two_digits(s, 2);
        const int ss = two_digits(s, 4);
        if (hh > 23 || mm > 59 || ss > 60) {
            return std::nullopt;
        }
        double fraction = 0.0;
        if (s.size() > 6) {
            if (s[6] != '.' || !all_digits(s.substr(7))) {
                return std::nullopt;
            }
            double unit = 0.1;
            for (char c : s.substr(7)) {
                fraction += (c - '0') * unit;
                unit /= 10.0;
            }
        }
        return hh * 3600.0 + mm * 60.0 + ss + fraction;
    }


    static double round_millis(double v) noexcept
    {
        return std::round(v * 1000.0) / 1000.0;
    }


    // Seconds to add to \p camera to reach the UTC date and time of a valid
    // (status A) RMC sentence.
    static std::optional<double> offset_from_rmc(std::string_view sentence,
                                                 double camera)
    {
        const std::vector<std::string_view> f = sentence_fields(sentence);
        if (f.size() < 10 || f[0].size() != 6 || f[0].substr(3) != "RMC"
            || f[2] != "A" || f[9].size() != 6 || !all_digits(f[9])) {
            return std::nullopt;
        }
        const std::optional<double> tod = nmea_time_of_day(f[1]);
        const int dd = two_digits(f[9], 0);
        const int mo = two_digits(f[9], 2);
        const int yy = two_digits(f[9], 4);
        if (!tod || mo < 1 || mo > 12 || dd < 1 || dd > 31) {
            return std::nullopt;
        }
        const int year   = yy < 69 ? 2000 + yy : 1900 + yy;
        const double utc = static_cast<double>(days_from_civil(year, mo, dd))
                               * 86400.0
                           + *tod;
        return round_millis(utc - camera);
    }


    // Keeps the camera date and takes the time of day from the sentence,
    // moving one day when the two clocks are more than 12 hours apart.
    static std::optional<double> offset_from_time_of_day(
        std::string_view sentence, double camera)
    {
        const std::vector<std::string_view> f = sentence_fields(sentence);
        if (f.size() < 2) {
            return std::nullopt;
        }
        const std::optional<double> tod = nmea_time_of_day(f[1]);
        if (!tod) {
            return std::nullopt;
        }
        static constexpr double kDay     = 86400.0;
        static constexpr double kHalfDay = 43200.0;
        const double midnight   = std::floor(camera / kDay) * kDay;
        const double camera_tod = std::floor(camera - midnight);
        const double gps_tod    = std::floor(*tod);
        double corrected        = midnight + *tod;
        if (camera_tod - gps_tod > kHalfDay) {
            corrected += kDay;
        } else if (gps_tod - camera_tod > kHalfDay) {
            corrected -= kDay;
        }
        return round_millis(corrected - camera);
    }


    struct CameraSentence final {
        double camera = 0.0;
        std::string sentence;
    };

}  // namespace


bool
nmea_checksum_ok(std::string_view sentence) noexcept
{
    if (sentence.empty() || sentence[0] != '$') {
        return false;
    }
    const size_t star = sentence.find('*');
    if (star == std::string_view::npos) {
        return true;
    }
    const std::string_view digits = strip_bytes(sentence.substr(star + 1),
                                                " \t\r\n");
    if (digits.size() != 2) {
        return false;
    }
    const int hi = hex_value(digits[0]);
    const int lo = hex_value(digits[1]);
    if (hi < 0 || lo < 0) {
        return false;
    }
    uint8_t sum = 0;
    for (size_t i = 1; i < star; ++i) {
        sum ^= static_cast<uint8_t>(sentence[i]);
    }
    return sum == static_cast<uint8_t>(hi * 16 + lo);
}


std::optional<GpsPoint>
parse_nmea_gga(std::string_view sentence)
{
    const std::vector<std::string_view> f = sentence_fields(sentence);
    if (f.size() < 10 || f[0].size() != 6 || f[0][0] != '$'
        || f[0].substr(3) != "GGA") {
        return std::nullopt;
    }
    if (!all_digits(f[6]) || f[6].size() > 2) {
        return std::nullopt;
    }
    int quality = 0;
    if (std::from_chars(f[6].data(), f[6].data() + f[6].size(), quality).ec
            != std::errc()
        || quality < 1) {
        return std::nullopt;
    }
    const std::optional<double> lat = degrees_from_dm(f[2], f[3]);
    const std::optional<double> lon = degrees_from_dm(f[4], f[5]);
    if (!lat || !lon) {
        return std::nullopt;
    }

    GpsPoint p;
    p.lat = *lat;
    p.lon = *lon;
    p.alt = parse_double(f[9]);
    p.fix = GpsFix::Fix3D;
    return p;
}


std::vector<GpsPoint>
parse_blackvue_gps_lines(std::span<const std::byte> data,
                         NmeaParseStats* stats)
{
    NmeaParseStats local;
    NmeaParseStats& st = stats ? *stats : local;
    st                 = NmeaParseStats {};

    std::vector<CameraSentence> sentences;
    std::optional<double> rmc_offset;
    std::optional<size_t> first_gga;
    const std::string_view text(reinterpret_cast<const char*>(data.data()),
                                data.size());
    std::smatch m;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find_first_of("\r\n", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string line(text.substr(start, end - start));
        start = end + 1;
        if (line.empty()) {
            continue;
        }
        st.lines += 1;

        if (!std::regex_match(line, m, nmea_line_regex())) {
            continue;
        }
        st.sentences += 1;
        CameraSentence cs;
        cs.sentence = m[2].str();
        if (!nmea_checksum_ok(cs.sentence)) {
            st.bad_checksum += 1;
            continue;
        }
        const std::string stamp = m[1].str();
        uint64_t epoch_ms       = 0;
        const auto r = std::from_chars(stamp.data(),
                                       stamp.data() + stamp.size(), epoch_ms);
        if (r.ec != std::errc()) {
            st.skipped += 1;
            continue;
        }
        cs.camera = static_cast<double>(epoch_ms) / 1000.0;
        if (!rmc_offset) {
            rmc_offset = offset_from_rmc(cs.sentence, cs.camera);
        }
        if (!first_gga && parse_nmea_gga(cs.sentence)) {
            first_gga = sentences.size();
        }
        sentences.push_back(std::move(cs));
    }

    std::optional<double> offset = rmc_offset;
    if (!offset && first_gga) {
        const CameraSentence& cs = sentences[*first_gga];
        offset = offset_from_time_of_day(cs.sentence, cs.camera);
    }
    st.clock_offset = offset.value_or(0.0);

    std::vector<GpsPoint> out;
    for (const CameraSentence& cs : sentences) {
        std::optional<GpsPoint> p = parse_nmea_gga(cs.sentence);
        if (!p) {
            st.skipped += 1;
            continue;
        }
        p->time       = round_millis(cs.camera + st.clock_offset);
        p->epoch_time = p->time;
        out.push_back(*p);
        st.points += 1;
    }
    return out;
}


std::string
blackvue_model_from_cprt(std::span<const std::byte> data)
{
    std::string_view text(reinterpret_cast<const char*>(data.data()),
                          data.size());
    text = strip_bytes(text, " \t\r\n\v\f");
    text = strip_bytes(text, std::string_view("\0", 1));
    const std::span<const std::byte> bytes(
        reinterpret_cast<const std::byte*>(text.data()), text.size());
    if (!bytes_valid_utf8(bytes)) {
        return std::string();
    }

    const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (!doc.is_discarded()) {
        if (!doc.is_object()) {
            return std::string();
        }
        const auto it = doc.find("model");
        if (it == doc.end()) {
            return std::string();
        }
        if (it->is_string()) {
            return trim_ascii(it->get<std::string>());
        }
        return trim_ascii(it->dump());
    }

    const std::vector<std::string_view> fields = split(text, ';');
    if (fields.size() < 2) {
        return std::string();
    }
    return trim_ascii(fields[1]);
}


TelemetryStatus
extract_blackvue_info(ByteSource& stream, BlackVueInfo* out,
                      const BoxParseLimits& limits, NmeaParseStats* stats)
{
    if (!out) {
        return TelemetryStatus::Malformed;
    }
    *out = BlackVueInfo {};

    static constexpr uint32_t kGpsPath[] = { kFree, kGps };
    if (stream.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return TelemetryStatus::IoError;
    }
    std::vector<std::byte> data;
    bool found             = false;
    const BoxStatus status = parse_mp4_data_first(stream, kGpsPath, &data,
                                                  &found, kUnboundedSize,
                                                  limits);
    if (status != BoxStatus::Ok) {
        return telemetry_status_from_box(status);
    }
    if (!found) {
        return TelemetryStatus::NotFound;
    }

    out->gps = parse_blackvue_gps_lines(data, stats);
    std::stable_sort(out->gps.begin(), out->gps.end(),
                     [](const GpsPoint& a, const GpsPoint& b) {
                         return a.time < b.time;
                     });
    if (!out->gps.empty()) {
        const double first = out->gps.front().time;
        for (GpsPoint& p : out->gps) {
            p.time -= first;
        }
    }

    out->model = extract_blackvue_camera_model(stream, limits);
    return TelemetryStatus::Ok;
}


std::string
extract_blackvue_camera_model(ByteSource& stream, const BoxParseLimits& limits)
{
    static constexpr uint32_t kCprtPath[] = { kFree, kCprt };
    if (stream.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        return std::string();
    }
    std::vector<std::byte> data;
    bool found = false;
    if (parse_mp4_data_first(stream, kCprtPath, &data, &found, kUnboundedSize,
                             limits)
            != BoxStatus::Ok
        || !found) {
        return std::string();
    }
    return blackvue_model_from_cprt(data);
}

}  // namespace openmotion
