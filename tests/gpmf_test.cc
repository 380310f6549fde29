#include "openmotion/gpmf.h"

#include "mp4_fixture.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace openmotion {
namespace {

    using Bytes = std::vector<std::byte>;

    static void put_u16(Bytes* out, uint16_t v)
    {
        out->push_back(static_cast<std::byte>(v >> 8));
        out->push_back(static_cast<std::byte>(v));
    }


    static void put_u32(Bytes* out, uint32_t v)
    {
        fixture::fixture_append_u32be(out, v);
    }


    static Bytes klv(const char* key, char type, uint8_t size, uint16_t repeat,
                     const Bytes& payload)
    {
        Bytes out;
        put_u32(&out, fourcc(key[0], key[1], key[2], key[3]));
        out.push_back(static_cast<std::byte>(type));
        out.push_back(static_cast<std::byte>(size));
        put_u16(&out, repeat);
        out.insert(out.end(), payload.begin(), payload.end());
        while (out.size() % 4 != 0) {
            out.push_back(std::byte { 0 });
        }
        return out;
    }


    static Bytes nest(const char* key, const std::vector<Bytes>& items)
    {
        Bytes payload;
        for (const Bytes& i : items) {
            payload.insert(payload.end(), i.begin(), i.end());
        }
        Bytes out;
        put_u32(&out, fourcc(key[0], key[1], key[2], key[3]));
        out.push_back(std::byte { 0 });
        out.push_back(std::byte { 4 });
        put_u16(&out, static_cast<uint16_t>(payload.size() / 4));
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }


    static Bytes text(const char* key, const std::string& s)
    {
        return klv(key, 'c', 1, static_cast<uint16_t>(s.size()),
                   fixture::fixture_bytes(s));
    }


    static Bytes longs(const char* key, char type,
                       const std::vector<int32_t>& values, uint8_t per_row)
    {
        Bytes payload;
        for (int32_t v : values) {
            put_u32(&payload, static_cast<uint32_t>(v));
        }
        return klv(key, type, static_cast<uint8_t>(4 * per_row),
                   static_cast<uint16_t>(values.size() / per_row), payload);
    }


    static Bytes shorts(const char* key, const std::vector<int16_t>& values,
                        uint8_t per_row)
    {
        Bytes payload;
        for (int16_t v : values) {
            put_u16(&payload, static_cast<uint16_t>(v));
        }
        return klv(key, 's', static_cast<uint8_t>(2 * per_row),
                   static_cast<uint16_t>(values.size() / per_row), payload);
    }


    static Bytes join(const std::vector<Bytes>& items)
    {
        Bytes out;
        for (const Bytes& i : items) {
            out.insert(out.end(), i.begin(), i.end());
        }
        return out;
    }


    static Bytes gps5_stream(const std::string& utc,
                             const std::vector<int32_t>& rows)
    {
        return nest("STRM",
                    {
                        longs("GPSF", 'L', { 3 }, 1),
                        text("GPSU", utc),
                        klv("GPSP", 'S', 2, 1, { std::byte { 0 },
                                                 std::byte { 150 } }),
                        longs("SCAL", 'l',
                              { 10000000, 10000000, 1000, 1000, 100 }, 1),
                        longs("GPS5", 'l', rows, 5),
                    });
    }


    static std::vector<GpmfDevice> decode(const Bytes& bytes)
    {
        std::vector<GpmfDevice> devices;
        EXPECT_EQ(decode_gpmf_payload(bytes, &devices), TelemetryStatus::Ok);
        return devices;
    }

}  // namespace

TEST(Gpmf, DecodesDeviceIdentity)
{
    const Bytes bytes = join({
        nest("DEVC", { longs("DVID", 'L', { 7 }, 1),
                       text("DVNM", "HERO9 Black"),
                       nest("STRM", { text("STNM", "x") }) }),
        nest("DEVC",
             { klv("DVID", 'F', 4, 1, fixture::fixture_bytes("HLMT")),
               text("DVNM", "Helmet") }),
        nest("DEVC", { text("DVNM", "anon") }),
    });
    const std::vector<GpmfDevice> devices = decode(bytes);
    ASSERT_EQ(devices.size(), 3U);
    EXPECT_EQ(devices[0].id, 7U);
    EXPECT_EQ(devices[0].name, "HERO9 Black");
    EXPECT_TRUE(devices[0].gps.empty());
    EXPECT_EQ(devices[1].id, fourcc('H', 'L', 'M', 'T'));
    EXPECT_EQ(devices[1].name, "Helmet");
    EXPECT_EQ(devices[2].id, uint64_t { 1 } << 32);
}


TEST(Gpmf, TruncatedPayloadIsMalformed)
{
    Bytes bytes = nest("DEVC", { longs("DVID", 'L', { 1 }, 1),
                                 text("DVNM", "HERO9 Black") });
    bytes.resize(bytes.size() - 4);
    std::vector<GpmfDevice> devices(1);
    EXPECT_EQ(decode_gpmf_payload(bytes, &devices), TelemetryStatus::Malformed);
    EXPECT_TRUE(devices.empty());

    EXPECT_EQ(decode_gpmf_payload({}, &devices), TelemetryStatus::Ok);
    EXPECT_TRUE(devices.empty());
}


TEST(Gpmf, ParsesUtc)
{
    const std::optional<double> t = parse_gpmf_utc("230415123045.500");
    ASSERT_TRUE(t);
    EXPECT_DOUBLE_EQ(*t, 1681561845.5);
    EXPECT_FALSE(parse_gpmf_utc("230230123045.000"));
    EXPECT_FALSE(parse_gpmf_utc("2304151230"));
    EXPECT_FALSE(parse_gpmf_utc("23041512304x.000"));
}


TEST(Gpmf, OrientationMatrix)
{
    const std::vector<double> m = gpmf_orientation_matrix("ZXY", "yxz");
    const std::vector<double> expected = { 0, 0, -1, 0, -1, 0, -1, 0, 0 };
    EXPECT_EQ(m, expected);
}


TEST(Gpmf, DeviceGps5)
{
    const Bytes device = nest(
        "DEVC", { longs("DVID", 'L', { 1 }, 1),
                  gps5_stream("230415123045.500",
                              { 515000000, -1250000, 12500, 3000, 0,
                                515000100, -1250100, 12600, 3100, 0 }) });
    const std::vector<GpmfDevice> devices = decode(device);
    ASSERT_EQ(devices.size(), 1U);

    const std::vector<GpsPoint>& points = devices[0].gps;
    ASSERT_EQ(points.size(), 2U);
    EXPECT_DOUBLE_EQ(points[0].lat, 51.5);
    EXPECT_DOUBLE_EQ(points[0].lon, -0.125);
    ASSERT_TRUE(points[0].alt);
    EXPECT_DOUBLE_EQ(*points[0].alt, 12.5);
    ASSERT_TRUE(points[1].ground_speed);
    EXPECT_DOUBLE_EQ(*points[1].ground_speed, 3.1);
    ASSERT_TRUE(points[0].fix);
    EXPECT_EQ(*points[0].fix, GpsFix::Fix3D);
    ASSERT_TRUE(points[0].precision);
    EXPECT_DOUBLE_EQ(*points[0].precision, 150.0);
    ASSERT_TRUE(points[1].epoch_time);
    EXPECT_DOUBLE_EQ(*points[1].epoch_time, 1681561845.5);
}


TEST(Gpmf, DeviceGps9)
{
    Bytes row;
    for (int32_t v : { 515000000, -1250000, 12500, 3000, 0, 8500, 3600000 }) {
        put_u32(&row, static_cast<uint32_t>(v));
    }
    put_u16(&row, 150);
    put_u16(&row, 3);
    const Bytes gps9 = klv("GPS9", '?', 32, 1, row);
    const Bytes scal = longs("SCAL", 'l',
                             { 10000000, 10000000, 1000, 1000, 100, 1, 1000,
                               100, 1 },
                             1);

    std::vector<GpmfDevice> devices = decode(
        nest("DEVC", { nest("STRM", { text("TYPE", "lllllllSS"), scal,
                                      gps9 }) }));
    ASSERT_EQ(devices.size(), 1U);
    const std::vector<GpsPoint> points = devices[0].gps;
    ASSERT_EQ(points.size(), 1U);
    EXPECT_DOUBLE_EQ(points[0].lat, 51.5);
    ASSERT_TRUE(points[0].epoch_time);
    EXPECT_DOUBLE_EQ(*points[0].epoch_time, 1681088400.0);
    ASSERT_TRUE(points[0].precision);
    EXPECT_DOUBLE_EQ(*points[0].precision, 150.0);
    ASSERT_TRUE(points[0].fix);
    EXPECT_EQ(*points[0].fix, GpsFix::Fix3D);

    EXPECT_EQ(decode_gpmf_payload(
                  nest("DEVC", { nest("STRM", { text("TYPE", "lllllllS"),
                                                scal, gps9 }) }),
                  &devices),
              TelemetryStatus::Malformed);
    EXPECT_TRUE(devices.empty());
}


TEST(Gpmf, SensorRowsScaledAndOriented)
{
    const std::vector<GpmfDevice> devices = decode(nest(
        "DEVC", { nest("STRM", { text("ORIN", "ZXY"), text("ORIO", "yxz"),
                                 shorts("SCAL", { 10 }, 1),
                                 shorts("ACCL", { 10, 20, 30 }, 3) }) }));
    ASSERT_EQ(devices.size(), 1U);
    const std::vector<std::vector<double>>& rows = devices[0].accl;
    ASSERT_EQ(rows.size(), 1U);
    ASSERT_EQ(rows[0].size(), 3U);
    EXPECT_DOUBLE_EQ(rows[0][0], -3.0);
    EXPECT_DOUBLE_EQ(rows[0][1], -2.0);
    EXPECT_DOUBLE_EQ(rows[0][2], -1.0);

    EXPECT_TRUE(devices[0].gyro.empty());
}


TEST(Gpmf, ZeroSensorScaleLeavesSensorEmpty)
{
    const std::vector<GpmfDevice> devices = decode(nest(
        "DEVC", { nest("STRM", { shorts("SCAL", { 0 }, 1),
                                 shorts("GYRO", { 1, 2, 3, 4, 5, 6 }, 3) }),
                  nest("STRM", { shorts("SCAL", { 2 }, 1),
                                 shorts("MAGN", { 2, 4, 6, 8, 10, 12 },
                                        3) }) }));
    ASSERT_EQ(devices.size(), 1U);
    EXPECT_TRUE(devices[0].gyro.empty());
    ASSERT_EQ(devices[0].magn.size(), 2U);
    EXPECT_DOUBLE_EQ(devices[0].magn[1][0], 4.0);
    EXPECT_DOUBLE_EQ(devices[0].magn[1][2], 6.0);
}


TEST(Gpmf, BackfillsEpochTimes)
{
    std::vector<GpsPoint> points(4);
    for (size_t i = 0; i < points.size(); ++i) {
        points[i].time = static_cast<double>(i);
    }
    points[2].epoch_time = 1000.0;
    backfill_gps_epoch_times(&points);
    EXPECT_DOUBLE_EQ(*points[0].epoch_time, 998.0);
    EXPECT_DOUBLE_EQ(*points[1].epoch_time, 999.0);
    EXPECT_DOUBLE_EQ(*points[3].epoch_time, 1001.0);

    std::vector<GpsPoint> none(2);
    backfill_gps_epoch_times(&none);
    EXPECT_FALSE(none[0].epoch_time);
}


TEST(Gpmf, FlatFramesInterpolate)
{
    const Bytes flat = join({
        longs("DVID", 'L', { 1 }, 1),
        text("GPSU", "230415123045.000"),
        longs("GPSF", 'L', { 2 }, 1),
        longs("SCAL", 'l', { 10000000, 10000000, 1000, 1000, 100 }, 1),
        longs("GPS5", 'l',
              { 100000000, 200000000, 1000, 0, 0, 100000010, 200000010, 1000,
                0, 0 },
              5),
        longs("DVID", 'L', { 1 }, 1),
        text("GPSU", "230415123046.000"),
        longs("GPS5", 'l', { 100000020, 200000020, 1000, 0, 0 }, 5),
        longs("DVID", 'L', { 1 }, 1),
        longs("GPS5", 'l', { 1, 1, 1, 0, 0 }, 5),
    });
    std::vector<GpsPoint> points;
    ASSERT_EQ(parse_gpmf_gps_frames(flat, &points), TelemetryStatus::Ok);
    ASSERT_EQ(points.size(), 3U);
    EXPECT_DOUBLE_EQ(points[0].time, 0.0);
    EXPECT_DOUBLE_EQ(points[1].time, 0.5);
    EXPECT_DOUBLE_EQ(points[2].time, 1.0);
    EXPECT_DOUBLE_EQ(points[0].lat, 10.0);
    EXPECT_DOUBLE_EQ(*points[2].epoch_time, 1681561846.0);
    ASSERT_TRUE(points[0].fix);
    EXPECT_EQ(*points[0].fix, GpsFix::Fix2D);
    EXPECT_FALSE(points[2].fix);

    Bytes truncated = longs("GPS5", 'l', { 1, 2, 3, 4, 5 }, 5);
    truncated.resize(truncated.size() - 4);
    EXPECT_EQ(parse_gpmf_gps_frames(truncated, &points),
              TelemetryStatus::Malformed);
}


TEST(Gpmf, SelectsCameraModel)
{
    EXPECT_EQ(select_gpmf_camera_model({ "Camera", " HERO10 Black " }),
              "HERO10 Black");
    EXPECT_EQ(select_gpmf_camera_model({ "Zed", "GoPro Max" }), "GoPro Max");
    EXPECT_EQ(select_gpmf_camera_model({ "b", "a" }), "a");
    EXPECT_EQ(select_gpmf_camera_model({}), "");
}


TEST(Gpmf, ExtractsTrackFromFile)
{
    fixture::FixtureFile file;
    fixture::FixtureTrack video;
    video.samples.push_back(fixture::fixture_bytes("frame"));
    file.tracks.push_back(video);

    fixture::FixtureTrack meta;
    meta.handler      = fourcc('m', 'e', 't', 'a');
    meta.format       = fourcc('g', 'p', 'm', 'd');
    meta.sample_delta = 1000;
    meta.samples.push_back(nest(
        "DEVC", { longs("DVID", 'L', { 1 }, 1), text("DVNM", "HERO9 Black"),
                  gps5_stream("230415123045.000",
                              { 515000000, -1250000, 0, 0, 0, 515000010,
                                -1250000, 0, 0, 0 }),
                  nest("STRM", { shorts("SCAL", { 1 }, 1),
                                 shorts("ACCL", { 9, 1, 2 }, 3) }) }));
    meta.samples.push_back(nest(
        "DEVC", { longs("DVID", 'L', { 1 }, 1),
                  gps5_stream("230415123046.000",
                              { 515000020, -1250000, 0, 0, 0, 515000030,
                                -1250000, 0, 0, 0 }) }));
    file.tracks.push_back(meta);
    MemorySource source(fixture::build_fixture_mp4(file));

    VideoTelemetry telemetry;
    ASSERT_EQ(extract_gpmf_telemetry(source, &telemetry), TelemetryStatus::Ok);
    ASSERT_EQ(telemetry.gps.size(), 4U);
    EXPECT_DOUBLE_EQ(telemetry.gps[1].time, 0.5);
    EXPECT_DOUBLE_EQ(telemetry.gps[3].time, 1.5);
    EXPECT_DOUBLE_EQ(telemetry.gps[2].lat, 51.500002);
    ASSERT_EQ(telemetry.accl.size(), 1U);
    EXPECT_DOUBLE_EQ(telemetry.accl[0].x, 1.0);
    EXPECT_DOUBLE_EQ(telemetry.accl[0].y, 2.0);
    EXPECT_DOUBLE_EQ(telemetry.accl[0].z, 9.0);

    std::string model;
    ASSERT_EQ(extract_gpmf_camera_model(source, &model), TelemetryStatus::Ok);
    EXPECT_EQ(model, "HERO9 Black");
}


TEST(Gpmf, FileWithoutGpmdTrackIsNotFound)
{
    fixture::FixtureFile file;
    fixture::FixtureTrack video;
    video.samples.push_back(fixture::fixture_bytes("frame"));
    file.tracks.push_back(video);
    MemorySource source(fixture::build_fixture_mp4(file));

    std::vector<GpsPoint> points;
    EXPECT_EQ(extract_gpmf_points(source, &points), TelemetryStatus::NotFound);
    EXPECT_TRUE(points.empty());
}

}  // namespace openmotion
