#include "openmotion/camm.h"

#include "mp4_fixture.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace openmotion {
namespace {

    static std::vector<std::byte> encode(const TelemetryMeasurement& m)
    {
        std::vector<std::byte> out;
        encode_camm_sample(m, &out);
        return out;
    }


    static CammRawSample decode(const std::vector<std::byte>& bytes,
                                double time)
    {
        CammRawSample raw;
        EXPECT_EQ(decode_camm_sample(bytes, time, &raw), TelemetryStatus::Ok);
        return raw;
    }


    static std::vector<TelemetryMeasurement>
    points_at(const std::vector<double>& times)
    {
        std::vector<TelemetryMeasurement> out;
        for (double t : times) {
            Point p;
            p.time = t;
            p.lat  = 1.0;
            p.lon  = 2.0;
            out.emplace_back(p);
        }
        return out;
    }

}  // namespace

TEST(Camm, PayloadSizes)
{
    EXPECT_EQ(camm_payload_size(0), 12U);
    EXPECT_EQ(camm_payload_size(1), 8U);
    EXPECT_EQ(camm_payload_size(5), 24U);
    EXPECT_EQ(camm_payload_size(6), 56U);
    EXPECT_EQ(camm_payload_size(7), 12U);
    EXPECT_EQ(camm_payload_size(1030), 40U);
    EXPECT_EQ(camm_payload_size(99), 0U);
}


TEST(Camm, MinGpsRoundTrip)
{
    Point p;
    p.time = 1.5;
    p.lat  = 37.1234567;
    p.lon  = -122.7654321;
    p.alt  = 12.5;
    const std::vector<std::byte> bytes = encode(p);
    ASSERT_EQ(bytes.size(), 4U + 24U);
    EXPECT_EQ(bytes[0], std::byte { 0 });
    EXPECT_EQ(bytes[1], std::byte { 0 });
    EXPECT_EQ(bytes[2], std::byte { 5 });
    EXPECT_EQ(bytes[3], std::byte { 0 });

    const CammRawSample raw = decode(bytes, 1.5);
    ASSERT_TRUE(raw.measurement);
    const Point* back = std::get_if<Point>(&*raw.measurement);
    ASSERT_NE(back, nullptr);
    EXPECT_DOUBLE_EQ(back->time, 1.5);
    EXPECT_DOUBLE_EQ(back->lat, p.lat);
    EXPECT_DOUBLE_EQ(back->lon, p.lon);
    ASSERT_TRUE(back->alt);
    EXPECT_DOUBLE_EQ(*back->alt, 12.5);
}


TEST(Camm, UnknownAltitudeUsesSentinel)
{
    Point p;
    p.lat = 1.0;
    p.lon = 2.0;
    const CammRawSample raw = decode(encode(p), 0.0);
    ASSERT_TRUE(raw.measurement);
    const Point* back = std::get_if<Point>(&*raw.measurement);
    ASSERT_NE(back, nullptr);
    EXPECT_FALSE(back->alt);

    CammGpsPoint g;
    g.lat = 3.0;
    g.lon = 4.0;
    const CammRawSample graw = decode(encode(g), 0.0);
    ASSERT_TRUE(graw.measurement);
    const CammGpsPoint* gback = std::get_if<CammGpsPoint>(&*graw.measurement);
    ASSERT_NE(gback, nullptr);
    EXPECT_FALSE(gback->alt);
}


TEST(Camm, GpsRoundTrip)
{
    CammGpsPoint g;
    g.time                = 2.0;
    g.lat                 = 51.5;
    g.lon                 = -0.125;
    g.alt                 = 100.0;
    g.time_gps_epoch      = 1234567890.5;
    g.gps_fix_type        = 3;
    g.horizontal_accuracy = 1.5;
    g.vertical_accuracy   = 2.5;
    g.velocity_east       = 0.25;
    g.velocity_north      = -0.5;
    g.velocity_up         = 0.75;
    g.speed_accuracy      = 0.125;
    const std::vector<std::byte> bytes = encode(g);
    ASSERT_EQ(bytes.size(), 4U + 56U);

    const CammRawSample raw = decode(bytes, 2.0);
    EXPECT_EQ(raw.type, 6U);
    ASSERT_TRUE(raw.measurement);
    const CammGpsPoint* back = std::get_if<CammGpsPoint>(&*raw.measurement);
    ASSERT_NE(back, nullptr);
    EXPECT_DOUBLE_EQ(back->time, 2.0);
    EXPECT_DOUBLE_EQ(back->lat, 51.5);
    EXPECT_DOUBLE_EQ(back->lon, -0.125);
    ASSERT_TRUE(back->alt);
    EXPECT_DOUBLE_EQ(*back->alt, 100.0);
    EXPECT_DOUBLE_EQ(back->time_gps_epoch, 1234567890.5);
    EXPECT_EQ(back->gps_fix_type, 3);
    EXPECT_DOUBLE_EQ(back->horizontal_accuracy, 1.5);
    EXPECT_DOUBLE_EQ(back->vertical_accuracy, 2.5);
    EXPECT_DOUBLE_EQ(back->velocity_east, 0.25);
    EXPECT_DOUBLE_EQ(back->velocity_north, -0.5);
    EXPECT_DOUBLE_EQ(back->velocity_up, 0.75);
    EXPECT_DOUBLE_EQ(back->speed_accuracy, 0.125);
}


TEST(Camm, ImuRoundTrip)
{
    AccelerationData a;
    a.x = 0.5;
    a.y = -9.75;
    a.z = 1.25;
    GyroscopeData g;
    g.x = 0.125;
    g.y = 0.25;
    g.z = -0.5;
    MagnetometerData m;
    m.x = 10.0;
    m.y = 20.0;
    m.z = 30.0;

    const CammRawSample ra = decode(encode(a), 0.5);
    EXPECT_EQ(ra.type, 3U);
    ASSERT_TRUE(ra.measurement);
    const AccelerationData* ab = std::get_if<AccelerationData>(
        &*ra.measurement);
    ASSERT_NE(ab, nullptr);
    EXPECT_DOUBLE_EQ(ab->time, 0.5);
    EXPECT_DOUBLE_EQ(ab->x, 0.5);
    EXPECT_DOUBLE_EQ(ab->y, -9.75);
    EXPECT_DOUBLE_EQ(ab->z, 1.25);

    const CammRawSample rg = decode(encode(g), 0.0);
    EXPECT_EQ(rg.type, 2U);
    ASSERT_TRUE(rg.measurement);
    const GyroscopeData* gb = std::get_if<GyroscopeData>(&*rg.measurement);
    ASSERT_NE(gb, nullptr);
    EXPECT_DOUBLE_EQ(gb->z, -0.5);

    const CammRawSample rm = decode(encode(m), 0.0);
    EXPECT_EQ(rm.type, 7U);
    ASSERT_TRUE(rm.measurement);
    const MagnetometerData* mb = std::get_if<MagnetometerData>(
        &*rm.measurement);
    ASSERT_NE(mb, nullptr);
    EXPECT_DOUBLE_EQ(mb->y, 20.0);
}


TEST(Camm, GoProGpsIsWriteOnly)
{
    GpsPoint g;
    g.lat          = 1.0;
    g.lon          = 2.0;
    g.fix          = GpsFix::Fix3D;
    g.ground_speed = 3.0;
    const std::vector<std::byte> bytes = encode(g);
    ASSERT_EQ(bytes.size(), 4U + 40U);
    EXPECT_EQ(camm_type_of(g), CammType::GoProGps);

    const CammRawSample raw = decode(bytes, 0.0);
    EXPECT_EQ(raw.type, 1030U);
    EXPECT_FALSE(raw.measurement);
}


TEST(Camm, TypeOfEachMeasurement)
{
    EXPECT_EQ(camm_type_of(Point {}), CammType::MinGps);
    EXPECT_EQ(camm_type_of(GpsPoint {}), CammType::GoProGps);
    EXPECT_EQ(camm_type_of(CammGpsPoint {}), CammType::Gps);
    EXPECT_EQ(camm_type_of(AccelerationData {}), CammType::Acceleration);
    EXPECT_EQ(camm_type_of(GyroscopeData {}), CammType::Gyro);
    EXPECT_EQ(camm_type_of(MagnetometerData {}), CammType::MagneticField);

    // The type word written ahead of each payload matches.
    const std::vector<std::byte> bytes = encode(MagnetometerData {});
    ASSERT_GE(bytes.size(), 4U);
    EXPECT_EQ(std::to_integer<uint32_t>(bytes[2])
                  | (std::to_integer<uint32_t>(bytes[3]) << 8),
              static_cast<uint32_t>(CammType::MagneticField));
}


TEST(Camm, NonMeasurementTypes)
{
    std::vector<std::byte> bytes = {
        std::byte { 0 }, std::byte { 0 }, std::byte { 1 }, std::byte { 0 },
        std::byte { 0x10 }, std::byte { 0 }, std::byte { 0 }, std::byte { 0 },
        std::byte { 0x20 }, std::byte { 0 }, std::byte { 0 }, std::byte { 0 },
    };
    CammRawSample raw = decode(bytes, 0.0);
    EXPECT_FALSE(raw.measurement);
    EXPECT_EQ(raw.pixel_exposure_time, 16);
    EXPECT_EQ(raw.rolling_shutter_skew_time, 32);

    bytes[2] = std::byte { 99 };
    raw      = decode(bytes, 0.0);
    EXPECT_EQ(raw.type, 99U);
    EXPECT_FALSE(raw.measurement);
}


TEST(Camm, ShortPayloadIsMalformed)
{
    Point p;
    std::vector<std::byte> bytes = encode(p);
    bytes.pop_back();
    CammRawSample raw;
    EXPECT_EQ(decode_camm_sample(bytes, 0.0, &raw),
              TelemetryStatus::Malformed);

    const std::vector<std::byte> tiny = { std::byte { 0 }, std::byte { 0 },
                                          std::byte { 5 } };
    EXPECT_EQ(decode_camm_sample(tiny, 0.0, &raw), TelemetryStatus::Malformed);
}


TEST(Camm, EmptyEditsOnlyShift)
{
    const std::vector<TelemetryMeasurement> in = points_at(
        { 0.0, 0.23, 0.29, 0.31 });
    const std::vector<EditSegment> segments = { { -1.0, 3.0 },
                                                { -1.0, 4.4 } };
    const std::vector<TelemetryMeasurement> out
        = filter_by_edit_segments(in, segments);
    ASSERT_EQ(out.size(), in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        EXPECT_DOUBLE_EQ(measurement_time(out[i]),
                         measurement_time(in[i]) + 4.4);
    }
}


TEST(Camm, EditSegmentsSelectAndShift)
{
    const std::vector<TelemetryMeasurement> in = points_at(
        { 0.0, 0.23, 0.29, 0.31 });
    const std::vector<EditSegment> segments = {
        { -1.0, 3.0 },
        { -1.0, 4.4 },
        { 0.30, 0.04 },
        { 0.21, 0.04 },
    };
    const std::vector<TelemetryMeasurement> out
        = filter_by_edit_segments(in, segments);
    ASSERT_EQ(out.size(), 2U);
    EXPECT_DOUBLE_EQ(measurement_time(out[0]), 0.23 + 4.4);
    EXPECT_DOUBLE_EQ(measurement_time(out[1]), 0.31 + 4.4);
}


TEST(Camm, EditSegmentFromEntryUsesBothTimescales)
{
    EditListEntry e;
    e.media_time       = 900;
    e.segment_duration = 50;
    const EditSegment s = edit_segment_from_entry(e, 100, 1000);
    EXPECT_DOUBLE_EQ(s.media_time, 0.9);
    EXPECT_DOUBLE_EQ(s.duration, 0.5);

    e.media_time = -1;
    EXPECT_DOUBLE_EQ(edit_segment_from_entry(e, 100, 1000).media_time, -1.0);
}


TEST(Camm, ExtractsTrackFromFile)
{
    fixture::FixtureFile file;
    fixture::FixtureTrack video;
    video.samples.push_back(fixture::fixture_bytes("frame-one"));
    file.tracks.push_back(video);

    fixture::FixtureTrack camm;
    camm.handler = fourcc('c', 'a', 'm', 'm');
    camm.format  = fourcc('c', 'a', 'm', 'm');
    Point p;
    p.lat = 10.0;
    p.lon = 20.0;
    camm.samples.push_back(encode(p));
    AccelerationData a;
    a.x = 1.0;
    camm.samples.push_back(encode(a));
    p.lat = 10.5;
    camm.samples.push_back(encode(p));
    camm.edits.push_back(EditListEntry { 2000, -1, 1, 0 });
    file.tracks.push_back(camm);

    MemorySource source(fixture::build_fixture_mp4(file));

    std::vector<TelemetryMeasurement> all;
    ASSERT_EQ(extract_camm_telemetry(source, &all), TelemetryStatus::Ok);
    ASSERT_EQ(all.size(), 3U);
    EXPECT_DOUBLE_EQ(measurement_time(all[0]), 2.0);
    EXPECT_DOUBLE_EQ(measurement_time(all[1]), 2.1);
    EXPECT_TRUE(std::holds_alternative<AccelerationData>(all[1]));
    EXPECT_DOUBLE_EQ(measurement_time(all[2]), 2.2);

    std::vector<TelemetryMeasurement> gps;
    ASSERT_EQ(extract_camm_points(source, &gps), TelemetryStatus::Ok);
    ASSERT_EQ(gps.size(), 2U);
    const Point* last = std::get_if<Point>(&gps[1]);
    ASSERT_NE(last, nullptr);
    EXPECT_DOUBLE_EQ(last->lat, 10.5);
}


TEST(Camm, FileWithoutCammTrackIsNotFound)
{
    fixture::FixtureFile file;
    fixture::FixtureTrack video;
    video.samples.push_back(fixture::fixture_bytes("frame"));
    file.tracks.push_back(video);
    MemorySource source(fixture::build_fixture_mp4(file));

    std::vector<TelemetryMeasurement> out;
    EXPECT_EQ(extract_camm_telemetry(source, &out),
              TelemetryStatus::NotFound);
    EXPECT_TRUE(out.empty());
}


TEST(Camm, ReadsMakeAndModel)
{
    // [u16be length][2 bytes reserved][text] with NUL padding.
    std::vector<std::byte> counted = { std::byte { 0 }, std::byte { 7 },
                                       std::byte { 0x15 }, std::byte { 0xC7 } };
    const std::vector<std::byte> text = fixture::fixture_bytes("HERO9");
    counted.insert(counted.end(), text.begin(), text.end());
    counted.push_back(std::byte { 0 });
    counted.push_back(std::byte { 0 });

    fixture::FixtureFile file;
    file.extra_moov_children.push_back(make_container_box(
        fourcc('u', 'd', 't', 'a'),
        {
            make_opaque_box(fourcc('@', 'm', 'a', 'k'),
                            fixture::fixture_bytes(" GoPro ")),
            make_opaque_box(fourcc('\xA9', 'm', 'o', 'd'), counted),
        }));
    MemorySource source(fixture::build_fixture_mp4(file));

    std::string make;
    std::string model;
    ASSERT_EQ(extract_camera_make_and_model(source, &make, &model),
              TelemetryStatus::Ok);
    EXPECT_EQ(make, "GoPro");
    EXPECT_EQ(model, "HERO9");
}

}  // namespace openmotion
