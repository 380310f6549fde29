#include "openmotion/blackvue.h"

#include "mp4_fixture.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace openmotion {
namespace {

    using fixture::fixture_bytes;

    static std::vector<std::byte> blackvue_file(const std::string& gps,
                                                const std::string* cprt)
    {
        std::vector<std::byte> free_payload;
        fixture::fixture_append_box(&free_payload, fourcc('g', 'p', 's', ' '),
                                    fixture_bytes(gps));
        if (cprt) {
            fixture::fixture_append_box(&free_payload,
                                        fourcc('c', 'p', 'r', 't'),
                                        fixture_bytes(*cprt));
        }
        std::vector<std::byte> out;
        fixture::fixture_append_box(&out, fourcc('f', 't', 'y', 'p'),
                                    fixture::fixture_ftyp_payload());
        fixture::fixture_append_box(&out, fourcc('f', 'r', 'e', 'e'),
                                    free_payload);
        return out;
    }

}  // namespace

TEST(BlackVue, DecodesGgaLine)
{
    const std::string line
        = "[1623057074211]$GPGGA,202530.00,5109.0262,N,11401.8407,W,5,40,0.5,"
          "1097.36,M,-17.00,M,18,TSTR*61";
    NmeaParseStats stats;
    const std::vector<GpsPoint> points
        = parse_blackvue_gps_lines(fixture_bytes(line), &stats);
    ASSERT_EQ(points.size(), 1U);
    EXPECT_DOUBLE_EQ(points[0].lat, 51.150436666666664);
    EXPECT_DOUBLE_EQ(points[0].lon, -114.03067833333333);
    ASSERT_TRUE(points[0].alt);
    EXPECT_DOUBLE_EQ(*points[0].alt, 1097.36);
    ASSERT_TRUE(points[0].fix);
    EXPECT_EQ(*points[0].fix, GpsFix::Fix3D);
    EXPECT_DOUBLE_EQ(points[0].time, 1623097530.0);
    ASSERT_TRUE(points[0].epoch_time);
    EXPECT_DOUBLE_EQ(*points[0].epoch_time, 1623097530.0);
    EXPECT_DOUBLE_EQ(stats.clock_offset, 40455.789);
    EXPECT_EQ(stats.lines, 1U);
    EXPECT_EQ(stats.points, 1U);
}


TEST(BlackVue, RmcDateFixesClockOffset)
{
    // The void RMC carries no usable date; the GGA time of day is ignored
    // once a valid RMC is seen.
    const std::string gps
        = "[1629874403069]$GPRMC,001031.00,V,,,,,,,100117,,,N*78\n"
          "[1629874404069]$GNRMC,001031.00,A,4404.13993,N,12118.86023,W,"
          "0.146,,100117,,,A*7B\n"
          "[1629874405069]$GNGGA,175322.00,3244.53126,N,11710.97811,W,1,12,"
          "0.84,17.4,M,-34.0,M,,*45\n";
    NmeaParseStats stats;
    const std::vector<GpsPoint> points
        = parse_blackvue_gps_lines(fixture_bytes(gps), &stats);
    ASSERT_EQ(points.size(), 1U);
    EXPECT_DOUBLE_EQ(points[0].time, 1484007032.0);
    ASSERT_TRUE(points[0].epoch_time);
    EXPECT_DOUBLE_EQ(*points[0].epoch_time, 1484007032.0);
    EXPECT_DOUBLE_EQ(stats.clock_offset, -145867373.069);
    EXPECT_EQ(stats.skipped, 2U);
}


TEST(BlackVue, GgaTimeOfDayCrossesMidnight)
{
    // Camera clock at 23:30 UTC, receiver already past midnight.
    const std::string gps
        = "[1623108600000]$GPGGA,001000.00,5109.0262,N,11401.8407,W,1,08,0.9,"
          "1097.36,M,-17.00,M,,*6A\n";
    NmeaParseStats stats;
    const std::vector<GpsPoint> points
        = parse_blackvue_gps_lines(fixture_bytes(gps), &stats);
    ASSERT_EQ(points.size(), 1U);
    EXPECT_DOUBLE_EQ(points[0].time, 1623111000.0);
    EXPECT_DOUBLE_EQ(stats.clock_offset, 2400.0);
}


TEST(BlackVue, Checksums)
{
    EXPECT_TRUE(nmea_checksum_ok(
        "$GNGGA,175322.00,3244.53126,N,11710.97811,W,1,12,0.84,17.4,M,-34.0,"
        "M,,*45"));
    EXPECT_FALSE(nmea_checksum_ok(
        "$GNGGA,175322.00,3244.53126,N,11710.97811,W,1,12,0.84,17.4,M,-34.0,"
        "M,,*46"));
    EXPECT_TRUE(nmea_checksum_ok("$GPGGA,no,checksum"));
    EXPECT_FALSE(nmea_checksum_ok("$GPGGA,x*4"));
    EXPECT_FALSE(nmea_checksum_ok("GPGGA*00"));
}


TEST(BlackVue, GgaFieldRules)
{
    std::optional<GpsPoint> p = parse_nmea_gga(
        "$GPGGA,201207.00,3853.17000,N,07659.55000,W,1,10,0.82,,M,-34.7,M,,"
        "0000*46");
    ASSERT_TRUE(p);
    EXPECT_FALSE(p->alt);

    // Fix quality 0.
    EXPECT_FALSE(parse_nmea_gga(
        "$GPGGA,201206.00,3853.17000,S,07659.55000,E,0,10,0.82,7.7,M,-34.7,M,,"
        "0000*67"));
    EXPECT_FALSE(parse_nmea_gga("$GPRMC,201205.00,A,3853.16949,N,07659.54604,"
                                "W,5.849,284.43,070621,,,D*76"));
    EXPECT_FALSE(parse_nmea_gga("$GPGGA,,,,,,1,,,,,,,,"));
}


TEST(BlackVue, SkipsMalformedLines)
{
    const std::string gps
        = "\n[1623057130221]$GPGGA,201205.00,3853.16949,N,07659.54604,W,2,10,"
          "0.82,7.7,M,-34.7,M,,0000*6F\r\n"
          "[1623057129257]$GPVTG,284.43,T,,M,5.849,N,10.833,K,D*08"
          "[1623057130221]\n"
          "# comment\n"
          "[1623057130221]$GPGGA,**&^%$%$&(&(*(&&(^^*^*^^*&^&*))))\n"
          "[1623057130222]$GPGGA,201205.00,3853.16949,N,07659.54604,W,2,10,"
          "0.82,7.7,M,-34.7,M,,0000*6E\n";
    NmeaParseStats stats;
    const std::vector<GpsPoint> points
        = parse_blackvue_gps_lines(fixture_bytes(gps), &stats);
    ASSERT_EQ(points.size(), 1U);
    EXPECT_DOUBLE_EQ(points[0].lat, 38.88615816666667);
    EXPECT_DOUBLE_EQ(points[0].lon, -76.992434);
    EXPECT_EQ(stats.lines, 5U);
    EXPECT_EQ(stats.sentences, 4U);
    EXPECT_EQ(stats.bad_checksum, 2U);
    EXPECT_EQ(stats.skipped, 1U);
}


TEST(BlackVue, ModelFromCprt)
{
    const std::string json
        = " {\"model\":\"DR900X Plus\",\"ver\":0.918,\"GPS\":1}";
    std::vector<std::byte> bytes = fixture_bytes(json);
    bytes.push_back(std::byte { 0 });
    EXPECT_EQ(blackvue_model_from_cprt(bytes), "DR900X Plus");

    EXPECT_EQ(blackvue_model_from_cprt(fixture_bytes(
                  " Pittasoft Co., Ltd.;DR900S-1CH;1.008;English;1;")),
              "DR900S-1CH");
    EXPECT_EQ(blackvue_model_from_cprt(fixture_bytes("{\"ver\":1}")), "");
    EXPECT_EQ(blackvue_model_from_cprt(fixture_bytes("no fields")), "");
    EXPECT_EQ(blackvue_model_from_cprt(
                  std::vector<std::byte> { std::byte { 0xFF }, std::byte {
                                                                   ';' } }),
              "");
}


TEST(BlackVue, ExtractsInfoFromFile)
{
    const std::string gps
        = "[1623057131000]$GPGGA,201206.00,3853.16949,N,07659.54604,W,2,10,"
          "0.82,7.7,M,-34.7,M,,0000*6C\n"
          "[1623057130000]$GPGGA,201205.00,3853.16949,N,07659.54604,W,2,10,"
          "0.82,7.7,M,-34.7,M,,0000*6F\n";
    const std::string cprt = " Pittasoft Co., Ltd.;DR750X;1.0;";
    MemorySource source(blackvue_file(gps, &cprt));

    BlackVueInfo info;
    ASSERT_EQ(extract_blackvue_info(source, &info), TelemetryStatus::Ok);
    EXPECT_EQ(info.make, "BlackVue");
    EXPECT_EQ(info.model, "DR750X");
    ASSERT_EQ(info.gps.size(), 2U);
    EXPECT_DOUBLE_EQ(info.gps[0].time, 0.0);
    EXPECT_DOUBLE_EQ(info.gps[1].time, 1.0);
    EXPECT_DOUBLE_EQ(*info.gps[0].epoch_time, 1623096725.0);

    MemorySource no_cprt(blackvue_file(gps, nullptr));
    ASSERT_EQ(extract_blackvue_info(no_cprt, &info), TelemetryStatus::Ok);
    EXPECT_EQ(info.model, "");
    EXPECT_EQ(extract_blackvue_camera_model(no_cprt), "");
}


TEST(BlackVue, FileWithoutGpsBoxIsNotFound)
{
    std::vector<std::byte> bytes;
    fixture::fixture_append_box(&bytes, fourcc('f', 't', 'y', 'p'),
                                fixture::fixture_ftyp_payload());
    MemorySource source(std::move(bytes));
    BlackVueInfo info;
    EXPECT_EQ(extract_blackvue_info(source, &info), TelemetryStatus::NotFound);
    EXPECT_TRUE(info.gps.empty());
}

}  // namespace openmotion
