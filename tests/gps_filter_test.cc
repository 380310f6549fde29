#include "openmotion/gps_filter.h"

#include "openmotion/geo.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace openmotion {
namespace {

    static GpsPoint make_point(double time, double lat, double lon)
    {
        GpsPoint p;
        p.time = time;
        p.lat  = lat;
        p.lon  = lon;
        return p;
    }

    // Slow northbound 3D-fix track, 1 s apart, about 4 m per step.
    static std::vector<GpsPoint> slow_track(size_t n)
    {
        std::vector<GpsPoint> out;
        for (size_t i = 0; i < n; ++i) {
            GpsPoint p = make_point(static_cast<double>(i),
                                    48.0 + 0.000036 * static_cast<double>(i),
                                    11.0);
            p.ground_speed = 5.0;
            p.fix          = GpsFix::Fix3D;
            p.precision    = 150.0;
            out.push_back(p);
        }
        return out;
    }

}  // namespace

TEST(Geo, DistanceMatchesKnownPair)
{
    const double d = gps_distance(42.1, -11.1, 42.2, -11.3);
    EXPECT_GT(d, 19000.0);
    EXPECT_LT(d, 20000.0);
    EXPECT_DOUBLE_EQ(gps_distance(10.0, 20.0, 10.0, 20.0), 0.0);
}


TEST(Geo, EcefOnEquatorAndPole)
{
    const Ecef eq = ecef_from_lla(0.0, 0.0, 0.0);
    EXPECT_NEAR(eq.x, kWgs84A, 1e-6);
    EXPECT_NEAR(eq.y, 0.0, 1e-6);
    EXPECT_NEAR(eq.z, 0.0, 1e-6);

    const Ecef pole = ecef_from_lla(90.0, 0.0, 100.0);
    EXPECT_NEAR(pole.z, kWgs84B + 100.0, 1e-6);
}


TEST(Geo, PointSpeedWithEqualTimesIsInfinite)
{
    const GpsPoint a = make_point(1.0, 48.0, 11.0);
    const GpsPoint b = make_point(1.0, 48.001, 11.0);
    EXPECT_TRUE(std::isinf(calculate_point_speed(a, b)));

    const GpsPoint c = make_point(3.0, 48.001, 11.0);
    EXPECT_NEAR(calculate_point_speed(a, c),
                gps_distance(48.0, 11.0, 48.001, 11.0) / 2.0, 1e-9);
}


TEST(GpsFilter, UpperWhiskerOddAndEvenCounts)
{
    double w = 0.0;
    const std::vector<double> odd = { 4.0, 0.0, 2.0, 1.0, 3.0 };
    ASSERT_TRUE(upper_whisker(odd, &w));
    // q1 = median(0, 1) = 0.5, q3 = median(3, 4) = 3.5
    EXPECT_DOUBLE_EQ(w, 3.5 + 3.0 * 1.5);

    const std::vector<double> even = { 0.0, 1.0, 2.0, 3.0 };
    ASSERT_TRUE(upper_whisker(even, &w));
    // q1 = 0.5, q3 = 2.5
    EXPECT_DOUBLE_EQ(w, 2.5 + 2.0 * 1.5);

    const std::vector<double> one = { 1.0 };
    EXPECT_FALSE(upper_whisker(one, &w));
}


TEST(GpsFilter, SplitsOnLargeJumps)
{
    std::vector<GpsPoint> points = slow_track(6);
    points[3].lat += 0.01;
    const std::vector<GpsSequence> seqs = split_by_distance(points, 30.0);
    ASSERT_EQ(seqs.size(), 3U);
    EXPECT_EQ(seqs[0].size(), 3U);
    EXPECT_EQ(seqs[1].size(), 1U);
    EXPECT_EQ(seqs[2].size(), 2U);
    EXPECT_TRUE(split_by_distance({}, 30.0).empty());
}


TEST(GpsFilter, MergeIsGreedyFirstReachable)
{
    std::vector<GpsSequence> seqs(3);
    seqs[0].push_back(make_point(0.0, 48.0, 11.0));
    seqs[1].push_back(make_point(1.0, 49.0, 11.0));
    seqs[2].push_back(make_point(2.0, 48.00001, 11.0));

    const std::vector<GpsSequence> merged = merge_reachable_sequences(seqs,
                                                                      5.0);
    ASSERT_EQ(merged.size(), 2U);
    ASSERT_EQ(merged[0].size(), 2U);
    EXPECT_DOUBLE_EQ(merged[0][0].time, 0.0);
    EXPECT_DOUBLE_EQ(merged[0][1].time, 2.0);
    ASSERT_EQ(merged[1].size(), 1U);
    EXPECT_DOUBLE_EQ(merged[1][0].time, 1.0);
}


TEST(GpsFilter, MajorityPrefersFirstOnTie)
{
    std::vector<GpsSequence> groups(2);
    groups[0].push_back(make_point(0.0, 1.0, 1.0));
    groups[1].push_back(make_point(5.0, 2.0, 2.0));
    const GpsSequence m = find_majority(groups);
    ASSERT_EQ(m.size(), 1U);
    EXPECT_DOUBLE_EQ(m[0].time, 0.0);
    EXPECT_TRUE(find_majority({}).empty());
}


TEST(GpsFilter, RemovesSingleTeleportPoint)
{
    std::vector<GpsPoint> points = slow_track(20);
    points[10].lat += 0.01;

    GpsFilterStats stats;
    const GpsSequence kept = remove_noisy_points(points, GpsFilterOptions {},
                                                 &stats);
    ASSERT_EQ(kept.size(), 19U);
    size_t j = 0;
    for (size_t i = 0; i < points.size(); ++i) {
        if (i == 10) {
            continue;
        }
        EXPECT_DOUBLE_EQ(kept[j].time, points[i].time);
        EXPECT_DOUBLE_EQ(kept[j].lat, points[i].lat);
        j += 1;
    }
    EXPECT_EQ(stats.sequences_after_split, 3U);
    EXPECT_EQ(stats.groups_after_merge, 2U);
    EXPECT_EQ(stats.removed_outliers, 1U);
}


TEST(GpsFilter, DropsRejectedFixAndHighDop)
{
    std::vector<GpsPoint> points = slow_track(4);
    points[0].fix       = GpsFix::NoFix;
    points[1].fix       = GpsFix::Fix3D;
    points[2].precision = 5000.0;
    points[3].precision = 150.0;

    GpsFilterStats stats;
    const GpsSequence kept = remove_noisy_points(points, GpsFilterOptions {},
                                                 &stats);
    EXPECT_EQ(stats.removed_by_fix, 1U);
    EXPECT_EQ(stats.removed_by_dop, 1U);
    ASSERT_EQ(kept.size(), 2U);
    EXPECT_DOUBLE_EQ(kept[0].time, 1.0);
    EXPECT_DOUBLE_EQ(kept[1].time, 3.0);
}


TEST(GpsFilter, DropsPointsWithoutFixOrDop)
{
    std::vector<GpsPoint> points = slow_track(5);
    points[2].fix.reset();

    GpsFilterStats stats;
    GpsSequence kept = remove_noisy_points(points, GpsFilterOptions {},
                                           &stats);
    EXPECT_EQ(stats.removed_by_fix, 1U);
    EXPECT_EQ(stats.removed_by_dop, 0U);
    ASSERT_EQ(kept.size(), 4U);
    EXPECT_DOUBLE_EQ(kept[2].time, 3.0);

    points = slow_track(5);
    points[4].precision.reset();
    kept = remove_noisy_points(points, GpsFilterOptions {}, &stats);
    EXPECT_EQ(stats.removed_by_fix, 0U);
    EXPECT_EQ(stats.removed_by_dop, 1U);
    ASSERT_EQ(kept.size(), 4U);
    EXPECT_DOUBLE_EQ(kept[3].time, 3.0);
}


TEST(GpsFilter, WithoutGroundSpeedsKeepsEverything)
{
    std::vector<GpsPoint> points = slow_track(8);
    for (GpsPoint& p : points) {
        p.ground_speed.reset();
    }
    points[4].lat += 0.01;
    const GpsSequence kept = remove_noisy_points(points);
    EXPECT_EQ(kept.size(), points.size());
}

}  // namespace openmotion
