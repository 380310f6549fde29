#pragma once

#include <cmath>
#include <limits>
#include <span>
#include <vector>

/**
 * \file geo.h
 * \brief WGS84 helpers: ECEF conversion and straight-line distances.
 */

namespace openmotion {

inline constexpr double kWgs84A = 6378137.0;
inline constexpr double kWgs84B = 6356752.314245;

struct Ecef final {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/// Converts latitude/longitude in degrees and ellipsoid altitude in meters to ECEF.
Ecef
ecef_from_lla(double lat, double lon, double alt) noexcept;

/// Chord distance in meters between two positions at altitude 0.
double
gps_distance(double lat1, double lon1, double lat2, double lon2) noexcept;

/**
 * \brief Ground speed in m/s from \p p1 to \p p2 (any type with `lat`,
 * `lon` and `time`).
 *
 * Equal times give +infinity.
 */
template<typename P>
double
calculate_point_speed(const P& p1, const P& p2) noexcept
{
    const double s = gps_distance(p1.lat, p1.lon, p2.lat, p2.lon);
    const double t = std::fabs(p2.time - p1.time);
    if (t == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return s / t;
}

/// Distances between consecutive points (`n - 1` values for `n` points).
template<typename P>
std::vector<double>
pairwise_distances(std::span<const P> points)
{
    std::vector<double> out;
    if (points.size() < 2) {
        return out;
    }
    out.reserve(points.size() - 1);
    for (size_t i = 1; i < points.size(); ++i) {
        out.push_back(gps_distance(points[i - 1].lat, points[i - 1].lon,
                                   points[i].lat, points[i].lon));
    }
    return out;
}

}  // namespace openmotion
