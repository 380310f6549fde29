#include "openmotion/geo.h"

#include <cmath>
#include <numbers>

namespace openmotion {

Ecef
ecef_from_lla(double lat, double lon, double alt) noexcept
{
    const double a2   = kWgs84A * kWgs84A;
    const double b2   = kWgs84B * kWgs84B;
    const double rlat = lat * std::numbers::pi / 180.0;
    const double rlon = lon * std::numbers::pi / 180.0;
    const double cl   = std::cos(rlat);
    const double sl   = std::sin(rlat);
    const double l    = 1.0 / std::sqrt(a2 * cl * cl + b2 * sl * sl);

    Ecef e;
    e.x = (a2 * l + alt) * cl * std::cos(rlon);
    e.y = (a2 * l + alt) * cl * std::sin(rlon);
    e.z = (b2 * l + alt) * sl;
    return e;
}


double
gps_distance(double lat1, double lon1, double lat2, double lon2) noexcept
{
    const Ecef p1 = ecef_from_lla(lat1, lon1, 0.0);
    const Ecef p2 = ecef_from_lla(lat2, lon2, 0.0);
    const double dx = p1.x - p2.x;
    const double dy = p1.y - p2.y;
    const double dz = p1.z - p2.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

}  // namespace openmotion
