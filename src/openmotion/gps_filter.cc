#include "openmotion/gps_filter.h"

#include "openmotion/geo.h"

#include <algorithm>
#include <utility>

namespace openmotion {
namespace {

    static double median_of_sorted(std::span<const double> v) noexcept
    {
        const size_t n = v.size();
        if (n == 0) {
            return 0.0;
        }
        if (n % 2 == 1) {
            return v[n / 2];
        }
        return (v[n / 2 - 1] + v[n / 2]) / 2.0;
    }


    static bool fix_accepted(const GpsPoint& p,
                             const GpsFilterOptions& options) noexcept
    {
        if (!p.fix) {
            return false;
        }
        for (GpsFix f : options.accepted_fixes) {
            if (f == *p.fix) {
                return true;
            }
        }
        return false;
    }

}  // namespace


bool
upper_whisker(std::span<const double> values, double* out)
{
    if (!out || values.size() < 2) {
        return false;
    }
    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    const size_t n      = sorted.size();
    const size_t middle = n / 2;
    const std::span<const double> all(sorted);
    const double q1 = median_of_sorted(all.first(middle));
    // [0, 1, 2, 3, 4] -> q3 over [3, 4]; [0, 1, 2, 3] -> q3 over [2, 3].
    const double q3 = n % 2 == 1 ? median_of_sorted(all.subspan(middle + 1))
                                 : median_of_sorted(all.subspan(middle));
    *out = q3 + (q3 - q1) * 1.5;
    return true;
}


std::vector<GpsSequence>
split_by_distance(std::span<const GpsPoint> points, double max_distance)
{
    std::vector<GpsSequence> sequences;
    for (size_t i = 0; i < points.size(); ++i) {
        const bool split
            = sequences.empty()
              || gps_distance(points[i - 1].lat, points[i - 1].lon,
                              points[i].lat, points[i].lon)
                     > max_distance;
        if (split) {
            sequences.emplace_back();
        }
        sequences.back().push_back(points[i]);
    }
    return sequences;
}


std::vector<GpsSequence>
merge_reachable_sequences(std::span<const GpsSequence> sequences,
                          double max_speed)
{
    const size_t n = sequences.size();
    constexpr size_t kUnset = static_cast<size_t>(-1);
    std::vector<size_t> merge_to(n, kUnset);

    for (size_t left = 0; left < n; ++left) {
        if (merge_to[left] == kUnset) {
            merge_to[left] = left;
        }
        if (sequences[left].empty()) {
            continue;
        }
        for (size_t right = left + 1; right < n; ++right) {
            if (merge_to[right] != kUnset || sequences[right].empty()) {
                continue;
            }
            if (calculate_point_speed(sequences[left].back(),
                                      sequences[right].front())
                <= max_speed) {
                merge_to[right] = merge_to[left];
                break;
            }
        }
    }

    std::vector<GpsSequence> merged;
    std::vector<size_t> group_of(n, kUnset);
    for (size_t i = 0; i < n; ++i) {
        const size_t root = merge_to[i];
        if (group_of[root] == kUnset) {
            group_of[root] = merged.size();
            merged.emplace_back();
        }
        GpsSequence& g = merged[group_of[root]];
        g.insert(g.end(), sequences[i].begin(), sequences[i].end());
    }
    return merged;
}


GpsSequence
find_majority(std::span<const GpsSequence> groups)
{
    const GpsSequence* best = nullptr;
    for (const GpsSequence& g : groups) {
        if (!best || g.size() > best->size()) {
            best = &g;
        }
    }
    return best ? *best : GpsSequence {};
}


GpsSequence
remove_outliers(std::span<const GpsPoint> points,
                const GpsFilterOptions& options, GpsFilterStats* stats)
{
    const GpsSequence unchanged(points.begin(), points.end());

    const std::vector<double> distances = pairwise_distances(points);
    double max_distance                 = 0.0;
    if (!upper_whisker(distances, &max_distance)) {
        return unchanged;
    }
    // Distance between two points, each off by up to the precision.
    max_distance = std::max(options.gps_precision_m * 2.0, max_distance);
    const std::vector<GpsSequence> sequences = split_by_distance(points,
                                                                 max_distance);
    if (stats) {
        stats->sequences_after_split = sequences.size();
    }

    std::vector<double> ground_speeds;
    for (const GpsPoint& p : points) {
        if (p.ground_speed) {
            ground_speeds.push_back(*p.ground_speed);
        }
    }
    double max_speed = 0.0;
    if (!upper_whisker(ground_speeds, &max_speed)) {
        return unchanged;
    }

    const std::vector<GpsSequence> merged
        = merge_reachable_sequences(sequences, max_speed);
    if (stats) {
        stats->groups_after_merge = merged.size();
    }
    return find_majority(merged);
}


GpsSequence
remove_noisy_points(std::span<const GpsPoint> points,
                    const GpsFilterOptions& options, GpsFilterStats* stats)
{
    GpsFilterStats local;

    GpsSequence by_fix;
    by_fix.reserve(points.size());
    for (const GpsPoint& p : points) {
        if (fix_accepted(p, options)) {
            by_fix.push_back(p);
        }
    }
    local.removed_by_fix = points.size() - by_fix.size();

    GpsSequence by_dop;
    by_dop.reserve(by_fix.size());
    for (const GpsPoint& p : by_fix) {
        if (p.precision && *p.precision <= options.max_dop100) {
            by_dop.push_back(p);
        }
    }
    local.removed_by_dop = by_fix.size() - by_dop.size();

    GpsSequence kept = remove_outliers(by_dop, options, &local);
    local.removed_outliers = by_dop.size() - kept.size();

    if (stats) {
        *stats = local;
    }
    return kept;
}

}  // namespace openmotion
