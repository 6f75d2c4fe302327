#include "timeline/coverage_analysis.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace commplan::timeline {

std::optional<std::string> pick_satellite(const geo::SatelliteSet& sats) {
    if (sats.empty()) return std::nullopt;
    return *sats.begin();
}

namespace {

RouteSample boundary_between(const RouteTemporalProjector& projector,
                             const RouteSample& prev, const RouteSample& next) {
    RouteSample s = projector.sample_at_distance(0.5 * (prev.distance_m + next.distance_m));
    s.coverage.clear();
    return s;
}

bool looks_like_antimeridian_gap(const RouteSample& start, const RouteSample& end) {
    return std::fabs(start.longitude - end.longitude) > ANTIMERIDIAN_GAP_LON_DIFF;
}

struct OverlapState {
    std::string from;
    std::string to;
    RouteSample start;
};

} // anonymous namespace

KaCoverageAnalysis analyze_ka_coverage(const std::vector<RouteSample>& samples,
                                       const RouteTemporalProjector& projector) {
    KaCoverageAnalysis result;
    if (samples.empty()) return result;

    std::optional<KaCoverageGap> gap;
    std::optional<OverlapState> overlap;

    if (samples.front().coverage.empty()) {
        gap = KaCoverageGap{samples.front(), std::nullopt, std::nullopt, std::nullopt};
    }

    for (std::size_t i = 1; i < samples.size(); ++i) {
        const RouteSample& prev = samples[i - 1];
        const RouteSample& curr = samples[i];
        const geo::SatelliteSet& prev_set = prev.coverage;
        const geo::SatelliteSet& curr_set = curr.coverage;

        if (prev_set == curr_set) continue;

        // A swap needs continuous coverage from the overlap to the new satellite
        if (curr_set.empty()) overlap.reset();

        // Gap opens
        if (curr_set.empty() && !prev_set.empty() && !gap) {
            gap = KaCoverageGap{boundary_between(projector, prev, curr), std::nullopt,
                                pick_satellite(prev_set), std::nullopt};
            continue;
        }

        // Gap closes
        if (gap && !curr_set.empty()) {
            gap->end = boundary_between(projector, prev, curr);
            gap->regained_satellite = pick_satellite(curr_set);
            const bool same_satellite = gap->lost_satellite &&
                                        gap->lost_satellite == gap->regained_satellite;
            const bool artifact = same_satellite &&
                                  looks_like_antimeridian_gap(gap->start, *gap->end);
            if (!artifact) {
                result.gaps.push_back(std::move(*gap));
            }
            gap.reset();
            if (artifact) continue;
        }

        // Overlap tracking
        if (curr_set.size() >= 2) {
            const bool subset = std::includes(curr_set.begin(), curr_set.end(),
                                              prev_set.begin(), prev_set.end());
            if (prev_set.size() == 1 && subset) {
                geo::SatelliteSet added;
                std::set_difference(curr_set.begin(), curr_set.end(),
                                    prev_set.begin(), prev_set.end(),
                                    std::inserter(added, added.end()));
                overlap = OverlapState{*prev_set.begin(), *added.begin(),
                                       boundary_between(projector, prev, curr)};
                continue;
            }
            if (overlap) continue;
        }

        if (overlap && curr_set.size() == 1 && *curr_set.begin() == overlap->to) {
            const RouteSample end_boundary = boundary_between(projector, prev, curr);
            const double mid = 0.5 * (overlap->start.distance_m + end_boundary.distance_m);
            result.swaps.push_back({projector.sample_at_distance(mid), overlap->from, overlap->to});
            overlap.reset();
        }
    }

    if (gap) {
        result.gaps.push_back(std::move(*gap));
    }
    return result;
}

} // namespace commplan::timeline
