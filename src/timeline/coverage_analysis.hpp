#ifndef COMMPLAN_TIMELINE_COVERAGE_ANALYSIS_HPP
#define COMMPLAN_TIMELINE_COVERAGE_ANALYSIS_HPP

#include "timeline/route_projector.hpp"
#include <optional>
#include <string>
#include <vector>

namespace commplan::timeline {

/// Interval with no Ka satellite covering the aircraft
struct KaCoverageGap {
    RouteSample start;
    std::optional<RouteSample> end;          // empty when the gap runs to the end of the route
    std::optional<std::string> lost_satellite;
    std::optional<std::string> regained_satellite;
};

/// Direct handoff inside an overlap of two footprints
struct KaCoverageSwap {
    RouteSample midpoint;
    std::string from_satellite;
    std::string to_satellite;
};

struct KaCoverageAnalysis {
    std::vector<KaCoverageGap> gaps;
    std::vector<KaCoverageSwap> swaps;
};

/// Same-satellite gaps whose boundaries differ by more than this are antimeridian artifacts
inline constexpr double ANTIMERIDIAN_GAP_LON_DIFF = 300.0;

/// Lexicographically first id of a non-empty set
std::optional<std::string> pick_satellite(const geo::SatelliteSet& sats);

/**
 * Classify coverage changes across consecutive samples into gaps and swaps.
 *
 * Boundaries are placed at the route-distance midpoint between the two
 * straddling samples. A swap needs single satellite -> overlap of two ->
 * the new satellite alone, with no empty interval in between; its midpoint
 * is halfway between the overlap entry and exit boundaries.
 *
 * @param samples    Samples with coverage sets populated
 * @param projector  Projector the samples were generated from
 */
KaCoverageAnalysis analyze_ka_coverage(const std::vector<RouteSample>& samples,
                                       const RouteTemporalProjector& projector);

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_COVERAGE_ANALYSIS_HPP
