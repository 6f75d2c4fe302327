#ifndef COMMPLAN_TIMELINE_ROUTE_PROJECTOR_HPP
#define COMMPLAN_TIMELINE_ROUTE_PROJECTOR_HPP

#include "core/route.hpp"
#include "geo/coverage_sampler.hpp"
#include "geo/geo_utils.hpp"
#include <optional>
#include <vector>

namespace commplan::timeline {

inline constexpr double DEFAULT_SAMPLE_INTERVAL_S = 60.0;
inline constexpr std::size_t HIGH_SAMPLE_COUNT = 2000;

/**
 * @brief Point sampled along the route at a known time
 */
struct RouteSample {
    double distance_m = 0.0;                 // along-route distance from the first point
    double timestamp = 0.0;
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = geo::DEFAULT_CRUISE_ALTITUDE_M;
    std::optional<double> heading;           // degrees; unknown on degenerate segments
    geo::SatelliteSet coverage;
};

/**
 * @brief Coordinate projected onto the route polyline
 */
struct RouteProjection {
    double progress = 0.0;         // 0..1 of total route distance
    double distance_m = 0.0;
    double timestamp = 0.0;
    double latitude = 0.0;
    double longitude = 0.0;
    double offset_m = 0.0;         // distance from the query point to the route
    std::size_t segment_index = 0;
};

struct MissionWindow {
    double start = 0.0;
    double end = 0.0;

    double duration() const { return end - start; }
};

/**
 * Mission window from the route timing profile and per-point arrival times:
 * start is the earliest candidate, end the latest.
 * @throws ConfigurationError if the route carries no timestamps at all,
 *         or if end <= start
 */
MissionWindow derive_mission_window(const Route& route);

/**
 * @brief Maps along-route distance to absolute time and back
 *
 * Time allocation, in order of preference:
 *   1. every point has an arrival time: piecewise linear through those times
 *   2. every segment has a planned speed: time proportional to distance / speed
 *   3. otherwise: time proportional to distance over the mission window
 *
 * Holds a reference to the route; the route must outlive the projector.
 */
class RouteTemporalProjector {
public:
    RouteTemporalProjector(const Route& route, double start_time, double end_time);

    double start_time() const { return start_; }
    double end_time() const { return end_; }
    double duration() const { return duration_; }
    double total_distance() const { return total_distance_; }
    const Route& route() const { return route_; }

    /// Interpolated position, altitude and heading at a clamped along-route distance
    RouteSample sample_at_distance(double distance_m) const;

    double timestamp_for_distance(double distance_m) const;
    double distance_for_timestamp(double t) const;

    /// Position at an absolute time (clamped to the mission window)
    RouteSample position_at_time(double t) const;

    /// Nearest-point projection of (lat, lon) onto the route polyline
    RouteProjection project(double lat, double lon) const;

    /**
     * Uniformly spaced samples from start to end inclusive; the last sample is
     * exactly at the mission end. Headings missing on degenerate segments are
     * back-filled from the nearest known value; the first sample's heading is
     * left unknown.
     * @param interval_s  Sample spacing; non-positive falls back to 60 s
     * @param coverage    Optional footprint set evaluated at every sample
     */
    std::vector<RouteSample> generate_samples(double interval_s,
                                              const geo::CoverageSampler* coverage = nullptr) const;

private:
    const Route& route_;
    double start_;
    double end_;
    double duration_;
    std::vector<double> cumulative_;     // along-route distance at each point
    std::vector<double> knot_times_;     // absolute time at each point
    double total_distance_ = 0.0;

    void build_time_knots();
    std::size_t segment_for_distance(double distance_m) const;
};

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_ROUTE_PROJECTOR_HPP
