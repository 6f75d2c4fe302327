#ifndef COMMPLAN_FLIGHT_ETA_CALCULATOR_HPP
#define COMMPLAN_FLIGHT_ETA_CALCULATOR_HPP

#include "core/poi.hpp"
#include "core/route.hpp"
#include "flight/flight_state_manager.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace commplan::flight {

/// ETA returned when no finite estimate exists (no speed, or time already passed)
inline constexpr double ETA_UNKNOWN = -1.0;

struct EtaConfig {
    double smoothing_window_s = 120.0;
    double default_speed_knots = 150.0;
    double passed_threshold_m = 100.0;
    double projection_tolerance_m = 1000.0;   // off-route projection to segment match
    double min_speed_knots = 0.5;
};

struct PoiMetrics {
    std::string poi_id;
    std::string poi_name;
    std::string poi_category;
    double distance_m = 0.0;
    double eta_seconds = ETA_UNKNOWN;
    EtaMode eta_type = EtaMode::ESTIMATED;
    bool passed = false;
    std::optional<FlightPhase> flight_phase;
    bool is_pre_departure = false;
};

struct EtaStats {
    double smoothed_speed_knots = 0.0;
    std::size_t speed_samples = 0;
    double smoothing_window_s = 0.0;
    double window_coverage_s = 0.0;   // newest minus oldest sample time
    std::size_t passed_count = 0;
    std::optional<double> last_update;
};

/**
 * @brief Distance and time-to-go for points of interest
 *
 * Route-aware estimates are tried first when the POI belongs to the active
 * route; otherwise, or when they give nothing, ETA is distance over speed.
 * POIs once within the passed threshold stay passed until clear_passed().
 */
class EtaCalculator {
public:
    using Clock = std::function<double()>;

    explicit EtaCalculator(EtaConfig config = EtaConfig(), Clock clock = Clock());

    EtaCalculator(const EtaCalculator&) = delete;
    EtaCalculator& operator=(const EtaCalculator&) = delete;

    const EtaConfig& config() const { return config_; }

    /// Append a speed sample and recompute the mean over the smoothing window
    void update_speed(double speed_knots, std::optional<double> now = std::nullopt);
    double smoothed_speed() const;

    double calculate_distance(double lat1, double lon1, double lat2, double lon2) const;

    /**
     * @param speed_knots  Smoothed speed when absent
     * @return seconds, or ETA_UNKNOWN below the minimum speed
     */
    double calculate_eta(double distance_m, std::optional<double> speed_knots = std::nullopt) const;

    /**
     * Metrics for each POI, in input order.
     * @param speed_knots   Live speed; default speed for the fallback when absent
     * @param active_route  Route whose id selects route-aware estimation
     */
    std::vector<PoiMetrics> calculate_poi_metrics(double current_lat, double current_lon,
                                                  const std::vector<PointOfInterest>& pois,
                                                  std::optional<double> speed_knots = std::nullopt,
                                                  const Route* active_route = nullptr,
                                                  EtaMode eta_mode = EtaMode::ESTIMATED,
                                                  std::optional<FlightPhase> flight_phase = std::nullopt);

    /**
     * In-flight estimate along the route: the current segment at the mean of
     * live and planned speed, later segments at their planned speed.
     * @return nullopt when the POI is neither a waypoint nor projected onto the route
     */
    std::optional<double> estimated_route_eta(double current_lat, double current_lon,
                                              const PointOfInterest& poi, const Route& route,
                                              std::optional<double> speed_knots) const;

    /**
     * Pre-departure estimate from planned waypoint arrival times.
     * @return ETA_UNKNOWN if the planned time has passed; nullopt without a plan
     */
    std::optional<double> anticipated_route_eta(const PointOfInterest& poi, const Route& route,
                                                double now) const;

    /// Approximate point-to-segment distance from the three pairwise great-circle distances, in meters
    double distance_to_segment(double lat, double lon,
                               double start_lat, double start_lon,
                               double end_lat, double end_lon) const;

    std::set<std::string> passed_pois() const;
    void clear_passed();
    void reset();
    EtaStats get_stats() const;

private:
    EtaConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::deque<std::pair<double, double>> speed_history_;   // (time, knots)
    double smoothed_speed_;
    std::optional<double> last_update_;
    std::set<std::string> passed_;

    double segment_hours(const RoutePoint& from, const RoutePoint& to, double speed,
                         bool current_segment) const;
};

} // namespace commplan::flight

#endif // COMMPLAN_FLIGHT_ETA_CALCULATOR_HPP
