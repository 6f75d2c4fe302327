#ifndef COMMPLAN_TIMELINE_RULE_ENGINE_HPP
#define COMMPLAN_TIMELINE_RULE_ENGINE_HPP

#include "core/route.hpp"
#include "timeline/coverage_analysis.hpp"
#include "timeline/mission_event.hpp"
#include "timeline/route_projector.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace commplan::timeline {

/**
 * @brief X azimuth exclusion cones and safety buffers
 *
 * Azimuths are relative to the aircraft nose. The refueling cone wraps
 * through 0 degrees (315..45).
 */
struct ConstraintConfig {
    double normal_azimuth_min = 135.0;
    double normal_azimuth_max = 225.0;
    double refuel_azimuth_min = 315.0;
    double refuel_azimuth_max = 45.0;
    double transition_buffer_s = 15.0 * 60.0;
    double takeoff_buffer_s = 15.0 * 60.0;
    double landing_buffer_s = 15.0 * 60.0;
    double elevation_min_deg = 0.0;
};

/// Refueling window resolved onto the mission time axis (inclusive bounds)
struct RefuelWindow {
    std::string name;
    double start_time = 0.0;
    double end_time = 0.0;

    bool contains(double t) const { return t >= start_time && t <= end_time; }
};

/// X satellite in force from `time` onward
struct XAssignment {
    double time = 0.0;
    std::string satellite_id;
};

using SatelliteLongitudeLookup = std::function<std::optional<double>(const std::string&)>;

/**
 * @brief Accumulates typed mission events from geometry and configuration
 *
 * Each add_* call appends events; sorted_events() returns them in time order
 * with ties kept in insertion order.
 */
class RuleEngine {
public:
    explicit RuleEngine(ConstraintConfig config = ConstraintConfig());

    const ConstraintConfig& config() const { return config_; }

    /**
     * Evaluate one aircraft position against the X constraints.
     * The elevation floor is checked first; when it fails the result is a
     * violation with reason ELEVATION regardless of azimuth.
     * @param refuel_mode  Use the refueling cone instead of the normal one
     * @throws GeometryInputError on non-finite input
     */
    AzimuthEvaluation evaluate_x_azimuth(double lat, double lon, double alt_m,
                                         double satellite_lon,
                                         std::optional<double> heading_deg,
                                         bool refuel_mode) const;

    /// Safety windows at departure and before arrival, on all three transports
    void add_takeoff_landing_buffers(double departure_time, double arrival_time);

    /// "AAR Start" / "AAR End" markers on X
    void add_refuel_window_events(const RefuelWindow& window);

    /// Degrade window of +/- transition buffer around an X handover
    void add_x_transition_events(double transition_time, const std::string& satellite_id);

    /**
     * Offline window for Ka or Ku.
     * @throws ConfigurationError for the X transport
     */
    void add_manual_outage_events(double start_time, double end_time, Transport transport,
                                  const std::string& reason, const std::string& outage_id);

    /// Coverage exit/entry per gap and a transition pair per swap
    void add_ka_coverage_events(const KaCoverageAnalysis& coverage);

    /**
     * Sweep route samples and record X azimuth violations as state changes.
     *
     * Samples without a heading are evaluated on absolute azimuth. Samples
     * whose assigned satellite has no known longitude are skipped. A
     * violation still open after the last sample is cleared at mission_end.
     *
     * @param samples         Route samples in time order
     * @param schedule        X assignments; need not be sorted
     * @param refuel_windows  Windows in which the refueling cone also applies
     * @param longitude_of    Satellite id -> longitude
     * @param route           Route used to name the nearest waypoint
     * @param mission_end     Closing time for an open violation
     */
    void add_x_azimuth_events(const std::vector<RouteSample>& samples,
                              std::vector<XAssignment> schedule,
                              const std::vector<RefuelWindow>& refuel_windows,
                              const SatelliteLongitudeLookup& longitude_of,
                              const Route& route,
                              double mission_end);

    const std::vector<MissionEvent>& events() const { return events_; }
    std::vector<MissionEvent> sorted_events() const;

    /**
     * "Disable X from HH:MMZ to HH:MMZ during transition to <sat>" for each
     * transition start matched with the next end for the same satellite.
     * Unmatched starts produce nothing.
     */
    std::vector<std::string> generate_advisories() const;

    void clear_events() { events_.clear(); }

private:
    ConstraintConfig config_;
    std::vector<MissionEvent> events_;

    void emit_safety_window(double timestamp, EventType type, Severity severity,
                            const std::string& reason);
    void append(MissionEvent ev) { events_.push_back(std::move(ev)); }
};

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_RULE_ENGINE_HPP
