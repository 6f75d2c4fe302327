#ifndef COMMPLAN_CORE_MISSION_HPP
#define COMMPLAN_CORE_MISSION_HPP

#include <optional>
#include <string>
#include <vector>

namespace commplan {

/// Planned handover of the X link to another satellite at a route coordinate
struct XTransition {
    std::string id;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string target_satellite_id;
    std::string target_beam_id;
    bool is_same_satellite_transition = false;
};

/// Operator-declared outage window (Ka outage or Ku override)
struct ManualOutage {
    std::string id;
    double start_time = 0.0;       // epoch seconds
    double duration_s = 0.0;
    std::string reason;            // empty: "<transport> outage"

    double end_time() const { return start_time + duration_s; }
};

/// Air-refueling window bounded by two named route waypoints
struct RefuelWindowSpec {
    std::string id;
    std::string start_waypoint;
    std::string end_waypoint;
};

struct TransportConfig {
    std::string initial_x_satellite_id;
    std::vector<std::string> initial_ka_satellite_ids = {"AOR", "POR", "IOR"};
    std::vector<XTransition> x_transitions;
    std::vector<ManualOutage> ka_outages;
    std::vector<RefuelWindowSpec> refuel_windows;
    std::vector<ManualOutage> ku_outages;
};

/**
 * @brief Communication plan for one mission leg
 */
struct MissionConfig {
    std::string id;
    std::string name;
    std::string route_id;
    TransportConfig transports;
    std::optional<double> window_start;   // mission window override, both or neither
    std::optional<double> window_end;

    /// @throws ConfigurationError describing the first invalid field
    void validate() const;
};

} // namespace commplan

#endif // COMMPLAN_CORE_MISSION_HPP
