#ifndef COMMPLAN_CORE_ROUTE_HPP
#define COMMPLAN_CORE_ROUTE_HPP

#include <optional>
#include <string>
#include <vector>

namespace commplan {

/**
 * @brief One vertex of the planned route geometry
 */
struct RoutePoint {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> altitude;              // meters; cruise altitude when absent
    int sequence = 0;
    std::optional<double> arrival_time;          // epoch seconds
    std::optional<double> segment_speed_knots;   // planned speed of the segment starting here
};

/**
 * @brief Named waypoint on the route (departure, refuel, arrival, ...)
 */
struct RouteWaypoint {
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
    int order = 0;
    std::string role;                            // free-form tag, may be empty
    std::optional<double> arrival_time;          // epoch seconds
};

struct RouteTimingProfile {
    std::optional<double> departure_time;
    std::optional<double> arrival_time;
    bool has_timing_data = false;
};

/**
 * @brief Immutable route as loaded from a route source
 */
struct Route {
    std::string id;
    std::string name;
    std::vector<RoutePoint> points;
    std::vector<RouteWaypoint> waypoints;
    RouteTimingProfile timing;

    /// @throws ConfigurationError if the route has no id or no points
    void validate() const;

    /**
     * Waypoint lookup by name, ignoring case and surrounding whitespace.
     * Unnamed waypoints answer to "waypoint-<order>".
     * @return nullptr when no waypoint matches
     */
    const RouteWaypoint* find_waypoint(const std::string& name) const;

    /// Name of the waypoint closest to (lat, lon); empty when the route has none
    std::string nearest_waypoint_name(double lat, double lon) const;

    /// Index of the route point closest to (lat, lon); 0 for an empty route
    std::size_t nearest_point_index(double lat, double lon) const;
};

} // namespace commplan

#endif // COMMPLAN_CORE_ROUTE_HPP
