#ifndef COMMPLAN_CORE_POI_HPP
#define COMMPLAN_CORE_POI_HPP

#include <optional>
#include <string>

namespace commplan {

/**
 * @brief Point of interest with optional precomputed route projection
 */
struct PointOfInterest {
    std::string id;
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string category;
    std::string route_id;                          // empty: not tied to a route

    // Nearest point on the associated route, for off-route POIs
    std::optional<double> projected_latitude;
    std::optional<double> projected_longitude;
    std::optional<int> projected_waypoint_index;
    std::optional<double> projected_route_progress; // percent

    bool has_projection() const {
        return projected_latitude && projected_longitude && projected_route_progress;
    }
};

} // namespace commplan

#endif // COMMPLAN_CORE_POI_HPP
