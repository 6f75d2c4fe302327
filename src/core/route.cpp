#include "core/route.hpp"
#include "core/errors.hpp"
#include "geo/geo_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace commplan {

namespace {

std::string normalize_name(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;

    std::string out = s.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string display_name(const RouteWaypoint& wp) {
    return wp.name.empty() ? "waypoint-" + std::to_string(wp.order) : wp.name;
}

} // anonymous namespace

void Route::validate() const {
    if (id.empty()) {
        throw ConfigurationError("Route has no id");
    }
    if (points.empty()) {
        throw ConfigurationError("Route '" + id + "' has no points");
    }
}

const RouteWaypoint* Route::find_waypoint(const std::string& wanted) const {
    const std::string key = normalize_name(wanted);
    if (key.empty()) return nullptr;

    for (const auto& wp : waypoints) {
        if (normalize_name(display_name(wp)) == key) {
            return &wp;
        }
    }
    return nullptr;
}

std::string Route::nearest_waypoint_name(double lat, double lon) const {
    std::string best;
    double best_dist = std::numeric_limits<double>::infinity();
    for (const auto& wp : waypoints) {
        double d = geo::haversine_distance(lat, lon, wp.latitude, wp.longitude);
        if (d < best_dist) {
            best_dist = d;
            best = display_name(wp);
        }
    }
    return best;
}

std::size_t Route::nearest_point_index(double lat, double lon) const {
    std::size_t best = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < points.size(); ++i) {
        double d = geo::haversine_distance(lat, lon, points[i].latitude, points[i].longitude);
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    return best;
}

} // namespace commplan
