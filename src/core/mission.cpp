#include "core/mission.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <set>

namespace commplan {

namespace {

void check_outages(const std::vector<ManualOutage>& outages, const char* label) {
    for (const auto& o : outages) {
        if (!std::isfinite(o.start_time) || !std::isfinite(o.duration_s) || o.duration_s < 0.0) {
            throw ConfigurationError(std::string(label) + " outage '" + o.id +
                                     "' has an invalid start or duration");
        }
    }
}

} // anonymous namespace

void MissionConfig::validate() const {
    if (id.empty()) {
        throw ConfigurationError("Mission has no id");
    }

    std::set<std::string> transition_ids;
    for (const auto& t : transports.x_transitions) {
        if (t.target_satellite_id.empty()) {
            throw ConfigurationError("X transition '" + t.id + "' has no target satellite");
        }
        if (!(t.latitude >= -90.0 && t.latitude <= 90.0) ||
            !(t.longitude >= -180.0 && t.longitude <= 180.0)) {
            throw ConfigurationError("X transition '" + t.id + "' has coordinates out of range");
        }
        if (!t.id.empty() && !transition_ids.insert(t.id).second) {
            throw ConfigurationError("Duplicate X transition id '" + t.id + "'");
        }
    }

    check_outages(transports.ka_outages, "Ka");
    check_outages(transports.ku_outages, "Ku");

    if (window_start.has_value() != window_end.has_value()) {
        throw ConfigurationError("Mission window override needs both start and end");
    }
    if (window_start && !(*window_end > *window_start)) {
        throw ConfigurationError("Mission window override must end after it starts");
    }

    for (const auto& w : transports.refuel_windows) {
        if (w.start_waypoint.empty() || w.end_waypoint.empty()) {
            throw ConfigurationError("Refueling window '" + w.id + "' needs start and end waypoints");
        }
    }
}

} // namespace commplan
