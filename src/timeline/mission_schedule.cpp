#include "timeline/mission_schedule.hpp"
#include <algorithm>
#include <iostream>

namespace commplan::timeline {

std::optional<double> waypoint_time(const std::string& name,
                                    const RouteTemporalProjector& projector) {
    const RouteWaypoint* wp = projector.route().find_waypoint(name);
    if (!wp) return std::nullopt;
    if (wp->arrival_time) return wp->arrival_time;
    return projector.project(wp->latitude, wp->longitude).timestamp;
}

std::vector<RefuelWindow> resolve_refuel_windows(const std::vector<RefuelWindowSpec>& specs,
                                                 const RouteTemporalProjector& projector) {
    std::vector<RefuelWindow> windows;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        const auto start = waypoint_time(spec.start_waypoint, projector);
        const auto end = waypoint_time(spec.end_waypoint, projector);
        if (!start || !end) {
            std::cerr << "[Timeline] WARNING: refueling window '" << spec.id
                      << "' references an unknown waypoint, skipped\n";
            continue;
        }
        if (*end <= *start) {
            std::cerr << "[Timeline] WARNING: refueling window '" << spec.id
                      << "' ends before it starts, skipped\n";
            continue;
        }

        RefuelWindow w;
        w.name = spec.id.empty() ? "AAR-" + std::to_string(i + 1) : spec.id;
        w.start_time = *start;
        w.end_time = *end;
        windows.push_back(std::move(w));
    }
    return windows;
}

std::vector<XAssignment> project_x_transitions(const std::vector<XTransition>& transitions,
                                               const RouteTemporalProjector& projector) {
    std::vector<XAssignment> out;
    out.reserve(transitions.size());
    for (const auto& t : transitions) {
        const RouteProjection p = projector.project(t.latitude, t.longitude);
        out.push_back({p.timestamp, t.target_satellite_id});
    }
    return out;
}

std::vector<XAssignment> x_assignment_schedule(const std::string& initial_satellite,
                                               double mission_start,
                                               const std::vector<XAssignment>& transitions) {
    std::vector<XAssignment> schedule;
    schedule.reserve(transitions.size() + 1);
    schedule.push_back({mission_start, initial_satellite});
    schedule.insert(schedule.end(), transitions.begin(), transitions.end());
    std::stable_sort(schedule.begin(), schedule.end(),
                     [](const XAssignment& a, const XAssignment& b) { return a.time < b.time; });
    return schedule;
}

} // namespace commplan::timeline
