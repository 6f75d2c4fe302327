#ifndef COMMPLAN_TIMELINE_MISSION_SCHEDULE_HPP
#define COMMPLAN_TIMELINE_MISSION_SCHEDULE_HPP

#include "core/mission.hpp"
#include "timeline/route_projector.hpp"
#include "timeline/rule_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace commplan::timeline {

/**
 * Time at which the route reaches a named waypoint: the waypoint's own
 * arrival time when present, otherwise the projection of its coordinates.
 * @return nullopt for an unknown name
 */
std::optional<double> waypoint_time(const std::string& name,
                                    const RouteTemporalProjector& projector);

/**
 * Refueling windows placed on the mission time axis. Windows naming an
 * unknown waypoint or with end <= start are dropped. Unnamed windows are
 * called "AAR-<n>" by position.
 */
std::vector<RefuelWindow> resolve_refuel_windows(const std::vector<RefuelWindowSpec>& specs,
                                                 const RouteTemporalProjector& projector);

/// Each X transition projected onto the route, in configuration order
std::vector<XAssignment> project_x_transitions(const std::vector<XTransition>& transitions,
                                               const RouteTemporalProjector& projector);

/**
 * Assignment schedule: the initial satellite at mission start followed by the
 * projected transitions, sorted by time.
 */
std::vector<XAssignment> x_assignment_schedule(const std::string& initial_satellite,
                                               double mission_start,
                                               const std::vector<XAssignment>& transitions);

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_MISSION_SCHEDULE_HPP
