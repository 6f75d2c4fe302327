#include "timeline/rule_engine.hpp"
#include "coordinate/time_utils.hpp"
#include "core/errors.hpp"
#include "geo/look_angles.hpp"
#include <algorithm>
#include <cstdio>

namespace commplan::timeline {

namespace {

std::string format(const char* fmt, double a) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, a);
    return buf;
}

std::string format(const char* fmt, double a, double b) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), fmt, a, b);
    return buf;
}

bool falls_within(double t, const std::vector<RefuelWindow>& windows) {
    for (const auto& w : windows) {
        if (w.contains(t)) return true;
    }
    return false;
}

// Reason line for an opened X azimuth violation. Line-of-sight and generic
// cone reasons carry trailing diagnostics; X-Ku and X-AAR conflicts do not.
std::string violation_reason(const ViolationRecord& rec, const std::string& satellite_id,
                             double timestamp) {
    const AzimuthEvaluation& ev = rec.evaluation;
    std::string reason;

    if (ev.reason == ViolationReason::ELEVATION) {
        reason = "X line-of-sight blocked (" + satellite_id + ", elevation "
               + format("%.1f\xC2\xB0 < min %.1f\xC2\xB0)", ev.elevation, ev.min_elevation);
    } else if (rec.x_ku_conflict) {
        return "X-Ku Conflict "
             + format("az=%.0f\xC2\xB0 el=%.0f\xC2\xB0", ev.relative_azimuth, ev.elevation);
    } else if (rec.forward_violation && !rec.aft_violation && rec.in_refuel_window) {
        return "X-AAR Conflict "
             + format("az=%.0f\xC2\xB0 el=%.0f\xC2\xB0", ev.relative_azimuth, ev.elevation);
    } else {
        const char* cone = (rec.forward_violation && rec.aft_violation) ? "forward & aft cones"
                         : rec.aft_violation ? "aft cone" : "forward cone";
        reason = "X azimuth conflict (" + satellite_id + ", " + cone + ", "
               + format("%.0f\xC2\xB0 relative)", ev.relative_azimuth);
    }

    reason += " [abs=" + format("%.1f\xC2\xB0", ev.absolute_azimuth)
            + " | sample=" + format("%.4f,%.4f", rec.sample_latitude, rec.sample_longitude)
            + " | t=" + TimeUtils::to_iso8601(timestamp);
    if (!rec.nearest_waypoint.empty()) reason += " | wp=" + rec.nearest_waypoint;
    reason += " | sat_lon=" + format("%.2f\xC2\xB0", rec.satellite_longitude);
    if (ev.elevation_below_min) reason += " | elev_below_min";
    reason += "]";
    return reason;
}

} // anonymous namespace

RuleEngine::RuleEngine(ConstraintConfig config)
    : config_(config) {}

AzimuthEvaluation RuleEngine::evaluate_x_azimuth(double lat, double lon, double alt_m,
                                                 double satellite_lon,
                                                 std::optional<double> heading_deg,
                                                 bool refuel_mode) const {
    const geo::LookAngles la = geo::look_angles(lat, lon, alt_m, satellite_lon);

    AzimuthEvaluation ev;
    ev.absolute_azimuth = la.azimuth;
    ev.relative_azimuth = geo::relative_to_heading(la.azimuth, heading_deg);
    ev.elevation = la.elevation;
    ev.min_elevation = config_.elevation_min_deg;
    ev.elevation_below_min = la.elevation < config_.elevation_min_deg;

    if (ev.elevation_below_min) {
        ev.violation = true;
        ev.reason = ViolationReason::ELEVATION;
        return ev;
    }

    const bool in_cone = refuel_mode
        ? geo::is_in_azimuth_range(ev.relative_azimuth,
                                   config_.refuel_azimuth_min, config_.refuel_azimuth_max)
        : geo::is_in_azimuth_range(ev.relative_azimuth,
                                   config_.normal_azimuth_min, config_.normal_azimuth_max);
    if (in_cone) {
        ev.violation = true;
        ev.reason = ViolationReason::AZIMUTH;
    }
    return ev;
}

// ═══════════════════════════════════════════════════════════════
// Event producers
// ═══════════════════════════════════════════════════════════════

void RuleEngine::emit_safety_window(double timestamp, EventType type, Severity severity,
                                    const std::string& reason) {
    for (Transport t : ALL_TRANSPORTS) {
        MissionEvent ev;
        ev.timestamp = timestamp;
        ev.type = type;
        ev.transport = t;
        ev.affected_transport = t;
        ev.severity = severity;
        ev.reason = reason;
        append(std::move(ev));
    }
}

void RuleEngine::add_takeoff_landing_buffers(double departure_time, double arrival_time) {
    emit_safety_window(departure_time, EventType::TAKEOFF_BUFFER, Severity::SAFETY,
                       "Safety-of-Flight (takeoff)");
    emit_safety_window(departure_time + config_.takeoff_buffer_s, EventType::TAKEOFF_BUFFER,
                       Severity::INFO, "Takeoff window complete");
    emit_safety_window(arrival_time - config_.landing_buffer_s, EventType::LANDING_BUFFER,
                       Severity::SAFETY, "Safety-of-Flight (landing)");
    emit_safety_window(arrival_time, EventType::LANDING_BUFFER, Severity::INFO,
                       "Landing window complete");
}

void RuleEngine::add_refuel_window_events(const RefuelWindow& window) {
    MissionEvent start;
    start.timestamp = window.start_time;
    start.type = EventType::AAR_WINDOW;
    start.transport = Transport::X;
    start.affected_transport = Transport::X;
    start.severity = Severity::SAFETY;
    start.reason = "AAR Start";
    start.transition_id = window.name;

    MissionEvent end = start;
    end.timestamp = window.end_time;
    end.severity = Severity::INFO;
    end.reason = "AAR End";

    append(std::move(start));
    append(std::move(end));
}

void RuleEngine::add_x_transition_events(double transition_time,
                                         const std::string& satellite_id) {
    MissionEvent start;
    start.timestamp = transition_time - config_.transition_buffer_s;
    start.type = EventType::X_TRANSITION_START;
    start.transport = Transport::X;
    start.affected_transport = Transport::X;
    start.severity = Severity::WARNING;
    start.reason = "X Transition to " + satellite_id;
    start.satellite_id = satellite_id;

    MissionEvent end = start;
    end.timestamp = transition_time + config_.transition_buffer_s;
    end.type = EventType::X_TRANSITION_END;
    end.severity = Severity::INFO;

    append(std::move(start));
    append(std::move(end));
}

void RuleEngine::add_manual_outage_events(double start_time, double end_time,
                                          Transport transport, const std::string& reason,
                                          const std::string& outage_id) {
    if (transport == Transport::X) {
        throw ConfigurationError("Manual outages apply to Ka or Ku only");
    }
    const bool ka = transport == Transport::KA;

    MissionEvent start;
    start.timestamp = start_time;
    start.type = ka ? EventType::KA_OUTAGE_START : EventType::KU_OUTAGE_START;
    start.transport = transport;
    start.affected_transport = transport;
    start.severity = Severity::WARNING;
    start.reason = reason.empty() ? std::string(to_string(transport)) + " outage" : reason;
    start.outage_id = outage_id;

    MissionEvent end = start;
    end.timestamp = end_time;
    end.type = ka ? EventType::KA_OUTAGE_END : EventType::KU_OUTAGE_END;
    end.severity = Severity::INFO;
    end.reason = std::string(to_string(transport)) + " outage ended";

    append(std::move(start));
    append(std::move(end));
}

void RuleEngine::add_ka_coverage_events(const KaCoverageAnalysis& coverage) {
    for (const auto& gap : coverage.gaps) {
        MissionEvent exit;
        exit.timestamp = gap.start.timestamp;
        exit.type = EventType::KA_COVERAGE_EXIT;
        exit.transport = Transport::KA;
        exit.affected_transport = Transport::KA;
        exit.severity = Severity::WARNING;
        exit.reason = "Ka coverage lost (" + gap.lost_satellite.value_or("unknown") + ")";
        exit.satellite_id = gap.lost_satellite;
        append(std::move(exit));

        if (gap.end) {
            MissionEvent entry;
            entry.timestamp = gap.end->timestamp;
            entry.type = EventType::KA_COVERAGE_ENTRY;
            entry.transport = Transport::KA;
            entry.affected_transport = Transport::KA;
            entry.severity = Severity::INFO;
            entry.reason = "Ka coverage restored ("
                         + gap.regained_satellite.value_or("unknown") + ")";
            entry.satellite_id = gap.regained_satellite;
            append(std::move(entry));
        }
    }

    for (std::size_t i = 0; i < coverage.swaps.size(); ++i) {
        const auto& swap = coverage.swaps[i];
        const std::string pair = swap.from_satellite + "->" + swap.to_satellite;

        MissionEvent start;
        start.timestamp = swap.midpoint.timestamp - config_.transition_buffer_s;
        start.type = EventType::KA_TRANSITION;
        start.transport = Transport::KA;
        start.affected_transport = Transport::KA;
        start.severity = Severity::WARNING;
        start.reason = "Ka transition " + swap.from_satellite + " \xE2\x86\x92 " + swap.to_satellite;
        start.satellite_id = pair;
        start.transition_id = pair + "-" + std::to_string(i);

        MissionEvent end = start;
        end.timestamp = swap.midpoint.timestamp + config_.transition_buffer_s;
        end.severity = Severity::INFO;
        end.reason = start.reason + " complete";

        append(std::move(start));
        append(std::move(end));
    }
}

// ── X azimuth sweep ──

void RuleEngine::add_x_azimuth_events(const std::vector<RouteSample>& samples,
                                      std::vector<XAssignment> schedule,
                                      const std::vector<RefuelWindow>& refuel_windows,
                                      const SatelliteLongitudeLookup& longitude_of,
                                      const Route& route,
                                      double mission_end) {
    if (samples.empty() || schedule.empty()) return;

    std::stable_sort(schedule.begin(), schedule.end(),
                     [](const XAssignment& a, const XAssignment& b) { return a.time < b.time; });

    std::size_t cursor = 0;
    bool active = false;

    for (const auto& sample : samples) {
        while (cursor + 1 < schedule.size() && sample.timestamp >= schedule[cursor + 1].time) {
            ++cursor;
        }
        const std::string& satellite_id = schedule[cursor].satellite_id;
        const std::optional<double> sat_lon = longitude_of(satellite_id);
        if (!sat_lon) continue;

        const bool in_refuel = falls_within(sample.timestamp, refuel_windows);

        const AzimuthEvaluation aft = evaluate_x_azimuth(
            sample.latitude, sample.longitude, sample.altitude, *sat_lon, sample.heading, false);
        bool forward = false;
        if (in_refuel) {
            forward = evaluate_x_azimuth(sample.latitude, sample.longitude, sample.altitude,
                                         *sat_lon, sample.heading, true).violation;
        }
        const bool violation = aft.violation || forward;

        if (violation && !active) {
            ViolationRecord rec;
            rec.evaluation = aft;
            rec.heading = sample.heading;
            rec.sample_latitude = sample.latitude;
            rec.sample_longitude = sample.longitude;
            rec.satellite_longitude = *sat_lon;
            rec.in_refuel_window = in_refuel;
            rec.forward_violation = forward;
            rec.aft_violation = aft.violation;
            rec.x_ku_conflict = aft.violation && !forward && !in_refuel
                             && aft.reason == ViolationReason::AZIMUTH;
            rec.nearest_waypoint = route.nearest_waypoint_name(sample.latitude, sample.longitude);

            MissionEvent ev;
            ev.timestamp = sample.timestamp;
            ev.type = EventType::X_AZIMUTH_VIOLATION;
            ev.transport = Transport::X;
            ev.affected_transport = Transport::X;
            ev.severity = Severity::WARNING;
            ev.reason = violation_reason(rec, satellite_id, sample.timestamp);
            ev.satellite_id = satellite_id;
            ev.violation = std::move(rec);
            append(std::move(ev));
            active = true;
        } else if (!violation && active) {
            MissionEvent ev;
            ev.timestamp = sample.timestamp;
            ev.type = EventType::X_AZIMUTH_VIOLATION;
            ev.transport = Transport::X;
            ev.affected_transport = Transport::X;
            ev.severity = Severity::INFO;
            ev.reason = "X azimuth clear";
            ev.satellite_id = satellite_id;
            append(std::move(ev));
            active = false;
        }
    }

    if (active) {
        MissionEvent ev;
        ev.timestamp = mission_end;
        ev.type = EventType::X_AZIMUTH_VIOLATION;
        ev.transport = Transport::X;
        ev.affected_transport = Transport::X;
        ev.severity = Severity::INFO;
        ev.reason = "X azimuth clear";
        ev.satellite_id = schedule[cursor].satellite_id;
        append(std::move(ev));
    }
}

std::vector<MissionEvent> RuleEngine::sorted_events() const {
    std::vector<MissionEvent> out = events_;
    std::stable_sort(out.begin(), out.end(),
                     [](const MissionEvent& a, const MissionEvent& b) {
                         return a.timestamp < b.timestamp;
                     });
    return out;
}

std::vector<std::string> RuleEngine::generate_advisories() const {
    std::vector<const MissionEvent*> starts;
    std::vector<const MissionEvent*> ends;
    std::vector<MissionEvent> sorted = sorted_events();
    for (const auto& ev : sorted) {
        if (ev.type == EventType::X_TRANSITION_START) starts.push_back(&ev);
        else if (ev.type == EventType::X_TRANSITION_END) ends.push_back(&ev);
    }

    std::vector<std::string> advisories;
    std::size_t end_idx = 0;
    for (const MissionEvent* start : starts) {
        std::size_t match = end_idx;
        while (match < ends.size() && ends[match]->satellite_id != start->satellite_id) ++match;
        if (match >= ends.size()) continue;

        const MissionEvent* end = ends[match];
        advisories.push_back("Disable X from " + TimeUtils::to_hhmm_z(start->timestamp)
                             + " to " + TimeUtils::to_hhmm_z(end->timestamp)
                             + " during transition to " + start->satellite_id.value_or("unknown"));
        end_idx = match + 1;
    }
    return advisories;
}

} // namespace commplan::timeline
