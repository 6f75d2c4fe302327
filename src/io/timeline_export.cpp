#include "io/timeline_export.hpp"
#include "coordinate/time_utils.hpp"
#include "io/json_writer.hpp"

namespace commplan {

using timeline::MissionEvent;
using timeline::TimelineSegment;

namespace {

void write_segment(JsonWriter& w, const TimelineSegment& seg) {
    w.begin_object();
    w.kv("id", seg.id);
    w.kv("start_time", TimeUtils::to_iso8601(seg.start));
    w.kv("end_time", TimeUtils::to_iso8601(seg.end));
    w.kv("duration_seconds", seg.duration());
    w.kv("status", to_string(seg.status));
    w.kv("x_state", to_string(seg.state_of(Transport::X)));
    w.kv("ka_state", to_string(seg.state_of(Transport::KA)));
    w.kv("ku_state", to_string(seg.state_of(Transport::KU)));
    w.string_array("reasons", seg.reasons);

    w.key("impacted_transports").begin_array();
    for (Transport t : seg.impacted) w.value(to_string(t));
    w.end_array();

    w.kv("x_ku_conflict_only", seg.x_ku_conflict_only);
    w.end_object();
}

void write_event(JsonWriter& w, const MissionEvent& ev) {
    w.begin_object();
    w.kv("timestamp", TimeUtils::to_iso8601(ev.timestamp));
    w.kv("type", to_string(ev.type));
    w.kv("transport", to_string(ev.transport));
    w.kv("affected_transport", to_string(ev.affected_transport));
    w.kv("severity", to_string(ev.severity));
    w.kv("reason", ev.reason);
    w.kv("satellite_id", ev.satellite_id);

    if (ev.violation) {
        const auto& v = *ev.violation;
        w.key("violation").begin_object();
        w.kv("absolute_azimuth", v.evaluation.absolute_azimuth);
        w.kv("relative_azimuth", v.evaluation.relative_azimuth);
        w.kv("elevation", v.evaluation.elevation);
        w.kv("elevation_below_min", v.evaluation.elevation_below_min);
        w.kv("heading", v.heading);
        w.kv("in_refuel_window", v.in_refuel_window);
        w.kv("forward_violation", v.forward_violation);
        w.kv("aft_violation", v.aft_violation);
        w.kv("x_ku_conflict", v.x_ku_conflict);
        w.kv("nearest_waypoint", v.nearest_waypoint);
        w.end_object();
    }
    if (!ev.transition_id.empty()) w.kv("transition_id", ev.transition_id);
    if (!ev.outage_id.empty()) w.kv("outage_id", ev.outage_id);
    w.end_object();
}

} // anonymous namespace

void write_timeline_json(const timeline::MissionTimeline& timeline,
                         const timeline::TimelineSummary& summary,
                         std::ostream& out,
                         bool include_events) {
    JsonWriter w(out);

    w.begin_object();
    w.kv("mission_id", timeline.mission_id);
    w.kv("mission_start", TimeUtils::to_iso8601(timeline.mission_start));
    w.kv("mission_end", TimeUtils::to_iso8601(timeline.mission_end));

    // ── segments ──
    w.key("segments").begin_array();
    for (const auto& seg : timeline.segments) write_segment(w, seg);
    w.end_array();

    w.string_array("advisories", timeline.advisories);

    // ── statistics ──
    const auto& st = timeline.statistics;
    w.key("statistics").begin_object();
    w.kv("total_duration_seconds", st.total_duration_s);
    w.kv("nominal_seconds", st.nominal_s);
    w.kv("degraded_seconds", st.degraded_s);
    w.kv("critical_seconds", st.critical_s);
    w.kv("next_conflict_seconds", st.next_conflict_s);
    w.end_object();

    // ── refueling blocks ──
    w.key("aar_blocks").begin_array();
    for (const auto& b : timeline.refuel_blocks) {
        w.begin_object();
        w.kv("name", b.name);
        w.kv("start", TimeUtils::to_iso8601(b.start));
        w.kv("end", TimeUtils::to_iso8601(b.end));
        w.end_object();
    }
    w.end_array();

    if (include_events) {
        w.key("events").begin_array();
        for (const auto& ev : timeline.events) write_event(w, ev);
        w.end_array();
    }

    // ── summary ──
    w.key("summary").begin_object();
    w.kv("mission_start", TimeUtils::to_iso8601(summary.mission_start));
    w.kv("mission_end", TimeUtils::to_iso8601(summary.mission_end));
    w.kv("degraded_seconds", summary.degraded_s);
    w.kv("critical_seconds", summary.critical_s);
    w.kv("next_conflict_seconds", summary.next_conflict_s);
    w.key("transport_states").begin_object();
    for (Transport t : ALL_TRANSPORTS) {
        w.kv(to_string(t), to_string(summary.worst_states[transport_index(t)]));
    }
    w.end_object();
    w.kv("sample_count", summary.sample_count);
    w.kv("sample_interval_seconds", summary.sample_interval_s);
    w.kv("generation_runtime_ms", summary.runtime_ms);
    w.end_object();

    w.end_object();
    out << "\n";
}

} // namespace commplan
