#include "timeline/timeline_assembler.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <set>

namespace commplan::timeline {

TimelineStatus status_for_impacted(std::size_t impacted_count) {
    if (impacted_count == 0) return TimelineStatus::NOMINAL;
    if (impacted_count == 1) return TimelineStatus::DEGRADED;
    return TimelineStatus::CRITICAL;
}

std::vector<TimelineSegment> build_segments(const std::string& mission_id,
                                            const TransportIntervals& intervals,
                                            double mission_start, double mission_end) {
    if (!(mission_end > mission_start)) {
        throw TimelineComputationError("mission_end must be after mission_start");
    }

    std::set<double> boundary_set = {mission_start, mission_end};
    for (const auto& list : intervals) {
        for (const auto& iv : list) {
            boundary_set.insert(iv.start);
            boundary_set.insert(iv.end);
        }
    }
    std::vector<double> boundaries;
    for (double b : boundary_set) {
        if (b >= mission_start && b <= mission_end) boundaries.push_back(b);
    }

    std::vector<TimelineSegment> segments;
    for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
        const double start = boundaries[i];
        const double end = boundaries[i + 1];
        if (start >= end) continue;

        TimelineSegment seg;
        char id[32];
        std::snprintf(id, sizeof(id), "-segment-%03zu", segments.size() + 1);
        seg.id = mission_id + id;
        seg.start = start;
        seg.end = end;

        const TransportInterval* x_interval = nullptr;
        for (Transport t : ALL_TRANSPORTS) {
            const TransportInterval* iv = interval_at(intervals[transport_index(t)], start);
            TransportSnapshot& snap = seg.transports[transport_index(t)];
            if (iv) {
                snap.state = iv->state;
                snap.reasons = iv->reasons;
            }
            if (t == Transport::X) x_interval = iv;
            if (snap.state != TransportState::AVAILABLE) seg.impacted.push_back(t);

            for (const auto& r : snap.reasons) {
                if (!r.empty() && std::find(seg.reasons.begin(), seg.reasons.end(), r)
                                      == seg.reasons.end()) {
                    seg.reasons.push_back(r);
                }
            }
        }

        seg.status = status_for_impacted(seg.impacted.size());
        if (x_interval && x_interval->x_ku_conflict_only &&
            seg.impacted.size() == 1 && seg.impacted[0] == Transport::X) {
            seg.status = TimelineStatus::NOMINAL;
            seg.x_ku_conflict_only = true;
        }
        segments.push_back(std::move(seg));
    }
    return segments;
}

void attach_statistics(MissionTimeline& timeline) {
    TimelineStatistics stats;
    stats.total_duration_s = std::max(timeline.mission_end - timeline.mission_start, 1.0);

    for (const auto& seg : timeline.segments) {
        const double d = seg.duration();
        if (d <= 0.0) continue;
        if (seg.status == TimelineStatus::DEGRADED) stats.degraded_s += d;
        else if (seg.status == TimelineStatus::CRITICAL) stats.critical_s += d;

        if (seg.status != TimelineStatus::NOMINAL && stats.next_conflict_s < 0.0) {
            stats.next_conflict_s = seg.start - timeline.mission_start;
        }
    }
    stats.nominal_s = stats.total_duration_s - stats.degraded_s - stats.critical_s;
    timeline.statistics = stats;
}

void annotate_refuel_markers(MissionTimeline& timeline, const std::vector<MissionEvent>& events) {
    timeline.refuel_blocks.clear();
    if (timeline.segments.empty()) return;

    bool pending = false;
    RefuelMarkerBlock block;
    for (const auto& ev : events) {
        if (ev.type != EventType::AAR_WINDOW) continue;
        if (ev.severity != Severity::INFO) {
            block.name = ev.transition_id;
            block.start = ev.timestamp;
            pending = true;
        } else if (pending) {
            block.end = ev.timestamp;
            timeline.refuel_blocks.push_back(block);
            pending = false;
        }
    }
    if (pending) {
        block.end = timeline.segments.back().end;
        timeline.refuel_blocks.push_back(block);
    }
}

TimelineSummary summarize_timeline(const MissionTimeline& timeline, std::size_t sample_count,
                                   double sample_interval_s, double runtime_ms) {
    TimelineSummary summary;
    summary.mission_start = timeline.mission_start;
    summary.mission_end = timeline.mission_end;
    summary.sample_count = sample_count;
    summary.sample_interval_s = sample_interval_s;
    summary.runtime_ms = runtime_ms;

    for (const auto& seg : timeline.segments) {
        const double d = seg.duration();
        if (d <= 0.0) continue;
        if (seg.status == TimelineStatus::DEGRADED) summary.degraded_s += d;
        else if (seg.status == TimelineStatus::CRITICAL) summary.critical_s += d;

        if (seg.status != TimelineStatus::NOMINAL && summary.next_conflict_s < 0.0) {
            summary.next_conflict_s = seg.start - timeline.mission_start;
        }
        for (Transport t : ALL_TRANSPORTS) {
            TransportState& worst = summary.worst_states[transport_index(t)];
            if (state_rank(seg.state_of(t)) > state_rank(worst)) worst = seg.state_of(t);
        }
    }
    return summary;
}

} // namespace commplan::timeline
