#ifndef COMMPLAN_TIMELINE_TIMELINE_ASSEMBLER_HPP
#define COMMPLAN_TIMELINE_TIMELINE_ASSEMBLER_HPP

#include "core/types.hpp"
#include "timeline/mission_event.hpp"
#include "timeline/transport_intervals.hpp"
#include <array>
#include <string>
#include <vector>

namespace commplan::timeline {

struct TransportSnapshot {
    TransportState state = TransportState::AVAILABLE;
    std::vector<std::string> reasons;
};

/**
 * @brief Half-open span [start, end) with constant state on every transport
 */
struct TimelineSegment {
    std::string id;                                  // "<mission>-segment-NNN"
    double start = 0.0;
    double end = 0.0;
    TimelineStatus status = TimelineStatus::NOMINAL;
    std::array<TransportSnapshot, 3> transports;     // by transport_index()
    std::vector<std::string> reasons;                // deduplicated, first-seen order
    std::vector<Transport> impacted;
    bool x_ku_conflict_only = false;

    double duration() const { return end - start; }
    TransportState state_of(Transport t) const { return transports[transport_index(t)].state; }
};

struct TimelineStatistics {
    double total_duration_s = 0.0;
    double nominal_s = 0.0;
    double degraded_s = 0.0;
    double critical_s = 0.0;
    double next_conflict_s = -1.0;    // from mission start; -1 when every segment is nominal
};

struct RefuelMarkerBlock {
    std::string name;
    double start = 0.0;
    double end = 0.0;
};

struct MissionTimeline {
    std::string mission_id;
    double mission_start = 0.0;
    double mission_end = 0.0;
    std::vector<TimelineSegment> segments;
    std::vector<std::string> advisories;
    TimelineStatistics statistics;
    std::vector<RefuelMarkerBlock> refuel_blocks;
    std::vector<MissionEvent> events;
};

struct TimelineSummary {
    double mission_start = 0.0;
    double mission_end = 0.0;
    double degraded_s = 0.0;
    double critical_s = 0.0;
    double next_conflict_s = -1.0;
    std::array<TransportState, 3> worst_states = {
        TransportState::AVAILABLE, TransportState::AVAILABLE, TransportState::AVAILABLE
    };
    std::size_t sample_count = 0;
    double sample_interval_s = 0.0;
    double runtime_ms = 0.0;
};

/// 0 impacted -> NOMINAL, 1 -> DEGRADED, 2 or more -> CRITICAL
TimelineStatus status_for_impacted(std::size_t impacted_count);

/**
 * Merge per-transport partitions on the sorted union of their boundaries.
 *
 * A segment in which only X is impacted and the X interval is flagged as an
 * X/Ku aft-cone conflict is reported NOMINAL with its reasons kept and
 * x_ku_conflict_only set.
 */
std::vector<TimelineSegment> build_segments(const std::string& mission_id,
                                            const TransportIntervals& intervals,
                                            double mission_start, double mission_end);

/// Seconds per status and countdown to the first non-nominal segment
void attach_statistics(MissionTimeline& timeline);

/**
 * Refueling blocks from AAR_WINDOW markers. A block opens on a non-info
 * marker and closes on the next info marker; a block left open closes at the
 * last segment's end.
 */
void annotate_refuel_markers(MissionTimeline& timeline, const std::vector<MissionEvent>& events);

TimelineSummary summarize_timeline(const MissionTimeline& timeline, std::size_t sample_count,
                                   double sample_interval_s, double runtime_ms);

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_TIMELINE_ASSEMBLER_HPP
