/**
 * Timeline JSON export.
 *
 * Format:
 *   { "mission_id", "mission_start", "mission_end",
 *     "segments": [...], "advisories": [...], "statistics": {...},
 *     "aar_blocks": [...], "events": [...], "summary": {...} }
 *
 * Times are ISO-8601 UTC strings; durations are seconds.
 */

#ifndef COMMPLAN_IO_TIMELINE_EXPORT_HPP
#define COMMPLAN_IO_TIMELINE_EXPORT_HPP

#include "timeline/timeline_assembler.hpp"
#include <ostream>

namespace commplan {

void write_timeline_json(const timeline::MissionTimeline& timeline,
                         const timeline::TimelineSummary& summary,
                         std::ostream& out,
                         bool include_events = true);

} // namespace commplan

#endif // COMMPLAN_IO_TIMELINE_EXPORT_HPP
