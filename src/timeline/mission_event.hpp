#ifndef COMMPLAN_TIMELINE_MISSION_EVENT_HPP
#define COMMPLAN_TIMELINE_MISSION_EVENT_HPP

#include "core/types.hpp"
#include <optional>
#include <string>

namespace commplan::timeline {

enum class EventType {
    X_AZIMUTH_VIOLATION,
    X_TRANSITION_START,
    X_TRANSITION_END,
    KA_COVERAGE_ENTRY,
    KA_COVERAGE_EXIT,
    KA_TRANSITION,
    KA_OUTAGE_START,
    KA_OUTAGE_END,
    KU_OUTAGE_START,
    KU_OUTAGE_END,
    TAKEOFF_BUFFER,
    LANDING_BUFFER,
    AAR_WINDOW       // air-refueling window marker
};

inline const char* to_string(EventType t) {
    switch (t) {
        case EventType::X_AZIMUTH_VIOLATION: return "x_azimuth_violation";
        case EventType::X_TRANSITION_START:  return "x_transition_start";
        case EventType::X_TRANSITION_END:    return "x_transition_end";
        case EventType::KA_COVERAGE_ENTRY:   return "ka_coverage_entry";
        case EventType::KA_COVERAGE_EXIT:    return "ka_coverage_exit";
        case EventType::KA_TRANSITION:       return "ka_transition";
        case EventType::KA_OUTAGE_START:     return "ka_outage_start";
        case EventType::KA_OUTAGE_END:       return "ka_outage_end";
        case EventType::KU_OUTAGE_START:     return "ku_outage_start";
        case EventType::KU_OUTAGE_END:       return "ku_outage_end";
        case EventType::TAKEOFF_BUFFER:      return "takeoff_buffer";
        case EventType::LANDING_BUFFER:      return "landing_buffer";
        case EventType::AAR_WINDOW:          return "aar_window";
    }
    return "?";
}

enum class ViolationReason { NONE, ELEVATION, AZIMUTH };

/**
 * @brief Outcome of one X azimuth/elevation check
 */
struct AzimuthEvaluation {
    bool violation = false;
    double absolute_azimuth = 0.0;
    double relative_azimuth = 0.0;
    double elevation = 0.0;
    double min_elevation = 0.0;
    bool elevation_below_min = false;
    ViolationReason reason = ViolationReason::NONE;
};

/**
 * @brief Context captured when an X azimuth violation opens
 */
struct ViolationRecord {
    AzimuthEvaluation evaluation;
    std::optional<double> heading;
    double sample_latitude = 0.0;
    double sample_longitude = 0.0;
    double satellite_longitude = 0.0;
    bool in_refuel_window = false;
    bool forward_violation = false;   // refueling-mode cone
    bool aft_violation = false;       // normal-mode cone
    bool x_ku_conflict = false;       // aft cone only, outside refueling windows
    std::string nearest_waypoint;
};

struct MissionEvent {
    double timestamp = 0.0;
    EventType type = EventType::X_AZIMUTH_VIOLATION;
    Transport transport = Transport::X;
    Transport affected_transport = Transport::X;
    Severity severity = Severity::WARNING;
    std::string reason;
    std::optional<std::string> satellite_id;

    std::optional<ViolationRecord> violation;  // X_AZIMUTH_VIOLATION openings only
    std::string transition_id;                 // KA_TRANSITION pairing key; AAR_WINDOW name
    std::string outage_id;                     // KA/KU outage pairing key

    bool is_activation() const {
        return severity == Severity::WARNING || severity == Severity::CRITICAL;
    }
};

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_MISSION_EVENT_HPP
