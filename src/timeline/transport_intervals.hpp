#ifndef COMMPLAN_TIMELINE_TRANSPORT_INTERVALS_HPP
#define COMMPLAN_TIMELINE_TRANSPORT_INTERVALS_HPP

#include "core/types.hpp"
#include "timeline/mission_event.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace commplan::timeline {

/**
 * @brief Span of constant state and reasons for one transport
 */
struct TransportInterval {
    Transport transport = Transport::X;
    TransportState state = TransportState::AVAILABLE;
    double start = 0.0;
    double end = 0.0;
    std::vector<std::string> reasons;
    bool x_ku_conflict_only = false;   // degraded only by flagged X/Ku aft-cone conditions

    double duration() const { return end - start; }
    bool contains(double t) const { return t >= start && t < end; }
};

/// Intervals indexed by transport_index()
using TransportIntervals = std::array<std::vector<TransportInterval>, 3>;

/**
 * @brief Active conditions of one transport, bucketed by effect
 *
 * Keys identify the condition (e.g. "x_azimuth", "ka_outage:<id>") and map to
 * the operator-facing reason. Iteration is in key order.
 */
class ConditionSet {
public:
    /// Apply one event. Returns false when nothing changed.
    bool apply(const MissionEvent& ev);

    TransportState state() const;

    /// Offline, then degraded, then safety reasons
    std::vector<std::string> reasons() const;

    bool x_ku_conflict_only() const;

private:
    std::map<std::string, std::string> offline_;
    std::map<std::string, std::string> degraded_;
    std::map<std::string, std::string> safety_;
    std::map<std::string, bool> x_ku_flags_;     // degraded key -> X/Ku conflict flag

    bool activate(std::map<std::string, std::string>& bucket, const std::string& key,
                  const std::string& reason);
    bool activate_degraded(const std::string& key, const std::string& reason, bool x_ku);
    bool deactivate(std::map<std::string, std::string>& bucket, const std::string& key);
};

/**
 * Sweep time-ordered events into a partition of [mission_start, mission_end]
 * per transport.
 *
 * Event times are clamped to the window and the sweep stops at the first
 * event at or after mission_end. An event that leaves state and reasons
 * unchanged opens no interval. A zero-length interval is replaced by its
 * successor, and adjacent equal intervals are merged.
 *
 * @param events  Events sorted by timestamp (ties in insertion order)
 * @throws TimelineComputationError if mission_end <= mission_start
 */
TransportIntervals build_transport_intervals(const std::vector<MissionEvent>& events,
                                             double mission_start, double mission_end);

/// Interval of one transport covering t; the last interval when none does
const TransportInterval* interval_at(const std::vector<TransportInterval>& intervals, double t);

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_TRANSPORT_INTERVALS_HPP
