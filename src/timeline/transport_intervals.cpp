#include "timeline/transport_intervals.hpp"
#include "core/errors.hpp"

namespace commplan::timeline {

// ═══════════════════════════════════════════════════════════════
// ConditionSet
// ═══════════════════════════════════════════════════════════════

bool ConditionSet::activate(std::map<std::string, std::string>& bucket,
                            const std::string& key, const std::string& reason) {
    auto it = bucket.find(key);
    if (it != bucket.end() && it->second == reason) return false;
    bucket[key] = reason;
    return true;
}

bool ConditionSet::activate_degraded(const std::string& key, const std::string& reason,
                                     bool x_ku) {
    bool flag_changed = false;
    auto f = x_ku_flags_.find(key);
    if (f == x_ku_flags_.end() || f->second != x_ku) {
        x_ku_flags_[key] = x_ku;
        flag_changed = true;
    }
    return activate(degraded_, key, reason) || flag_changed;
}

bool ConditionSet::deactivate(std::map<std::string, std::string>& bucket,
                              const std::string& key) {
    if (&bucket == &degraded_) x_ku_flags_.erase(key);
    return bucket.erase(key) > 0;
}

bool ConditionSet::apply(const MissionEvent& ev) {
    const bool activation = ev.is_activation();
    const std::string sat = ev.satellite_id.value_or("");

    switch (ev.type) {
        case EventType::X_TRANSITION_START: {
            const std::string key = "x_transition:" + (sat.empty() ? "unknown" : sat);
            return activate_degraded(key, ev.reason.empty() ? "X transition " + sat : ev.reason,
                                     false);
        }
        case EventType::X_TRANSITION_END:
            return deactivate(degraded_, "x_transition:" + (sat.empty() ? "unknown" : sat));

        case EventType::TAKEOFF_BUFFER:
        case EventType::LANDING_BUFFER: {
            const bool takeoff = ev.type == EventType::TAKEOFF_BUFFER;
            const std::string key = takeoff ? "takeoff_buffer" : "landing_buffer";
            const std::string reason = !ev.reason.empty() ? ev.reason
                                     : takeoff ? "Takeoff buffer" : "Landing buffer";
            if (ev.severity == Severity::SAFETY) return activate(safety_, key, reason);
            if (activation) return activate_degraded(key, reason, false);

            const bool d1 = deactivate(degraded_, key);
            const bool d2 = deactivate(safety_, key);
            if (takeoff) return d1 || d2;
            const bool offline = activate(offline_, "landing_complete",
                                          ev.reason.empty() ? "Landing complete - X offline"
                                                            : ev.reason);
            return offline || d1 || d2;
        }

        case EventType::AAR_WINDOW:
            return false;

        case EventType::X_AZIMUTH_VIOLATION:
            if (activation) {
                const bool x_ku = ev.violation && ev.violation->x_ku_conflict;
                return activate_degraded("x_azimuth",
                                         ev.reason.empty() ? "X azimuth conflict" : ev.reason,
                                         x_ku);
            }
            return deactivate(degraded_, "x_azimuth");

        case EventType::KA_COVERAGE_EXIT:
            return activate_degraded("ka_no_coverage",
                                     ev.reason.empty() ? "Ka coverage gap" : ev.reason, false);
        case EventType::KA_COVERAGE_ENTRY:
            return deactivate(degraded_, "ka_no_coverage");

        case EventType::KA_TRANSITION: {
            const std::string id = !ev.transition_id.empty() ? ev.transition_id
                                 : !sat.empty() ? sat : "swap";
            const std::string key = "ka_transition:" + id;
            if (activation) {
                return activate_degraded(key, ev.reason.empty() ? "Ka transition" : ev.reason,
                                         false);
            }
            return deactivate(degraded_, key);
        }

        case EventType::KA_OUTAGE_START:
        case EventType::KU_OUTAGE_START: {
            const bool ka = ev.type == EventType::KA_OUTAGE_START;
            const std::string key = std::string(ka ? "ka_outage:" : "ku_outage:")
                                  + (ev.outage_id.empty() ? "default" : ev.outage_id);
            return activate(offline_, key,
                            !ev.reason.empty() ? ev.reason : ka ? "Ka outage" : "Ku outage");
        }
        case EventType::KA_OUTAGE_END:
        case EventType::KU_OUTAGE_END: {
            const bool ka = ev.type == EventType::KA_OUTAGE_END;
            const std::string key = std::string(ka ? "ka_outage:" : "ku_outage:")
                                  + (ev.outage_id.empty() ? "default" : ev.outage_id);
            return deactivate(offline_, key);
        }
    }
    return false;
}

TransportState ConditionSet::state() const {
    if (!offline_.empty()) return TransportState::OFFLINE;
    if (!degraded_.empty()) return TransportState::DEGRADED;
    return TransportState::AVAILABLE;
}

std::vector<std::string> ConditionSet::reasons() const {
    std::vector<std::string> out;
    out.reserve(offline_.size() + degraded_.size() + safety_.size());
    for (const auto& kv : offline_) out.push_back(kv.second);
    for (const auto& kv : degraded_) out.push_back(kv.second);
    for (const auto& kv : safety_) out.push_back(kv.second);
    return out;
}

bool ConditionSet::x_ku_conflict_only() const {
    if (!offline_.empty() || degraded_.empty()) return false;
    for (const auto& kv : degraded_) {
        auto f = x_ku_flags_.find(kv.first);
        if (f == x_ku_flags_.end() || !f->second) return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════
// Interval sweep
// ═══════════════════════════════════════════════════════════════

namespace {

bool same_content(const TransportInterval& iv, TransportState state,
                  const std::vector<std::string>& reasons, bool x_ku) {
    return iv.state == state && iv.reasons == reasons && iv.x_ku_conflict_only == x_ku;
}

} // anonymous namespace

TransportIntervals build_transport_intervals(const std::vector<MissionEvent>& events,
                                             double mission_start, double mission_end) {
    if (!(mission_end > mission_start)) {
        throw TimelineComputationError("mission_end must be after mission_start");
    }

    TransportIntervals result;
    std::array<ConditionSet, 3> conditions;

    for (Transport t : ALL_TRANSPORTS) {
        TransportInterval first;
        first.transport = t;
        first.start = mission_start;
        first.end = mission_end;
        result[transport_index(t)].push_back(first);
    }

    for (const auto& ev : events) {
        const double effective = ev.timestamp <= mission_start ? mission_start
                               : ev.timestamp >= mission_end ? mission_end
                               : ev.timestamp;
        if (effective >= mission_end) break;

        const std::size_t idx = transport_index(ev.affected_transport);
        ConditionSet& cond = conditions[idx];
        if (!cond.apply(ev)) continue;

        const TransportState state = cond.state();
        std::vector<std::string> reasons = cond.reasons();
        const bool x_ku = state == TransportState::DEGRADED && cond.x_ku_conflict_only();

        auto& list = result[idx];
        if (same_content(list.back(), state, reasons, x_ku)) continue;

        if (list.back().start == effective) {
            list.pop_back();
            if (!list.empty() && same_content(list.back(), state, reasons, x_ku)) {
                list.back().end = mission_end;
                continue;
            }
        } else {
            list.back().end = effective;
        }

        TransportInterval next;
        next.transport = ev.affected_transport;
        next.state = state;
        next.start = effective;
        next.end = mission_end;
        next.reasons = std::move(reasons);
        next.x_ku_conflict_only = x_ku;
        list.push_back(std::move(next));
    }

    for (auto& list : result) {
        list.back().end = mission_end;
    }
    return result;
}

const TransportInterval* interval_at(const std::vector<TransportInterval>& intervals, double t) {
    for (const auto& iv : intervals) {
        if (iv.contains(t)) return &iv;
    }
    return intervals.empty() ? nullptr : &intervals.back();
}

} // namespace commplan::timeline
