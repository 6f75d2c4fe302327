#include "flight/flight_state_manager.hpp"
#include "coordinate/time_utils.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace commplan::flight {

FlightStateManager::FlightStateManager(FlightStateConfig config, Clock clock)
    : config_(config),
      clock_(clock ? std::move(clock) : Clock(&TimeUtils::now))
{
}

// ═══════════════════════════════════════════════════════════════
// Snapshot
// ═══════════════════════════════════════════════════════════════

FlightStatus FlightStateManager::snapshot_locked(double now) const {
    FlightStatus s = status_;
    s.eta_mode = eta_mode_for(s.phase);
    s.speed_persistence_s = above_threshold_since_ ? now - *above_threshold_since_ : 0.0;
    s.arrival_dwell_s = arrival_dwell_since_ ? now - *arrival_dwell_since_ : 0.0;

    if (s.departure_time) {
        s.time_until_departure_s = 0.0;
        s.time_since_departure_s = now - *s.departure_time;
    } else {
        s.time_since_departure_s.reset();
        if (s.scheduled_departure_time) {
            s.time_until_departure_s = *s.scheduled_departure_time - now;
        } else {
            s.time_until_departure_s.reset();
        }
    }
    return s;
}

FlightStatus FlightStateManager::get_status(std::optional<double> now) const {
    const double t = now_or(now);
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked(t);
}

// ═══════════════════════════════════════════════════════════════
// Phase changes
// ═══════════════════════════════════════════════════════════════

void FlightStateManager::clear_timers_locked() {
    above_threshold_since_.reset();
    arrival_dwell_since_.reset();
}

std::optional<FlightStateManager::PhaseChange>
FlightStateManager::set_phase_locked(FlightPhase phase, const std::string& reason, double now) {
    if (status_.phase == phase) return std::nullopt;

    const FlightPhase from = status_.phase;
    status_.phase = phase;
    status_.eta_mode = eta_mode_for(phase);
    if (phase == FlightPhase::PRE_DEPARTURE) {
        clear_timers_locked();
    }

    std::cerr << "[FlightState] " << to_string(from) << " -> " << to_string(phase)
              << " (" << reason << ")\n";
    return PhaseChange{from, phase, snapshot_locked(now)};
}

void FlightStateManager::notify(const std::optional<PhaseChange>& change) {
    if (!change) return;

    std::vector<PhaseCallback> phase_cbs;
    std::vector<ModeCallback> mode_cbs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_cbs = phase_callbacks_;
        mode_cbs = mode_callbacks_;
    }

    // The phase has already changed; a failing callback must not hide that
    for (const auto& cb : phase_cbs) {
        try {
            cb(change->from, change->to, change->status);
        } catch (const std::exception& e) {
            std::cerr << "[FlightState] WARNING: phase callback failed: " << e.what() << "\n";
        }
    }
    const EtaMode old_mode = eta_mode_for(change->from);
    const EtaMode new_mode = eta_mode_for(change->to);
    if (old_mode != new_mode) {
        for (const auto& cb : mode_cbs) {
            try {
                cb(old_mode, new_mode);
            } catch (const std::exception& e) {
                std::cerr << "[FlightState] WARNING: mode callback failed: " << e.what() << "\n";
            }
        }
    }
}

bool FlightStateManager::transition_phase(FlightPhase phase, const std::string& reason) {
    const double now = clock_();
    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        change = set_phase_locked(phase, reason, now);
    }
    notify(change);
    return change.has_value();
}

// ── Automatic detection ──

bool FlightStateManager::check_departure(double speed_knots, std::optional<double> now) {
    const double t = now_or(now);
    if (!std::isfinite(speed_knots) || !std::isfinite(t)) {
        std::cerr << "[FlightState] WARNING: non-finite speed sample ignored\n";
        return false;
    }

    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.last_departure_check_time = t;
        status_.last_speed_knots = speed_knots;
        if (status_.phase != FlightPhase::PRE_DEPARTURE) return false;

        if (speed_knots <= config_.departure_speed_threshold_knots) {
            above_threshold_since_.reset();
            return false;
        }

        if (!above_threshold_since_) above_threshold_since_ = t;
        if (t - *above_threshold_since_ < config_.departure_persistence_s) return false;

        if (!status_.departure_time) status_.departure_time = t;
        above_threshold_since_.reset();
        change = set_phase_locked(FlightPhase::IN_FLIGHT, "speed persistence", t);
    }
    notify(change);
    return change.has_value();
}

bool FlightStateManager::check_arrival(double distance_m, double speed_knots,
                                       std::optional<double> now) {
    const double t = now_or(now);
    if (!std::isfinite(distance_m) || !std::isfinite(speed_knots) || !std::isfinite(t)) {
        std::cerr << "[FlightState] WARNING: non-finite arrival sample ignored\n";
        return false;
    }

    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.last_arrival_check_time = t;
        status_.last_speed_knots = speed_knots;
        if (status_.phase != FlightPhase::IN_FLIGHT) return false;

        if (distance_m > config_.arrival_distance_threshold_m) {
            arrival_dwell_since_.reset();
            return false;
        }

        if (!arrival_dwell_since_) arrival_dwell_since_ = t;
        if (t - *arrival_dwell_since_ < config_.arrival_dwell_s) return false;

        if (!status_.arrival_time) status_.arrival_time = t;
        arrival_dwell_since_.reset();
        change = set_phase_locked(FlightPhase::POST_ARRIVAL, "arrival dwell", t);
    }
    notify(change);
    return change.has_value();
}

// ── Explicit triggers ──

bool FlightStateManager::trigger_departure(std::optional<double> timestamp,
                                           const std::string& reason) {
    const double now = clock_();
    const double t = timestamp ? *timestamp : now;
    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.phase != FlightPhase::PRE_DEPARTURE) return false;
        if (!status_.departure_time) status_.departure_time = t;
        above_threshold_since_.reset();
        change = set_phase_locked(FlightPhase::IN_FLIGHT, reason, now);
    }
    notify(change);
    return true;
}

bool FlightStateManager::trigger_arrival(std::optional<double> timestamp,
                                         const std::string& reason) {
    const double now = clock_();
    const double t = timestamp ? *timestamp : now;
    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.phase == FlightPhase::POST_ARRIVAL) return false;
        if (!status_.arrival_time) status_.arrival_time = t;
        arrival_dwell_since_.reset();
        change = set_phase_locked(FlightPhase::POST_ARRIVAL, reason, now);
    }
    notify(change);
    return true;
}

// ═══════════════════════════════════════════════════════════════
// Route context
// ═══════════════════════════════════════════════════════════════

void FlightStateManager::update_route_context(const Route& route, bool auto_reset,
                                              const std::string& reason) {
    const double now = clock_();
    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool route_changed = !status_.active_route_id || *status_.active_route_id != route.id;

        status_.active_route_id = route.id;
        status_.active_route_name = route.name;
        status_.has_timing_data = route.timing.has_timing_data;
        if (route.timing.has_timing_data) {
            status_.scheduled_departure_time = route.timing.departure_time;
            status_.scheduled_arrival_time = route.timing.arrival_time;
        } else {
            status_.scheduled_departure_time.reset();
            status_.scheduled_arrival_time.reset();
        }

        if (route_changed && auto_reset) {
            status_.departure_time.reset();
            status_.arrival_time.reset();
            clear_timers_locked();
            change = set_phase_locked(FlightPhase::PRE_DEPARTURE, reason, now);
        }
    }
    notify(change);
}

void FlightStateManager::clear_route_context() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.active_route_id.reset();
    status_.active_route_name.reset();
    status_.has_timing_data = false;
    status_.scheduled_departure_time.reset();
    status_.scheduled_arrival_time.reset();
}

void FlightStateManager::reset(const std::string& reason) {
    const double now = clock_();
    std::optional<PhaseChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.departure_time.reset();
        status_.arrival_time.reset();
        status_.last_speed_knots.reset();
        status_.last_departure_check_time.reset();
        status_.last_arrival_check_time.reset();
        clear_timers_locked();
        change = set_phase_locked(FlightPhase::PRE_DEPARTURE, reason, now);
    }
    notify(change);
}

void FlightStateManager::on_phase_change(PhaseCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_callbacks_.push_back(std::move(cb));
}

void FlightStateManager::on_mode_change(ModeCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_callbacks_.push_back(std::move(cb));
}

} // namespace commplan::flight
