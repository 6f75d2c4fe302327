#ifndef COMMPLAN_FLIGHT_FLIGHT_STATE_MANAGER_HPP
#define COMMPLAN_FLIGHT_FLIGHT_STATE_MANAGER_HPP

#include "core/route.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace commplan::flight {

enum class FlightPhase {
    PRE_DEPARTURE,
    IN_FLIGHT,
    POST_ARRIVAL
};

/// ETA source: planned schedule before departure, live speed afterwards
enum class EtaMode {
    ANTICIPATED,
    ESTIMATED
};

inline const char* to_string(FlightPhase p) {
    switch (p) {
        case FlightPhase::PRE_DEPARTURE: return "pre_departure";
        case FlightPhase::IN_FLIGHT:     return "in_flight";
        case FlightPhase::POST_ARRIVAL:  return "post_arrival";
    }
    return "?";
}

inline const char* to_string(EtaMode m) {
    switch (m) {
        case EtaMode::ANTICIPATED: return "anticipated";
        case EtaMode::ESTIMATED:   return "estimated";
    }
    return "?";
}

inline EtaMode eta_mode_for(FlightPhase p) {
    return p == FlightPhase::PRE_DEPARTURE ? EtaMode::ANTICIPATED : EtaMode::ESTIMATED;
}

struct FlightStateConfig {
    double departure_speed_threshold_knots = 50.0;
    double departure_persistence_s = 10.0;
    double arrival_distance_threshold_m = 100.0;
    double arrival_dwell_s = 60.0;
};

/**
 * @brief Immutable snapshot of the flight state
 *
 * Times are epoch seconds. time_until/time_since are computed relative to the
 * "now" passed to get_status().
 */
struct FlightStatus {
    FlightPhase phase = FlightPhase::PRE_DEPARTURE;
    EtaMode eta_mode = EtaMode::ANTICIPATED;
    std::optional<double> departure_time;        // set once
    std::optional<double> arrival_time;          // set once
    double speed_persistence_s = 0.0;
    double arrival_dwell_s = 0.0;
    std::optional<double> last_speed_knots;
    std::optional<double> last_departure_check_time;
    std::optional<double> last_arrival_check_time;

    std::optional<std::string> active_route_id;
    std::optional<std::string> active_route_name;
    bool has_timing_data = false;
    std::optional<double> scheduled_departure_time;
    std::optional<double> scheduled_arrival_time;

    std::optional<double> time_until_departure_s;
    std::optional<double> time_since_departure_s;
};

/**
 * @brief Tracks departure and arrival of the aircraft from live telemetry
 *
 * One instance is created at startup and shared by reference between the
 * telemetry tick and readers. Every member is guarded by one mutex; readers
 * get a snapshot by value. Callbacks are invoked after the lock is released,
 * in registration order.
 *
 * Automatic detection only moves forward (pre_departure -> in_flight ->
 * post_arrival). transition_phase() may move to any phase.
 */
class FlightStateManager {
public:
    using Clock = std::function<double()>;
    using PhaseCallback = std::function<void(FlightPhase from, FlightPhase to,
                                             const FlightStatus& status)>;
    using ModeCallback = std::function<void(EtaMode from, EtaMode to)>;

    explicit FlightStateManager(FlightStateConfig config = FlightStateConfig(),
                                Clock clock = Clock());

    FlightStateManager(const FlightStateManager&) = delete;
    FlightStateManager& operator=(const FlightStateManager&) = delete;

    const FlightStateConfig& config() const { return config_; }

    FlightStatus get_status(std::optional<double> now = std::nullopt) const;

    /**
     * Feed one ground-speed sample. Active only before departure.
     * Speed above the threshold continuously for the persistence duration
     * declares departure. A non-finite sample is logged and ignored.
     * @return true when departure fired on this call
     */
    bool check_departure(double speed_knots, std::optional<double> now = std::nullopt);

    /**
     * Feed one distance-to-destination sample. Active only in flight.
     * Staying within the distance threshold for the dwell duration declares
     * arrival. A non-finite sample is logged and ignored.
     * @return true when arrival fired on this call
     */
    bool check_arrival(double distance_m, double speed_knots,
                       std::optional<double> now = std::nullopt);

    /// @return false when already in that phase
    bool transition_phase(FlightPhase phase, const std::string& reason = "manual");

    /// @return false when already departed
    bool trigger_departure(std::optional<double> timestamp = std::nullopt,
                           const std::string& reason = "manual");

    /// @return false when already arrived
    bool trigger_arrival(std::optional<double> timestamp = std::nullopt,
                         const std::string& reason = "manual");

    /**
     * Record the active route. A different route id resets the state to
     * pre_departure unless auto_reset is false.
     */
    void update_route_context(const Route& route, bool auto_reset = true,
                              const std::string& reason = "route change");
    void clear_route_context();

    /// Back to pre_departure with timers and departure/arrival times cleared
    void reset(const std::string& reason = "reset");

    /// Callbacks run after the lock is released; exceptions they throw are logged and dropped
    void on_phase_change(PhaseCallback cb);
    void on_mode_change(ModeCallback cb);

private:
    struct PhaseChange {
        FlightPhase from;
        FlightPhase to;
        FlightStatus status;
    };

    FlightStateConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    FlightStatus status_;
    std::optional<double> above_threshold_since_;
    std::optional<double> arrival_dwell_since_;
    std::vector<PhaseCallback> phase_callbacks_;
    std::vector<ModeCallback> mode_callbacks_;

    double now_or(std::optional<double> now) const { return now ? *now : clock_(); }

    // Caller holds mutex_
    std::optional<PhaseChange> set_phase_locked(FlightPhase phase, const std::string& reason,
                                                double now);
    void clear_timers_locked();
    FlightStatus snapshot_locked(double now) const;

    void notify(const std::optional<PhaseChange>& change);
};

} // namespace commplan::flight

#endif // COMMPLAN_FLIGHT_FLIGHT_STATE_MANAGER_HPP
