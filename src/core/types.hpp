#ifndef COMMPLAN_CORE_TYPES_HPP
#define COMMPLAN_CORE_TYPES_HPP

#include <array>
#include <cmath>
#include <string>

namespace commplan {

/**
 * @brief Satellite communication transports carried by the aircraft
 *
 * X:  fixed geostationary link, one assigned satellite at a time
 * KA: three-satellite geostationary constellation (AOR, POR, IOR)
 * KU: always-on LEO constellation, unavailable only during manual outages
 */
enum class Transport {
    X,
    KA,
    KU
};

inline constexpr std::array<Transport, 3> ALL_TRANSPORTS = {
    Transport::X, Transport::KA, Transport::KU
};

enum class TransportState {
    AVAILABLE,
    DEGRADED,
    OFFLINE
};

/// Aggregate status of a timeline segment
enum class TimelineStatus {
    NOMINAL,   // no transport impacted
    DEGRADED,  // exactly one transport impacted
    CRITICAL   // two or more transports impacted
};

enum class Severity {
    INFO,
    WARNING,
    CRITICAL,
    SAFETY
};

inline const char* to_string(Transport t) {
    switch (t) {
        case Transport::X:  return "X";
        case Transport::KA: return "Ka";
        case Transport::KU: return "Ku";
    }
    return "?";
}

inline const char* to_string(TransportState s) {
    switch (s) {
        case TransportState::AVAILABLE: return "available";
        case TransportState::DEGRADED:  return "degraded";
        case TransportState::OFFLINE:   return "offline";
    }
    return "?";
}

inline const char* to_string(TimelineStatus s) {
    switch (s) {
        case TimelineStatus::NOMINAL:  return "nominal";
        case TimelineStatus::DEGRADED: return "degraded";
        case TimelineStatus::CRITICAL: return "critical";
    }
    return "?";
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::INFO:     return "info";
        case Severity::WARNING:  return "warning";
        case Severity::CRITICAL: return "critical";
        case Severity::SAFETY:   return "safety";
    }
    return "?";
}

inline std::size_t transport_index(Transport t) {
    return static_cast<std::size_t>(t);
}

/// Severity ordering of transport states (AVAILABLE < DEGRADED < OFFLINE)
inline int state_rank(TransportState s) {
    return static_cast<int>(s);
}

/**
 * @brief Minimal cartesian vector for ECEF geometry
 */
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator-(const Vec3& o) const { return Vec3(x - o.x, y - o.y, z - o.z); }
    double norm() const { return std::sqrt(x * x + y * y + z * z); }
};

} // namespace commplan

#endif // COMMPLAN_CORE_TYPES_HPP
