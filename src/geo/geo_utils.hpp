#ifndef COMMPLAN_GEO_GEO_UTILS_HPP
#define COMMPLAN_GEO_GEO_UTILS_HPP

#include "core/types.hpp"
#include <cmath>
#include <optional>

namespace commplan::geo {

// WGS84 ellipsoid constants
inline constexpr double WGS84_A      = 6378137.0;          // semi-major axis (meters)
inline constexpr double WGS84_E2     = 0.00669437999014;   // first eccentricity squared
inline constexpr double R_EARTH_MEAN = 6371000.0;          // mean Earth radius (meters)

inline constexpr double GEO_ALTITUDE_M   = 35786000.0;     // geostationary altitude above ellipsoid
inline constexpr double METERS_PER_NM    = 1852.0;
inline constexpr double DEFAULT_CRUISE_ALTITUDE_M = 10668.0;  // ~35,000 ft

inline constexpr double DEG2RAD = M_PI / 180.0;
inline constexpr double RAD2DEG = 180.0 / M_PI;

/// Wrap an angle in degrees into [0, 360)
inline double normalize_degrees(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) r += 360.0;
    if (r >= 360.0) r -= 360.0;
    return r;
}

/**
 * Convert geodetic coordinates to ECEF (Earth-Centered Earth-Fixed).
 * @param lat_deg  Geodetic latitude in degrees
 * @param lon_deg  Geodetic longitude in degrees
 * @param alt_m    Altitude above ellipsoid in meters
 * @return ECEF position as Vec3 (meters)
 */
inline Vec3 geodetic_to_ecef(double lat_deg, double lon_deg, double alt_m) {
    const double sin_lat = std::sin(lat_deg * DEG2RAD);
    const double cos_lat = std::cos(lat_deg * DEG2RAD);
    const double sin_lon = std::sin(lon_deg * DEG2RAD);
    const double cos_lon = std::cos(lon_deg * DEG2RAD);

    const double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sin_lat * sin_lat);

    return Vec3(
        (N + alt_m) * cos_lat * cos_lon,
        (N + alt_m) * cos_lat * sin_lon,
        (N * (1.0 - WGS84_E2) + alt_m) * sin_lat
    );
}

/**
 * Haversine great-circle distance between two points on the mean-radius sphere.
 * Symmetric in its arguments; zero for identical points.
 * @param lat1  Latitude of point 1 in degrees
 * @param lon1  Longitude of point 1 in degrees
 * @param lat2  Latitude of point 2 in degrees
 * @param lon2  Longitude of point 2 in degrees
 * @return Distance in meters
 */
inline double haversine_distance(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = lat1 * DEG2RAD;
    const double phi2 = lat2 * DEG2RAD;
    const double dlat = (lat2 - lat1) * DEG2RAD;
    const double dlon = (lon2 - lon1) * DEG2RAD;

    const double a = std::sin(dlat * 0.5) * std::sin(dlat * 0.5)
                   + std::cos(phi1) * std::cos(phi2)
                   * std::sin(dlon * 0.5) * std::sin(dlon * 0.5);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return R_EARTH_MEAN * c;
}

/**
 * Initial great-circle bearing from point 1 to point 2.
 * @return Bearing in degrees, range [0, 360)
 */
inline double initial_bearing(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = lat1 * DEG2RAD;
    const double phi2 = lat2 * DEG2RAD;
    const double dlon = (lon2 - lon1) * DEG2RAD;

    const double y = std::sin(dlon) * std::cos(phi2);
    const double x = std::cos(phi1) * std::sin(phi2)
                   - std::sin(phi1) * std::cos(phi2) * std::cos(dlon);

    return normalize_degrees(std::atan2(y, x) * RAD2DEG);
}

/**
 * Interpolate longitude along the shortest path, crossing the antimeridian
 * when that is shorter.
 * @param prev_lon  Start longitude in degrees
 * @param next_lon  End longitude in degrees
 * @param ratio     Fraction in [0, 1]
 * @return Longitude in [-180, 180]; exactly -180 is reported as +180
 */
inline double interpolate_longitude(double prev_lon, double next_lon, double ratio) {
    const double delta = normalize_degrees(next_lon - prev_lon + 540.0) - 180.0;
    const double lon = normalize_degrees(prev_lon + delta * ratio + 180.0) - 180.0;
    if (std::fabs(lon + 180.0) < 1e-9) {
        return 180.0;
    }
    return lon;
}

/// Linear altitude interpolation; a missing end takes the other, both missing gives cruise altitude
inline double interpolate_altitude(std::optional<double> prev_alt,
                                   std::optional<double> next_alt,
                                   double ratio) {
    if (prev_alt && next_alt) return *prev_alt + ratio * (*next_alt - *prev_alt);
    if (prev_alt) return *prev_alt;
    if (next_alt) return *next_alt;
    return DEFAULT_CRUISE_ALTITUDE_M;
}

/// Signed shortest longitude difference b - a in degrees, range [-180, 180)
inline double longitude_delta(double a, double b) {
    return normalize_degrees(b - a + 180.0) - 180.0;
}

} // namespace commplan::geo

#endif // COMMPLAN_GEO_GEO_UTILS_HPP
