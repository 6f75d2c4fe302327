#ifndef COMMPLAN_GEO_LOOK_ANGLES_HPP
#define COMMPLAN_GEO_LOOK_ANGLES_HPP

#include <optional>

namespace commplan::geo {

/**
 * @brief Topocentric pointing from the aircraft to a satellite
 */
struct LookAngles {
    double azimuth = 0.0;    // degrees clockwise from true north, [0, 360)
    double elevation = 0.0;  // degrees above the local horizon
};

/**
 * Azimuth/elevation from an aircraft to a geostationary satellite.
 *
 * The satellite sits on the equator at GEO_ALTITUDE_M above the WGS84
 * ellipsoid. Both positions go to ECEF; the difference vector is rotated
 * into the observer's South-East-Zenith frame.
 *
 * @param lat_deg        Aircraft latitude in degrees
 * @param lon_deg        Aircraft longitude in degrees
 * @param alt_m          Aircraft altitude in meters
 * @param sat_lon_deg    Satellite sub-point longitude in degrees
 * @throws GeometryInputError if any input is not finite
 */
LookAngles look_angles(double lat_deg, double lon_deg, double alt_m, double sat_lon_deg);

/**
 * Test whether an azimuth lies in [min_az, max_az].
 * All three values are reduced modulo 360. When min_az > max_az the range
 * wraps through north, so 315..45 contains 350, 0 and 30.
 */
bool is_in_azimuth_range(double azimuth, double min_az, double max_az);

/// Azimuth relative to the aircraft nose; absolute azimuth when heading is unknown
double relative_to_heading(double azimuth, std::optional<double> heading_deg);

} // namespace commplan::geo

#endif // COMMPLAN_GEO_LOOK_ANGLES_HPP
