#include "geo/look_angles.hpp"
#include "geo/geo_utils.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>

namespace commplan::geo {

namespace {

void require_finite(double v, const char* name) {
    if (!std::isfinite(v)) {
        std::ostringstream oss;
        oss << "look_angles: " << name << " is not finite (" << v << ")";
        throw GeometryInputError(oss.str());
    }
}

} // anonymous namespace

LookAngles look_angles(double lat_deg, double lon_deg, double alt_m, double sat_lon_deg) {
    require_finite(lat_deg, "latitude");
    require_finite(lon_deg, "longitude");
    require_finite(alt_m, "altitude");
    require_finite(sat_lon_deg, "satellite longitude");

    const Vec3 observer  = geodetic_to_ecef(lat_deg, lon_deg, alt_m);
    const Vec3 satellite = geodetic_to_ecef(0.0, sat_lon_deg, GEO_ALTITUDE_M);
    const Vec3 d = satellite - observer;

    const double sin_lat = std::sin(lat_deg * DEG2RAD);
    const double cos_lat = std::cos(lat_deg * DEG2RAD);
    const double sin_lon = std::sin(lon_deg * DEG2RAD);
    const double cos_lon = std::cos(lon_deg * DEG2RAD);

    // ECEF -> SEZ rotation
    const double south  = sin_lat * cos_lon * d.x + sin_lat * sin_lon * d.y - cos_lat * d.z;
    const double east   = -sin_lon * d.x + cos_lon * d.y;
    const double zenith = cos_lat * cos_lon * d.x + cos_lat * sin_lon * d.y + sin_lat * d.z;

    const double range = std::sqrt(south * south + east * east + zenith * zenith);

    LookAngles out;
    out.elevation = (range > 0.0) ? std::asin(zenith / range) * RAD2DEG : 90.0;
    out.azimuth = normalize_degrees(std::atan2(east, -south) * RAD2DEG);
    return out;
}

bool is_in_azimuth_range(double azimuth, double min_az, double max_az) {
    const double az = normalize_degrees(azimuth);
    const double lo = normalize_degrees(min_az);
    const double hi = normalize_degrees(max_az);

    if (lo <= hi) {
        return az >= lo && az <= hi;
    }
    return az >= lo || az <= hi;
}

double relative_to_heading(double azimuth, std::optional<double> heading_deg) {
    if (!heading_deg) {
        return normalize_degrees(azimuth);
    }
    return normalize_degrees(azimuth - *heading_deg);
}

} // namespace commplan::geo
