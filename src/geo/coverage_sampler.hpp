#ifndef COMMPLAN_GEO_COVERAGE_SAMPLER_HPP
#define COMMPLAN_GEO_COVERAGE_SAMPLER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace commplan {
class JsonValue;
}

namespace commplan::geo {

/// (longitude, latitude) in degrees, GeoJSON axis order
using LonLat = std::pair<double, double>;
using Ring = std::vector<LonLat>;
using SatelliteSet = std::set<std::string>;

/**
 * Ray-casting point-in-polygon test against one ring.
 * @param lon  Point longitude in degrees
 * @param lat  Point latitude in degrees
 * @param ring Exterior ring; closing vertex optional
 */
bool point_in_polygon(double lon, double lat, const Ring& ring);

/// Position handed to the coverage sampler
struct CoveragePoint {
    double timestamp = 0.0;
    double latitude = 0.0;
    double longitude = 0.0;
};

enum class CoverageEventKind { ENTRY, EXIT };

struct CoverageEvent {
    double timestamp = 0.0;
    CoverageEventKind kind = CoverageEventKind::ENTRY;
    std::string satellite_id;
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @brief Named satellite footprints and containment queries
 *
 * A footprint may consist of several rings (e.g. split at the antimeridian);
 * a satellite covers a point when any of its rings contains it.
 * Const member functions are safe to call concurrently.
 */
class CoverageSampler {
public:
    CoverageSampler() = default;

    /**
     * Build from a GeoJSON FeatureCollection whose features carry a
     * "satellite_id" property and a Polygon or MultiPolygon geometry.
     * Features that do not qualify are skipped.
     * @throws CoverageDataError if the document is not a FeatureCollection
     */
    static CoverageSampler from_geojson(const JsonValue& root);

    /**
     * Load a GeoJSON file. A missing or malformed file is logged and
     * yields an empty sampler (no coverage anywhere).
     */
    static CoverageSampler load_file(const std::string& path);

    void add_ring(const std::string& satellite_id, Ring ring);

    bool empty() const { return rings_.empty(); }
    std::size_t satellite_count() const { return rings_.size(); }
    std::vector<std::string> satellite_ids() const;

    /// Satellites whose footprint contains (lat, lon)
    SatelliteSet coverage_at(double lat, double lon) const;

    /**
     * Entry/exit events along a point sequence. Coverage before the first
     * point is taken as empty. At each point entries come before exits,
     * each in satellite id order.
     */
    std::vector<CoverageEvent> sample_route_coverage(const std::vector<CoveragePoint>& points) const;

private:
    std::map<std::string, std::vector<Ring>> rings_;
};

/**
 * @brief Process-wide cache of loaded coverage datasets
 *
 * Each path is read once; later calls return the same immutable sampler.
 */
class CoverageRegistry {
public:
    static std::shared_ptr<const CoverageSampler> get(const std::string& path);

    /// Drop cached datasets (test isolation)
    static void clear();

private:
    static std::mutex mutex_;
    static std::map<std::string, std::shared_ptr<const CoverageSampler>> cache_;
};

} // namespace commplan::geo

#endif // COMMPLAN_GEO_COVERAGE_SAMPLER_HPP
