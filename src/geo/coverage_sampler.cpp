#include "geo/coverage_sampler.hpp"
#include "core/errors.hpp"
#include "io/json_reader.hpp"
#include <algorithm>
#include <iostream>

namespace commplan::geo {

bool point_in_polygon(double lon, double lat, const Ring& ring) {
    const std::size_t n = ring.size();
    if (n < 3) return false;

    bool inside = false;
    double p1_lon = ring[0].first;
    double p1_lat = ring[0].second;

    for (std::size_t i = 1; i <= n; ++i) {
        const double p2_lon = ring[i % n].first;
        const double p2_lat = ring[i % n].second;

        if (lat > std::min(p1_lat, p2_lat) &&
            lat <= std::max(p1_lat, p2_lat) &&
            lon <= std::max(p1_lon, p2_lon)) {
            if (p1_lon == p2_lon) {
                inside = !inside;
            } else if (p1_lat != p2_lat) {
                const double x_intersect =
                    (lat - p1_lat) * (p2_lon - p1_lon) / (p2_lat - p1_lat) + p1_lon;
                if (lon <= x_intersect) {
                    inside = !inside;
                }
            }
        }

        p1_lon = p2_lon;
        p1_lat = p2_lat;
    }
    return inside;
}

// ── Loading ──

namespace {

Ring parse_ring(const JsonValue& coords) {
    Ring ring;
    for (const auto& pos : coords.as_array()) {
        if (!pos.is_array() || pos.size() < 2) {
            throw CoverageDataError("Coverage ring position must be [lon, lat]");
        }
        ring.emplace_back(pos[0].as_number(), pos[1].as_number());
    }
    return ring;
}

} // anonymous namespace

CoverageSampler CoverageSampler::from_geojson(const JsonValue& root) {
    if (root["type"].get_string() != "FeatureCollection" || !root["features"].is_array()) {
        throw CoverageDataError("Coverage data is not a GeoJSON FeatureCollection");
    }

    CoverageSampler sampler;
    for (const auto& feature : root["features"].as_array()) {
        if (feature["type"].get_string() != "Feature") continue;

        const std::string sat_id = feature["properties"]["satellite_id"].get_string();
        if (sat_id.empty()) continue;

        const auto& geometry = feature["geometry"];
        const std::string geom_type = geometry["type"].get_string();
        const auto& coords = geometry["coordinates"];

        try {
            if (geom_type == "Polygon") {
                if (coords.size() > 0) sampler.add_ring(sat_id, parse_ring(coords[0]));
            } else if (geom_type == "MultiPolygon") {
                for (const auto& polygon : coords.as_array()) {
                    if (polygon.size() > 0) sampler.add_ring(sat_id, parse_ring(polygon[0]));
                }
            }
        } catch (const JsonError& e) {
            throw CoverageDataError("Malformed geometry for " + sat_id + ": " + e.what());
        }
    }
    return sampler;
}

CoverageSampler CoverageSampler::load_file(const std::string& path) {
    try {
        CoverageSampler sampler = from_geojson(JsonReader::parse_file(path));
        std::cerr << "[Coverage] Loaded " << sampler.satellite_count()
                  << " satellite footprints from " << path << "\n";
        return sampler;
    } catch (const JsonError& e) {
        std::cerr << "[Coverage] WARNING: " << e.what() << "; coverage disabled\n";
    } catch (const CoverageDataError& e) {
        std::cerr << "[Coverage] WARNING: " << path << ": " << e.what() << "; coverage disabled\n";
    }
    return CoverageSampler();
}

void CoverageSampler::add_ring(const std::string& satellite_id, Ring ring) {
    if (ring.size() < 3) return;
    rings_[satellite_id].push_back(std::move(ring));
}

std::vector<std::string> CoverageSampler::satellite_ids() const {
    std::vector<std::string> ids;
    ids.reserve(rings_.size());
    for (const auto& entry : rings_) ids.push_back(entry.first);
    return ids;
}

// ── Queries ──

SatelliteSet CoverageSampler::coverage_at(double lat, double lon) const {
    SatelliteSet covered;
    for (const auto& [sat_id, rings] : rings_) {
        for (const auto& ring : rings) {
            if (point_in_polygon(lon, lat, ring)) {
                covered.insert(sat_id);
                break;
            }
        }
    }
    return covered;
}

std::vector<CoverageEvent> CoverageSampler::sample_route_coverage(
        const std::vector<CoveragePoint>& points) const {
    std::vector<CoverageEvent> events;
    if (points.empty() || rings_.empty()) return events;

    SatelliteSet previous;
    for (const auto& p : points) {
        SatelliteSet current = coverage_at(p.latitude, p.longitude);

        for (const auto& id : current) {
            if (!previous.count(id)) {
                events.push_back({p.timestamp, CoverageEventKind::ENTRY, id, p.latitude, p.longitude});
            }
        }
        for (const auto& id : previous) {
            if (!current.count(id)) {
                events.push_back({p.timestamp, CoverageEventKind::EXIT, id, p.latitude, p.longitude});
            }
        }
        previous = std::move(current);
    }
    return events;
}

// ── Registry ──

std::mutex CoverageRegistry::mutex_;
std::map<std::string, std::shared_ptr<const CoverageSampler>> CoverageRegistry::cache_;

std::shared_ptr<const CoverageSampler> CoverageRegistry::get(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(path);
    if (it != cache_.end()) return it->second;

    auto sampler = std::make_shared<const CoverageSampler>(CoverageSampler::load_file(path));
    cache_[path] = sampler;
    return sampler;
}

void CoverageRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace commplan::geo
