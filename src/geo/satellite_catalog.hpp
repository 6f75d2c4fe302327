#ifndef COMMPLAN_GEO_SATELLITE_CATALOG_HPP
#define COMMPLAN_GEO_SATELLITE_CATALOG_HPP

#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace commplan::geo {

struct Satellite {
    std::string id;                     // e.g. "X-1", "AOR", "Ku-Leo"
    Transport transport = Transport::X;
    std::optional<double> longitude;    // sub-point longitude for geostationary satellites
    std::string slot;
};

/**
 * @brief Satellite id -> transport / longitude lookup
 *
 * Built once at startup and shared read-only by every timeline build.
 */
class SatelliteCatalog {
public:
    SatelliteCatalog() = default;

    /// X-1 (longitude to be set by the planner), AOR/POR/IOR Ka, Ku-Leo
    static SatelliteCatalog with_defaults();

    /// Insert or replace by id
    void add(Satellite sat);

    const Satellite* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    /// Longitude of a known geostationary satellite, nullopt otherwise
    std::optional<double> longitude_of(const std::string& id) const;

    std::vector<const Satellite*> by_transport(Transport t) const;
    std::size_t size() const { return sats_.size(); }

private:
    std::map<std::string, Satellite> sats_;
};

} // namespace commplan::geo

#endif // COMMPLAN_GEO_SATELLITE_CATALOG_HPP
