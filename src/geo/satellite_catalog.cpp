#include "geo/satellite_catalog.hpp"

namespace commplan::geo {

SatelliteCatalog SatelliteCatalog::with_defaults() {
    SatelliteCatalog catalog;
    catalog.add({"X-1", Transport::X, std::nullopt, "X-Slot-1"});
    catalog.add({"AOR", Transport::KA, -30.0, "Atlantic Ocean Region"});
    catalog.add({"POR", Transport::KA, 154.0, "Pacific Ocean Region"});
    catalog.add({"IOR", Transport::KA, 60.0, "Indian Ocean Region"});
    catalog.add({"Ku-Leo", Transport::KU, std::nullopt, "LEO Constellation"});
    return catalog;
}

void SatelliteCatalog::add(Satellite sat) {
    std::string key = sat.id;
    sats_[key] = std::move(sat);
}

const Satellite* SatelliteCatalog::find(const std::string& id) const {
    auto it = sats_.find(id);
    return it == sats_.end() ? nullptr : &it->second;
}

std::optional<double> SatelliteCatalog::longitude_of(const std::string& id) const {
    const Satellite* sat = find(id);
    if (!sat) return std::nullopt;
    return sat->longitude;
}

std::vector<const Satellite*> SatelliteCatalog::by_transport(Transport t) const {
    std::vector<const Satellite*> out;
    for (const auto& [id, sat] : sats_) {
        if (sat.transport == t) out.push_back(&sat);
    }
    return out;
}

} // namespace commplan::geo
