/**
 * MissionParser: JSON inputs of the timeline engine.
 *
 * Timestamps may be ISO-8601 strings or epoch-second numbers.
 *
 * Route:
 *   { "id", "name",
 *     "timing": { "departure_time", "arrival_time", "has_timing_data" },
 *     "points": [ { "latitude", "longitude", "altitude", "sequence",
 *                   "arrival_time", "segment_speed_knots" } ],
 *     "waypoints": [ { "name", "latitude", "longitude", "order", "role",
 *                      "arrival_time" } ] }
 *
 * Mission:
 *   { "id", "name", "route_id", "window": { "start", "end" },
 *     "transports": { "initial_x_satellite_id", "initial_ka_satellite_ids",
 *                     "x_transitions", "ka_outages", "aar_windows",
 *                     "ku_overrides" } }
 *
 * POIs:     { "pois": [ { "id", "name", "latitude", "longitude", "category",
 *                         "route_id", "projected_latitude", ... } ] }
 * Catalog:  { "satellites": [ { "id", "transport", "longitude", "slot" } ] }
 */

#ifndef COMMPLAN_IO_MISSION_PARSER_HPP
#define COMMPLAN_IO_MISSION_PARSER_HPP

#include "core/mission.hpp"
#include "core/poi.hpp"
#include "core/route.hpp"
#include "geo/satellite_catalog.hpp"
#include "io/json_reader.hpp"
#include <optional>
#include <string>
#include <vector>

namespace commplan {

class MissionParser {
public:
    /// @throws ConfigurationError on malformed fields or an invalid route
    static Route parse_route(const JsonValue& root);

    /// @throws ConfigurationError on malformed fields or an invalid mission
    static MissionConfig parse_mission(const JsonValue& root);

    /// Accepts { "pois": [...] } or a bare array
    static std::vector<PointOfInterest> parse_pois(const JsonValue& root);

    /// Default catalog with the file's satellites added or replaced
    static geo::SatelliteCatalog parse_catalog(const JsonValue& root);

    static Route load_route(const std::string& path);
    static MissionConfig load_mission(const std::string& path);
    static std::vector<PointOfInterest> load_pois(const std::string& path);
    static geo::SatelliteCatalog load_catalog(const std::string& path);

    /**
     * Epoch seconds from an ISO-8601 string or a number; nullopt when absent.
     * @throws ConfigurationError naming the field on a malformed timestamp
     */
    static std::optional<double> parse_time(const JsonValue& value, const std::string& field);

    /// "X", "Ka" or "Ku", case-insensitive
    static Transport parse_transport(const std::string& text);
};

} // namespace commplan

#endif // COMMPLAN_IO_MISSION_PARSER_HPP
