#include "io/mission_parser.hpp"
#include "coordinate/time_utils.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace commplan {

namespace {

const JsonValue::Array& array_or_empty(const JsonValue& v, const std::string& field) {
    static const JsonValue::Array empty;
    if (v.is_null()) return empty;
    if (!v.is_array()) throw ConfigurationError("'" + field + "' must be an array");
    return v.as_array();
}

double required_number(const JsonValue& obj, const std::string& field, const std::string& owner) {
    const auto& v = obj[field];
    if (!v.is_number()) {
        throw ConfigurationError(owner + " is missing numeric '" + field + "'");
    }
    return v.as_number();
}

ManualOutage parse_outage(const JsonValue& o, const std::string& label) {
    ManualOutage out;
    out.id = o["id"].get_string("");
    const auto start = MissionParser::parse_time(o["start_time"], label + " start_time");
    if (!start) {
        throw ConfigurationError(label + " '" + out.id + "' has no start_time");
    }
    out.start_time = *start;
    out.duration_s = o["duration_seconds"].get_number(0.0);
    out.reason = o["reason"].get_string("");
    return out;
}

} // anonymous namespace

std::optional<double> MissionParser::parse_time(const JsonValue& value, const std::string& field) {
    if (value.is_number()) return value.as_number();
    if (!value.is_string() || value.as_string().empty()) return std::nullopt;
    try {
        return TimeUtils::parse_iso8601(value.as_string());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Invalid timestamp for '" + field + "': " + e.what());
    }
}

Transport MissionParser::parse_transport(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "x") return Transport::X;
    if (t == "ka") return Transport::KA;
    if (t == "ku") return Transport::KU;
    throw ConfigurationError("Unknown transport '" + text + "'");
}

// ═══════════════════════════════════════════════════════════════
// Route
// ═══════════════════════════════════════════════════════════════

Route MissionParser::parse_route(const JsonValue& root) {
    Route route;
    route.id = root["id"].get_string("");
    route.name = root["name"].get_string(route.id);

    const auto& pts = array_or_empty(root["points"], "points");
    for (std::size_t i = 0; i < pts.size(); ++i) {
        const auto& p = pts[i];
        const std::string owner = "Route point " + std::to_string(i);
        RoutePoint rp;
        rp.latitude = required_number(p, "latitude", owner);
        rp.longitude = required_number(p, "longitude", owner);
        rp.altitude = p["altitude"].get_optional_number();
        rp.sequence = p["sequence"].get_int(static_cast<int>(i));
        rp.arrival_time = parse_time(p["arrival_time"], owner + " arrival_time");
        rp.segment_speed_knots = p["segment_speed_knots"].get_optional_number();
        route.points.push_back(rp);
    }
    std::stable_sort(route.points.begin(), route.points.end(),
                     [](const RoutePoint& a, const RoutePoint& b) { return a.sequence < b.sequence; });

    const auto& wps = array_or_empty(root["waypoints"], "waypoints");
    for (std::size_t i = 0; i < wps.size(); ++i) {
        const auto& w = wps[i];
        const std::string owner = "Waypoint " + std::to_string(i);
        RouteWaypoint wp;
        wp.name = w["name"].get_string("");
        wp.latitude = required_number(w, "latitude", owner);
        wp.longitude = required_number(w, "longitude", owner);
        wp.order = w["order"].get_int(static_cast<int>(i));
        wp.role = w["role"].get_string("");
        wp.arrival_time = parse_time(w["arrival_time"], owner + " arrival_time");
        route.waypoints.push_back(wp);
    }

    const auto& timing = root["timing"];
    route.timing.departure_time = parse_time(timing["departure_time"], "timing.departure_time");
    route.timing.arrival_time = parse_time(timing["arrival_time"], "timing.arrival_time");

    const bool any_point_time = std::any_of(route.points.begin(), route.points.end(),
                                            [](const RoutePoint& p) { return p.arrival_time.has_value(); });
    route.timing.has_timing_data = timing["has_timing_data"].get_bool(
        route.timing.departure_time || route.timing.arrival_time || any_point_time);

    route.validate();
    return route;
}

// ═══════════════════════════════════════════════════════════════
// Mission
// ═══════════════════════════════════════════════════════════════

MissionConfig MissionParser::parse_mission(const JsonValue& root) {
    MissionConfig config;
    config.id = root["id"].get_string("");
    config.name = root["name"].get_string(config.id);
    config.route_id = root["route_id"].get_string("");

    const auto& window = root["window"];
    config.window_start = parse_time(window["start"], "window.start");
    config.window_end = parse_time(window["end"], "window.end");

    const auto& tc = root["transports"];
    TransportConfig& transports = config.transports;
    transports.initial_x_satellite_id = tc["initial_x_satellite_id"].get_string("");

    if (tc.has("initial_ka_satellite_ids")) {
        transports.initial_ka_satellite_ids.clear();
        for (const auto& id : array_or_empty(tc["initial_ka_satellite_ids"], "initial_ka_satellite_ids")) {
            transports.initial_ka_satellite_ids.push_back(id.as_string());
        }
    }

    for (const auto& t : array_or_empty(tc["x_transitions"], "x_transitions")) {
        XTransition xt;
        xt.id = t["id"].get_string("");
        const std::string owner = "X transition '" + xt.id + "'";
        xt.latitude = required_number(t, "latitude", owner);
        xt.longitude = required_number(t, "longitude", owner);
        xt.target_satellite_id = t["target_satellite_id"].get_string("");
        xt.target_beam_id = t["target_beam_id"].get_string("");
        xt.is_same_satellite_transition = t["is_same_satellite_transition"].get_bool(false);
        transports.x_transitions.push_back(std::move(xt));
    }

    for (const auto& o : array_or_empty(tc["ka_outages"], "ka_outages")) {
        transports.ka_outages.push_back(parse_outage(o, "Ka outage"));
    }
    for (const auto& o : array_or_empty(tc["ku_overrides"], "ku_overrides")) {
        transports.ku_outages.push_back(parse_outage(o, "Ku outage"));
    }

    for (const auto& w : array_or_empty(tc["aar_windows"], "aar_windows")) {
        RefuelWindowSpec spec;
        spec.id = w["id"].get_string("");
        spec.start_waypoint = w["start_waypoint_name"].get_string("");
        spec.end_waypoint = w["end_waypoint_name"].get_string("");
        transports.refuel_windows.push_back(std::move(spec));
    }

    config.validate();
    return config;
}

// ═══════════════════════════════════════════════════════════════
// POIs and catalog
// ═══════════════════════════════════════════════════════════════

std::vector<PointOfInterest> MissionParser::parse_pois(const JsonValue& root) {
    const JsonValue& list = root.is_array() ? root : root["pois"];

    std::vector<PointOfInterest> pois;
    for (const auto& p : array_or_empty(list, "pois")) {
        PointOfInterest poi;
        poi.id = p["id"].get_string("");
        poi.name = p["name"].get_string(poi.id);
        const std::string owner = "POI '" + poi.name + "'";
        poi.latitude = required_number(p, "latitude", owner);
        poi.longitude = required_number(p, "longitude", owner);
        poi.category = p["category"].get_string("");
        poi.route_id = p["route_id"].get_string("");
        poi.projected_latitude = p["projected_latitude"].get_optional_number();
        poi.projected_longitude = p["projected_longitude"].get_optional_number();
        if (p["projected_waypoint_index"].is_number()) {
            poi.projected_waypoint_index = p["projected_waypoint_index"].as_int();
        }
        poi.projected_route_progress = p["projected_route_progress"].get_optional_number();
        pois.push_back(std::move(poi));
    }
    return pois;
}

geo::SatelliteCatalog MissionParser::parse_catalog(const JsonValue& root) {
    geo::SatelliteCatalog catalog = geo::SatelliteCatalog::with_defaults();
    for (const auto& s : array_or_empty(root["satellites"], "satellites")) {
        geo::Satellite sat;
        sat.id = s["id"].get_string("");
        if (sat.id.empty()) {
            throw ConfigurationError("Catalog satellite has no id");
        }
        sat.transport = parse_transport(s["transport"].get_string("X"));
        sat.longitude = s["longitude"].get_optional_number();
        sat.slot = s["slot"].get_string("");
        catalog.add(std::move(sat));
    }
    return catalog;
}

// ── Files ──

Route MissionParser::load_route(const std::string& path) {
    return parse_route(JsonReader::parse_file(path));
}

MissionConfig MissionParser::load_mission(const std::string& path) {
    return parse_mission(JsonReader::parse_file(path));
}

std::vector<PointOfInterest> MissionParser::load_pois(const std::string& path) {
    return parse_pois(JsonReader::parse_file(path));
}

geo::SatelliteCatalog MissionParser::load_catalog(const std::string& path) {
    return parse_catalog(JsonReader::parse_file(path));
}

} // namespace commplan
