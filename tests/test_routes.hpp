#ifndef COMMPLAN_TESTS_TEST_ROUTES_HPP
#define COMMPLAN_TESTS_TEST_ROUTES_HPP

#include "core/mission.hpp"
#include "core/route.hpp"
#include "geo/satellite_catalog.hpp"

namespace commplan::test_support {

// 2025-01-01T00:00:00Z
inline constexpr double T0 = 1735689600.0;
inline constexpr double TWO_HOURS = 7200.0;

/// Eastbound leg along 10N from 0E to 10E, two hours, timing on the profile only
inline Route eastbound_route() {
    Route route;
    route.id = "route-east";
    route.name = "Eastbound";
    RoutePoint a;
    a.latitude = 10.0;
    a.longitude = 0.0;
    a.sequence = 0;
    RoutePoint b;
    b.latitude = 10.0;
    b.longitude = 10.0;
    b.sequence = 1;
    route.points = {a, b};

    RouteWaypoint dep;
    dep.name = "DEP";
    dep.latitude = 10.0;
    dep.longitude = 0.0;
    dep.order = 0;
    dep.role = "departure";
    RouteWaypoint arr;
    arr.name = "ARR";
    arr.latitude = 10.0;
    arr.longitude = 10.0;
    arr.order = 1;
    arr.role = "arrival";
    route.waypoints = {dep, arr};

    route.timing.departure_time = T0;
    route.timing.arrival_time = T0 + TWO_HOURS;
    route.timing.has_timing_data = true;
    return route;
}

/// Mission on eastbound_route() with one X satellite and nothing else
inline MissionConfig single_satellite_mission(const std::string& x_satellite = "X-EAST") {
    MissionConfig config;
    config.id = "M1";
    config.name = "Test mission";
    config.route_id = "route-east";
    config.transports.initial_x_satellite_id = x_satellite;
    return config;
}

/// Default catalog plus an X satellite east (60E) and west (40W) of the route
inline geo::SatelliteCatalog test_catalog() {
    geo::SatelliteCatalog catalog = geo::SatelliteCatalog::with_defaults();
    catalog.add({"X-EAST", Transport::X, 60.0, "east"});
    catalog.add({"X-WEST", Transport::X, -40.0, "west"});
    return catalog;
}

} // namespace commplan::test_support

#endif // COMMPLAN_TESTS_TEST_ROUTES_HPP
