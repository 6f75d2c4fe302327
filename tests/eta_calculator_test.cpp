#include <gtest/gtest.h>
#include "flight/eta_calculator.hpp"
#include "geo/geo_utils.hpp"

#include <limits>

namespace commplan::flight {
namespace {

class EtaCalculatorTest : public ::testing::Test {
protected:
    EtaCalculatorTest()
        : calc_(EtaConfig(), [this]() { return now_; }) {}

    void SetUp() override {
        route_.id = "route-eq";
        route_.name = "Equator";
        for (int i = 0; i < 3; ++i) {
            RoutePoint p;
            p.latitude = 0.0;
            p.longitude = static_cast<double>(i);
            p.sequence = i;
            p.segment_speed_knots = 120.0;
            route_.points.push_back(p);
        }
        RouteWaypoint mid;
        mid.name = "MID";
        mid.longitude = 1.0;
        mid.order = 1;
        mid.arrival_time = 5000.0;
        RouteWaypoint end;
        end.name = "END";
        end.longitude = 2.0;
        end.order = 2;
        route_.waypoints = {mid, end};
        route_.timing.departure_time = 1000.0;
        route_.timing.arrival_time = 8000.0;
        route_.timing.has_timing_data = true;
    }

    PointOfInterest poi(const std::string& id, const std::string& name, double lat, double lon,
                        const std::string& route_id = "") const {
        PointOfInterest p;
        p.id = id;
        p.name = name;
        p.latitude = lat;
        p.longitude = lon;
        p.category = "waypoint";
        p.route_id = route_id;
        return p;
    }

    double leg_m(int from, int to) const {
        return calc_.calculate_distance(0.0, from, 0.0, to);
    }

    double now_ = 1000.0;
    EtaCalculator calc_;
    Route route_;
};

TEST_F(EtaCalculatorTest, EtaFromDistanceAndSpeed) {
    EXPECT_DOUBLE_EQ(calc_.calculate_eta(geo::METERS_PER_NM, 60.0), 60.0);
    EXPECT_DOUBLE_EQ(calc_.calculate_eta(10.0 * geo::METERS_PER_NM, 600.0), 60.0);
}

TEST_F(EtaCalculatorTest, EtaUnknownBelowMinimumSpeed) {
    EXPECT_DOUBLE_EQ(calc_.calculate_eta(1000.0, 0.0), ETA_UNKNOWN);
    EXPECT_DOUBLE_EQ(calc_.calculate_eta(1000.0, -5.0), ETA_UNKNOWN);
    EXPECT_DOUBLE_EQ(calc_.calculate_eta(1000.0, 0.4), ETA_UNKNOWN);
}

TEST_F(EtaCalculatorTest, DefaultSpeedBeforeSamples) {
    EXPECT_DOUBLE_EQ(calc_.smoothed_speed(), 150.0);
    EXPECT_DOUBLE_EQ(calc_.calculate_eta(geo::METERS_PER_NM), 24.0);
}

TEST_F(EtaCalculatorTest, SpeedSmoothingWindow) {
    calc_.update_speed(100.0, 0.0);
    calc_.update_speed(200.0, 60.0);
    EXPECT_DOUBLE_EQ(calc_.smoothed_speed(), 150.0);

    calc_.update_speed(300.0, 200.0);
    EXPECT_DOUBLE_EQ(calc_.smoothed_speed(), 300.0);

    const EtaStats stats = calc_.get_stats();
    EXPECT_EQ(stats.speed_samples, 1u);
    EXPECT_DOUBLE_EQ(*stats.last_update, 200.0);
    EXPECT_DOUBLE_EQ(stats.smoothing_window_s, 120.0);
}

TEST_F(EtaCalculatorTest, NonFiniteSpeedIgnored) {
    calc_.update_speed(std::numeric_limits<double>::infinity(), 0.0);
    EXPECT_DOUBLE_EQ(calc_.smoothed_speed(), 150.0);
    EXPECT_EQ(calc_.get_stats().speed_samples, 0u);
}

TEST_F(EtaCalculatorTest, DistanceToSegment) {
    EXPECT_DOUBLE_EQ(calc_.distance_to_segment(0.0, 1.0, 0.0, 0.0, 0.0, 1.0), 0.0);
    // Degenerate segment measures to its start
    EXPECT_DOUBLE_EQ(calc_.distance_to_segment(1.0, 0.0, 0.0, 0.0, 0.0, 0.0),
                     calc_.calculate_distance(1.0, 0.0, 0.0, 0.0));
    EXPECT_GT(calc_.distance_to_segment(1.0, 0.5, 0.0, 0.0, 0.0, 1.0), 50000.0);
}

TEST_F(EtaCalculatorTest, EstimatedEtaWalksRouteToWaypoint) {
    const auto eta = calc_.estimated_route_eta(0.0, 0.0, poi("p-end", "END", 0.0, 2.0, "route-eq"),
                                               route_, 120.0);
    ASSERT_TRUE(eta.has_value());
    const double expected = (leg_m(0, 1) + leg_m(1, 2)) / geo::METERS_PER_NM / 120.0 * 3600.0;
    EXPECT_NEAR(*eta, expected, 1e-6);
}

TEST_F(EtaCalculatorTest, EstimatedEtaBlendsLiveSpeedOnCurrentSegment) {
    const auto eta = calc_.estimated_route_eta(0.0, 0.0, poi("p-end", "END", 0.0, 2.0, "route-eq"),
                                               route_, 60.0);
    ASSERT_TRUE(eta.has_value());
    const double hours = leg_m(0, 1) / geo::METERS_PER_NM / 90.0
                       + leg_m(1, 2) / geo::METERS_PER_NM / 120.0;
    EXPECT_NEAR(*eta, hours * 3600.0, 1e-6);
}

TEST_F(EtaCalculatorTest, EstimatedEtaFromProjection) {
    PointOfInterest off = poi("p-off", "Tanker track", 0.3, 1.0, "route-eq");
    off.projected_latitude = 0.0;
    off.projected_longitude = 1.0;
    off.projected_route_progress = 50.0;

    const auto eta = calc_.estimated_route_eta(0.0, 0.0, off, route_, 120.0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_NEAR(*eta, leg_m(0, 1) / geo::METERS_PER_NM / 120.0 * 3600.0, 1e-6);
}

TEST_F(EtaCalculatorTest, EstimatedEtaNeedsPlanOrProjection) {
    EXPECT_FALSE(calc_.estimated_route_eta(0.0, 0.0, poi("p", "Elsewhere", 5.0, 5.0), route_, 120.0));
    route_.timing.has_timing_data = false;
    EXPECT_FALSE(calc_.estimated_route_eta(0.0, 0.0, poi("p", "END", 0.0, 2.0), route_, 120.0));
}

TEST_F(EtaCalculatorTest, AnticipatedEtaFromPlannedArrival) {
    const PointOfInterest mid = poi("p-mid", "mid", 0.0, 1.0, "route-eq");
    EXPECT_DOUBLE_EQ(*calc_.anticipated_route_eta(mid, route_, 1000.0), 4000.0);
    EXPECT_DOUBLE_EQ(*calc_.anticipated_route_eta(mid, route_, 6000.0), ETA_UNKNOWN);

    PointOfInterest indexed = poi("p-idx", "Unnamed", 0.1, 1.0, "route-eq");
    indexed.projected_waypoint_index = 0;
    EXPECT_DOUBLE_EQ(*calc_.anticipated_route_eta(indexed, route_, 4000.0), 1000.0);

    indexed.projected_waypoint_index = 1;   // END has no planned time
    EXPECT_FALSE(calc_.anticipated_route_eta(indexed, route_, 4000.0).has_value());
}

TEST_F(EtaCalculatorTest, PoiMetricsRouteAwareOnlyForActiveRoute) {
    const std::vector<PointOfInterest> pois = {
        poi("p-end", "END", 0.0, 2.0, "route-eq"),
        poi("p-other", "END", 0.0, 2.0, "route-other"),
    };
    const auto metrics = calc_.calculate_poi_metrics(0.0, 0.0, pois, 60.0, &route_);
    ASSERT_EQ(metrics.size(), 2u);

    const double route_hours = leg_m(0, 1) / geo::METERS_PER_NM / 90.0
                             + leg_m(1, 2) / geo::METERS_PER_NM / 120.0;
    EXPECT_NEAR(metrics[0].eta_seconds, route_hours * 3600.0, 1e-6);
    EXPECT_NEAR(metrics[1].eta_seconds, calc_.calculate_eta(metrics[1].distance_m, 60.0), 1e-6);
    EXPECT_EQ(metrics[0].eta_type, EtaMode::ESTIMATED);
    EXPECT_EQ(metrics[0].poi_category, "waypoint");
}

TEST_F(EtaCalculatorTest, PoiMetricsAnticipatedBeforeDeparture) {
    now_ = 2000.0;
    const auto metrics = calc_.calculate_poi_metrics(
        0.0, 0.0, {poi("p-mid", "MID", 0.0, 1.0, "route-eq")}, std::nullopt, &route_,
        EtaMode::ANTICIPATED, FlightPhase::PRE_DEPARTURE);
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_DOUBLE_EQ(metrics[0].eta_seconds, 3000.0);
    EXPECT_EQ(metrics[0].eta_type, EtaMode::ANTICIPATED);
    EXPECT_TRUE(metrics[0].is_pre_departure);
    EXPECT_EQ(metrics[0].flight_phase, std::optional<FlightPhase>(FlightPhase::PRE_DEPARTURE));
}

TEST_F(EtaCalculatorTest, FallbackUsesDefaultSpeedWithoutLiveSpeed) {
    const auto metrics = calc_.calculate_poi_metrics(0.0, 0.0, {poi("p", "Far", 0.0, 1.0)});
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_NEAR(metrics[0].eta_seconds, calc_.calculate_eta(metrics[0].distance_m, 150.0), 1e-9);
}

TEST_F(EtaCalculatorTest, PassedPoisStayPassed) {
    const std::vector<PointOfInterest> pois = {poi("p-1", "Gate", 0.0, 0.0005)};
    auto metrics = calc_.calculate_poi_metrics(0.0, 0.0, pois, 120.0);
    EXPECT_TRUE(metrics[0].passed);

    metrics = calc_.calculate_poi_metrics(0.0, 1.0, pois, 120.0);
    EXPECT_TRUE(metrics[0].passed);
    EXPECT_EQ(calc_.passed_pois().count("p-1"), 1u);
    EXPECT_EQ(calc_.get_stats().passed_count, 1u);

    calc_.clear_passed();
    metrics = calc_.calculate_poi_metrics(0.0, 1.0, pois, 120.0);
    EXPECT_FALSE(metrics[0].passed);
}

TEST_F(EtaCalculatorTest, ResetRestoresDefaults) {
    calc_.update_speed(300.0, 0.0);
    calc_.calculate_poi_metrics(0.0, 0.0, {poi("p-1", "Gate", 0.0, 0.0)}, 120.0);
    calc_.reset();
    EXPECT_DOUBLE_EQ(calc_.smoothed_speed(), 150.0);
    EXPECT_TRUE(calc_.passed_pois().empty());
    EXPECT_FALSE(calc_.get_stats().last_update.has_value());
}

} // namespace
} // namespace commplan::flight
