#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "timeline/mission_timeline_builder.hpp"
#include "test_routes.hpp"

#include <cmath>
#include <limits>

namespace commplan::timeline {
namespace {

using test_support::T0;
using test_support::TWO_HOURS;

class TimelineBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        route_ = test_support::eastbound_route();
        catalog_ = test_support::test_catalog();
    }

    std::pair<MissionTimeline, TimelineSummary> build(const MissionConfig& mission,
                                                      const BuildOptions& options = BuildOptions()) {
        return build_mission_timeline(mission, route_, catalog_, nullptr, nullptr, options);
    }

    static void expect_contiguous(const MissionTimeline& timeline) {
        ASSERT_FALSE(timeline.segments.empty());
        EXPECT_DOUBLE_EQ(timeline.segments.front().start, timeline.mission_start);
        EXPECT_DOUBLE_EQ(timeline.segments.back().end, timeline.mission_end);
        for (std::size_t i = 1; i < timeline.segments.size(); ++i) {
            EXPECT_DOUBLE_EQ(timeline.segments[i].start, timeline.segments[i - 1].end);
            EXPECT_GT(timeline.segments[i].duration(), 0.0);
        }
    }

    Route route_;
    geo::SatelliteCatalog catalog_;
};

TEST_F(TimelineBuilderTest, NominalLegHasOnlySafetyBuffers) {
    const auto [timeline, summary] = build(test_support::single_satellite_mission("X-EAST"));

    expect_contiguous(timeline);
    ASSERT_EQ(timeline.segments.size(), 3u);
    EXPECT_DOUBLE_EQ(timeline.segments[0].end, T0 + 900.0);
    EXPECT_DOUBLE_EQ(timeline.segments[1].end, T0 + TWO_HOURS - 900.0);
    for (const auto& seg : timeline.segments) {
        EXPECT_EQ(seg.status, TimelineStatus::NOMINAL);
        EXPECT_FALSE(seg.x_ku_conflict_only);
    }
    EXPECT_EQ(timeline.segments[0].reasons, std::vector<std::string>({"Safety-of-Flight (takeoff)"}));
    EXPECT_TRUE(timeline.segments[1].reasons.empty());
    EXPECT_EQ(timeline.segments[2].reasons, std::vector<std::string>({"Safety-of-Flight (landing)"}));

    EXPECT_TRUE(timeline.advisories.empty());
    EXPECT_DOUBLE_EQ(timeline.statistics.total_duration_s, TWO_HOURS);
    EXPECT_DOUBLE_EQ(timeline.statistics.nominal_s, TWO_HOURS);
    EXPECT_DOUBLE_EQ(timeline.statistics.next_conflict_s, -1.0);

    EXPECT_EQ(summary.sample_count, 121u);
    EXPECT_DOUBLE_EQ(summary.sample_interval_s, 60.0);
    EXPECT_DOUBLE_EQ(summary.mission_start, T0);
    EXPECT_DOUBLE_EQ(summary.mission_end, T0 + TWO_HOURS);
}

TEST_F(TimelineBuilderTest, AftSatelliteIsNominalWithXKuFlag) {
    const auto [timeline, summary] = build(test_support::single_satellite_mission("X-WEST"));

    expect_contiguous(timeline);
    bool flagged = false;
    for (const auto& seg : timeline.segments) {
        EXPECT_EQ(seg.status, TimelineStatus::NOMINAL);
        flagged = flagged || seg.x_ku_conflict_only;
    }
    EXPECT_TRUE(flagged);
    EXPECT_DOUBLE_EQ(timeline.statistics.degraded_s, 0.0);
    EXPECT_DOUBLE_EQ(summary.degraded_s, 0.0);
    EXPECT_EQ(summary.worst_states[transport_index(Transport::X)], TransportState::DEGRADED);

    ASSERT_GE(timeline.segments.size(), 2u);
    EXPECT_DOUBLE_EQ(timeline.segments[1].start, T0 + 60.0);
    EXPECT_TRUE(timeline.segments[1].x_ku_conflict_only);
}

TEST_F(TimelineBuilderTest, KuOutageDegradesLeg) {
    MissionConfig mission = test_support::single_satellite_mission("X-EAST");
    ManualOutage ku;
    ku.id = "ku-1";
    ku.start_time = T0 + 3600.0;
    ku.duration_s = 600.0;
    mission.transports.ku_outages.push_back(ku);

    const auto [timeline, summary] = build(mission);
    expect_contiguous(timeline);

    const TimelineSegment* outage = nullptr;
    for (const auto& seg : timeline.segments) {
        if (seg.start == T0 + 3600.0) outage = &seg;
    }
    ASSERT_NE(outage, nullptr);
    EXPECT_DOUBLE_EQ(outage->end, T0 + 4200.0);
    EXPECT_EQ(outage->status, TimelineStatus::DEGRADED);
    EXPECT_EQ(outage->impacted, std::vector<Transport>({Transport::KU}));
    EXPECT_EQ(outage->reasons, std::vector<std::string>({"Ku outage"}));
    EXPECT_EQ(outage->state_of(Transport::KU), TransportState::OFFLINE);

    EXPECT_DOUBLE_EQ(timeline.statistics.degraded_s, 600.0);
    EXPECT_DOUBLE_EQ(timeline.statistics.next_conflict_s, 3600.0);
    EXPECT_DOUBLE_EQ(summary.next_conflict_s, 3600.0);
}

TEST_F(TimelineBuilderTest, OverlappingOutagesAreCritical) {
    MissionConfig mission = test_support::single_satellite_mission("X-EAST");
    ManualOutage ka;
    ka.id = "ka-1";
    ka.start_time = T0 + 3600.0;
    ka.duration_s = 600.0;
    ka.reason = "Ka gateway maintenance";
    ManualOutage ku;
    ku.id = "ku-1";
    ku.start_time = T0 + 3900.0;
    ku.duration_s = 600.0;
    mission.transports.ka_outages.push_back(ka);
    mission.transports.ku_outages.push_back(ku);

    const auto [timeline, summary] = build(mission);
    EXPECT_DOUBLE_EQ(timeline.statistics.critical_s, 300.0);
    EXPECT_DOUBLE_EQ(timeline.statistics.degraded_s, 600.0);
    EXPECT_DOUBLE_EQ(summary.critical_s, 300.0);
}

TEST_F(TimelineBuilderTest, XTransitionProducesAdvisory) {
    MissionConfig mission = test_support::single_satellite_mission("X-EAST");
    XTransition t;
    t.id = "xt-1";
    t.latitude = 10.0;
    t.longitude = 5.0;
    t.target_satellite_id = "X-EAST";
    t.is_same_satellite_transition = true;
    mission.transports.x_transitions.push_back(t);

    const auto [timeline, summary] = build(mission);
    ASSERT_EQ(timeline.advisories.size(), 1u);
    EXPECT_EQ(timeline.advisories[0], "Disable X from 00:45Z to 01:15Z during transition to X-EAST");
    EXPECT_NEAR(timeline.statistics.degraded_s, 1800.0, 1.0);
    EXPECT_NEAR(timeline.statistics.next_conflict_s, 2700.0, 1.0);
}

TEST_F(TimelineBuilderTest, RefuelWindowDegradesXForForwardSatellite) {
    RouteWaypoint arip;
    arip.name = "ARIP";
    arip.latitude = 10.0;
    arip.longitude = 2.5;
    arip.order = 2;
    RouteWaypoint exit;
    exit.name = "EXIT";
    exit.latitude = 10.0;
    exit.longitude = 5.0;
    exit.order = 3;
    route_.waypoints.push_back(arip);
    route_.waypoints.push_back(exit);

    MissionConfig mission = test_support::single_satellite_mission("X-EAST");
    mission.transports.refuel_windows.push_back({"AAR-1", "ARIP", "EXIT"});

    const auto [timeline, summary] = build(mission);
    ASSERT_EQ(timeline.refuel_blocks.size(), 1u);
    EXPECT_EQ(timeline.refuel_blocks[0].name, "AAR-1");
    EXPECT_NEAR(timeline.refuel_blocks[0].start, T0 + 1800.0, 1.0);
    EXPECT_NEAR(timeline.refuel_blocks[0].end, T0 + 3600.0, 1.0);

    EXPECT_NEAR(timeline.statistics.next_conflict_s, 1800.0, 61.0);
    EXPECT_NEAR(timeline.statistics.degraded_s, 1800.0, 121.0);
    for (const auto& seg : timeline.segments) {
        EXPECT_NE(seg.status, TimelineStatus::CRITICAL);
    }
}

TEST_F(TimelineBuilderTest, KaCoverageGapFromFootprints) {
    geo::CoverageSampler coverage;
    coverage.add_ring("AOR", {{-10.0, 0.0}, {3.0, 0.0}, {3.0, 20.0}, {-10.0, 20.0}});
    coverage.add_ring("IOR", {{6.0, 0.0}, {20.0, 0.0}, {20.0, 20.0}, {6.0, 20.0}});

    const auto result = build_mission_timeline(test_support::single_satellite_mission("X-EAST"),
                                               route_, catalog_, &coverage);
    const MissionTimeline& timeline = result.first;
    bool saw_exit = false;
    for (const auto& ev : timeline.events) {
        if (ev.type == EventType::KA_COVERAGE_EXIT) {
            saw_exit = true;
            EXPECT_EQ(ev.reason, "Ka coverage lost (AOR)");
        }
    }
    EXPECT_TRUE(saw_exit);
    EXPECT_NEAR(timeline.statistics.degraded_s, 2160.0, 130.0);
}

TEST_F(TimelineBuilderTest, WindowOverrideWins) {
    BuildOptions options;
    options.window_override = MissionWindow{T0 + 600.0, T0 + 4200.0};
    const auto [timeline, summary] = build(test_support::single_satellite_mission("X-EAST"), options);
    EXPECT_DOUBLE_EQ(timeline.mission_start, T0 + 600.0);
    EXPECT_DOUBLE_EQ(timeline.mission_end, T0 + 4200.0);
    expect_contiguous(timeline);
}

TEST_F(TimelineBuilderTest, MissionWindowUsedWithoutRouteTiming) {
    route_.timing = RouteTimingProfile();
    MissionConfig mission = test_support::single_satellite_mission("X-EAST");
    EXPECT_THROW(build(mission), ConfigurationError);

    mission.window_start = T0;
    mission.window_end = T0 + 3600.0;
    const auto [timeline, summary] = build(mission);
    EXPECT_DOUBLE_EQ(timeline.mission_end, T0 + 3600.0);
}

TEST_F(TimelineBuilderTest, SatelliteLongitudeFromPoi) {
    PointOfInterest poi;
    poi.id = "poi-1";
    poi.name = "X-POI";
    poi.longitude = -40.0;
    const std::vector<PointOfInterest> pois = {poi};

    const auto result = build_mission_timeline(test_support::single_satellite_mission("X-POI"),
                                               route_, catalog_, nullptr, &pois);
    bool flagged = false;
    for (const auto& seg : result.first.segments) flagged = flagged || seg.x_ku_conflict_only;
    EXPECT_TRUE(flagged);
}

TEST_F(TimelineBuilderTest, InvalidConfigurationPropagates) {
    MissionConfig mission = test_support::single_satellite_mission();
    mission.id.clear();
    EXPECT_THROW(build(mission), ConfigurationError);

    Route empty;
    empty.id = "empty";
    EXPECT_THROW(build_mission_timeline(test_support::single_satellite_mission(), empty, catalog_),
                 ConfigurationError);
}

TEST_F(TimelineBuilderTest, GeometryFailureIsWrapped) {
    route_.points[0].altitude = std::numeric_limits<double>::quiet_NaN();
    try {
        build(test_support::single_satellite_mission("X-EAST"));
        FAIL() << "expected TimelineComputationError";
    } catch (const TimelineComputationError& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to build timeline for mission 'M1'"),
                  std::string::npos);
    }
}

} // namespace
} // namespace commplan::timeline
