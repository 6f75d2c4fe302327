#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "io/json_reader.hpp"
#include "io/mission_parser.hpp"
#include "io/timeline_export.hpp"
#include "timeline/mission_timeline_builder.hpp"

#include <sstream>

namespace commplan {
namespace {

class MissionParserTest : public ::testing::Test {
protected:
    static constexpr double T0 = 1735689600.0;

    static const char* route_json() {
        return R"({
            "id": "route-east",
            "name": "Eastbound",
            "timing": {
                "departure_time": "2025-01-01T00:00:00Z",
                "arrival_time": "2025-01-01T02:00:00Z"
            },
            "points": [
                {"latitude": 10.0, "longitude": 10.0, "sequence": 2, "altitude": 11000},
                {"latitude": 10.0, "longitude": 0.0, "sequence": 0, "segment_speed_knots": 420},
                {"latitude": 10.0, "longitude": 5.0, "sequence": 1}
            ],
            "waypoints": [
                {"name": "DEP", "latitude": 10.0, "longitude": 0.0, "role": "departure"},
                {"name": "ARIP", "latitude": 10.0, "longitude": 2.5, "order": 1,
                 "arrival_time": 1735691400}
            ]
        })";
    }

    static const char* mission_json() {
        return R"({
            "id": "M-7",
            "route_id": "route-east",
            "transports": {
                "initial_x_satellite_id": "X-EAST",
                "initial_ka_satellite_ids": ["AOR", "IOR"],
                "x_transitions": [
                    {"id": "xt-1", "latitude": 10.0, "longitude": 5.0,
                     "target_satellite_id": "X-2", "target_beam_id": "B7"}
                ],
                "ka_outages": [
                    {"id": "ka-1", "start_time": "2025-01-01T01:00:00Z", "duration_seconds": 600}
                ],
                "ku_overrides": [
                    {"id": "ku-1", "start_time": 1735693200, "duration_seconds": 300,
                     "reason": "Ku terminal reboot"}
                ],
                "aar_windows": [
                    {"id": "AAR-1", "start_waypoint_name": "ARIP", "end_waypoint_name": "DEP"}
                ]
            }
        })";
    }
};

TEST_F(MissionParserTest, ParsesRoute) {
    const Route route = MissionParser::parse_route(JsonReader::parse(route_json()));
    EXPECT_EQ(route.id, "route-east");
    EXPECT_EQ(route.name, "Eastbound");
    ASSERT_EQ(route.points.size(), 3u);

    // Sorted by sequence
    EXPECT_DOUBLE_EQ(route.points[0].longitude, 0.0);
    EXPECT_DOUBLE_EQ(route.points[1].longitude, 5.0);
    EXPECT_DOUBLE_EQ(route.points[2].longitude, 10.0);
    EXPECT_DOUBLE_EQ(*route.points[0].segment_speed_knots, 420.0);
    EXPECT_DOUBLE_EQ(*route.points[2].altitude, 11000.0);
    EXPECT_FALSE(route.points[1].altitude.has_value());

    EXPECT_DOUBLE_EQ(*route.timing.departure_time, T0);
    EXPECT_DOUBLE_EQ(*route.timing.arrival_time, T0 + 7200.0);
    EXPECT_TRUE(route.timing.has_timing_data);

    ASSERT_EQ(route.waypoints.size(), 2u);
    EXPECT_EQ(route.waypoints[0].order, 0);
    EXPECT_EQ(route.waypoints[0].role, "departure");
    EXPECT_DOUBLE_EQ(*route.waypoints[1].arrival_time, T0 + 1800.0);
}

TEST_F(MissionParserTest, RouteWithoutTimestampsHasNoTimingData) {
    const Route route = MissionParser::parse_route(JsonReader::parse(R"({
        "id": "r", "points": [{"latitude": 1, "longitude": 2}]
    })"));
    EXPECT_FALSE(route.timing.has_timing_data);
    EXPECT_EQ(route.name, "r");
}

TEST_F(MissionParserTest, RouteErrors) {
    EXPECT_THROW(MissionParser::parse_route(JsonReader::parse(R"({"id": "r", "points": []})")),
                 ConfigurationError);
    EXPECT_THROW(MissionParser::parse_route(JsonReader::parse(
                     R"({"id": "r", "points": [{"latitude": "north", "longitude": 2}]})")),
                 ConfigurationError);
    EXPECT_THROW(MissionParser::parse_route(JsonReader::parse(
                     R"({"id": "r", "points": [{"latitude": 1, "longitude": 2}],
                         "timing": {"departure_time": "not a time"}})")),
                 ConfigurationError);
}

TEST_F(MissionParserTest, ParsesMission) {
    const MissionConfig mission = MissionParser::parse_mission(JsonReader::parse(mission_json()));
    EXPECT_EQ(mission.id, "M-7");
    EXPECT_EQ(mission.name, "M-7");
    EXPECT_EQ(mission.route_id, "route-east");
    EXPECT_FALSE(mission.window_start.has_value());

    const TransportConfig& tc = mission.transports;
    EXPECT_EQ(tc.initial_x_satellite_id, "X-EAST");
    EXPECT_EQ(tc.initial_ka_satellite_ids, std::vector<std::string>({"AOR", "IOR"}));
    ASSERT_EQ(tc.x_transitions.size(), 1u);
    EXPECT_EQ(tc.x_transitions[0].target_beam_id, "B7");

    ASSERT_EQ(tc.ka_outages.size(), 1u);
    EXPECT_DOUBLE_EQ(tc.ka_outages[0].start_time, T0 + 3600.0);
    EXPECT_DOUBLE_EQ(tc.ka_outages[0].end_time(), T0 + 4200.0);
    ASSERT_EQ(tc.ku_outages.size(), 1u);
    EXPECT_EQ(tc.ku_outages[0].reason, "Ku terminal reboot");

    ASSERT_EQ(tc.refuel_windows.size(), 1u);
    EXPECT_EQ(tc.refuel_windows[0].start_waypoint, "ARIP");
}

TEST_F(MissionParserTest, MissionDefaultsKaConstellation) {
    const MissionConfig mission = MissionParser::parse_mission(JsonReader::parse(R"({"id": "M"})"));
    EXPECT_EQ(mission.transports.initial_ka_satellite_ids,
              std::vector<std::string>({"AOR", "POR", "IOR"}));
}

TEST_F(MissionParserTest, MissionErrors) {
    EXPECT_THROW(MissionParser::parse_mission(JsonReader::parse(R"({"name": "no id"})")),
                 ConfigurationError);
    EXPECT_THROW(MissionParser::parse_mission(JsonReader::parse(
                     R"({"id": "M", "transports": {"ka_outages": [{"id": "k"}]}})")),
                 ConfigurationError);
    EXPECT_THROW(MissionParser::parse_mission(JsonReader::parse(
                     R"({"id": "M", "transports": {"x_transitions": {"id": "not an array"}}})")),
                 ConfigurationError);
    EXPECT_THROW(MissionParser::parse_mission(JsonReader::parse(
                     R"({"id": "M", "window": {"start": "2025-01-01T00:00:00Z"}})")),
                 ConfigurationError);
}

TEST_F(MissionParserTest, ParsesPoisInBothShapes) {
    const auto wrapped = MissionParser::parse_pois(JsonReader::parse(R"({"pois": [
        {"id": "p1", "name": "Tanker", "latitude": 1, "longitude": 2, "route_id": "route-east",
         "projected_latitude": 1.5, "projected_longitude": 2.5, "projected_waypoint_index": 3,
         "projected_route_progress": 40}
    ]})"));
    ASSERT_EQ(wrapped.size(), 1u);
    EXPECT_TRUE(wrapped[0].has_projection());
    EXPECT_EQ(*wrapped[0].projected_waypoint_index, 3);

    const auto bare = MissionParser::parse_pois(JsonReader::parse(
        R"([{"id": "p2", "latitude": 0, "longitude": 0}])"));
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_EQ(bare[0].name, "p2");
    EXPECT_FALSE(bare[0].has_projection());
}

TEST_F(MissionParserTest, CatalogExtendsDefaults) {
    const geo::SatelliteCatalog catalog = MissionParser::parse_catalog(JsonReader::parse(R"({
        "satellites": [
            {"id": "X-1", "transport": "x", "longitude": 25.5},
            {"id": "KA-NEW", "transport": "Ka", "longitude": 100, "slot": "spare"}
        ]
    })"));
    EXPECT_DOUBLE_EQ(*catalog.longitude_of("X-1"), 25.5);
    EXPECT_EQ(catalog.find("KA-NEW")->transport, Transport::KA);
    EXPECT_TRUE(catalog.contains("AOR"));
    EXPECT_EQ(catalog.size(), 6u);
}

TEST_F(MissionParserTest, ParseTransport) {
    EXPECT_EQ(MissionParser::parse_transport("KU"), Transport::KU);
    EXPECT_EQ(MissionParser::parse_transport("ka"), Transport::KA);
    EXPECT_THROW(MissionParser::parse_transport("L-band"), ConfigurationError);
}

TEST_F(MissionParserTest, MissingFilesThrow) {
    EXPECT_THROW(MissionParser::load_route("/nonexistent/commplan/route.json"), ConfigurationError);
    EXPECT_THROW(MissionParser::load_mission("/nonexistent/commplan/mission.json"), ConfigurationError);
}

// ── Export ──

class TimelineExportTest : public MissionParserTest {};

TEST_F(TimelineExportTest, ParsedInputsExportAsJson) {
    const Route route = MissionParser::parse_route(JsonReader::parse(route_json()));
    MissionConfig mission = MissionParser::parse_mission(JsonReader::parse(mission_json()));
    mission.transports.refuel_windows.clear();
    geo::SatelliteCatalog catalog = geo::SatelliteCatalog::with_defaults();
    catalog.add({"X-EAST", Transport::X, 60.0, ""});
    catalog.add({"X-2", Transport::X, 60.0, ""});

    const auto [timeline, summary] = timeline::build_mission_timeline(mission, route, catalog);

    std::ostringstream out;
    write_timeline_json(timeline, summary, out);
    const JsonValue doc = JsonReader::parse(out.str());

    EXPECT_EQ(doc["mission_id"].as_string(), "M-7");
    EXPECT_EQ(doc["mission_start"].as_string(), "2025-01-01T00:00:00Z");
    EXPECT_EQ(doc["mission_end"].as_string(), "2025-01-01T02:00:00Z");
    ASSERT_EQ(doc["segments"].size(), timeline.segments.size());
    EXPECT_EQ(doc["segments"][0]["id"].as_string(), "M-7-segment-001");
    EXPECT_EQ(doc["segments"][0]["status"].as_string(), "nominal");
    EXPECT_EQ(doc["advisories"].size(), 1u);
    EXPECT_EQ(doc["events"].size(), timeline.events.size());
    EXPECT_DOUBLE_EQ(doc["statistics"]["total_duration_seconds"].as_number(), 7200.0);
    EXPECT_EQ(doc["summary"]["transport_states"]["Ka"].as_string(), "offline");
    EXPECT_EQ(doc["summary"]["sample_count"].as_int(), 121);
}

TEST_F(TimelineExportTest, EventsCanBeOmitted) {
    const Route route = MissionParser::parse_route(JsonReader::parse(route_json()));
    const MissionConfig mission = MissionParser::parse_mission(JsonReader::parse(R"({"id": "M-8"})"));
    const auto [timeline, summary] =
        timeline::build_mission_timeline(mission, route, geo::SatelliteCatalog::with_defaults());

    std::ostringstream out;
    write_timeline_json(timeline, summary, out, false);
    const JsonValue doc = JsonReader::parse(out.str());
    EXPECT_FALSE(doc.has("events"));
    EXPECT_TRUE(doc.has("summary"));
}

} // namespace
} // namespace commplan
