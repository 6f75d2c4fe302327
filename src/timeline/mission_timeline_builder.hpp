#ifndef COMMPLAN_TIMELINE_MISSION_TIMELINE_BUILDER_HPP
#define COMMPLAN_TIMELINE_MISSION_TIMELINE_BUILDER_HPP

#include "core/mission.hpp"
#include "core/poi.hpp"
#include "core/route.hpp"
#include "geo/coverage_sampler.hpp"
#include "geo/satellite_catalog.hpp"
#include "timeline/route_projector.hpp"
#include "timeline/rule_engine.hpp"
#include "timeline/timeline_assembler.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace commplan::timeline {

struct BuildOptions {
    double sample_interval_s = DEFAULT_SAMPLE_INTERVAL_S;
    ConstraintConfig constraints;
    std::optional<MissionWindow> window_override;   // wins over the mission and route windows
};

/**
 * Build the communication timeline of one mission leg.
 *
 * Pipeline: mission window -> route samples -> rule engine events ->
 * per-transport intervals -> merged segments, advisories, statistics.
 *
 * The mission window comes from options.window_override, else the mission's
 * own override, else the route timing. Satellite longitudes are looked up in
 * the catalog first, then among POIs named after the satellite.
 *
 * @param coverage  Ka footprints; null or empty disables coverage analysis
 * @param pois      Extra longitude source for satellites missing from the catalog
 * @throws ConfigurationError for an invalid route, mission or missing window
 * @throws TimelineComputationError wrapping any other failure
 */
std::pair<MissionTimeline, TimelineSummary> build_mission_timeline(
    const MissionConfig& config,
    const Route& route,
    const geo::SatelliteCatalog& catalog,
    const geo::CoverageSampler* coverage = nullptr,
    const std::vector<PointOfInterest>* pois = nullptr,
    const BuildOptions& options = BuildOptions());

} // namespace commplan::timeline

#endif // COMMPLAN_TIMELINE_MISSION_TIMELINE_BUILDER_HPP
