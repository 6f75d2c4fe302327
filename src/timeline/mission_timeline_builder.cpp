#include "timeline/mission_timeline_builder.hpp"
#include "core/errors.hpp"
#include "timeline/coverage_analysis.hpp"
#include "timeline/mission_schedule.hpp"
#include "timeline/transport_intervals.hpp"
#include <chrono>
#include <iostream>

namespace commplan::timeline {

namespace {

MissionWindow resolve_window(const MissionConfig& config, const Route& route,
                             const BuildOptions& options) {
    if (options.window_override) {
        if (!(options.window_override->end > options.window_override->start)) {
            throw ConfigurationError("Mission end must be after mission start");
        }
        return *options.window_override;
    }
    if (config.window_start && config.window_end) {
        return {*config.window_start, *config.window_end};
    }
    return derive_mission_window(route);
}

SatelliteLongitudeLookup make_longitude_lookup(const geo::SatelliteCatalog& catalog,
                                               const std::vector<PointOfInterest>* pois) {
    return [&catalog, pois](const std::string& id) -> std::optional<double> {
        if (auto lon = catalog.longitude_of(id)) return lon;
        if (pois) {
            for (const auto& poi : *pois) {
                if (poi.name == id) return poi.longitude;
            }
        }
        return std::nullopt;
    };
}

std::pair<MissionTimeline, TimelineSummary> build(const MissionConfig& config,
                                                  const Route& route,
                                                  const geo::SatelliteCatalog& catalog,
                                                  const geo::CoverageSampler* coverage,
                                                  const std::vector<PointOfInterest>* pois,
                                                  const BuildOptions& options) {
    auto t_start = std::chrono::high_resolution_clock::now();

    route.validate();
    config.validate();

    const MissionWindow window = resolve_window(config, route, options);
    RouteTemporalProjector projector(route, window.start, window.end);

    const double interval = options.sample_interval_s > 0.0
                          ? options.sample_interval_s : DEFAULT_SAMPLE_INTERVAL_S;
    const bool with_coverage = coverage && !coverage->empty();
    const std::vector<RouteSample> samples =
        projector.generate_samples(interval, with_coverage ? coverage : nullptr);
    if (samples.size() > HIGH_SAMPLE_COUNT) {
        std::cerr << "[Timeline] WARNING: mission " << config.id << " generated "
                  << samples.size() << " samples at " << interval << " s spacing\n";
    }

    RuleEngine engine(options.constraints);
    const TransportConfig& tc = config.transports;

    engine.add_takeoff_landing_buffers(window.start, window.end);

    const std::vector<RefuelWindow> refuel_windows =
        resolve_refuel_windows(tc.refuel_windows, projector);
    for (const auto& w : refuel_windows) {
        engine.add_refuel_window_events(w);
    }

    const std::vector<XAssignment> transitions =
        project_x_transitions(tc.x_transitions, projector);
    for (const auto& t : transitions) {
        engine.add_x_transition_events(t.time, t.satellite_id);
    }

    if (with_coverage) {
        engine.add_ka_coverage_events(analyze_ka_coverage(samples, projector));
    }

    if (!tc.initial_x_satellite_id.empty()) {
        engine.add_x_azimuth_events(
            samples,
            x_assignment_schedule(tc.initial_x_satellite_id, window.start, transitions),
            refuel_windows,
            make_longitude_lookup(catalog, pois),
            route,
            window.end);
    }

    for (const auto& o : tc.ka_outages) {
        engine.add_manual_outage_events(o.start_time, o.end_time(), Transport::KA, o.reason, o.id);
    }
    for (const auto& o : tc.ku_outages) {
        engine.add_manual_outage_events(o.start_time, o.end_time(), Transport::KU, o.reason, o.id);
    }

    std::vector<MissionEvent> events = engine.sorted_events();
    const TransportIntervals intervals =
        build_transport_intervals(events, window.start, window.end);

    MissionTimeline timeline;
    timeline.mission_id = config.id;
    timeline.mission_start = window.start;
    timeline.mission_end = window.end;
    timeline.segments = build_segments(config.id, intervals, window.start, window.end);
    timeline.advisories = engine.generate_advisories();
    annotate_refuel_markers(timeline, events);
    attach_statistics(timeline);
    timeline.events = std::move(events);

    auto t_end = std::chrono::high_resolution_clock::now();
    const double runtime_ms =
        std::chrono::duration<double, std::milli>(t_end - t_start).count();
    if (runtime_ms > 1000.0) {
        std::cerr << "[Timeline] WARNING: mission " << config.id << " took "
                  << runtime_ms << " ms to build\n";
    }

    TimelineSummary summary = summarize_timeline(timeline, samples.size(), interval, runtime_ms);
    return {std::move(timeline), summary};
}

} // anonymous namespace

std::pair<MissionTimeline, TimelineSummary> build_mission_timeline(
    const MissionConfig& config,
    const Route& route,
    const geo::SatelliteCatalog& catalog,
    const geo::CoverageSampler* coverage,
    const std::vector<PointOfInterest>* pois,
    const BuildOptions& options) {
    try {
        return build(config, route, catalog, coverage, pois, options);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const TimelineComputationError&) {
        throw;
    } catch (const std::exception& e) {
        throw TimelineComputationError("Failed to build timeline for mission '" + config.id +
                                       "': " + e.what());
    }
}

} // namespace commplan::timeline
