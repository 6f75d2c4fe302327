/**
 * timeline_engine: Mission communication timeline generator.
 *
 * Reads a route, a mission leg and optional coverage/catalog/POI files,
 * builds the X/Ka/Ku availability timeline and writes it as JSON.
 *
 * Usage:
 *   timeline_engine --route <path> --mission <path> [--coverage <path>]
 *                   [--catalog <path>] [--pois <path>] [--sample-interval S]
 *                   [--window-start ISO --window-end ISO] [--output <path>]
 *                   [--no-events] [--verbose]
 */

#include "coordinate/time_utils.hpp"
#include "geo/coverage_sampler.hpp"
#include "io/mission_parser.hpp"
#include "io/timeline_export.hpp"
#include "timeline/mission_timeline_builder.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

struct CliConfig {
    std::string route_path;
    std::string mission_path;
    std::string coverage_path;      // empty = no Ka coverage analysis
    std::string catalog_path;       // empty = built-in catalog
    std::string pois_path;
    std::string output_path;        // empty = stdout
    double sample_interval = commplan::timeline::DEFAULT_SAMPLE_INTERVAL_S;
    std::string window_start;
    std::string window_end;
    bool include_events = true;
    bool verbose = false;
};

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --route <path> --mission <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --route <path>         Route JSON file (required)\n"
              << "  --mission <path>       Mission leg JSON file (required)\n"
              << "  --coverage <path>      Ka coverage GeoJSON FeatureCollection\n"
              << "  --catalog <path>       Satellite catalog JSON (default: built-in)\n"
              << "  --pois <path>          POI JSON (extra satellite longitudes)\n"
              << "  --sample-interval S    Seconds between route samples (default: 60)\n"
              << "  --window-start ISO     Mission window override start\n"
              << "  --window-end ISO       Mission window override end\n"
              << "  --output <path>        Output JSON file (default: stdout)\n"
              << "  --no-events            Omit the raw event list from the output\n"
              << "  --verbose              Progress to stderr\n"
              << "  --help                 Show this message\n";
}

int main(int argc, char* argv[]) {
    using namespace commplan;

    CliConfig config;

    // Parse CLI arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--route" && i + 1 < argc) {
            config.route_path = argv[++i];
        } else if (arg == "--mission" && i + 1 < argc) {
            config.mission_path = argv[++i];
        } else if (arg == "--coverage" && i + 1 < argc) {
            config.coverage_path = argv[++i];
        } else if (arg == "--catalog" && i + 1 < argc) {
            config.catalog_path = argv[++i];
        } else if (arg == "--pois" && i + 1 < argc) {
            config.pois_path = argv[++i];
        } else if (arg == "--sample-interval" && i + 1 < argc) {
            try {
                config.sample_interval = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --sample-interval expects a number\n";
                return 1;
            }
        } else if (arg == "--window-start" && i + 1 < argc) {
            config.window_start = argv[++i];
        } else if (arg == "--window-end" && i + 1 < argc) {
            config.window_end = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (arg == "--no-events") {
            config.include_events = false;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.route_path.empty() || config.mission_path.empty()) {
        std::cerr << "Error: --route and --mission are required\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (config.window_start.empty() != config.window_end.empty()) {
        std::cerr << "Error: --window-start and --window-end must be given together\n";
        return 1;
    }

    try {
        Route route = MissionParser::load_route(config.route_path);
        MissionConfig mission = MissionParser::load_mission(config.mission_path);
        if (!mission.route_id.empty() && mission.route_id != route.id) {
            std::cerr << "[Timeline] WARNING: mission " << mission.id << " names route "
                      << mission.route_id << " but route file is " << route.id << "\n";
        }

        geo::SatelliteCatalog catalog = config.catalog_path.empty()
            ? geo::SatelliteCatalog::with_defaults()
            : MissionParser::load_catalog(config.catalog_path);

        std::vector<PointOfInterest> pois;
        if (!config.pois_path.empty()) {
            pois = MissionParser::load_pois(config.pois_path);
        }

        std::shared_ptr<const geo::CoverageSampler> coverage;
        if (!config.coverage_path.empty()) {
            coverage = geo::CoverageRegistry::get(config.coverage_path);
        }

        timeline::BuildOptions options;
        options.sample_interval_s = config.sample_interval;
        if (!config.window_start.empty()) {
            timeline::MissionWindow window;
            window.start = TimeUtils::parse_iso8601(config.window_start);
            window.end = TimeUtils::parse_iso8601(config.window_end);
            options.window_override = window;
        }

        if (config.verbose) {
            std::cerr << "=== Timeline Engine ===\n"
                      << "Mission:   " << mission.id << " (" << mission.name << ")\n"
                      << "Route:     " << route.id << ", " << route.points.size() << " points, "
                      << route.waypoints.size() << " waypoints\n"
                      << "Catalog:   " << catalog.size() << " satellites\n"
                      << "Coverage:  "
                      << (coverage ? std::to_string(coverage->satellite_count()) + " footprints"
                                   : std::string("none"))
                      << "\n"
                      << "Interval:  " << options.sample_interval_s << " s\n\n";
        }

        auto result = timeline::build_mission_timeline(
            mission, route, catalog, coverage.get(), pois.empty() ? nullptr : &pois, options);
        const timeline::MissionTimeline& tl = result.first;
        const timeline::TimelineSummary& summary = result.second;

        if (config.verbose) {
            std::cerr << "Window:    " << TimeUtils::to_iso8601(tl.mission_start) << " .. "
                      << TimeUtils::to_iso8601(tl.mission_end) << "\n"
                      << "Samples:   " << summary.sample_count << "\n"
                      << "Segments:  " << tl.segments.size() << "\n"
                      << "Degraded:  " << summary.degraded_s << " s\n"
                      << "Critical:  " << summary.critical_s << " s\n"
                      << "Runtime:   " << summary.runtime_ms << " ms\n";
            for (const auto& adv : tl.advisories) {
                std::cerr << "Advisory:  " << adv << "\n";
            }
        }

        // Write output
        if (config.output_path.empty()) {
            write_timeline_json(tl, summary, std::cout, config.include_events);
        } else {
            std::ofstream out(config.output_path);
            if (!out.is_open()) {
                std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
                return 1;
            }
            write_timeline_json(tl, summary, out, config.include_events);
            if (config.verbose) {
                std::cerr << "Timeline written to: " << config.output_path << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
