#include "flight/eta_calculator.hpp"
#include "coordinate/time_utils.hpp"
#include "geo/geo_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace commplan::flight {

EtaCalculator::EtaCalculator(EtaConfig config, Clock clock)
    : config_(config),
      clock_(clock ? std::move(clock) : Clock(&TimeUtils::now)),
      smoothed_speed_(config.default_speed_knots)
{
}

// ═══════════════════════════════════════════════════════════════
// Speed smoothing
// ═══════════════════════════════════════════════════════════════

void EtaCalculator::update_speed(double speed_knots, std::optional<double> now) {
    if (!std::isfinite(speed_knots)) {
        std::cerr << "[ETA] WARNING: non-finite speed sample ignored\n";
        return;
    }
    const double t = now ? *now : clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    speed_history_.emplace_back(t, speed_knots);
    const double cutoff = t - config_.smoothing_window_s;
    while (!speed_history_.empty() && speed_history_.front().first < cutoff) {
        speed_history_.pop_front();
    }

    if (speed_history_.empty()) {
        smoothed_speed_ = config_.default_speed_knots;
    } else {
        double sum = 0.0;
        for (const auto& s : speed_history_) sum += s.second;
        smoothed_speed_ = sum / static_cast<double>(speed_history_.size());
    }
    last_update_ = t;
}

double EtaCalculator::smoothed_speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return smoothed_speed_;
}

// ═══════════════════════════════════════════════════════════════
// Distance and time
// ═══════════════════════════════════════════════════════════════

double EtaCalculator::calculate_distance(double lat1, double lon1, double lat2, double lon2) const {
    return geo::haversine_distance(lat1, lon1, lat2, lon2);
}

double EtaCalculator::calculate_eta(double distance_m, std::optional<double> speed_knots) const {
    const double speed = speed_knots ? *speed_knots : smoothed_speed();
    if (!(speed >= config_.min_speed_knots)) return ETA_UNKNOWN;
    return (distance_m / geo::METERS_PER_NM) / speed * 3600.0;
}

double EtaCalculator::distance_to_segment(double lat, double lon,
                                          double start_lat, double start_lon,
                                          double end_lat, double end_lon) const {
    const double d_start = calculate_distance(lat, lon, start_lat, start_lon);
    const double d_end = calculate_distance(lat, lon, end_lat, end_lon);
    const double seg = calculate_distance(start_lat, start_lon, end_lat, end_lon);

    if (seg < 1.0) return d_start;
    if (d_start + d_end > seg) {
        return std::fabs((d_start * d_start + d_end * d_end - seg * seg) / (2.0 * seg));
    }
    return std::min(d_start, d_end);
}

// Hours to fly one segment; zero when the segment speed is too low to count
double EtaCalculator::segment_hours(const RoutePoint& from, const RoutePoint& to, double speed,
                                    bool current_segment) const {
    const double planned = (from.segment_speed_knots && *from.segment_speed_knots != 0.0)
                         ? *from.segment_speed_knots : speed;
    const double seg_speed = current_segment ? (speed + planned) / 2.0 : planned;
    if (!(seg_speed > config_.min_speed_knots)) return 0.0;

    const double nm = calculate_distance(from.latitude, from.longitude,
                                         to.latitude, to.longitude) / geo::METERS_PER_NM;
    return nm / seg_speed;
}

// ── Route-aware estimates ──

std::optional<double> EtaCalculator::estimated_route_eta(double current_lat, double current_lon,
                                                         const PointOfInterest& poi,
                                                         const Route& route,
                                                         std::optional<double> speed_knots) const {
    if (!route.timing.has_timing_data || route.points.size() < 2) return std::nullopt;

    const double speed = speed_knots ? *speed_knots : smoothed_speed();
    const std::size_t nearest = route.nearest_point_index(current_lat, current_lon);
    const std::size_t last_segment = route.points.size() - 2;

    std::size_t stop = 0;    // last segment index walked, inclusive
    const RouteWaypoint* wp = route.find_waypoint(poi.name);
    double total_hours = 0.0;

    if (wp) {
        for (std::size_t i = nearest; i <= last_segment; ++i) {
            const RoutePoint& p = route.points[i];
            if (p.latitude == wp->latitude && p.longitude == wp->longitude) break;
            total_hours += segment_hours(p, route.points[i + 1], speed, i == nearest);
        }
    } else if (poi.has_projection()) {
        bool found = false;
        for (std::size_t i = 0; i <= last_segment; ++i) {
            const RoutePoint& a = route.points[i];
            const RoutePoint& b = route.points[i + 1];
            if (distance_to_segment(*poi.projected_latitude, *poi.projected_longitude,
                                    a.latitude, a.longitude, b.latitude, b.longitude)
                < config_.projection_tolerance_m) {
                stop = i;
                found = true;
                break;
            }
        }
        if (!found) return std::nullopt;

        for (std::size_t i = nearest; i <= stop; ++i) {
            total_hours += segment_hours(route.points[i], route.points[i + 1], speed, i == nearest);
        }
    } else {
        return std::nullopt;
    }

    if (!(total_hours > 0.0)) return std::nullopt;
    return total_hours * 3600.0;
}

std::optional<double> EtaCalculator::anticipated_route_eta(const PointOfInterest& poi,
                                                           const Route& route,
                                                           double now) const {
    if (!route.timing.has_timing_data || !route.timing.departure_time) return std::nullopt;

    auto time_to = [now](double planned) {
        const double eta = planned - now;
        return eta > 0.0 ? eta : ETA_UNKNOWN;
    };

    const RouteWaypoint* wp = route.find_waypoint(poi.name);
    if (wp && wp->arrival_time) return time_to(*wp->arrival_time);

    if (poi.projected_waypoint_index) {
        const int idx = *poi.projected_waypoint_index;
        if (idx >= 0 && static_cast<std::size_t>(idx) < route.waypoints.size()) {
            const RouteWaypoint& indexed = route.waypoints[static_cast<std::size_t>(idx)];
            if (indexed.arrival_time) return time_to(*indexed.arrival_time);
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════
// POI metrics
// ═══════════════════════════════════════════════════════════════

std::vector<PoiMetrics> EtaCalculator::calculate_poi_metrics(double current_lat, double current_lon,
                                                             const std::vector<PointOfInterest>& pois,
                                                             std::optional<double> speed_knots,
                                                             const Route* active_route,
                                                             EtaMode eta_mode,
                                                             std::optional<FlightPhase> flight_phase) {
    const double now = clock_();
    const bool pre_departure = flight_phase && *flight_phase == FlightPhase::PRE_DEPARTURE;

    std::vector<PoiMetrics> out;
    out.reserve(pois.size());

    for (const auto& poi : pois) {
        PoiMetrics m;
        m.poi_id = poi.id;
        m.poi_name = poi.name;
        m.poi_category = poi.category;
        m.distance_m = calculate_distance(current_lat, current_lon, poi.latitude, poi.longitude);
        m.eta_type = eta_mode;
        m.flight_phase = flight_phase;
        m.is_pre_departure = pre_departure;

        std::optional<double> eta;
        if (active_route && !poi.route_id.empty() && poi.route_id == active_route->id) {
            eta = eta_mode == EtaMode::ESTIMATED
                ? estimated_route_eta(current_lat, current_lon, poi, *active_route, speed_knots)
                : anticipated_route_eta(poi, *active_route, now);
        }
        if (!eta) {
            eta = calculate_eta(m.distance_m,
                                speed_knots ? *speed_knots : config_.default_speed_knots);
        }
        m.eta_seconds = *eta;

        std::lock_guard<std::mutex> lock(mutex_);
        if (m.distance_m < config_.passed_threshold_m && passed_.insert(poi.id).second) {
            std::cerr << "[ETA] POI passed: " << poi.name << " (" << poi.id << ")\n";
        }
        m.passed = passed_.count(poi.id) > 0;
        out.push_back(std::move(m));
    }
    return out;
}

// ── Bookkeeping ──

std::set<std::string> EtaCalculator::passed_pois() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return passed_;
}

void EtaCalculator::clear_passed() {
    std::lock_guard<std::mutex> lock(mutex_);
    passed_.clear();
}

void EtaCalculator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    speed_history_.clear();
    smoothed_speed_ = config_.default_speed_knots;
    last_update_.reset();
    passed_.clear();
}

EtaStats EtaCalculator::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EtaStats s;
    s.smoothed_speed_knots = smoothed_speed_;
    s.speed_samples = speed_history_.size();
    s.smoothing_window_s = config_.smoothing_window_s;
    if (speed_history_.size() > 1) {
        s.window_coverage_s = speed_history_.back().first - speed_history_.front().first;
    }
    s.passed_count = passed_.size();
    s.last_update = last_update_;
    return s;
}

} // namespace commplan::flight
