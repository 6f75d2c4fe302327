#include "timeline/route_projector.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace commplan::timeline {

MissionWindow derive_mission_window(const Route& route) {
    std::vector<double> starts;
    std::vector<double> ends;

    if (route.timing.departure_time) starts.push_back(*route.timing.departure_time);
    if (route.timing.arrival_time)   ends.push_back(*route.timing.arrival_time);

    for (const auto& p : route.points) {
        if (p.arrival_time) {
            starts.push_back(*p.arrival_time);
            ends.push_back(*p.arrival_time);
        }
    }

    if (starts.empty() || ends.empty()) {
        throw ConfigurationError("Route timing data missing departure/arrival timestamps");
    }

    MissionWindow window;
    window.start = *std::min_element(starts.begin(), starts.end());
    window.end = *std::max_element(ends.begin(), ends.end());
    if (window.end <= window.start) {
        throw ConfigurationError("Mission end must be after mission start");
    }
    return window;
}

// ═══════════════════════════════════════════════════════════════
// RouteTemporalProjector
// ═══════════════════════════════════════════════════════════════

RouteTemporalProjector::RouteTemporalProjector(const Route& route, double start_time, double end_time)
    : route_(route), start_(start_time), end_(end_time), duration_(end_time - start_time)
{
    if (route.points.empty()) {
        throw ConfigurationError("Cannot project an empty route");
    }
    if (!(duration_ > 0.0)) {
        throw ConfigurationError("Mission end must be after mission start");
    }

    cumulative_.reserve(route.points.size());
    cumulative_.push_back(0.0);
    for (std::size_t i = 1; i < route.points.size(); ++i) {
        const auto& a = route.points[i - 1];
        const auto& b = route.points[i];
        cumulative_.push_back(cumulative_.back() +
                              geo::haversine_distance(a.latitude, a.longitude, b.latitude, b.longitude));
    }
    total_distance_ = cumulative_.back();

    build_time_knots();
}

void RouteTemporalProjector::build_time_knots() {
    const auto& pts = route_.points;
    const std::size_t n = pts.size();
    knot_times_.assign(n, start_);
    if (n < 2) return;

    // 1. Explicit arrival times on every point
    bool all_timed = true;
    for (std::size_t i = 0; i < n && all_timed; ++i) {
        if (!pts[i].arrival_time) all_timed = false;
        else if (i > 0 && *pts[i].arrival_time < *pts[i - 1].arrival_time) all_timed = false;
    }
    if (all_timed) {
        for (std::size_t i = 0; i < n; ++i) {
            knot_times_[i] = std::clamp(*pts[i].arrival_time, start_, end_);
        }
        return;
    }

    // 2. Planned speed on every segment
    bool all_speeds = true;
    for (std::size_t i = 0; i + 1 < n; ++i) {
        if (!pts[i].segment_speed_knots || *pts[i].segment_speed_knots <= 0.0) {
            all_speeds = false;
            break;
        }
    }
    if (all_speeds) {
        std::vector<double> raw(n, 0.0);
        for (std::size_t i = 0; i + 1 < n; ++i) {
            const double mps = *pts[i].segment_speed_knots * geo::METERS_PER_NM / 3600.0;
            raw[i + 1] = raw[i] + (cumulative_[i + 1] - cumulative_[i]) / mps;
        }
        if (raw.back() > 0.0) {
            for (std::size_t i = 0; i < n; ++i) {
                knot_times_[i] = start_ + raw[i] / raw.back() * duration_;
            }
            return;
        }
    }

    // 3. Distance-proportional over the window
    if (total_distance_ > 0.0) {
        for (std::size_t i = 0; i < n; ++i) {
            knot_times_[i] = start_ + cumulative_[i] / total_distance_ * duration_;
        }
    }
}

std::size_t RouteTemporalProjector::segment_for_distance(double distance_m) const {
    // First segment whose end is at or beyond the distance
    auto it = std::lower_bound(cumulative_.begin() + 1, cumulative_.end(), distance_m);
    if (it == cumulative_.end()) --it;
    return static_cast<std::size_t>(it - cumulative_.begin()) - 1;
}

double RouteTemporalProjector::timestamp_for_distance(double distance_m) const {
    if (route_.points.size() < 2 || total_distance_ <= 0.0) return start_;

    const double d = std::clamp(distance_m, 0.0, total_distance_);
    const std::size_t i = segment_for_distance(d);
    const double span = cumulative_[i + 1] - cumulative_[i];
    const double ratio = span > 0.0 ? (d - cumulative_[i]) / span : 0.0;
    return knot_times_[i] + ratio * (knot_times_[i + 1] - knot_times_[i]);
}

double RouteTemporalProjector::distance_for_timestamp(double t) const {
    if (route_.points.size() < 2 || total_distance_ <= 0.0) return 0.0;
    if (t <= knot_times_.front()) return 0.0;
    if (t >= knot_times_.back()) return total_distance_;

    auto it = std::upper_bound(knot_times_.begin(), knot_times_.end(), t);
    const std::size_t i = static_cast<std::size_t>(it - knot_times_.begin()) - 1;
    const double dt = knot_times_[i + 1] - knot_times_[i];
    const double ratio = dt > 0.0 ? (t - knot_times_[i]) / dt : 1.0;
    return cumulative_[i] + ratio * (cumulative_[i + 1] - cumulative_[i]);
}

RouteSample RouteTemporalProjector::sample_at_distance(double distance_m) const {
    const auto& pts = route_.points;
    RouteSample s;

    if (pts.size() == 1) {
        s.distance_m = 0.0;
        s.timestamp = start_;
        s.latitude = pts[0].latitude;
        s.longitude = pts[0].longitude;
        s.altitude = pts[0].altitude.value_or(geo::DEFAULT_CRUISE_ALTITUDE_M);
        return s;
    }

    const double d = std::clamp(distance_m, 0.0, total_distance_);
    const std::size_t i = segment_for_distance(d);
    const auto& a = pts[i];
    const auto& b = pts[i + 1];

    const double span = std::max(cumulative_[i + 1] - cumulative_[i], 1e-6);
    const double ratio = std::clamp((d - cumulative_[i]) / span, 0.0, 1.0);

    s.distance_m = d;
    s.timestamp = timestamp_for_distance(d);
    s.latitude = a.latitude + ratio * (b.latitude - a.latitude);
    s.longitude = geo::interpolate_longitude(a.longitude, b.longitude, ratio);
    s.altitude = geo::interpolate_altitude(a.altitude, b.altitude, ratio);
    if (!(a.latitude == b.latitude && a.longitude == b.longitude)) {
        s.heading = geo::initial_bearing(a.latitude, a.longitude, b.latitude, b.longitude);
    }
    return s;
}

RouteSample RouteTemporalProjector::position_at_time(double t) const {
    const double clamped = std::clamp(t, start_, end_);
    RouteSample s = sample_at_distance(distance_for_timestamp(clamped));
    s.timestamp = clamped;
    return s;
}

RouteProjection RouteTemporalProjector::project(double lat, double lon) const {
    const auto& pts = route_.points;
    RouteProjection best;
    best.offset_m = std::numeric_limits<double>::infinity();

    if (pts.size() == 1) {
        best.latitude = pts[0].latitude;
        best.longitude = pts[0].longitude;
        best.offset_m = geo::haversine_distance(lat, lon, best.latitude, best.longitude);
        best.timestamp = start_;
        return best;
    }

    double best_along = 0.0;
    for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
        const auto& a = pts[i];
        const auto& b = pts[i + 1];

        // Local equirectangular frame anchored at a
        const double k = std::cos(0.5 * (a.latitude + b.latitude) * geo::DEG2RAD);
        const double sx = geo::longitude_delta(a.longitude, b.longitude) * k;
        const double sy = b.latitude - a.latitude;
        const double px = geo::longitude_delta(a.longitude, lon) * k;
        const double py = lat - a.latitude;

        const double len2 = sx * sx + sy * sy;
        const double f = len2 > 0.0 ? std::clamp((px * sx + py * sy) / len2, 0.0, 1.0) : 0.0;

        const double plat = a.latitude + f * sy;
        const double plon = geo::interpolate_longitude(a.longitude, b.longitude, f);
        const double offset = geo::haversine_distance(lat, lon, plat, plon);

        if (offset < best.offset_m) {
            best.offset_m = offset;
            best.latitude = plat;
            best.longitude = plon;
            best.segment_index = i;
            best_along = cumulative_[i] + f * (cumulative_[i + 1] - cumulative_[i]);
        }
    }

    best.distance_m = best_along;
    best.progress = total_distance_ > 0.0 ? best_along / total_distance_ : 0.0;
    best.timestamp = timestamp_for_distance(best_along);
    return best;
}

namespace {

void backfill_headings(std::vector<RouteSample>& samples) {
    std::optional<double> last;
    for (auto& s : samples) {
        if (!s.heading && last) s.heading = last;
        if (s.heading) last = s.heading;
    }
    last.reset();
    for (auto it = samples.rbegin(); it != samples.rend(); ++it) {
        if (!it->heading && last) it->heading = last;
        if (it->heading) last = it->heading;
    }
    if (!samples.empty()) {
        samples.front().heading.reset();
    }
}

} // anonymous namespace

std::vector<RouteSample> RouteTemporalProjector::generate_samples(
        double interval_s, const geo::CoverageSampler* coverage) const {
    if (!(interval_s > 0.0)) interval_s = DEFAULT_SAMPLE_INTERVAL_S;

    std::vector<RouteSample> samples;
    samples.reserve(static_cast<std::size_t>(duration_ / interval_s) + 2);

    for (long long step = 0;; ++step) {
        const double elapsed = std::min(static_cast<double>(step) * interval_s, duration_);
        const double t = (elapsed >= duration_) ? end_ : start_ + elapsed;
        RouteSample s = position_at_time(t);
        if (coverage) {
            s.coverage = coverage->coverage_at(s.latitude, s.longitude);
        }
        samples.push_back(std::move(s));
        if (elapsed >= duration_) break;
    }

    backfill_headings(samples);
    return samples;
}

} // namespace commplan::timeline
