#include "ridesafe/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace ridesafe {

namespace {

constexpr double kPi = 3.14159265358979323846;

double to_radians(double degrees) {
    return degrees * kPi / 180.0;
}

double to_degrees(double radians) {
    return radians * 180.0 / kPi;
}

}  // namespace

double haversine_distance(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = to_radians(lat1);
    const double phi2 = to_radians(lat2);
    const double d_phi = to_radians(lat2 - lat1);
    const double d_lambda = to_radians(lon2 - lon1);

    const double a = std::sin(d_phi / 2.0) * std::sin(d_phi / 2.0) +
                     std::cos(phi1) * std::cos(phi2) * std::sin(d_lambda / 2.0) * std::sin(d_lambda / 2.0);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return kEarthRadiusMeters * c;
}

double haversine_distance(const RoutePoint& a, const RoutePoint& b) {
    return haversine_distance(a.latitude, a.longitude, b.latitude, b.longitude);
}

double initial_bearing(const RoutePoint& a, const RoutePoint& b) {
    const double phi1 = to_radians(a.latitude);
    const double phi2 = to_radians(b.latitude);
    const double d_lambda = to_radians(b.longitude - a.longitude);
    const double y = std::sin(d_lambda) * std::cos(phi2);
    const double x = std::cos(phi1) * std::sin(phi2) - std::sin(phi1) * std::cos(phi2) * std::cos(d_lambda);
    const double bearing = to_degrees(std::atan2(y, x));
    return std::fmod(bearing + 360.0, 360.0);
}

double bearing_delta(double heading_a, double heading_b) {
    const double change = std::fmod(std::abs(heading_a - heading_b), 360.0);
    return std::min(change, 360.0 - change);
}

double speed_between(const RoutePoint& from, const RoutePoint& to) {
    const double dt = to.timestamp - from.timestamp;
    if (dt <= 0.0) {
        return 0.0;
    }
    return haversine_distance(from, to) / dt;
}

std::optional<NearestPoint> nearest_route_vertex(const RoutePoint& position, const std::vector<RoutePoint>& route) {
    if (route.empty()) {
        return std::nullopt;
    }
    NearestPoint best{route.front(), haversine_distance(position, route.front()), 0};
    for (std::size_t i = 1; i < route.size(); ++i) {
        const double distance = haversine_distance(position, route[i]);
        if (distance < best.distance) {
            best = NearestPoint{route[i], distance, i};
        }
    }
    return best;
}

std::optional<NearestPoint> nearest_point_on_polyline(const RoutePoint& position,
                                                      const std::vector<RoutePoint>& route) {
    if (route.size() < 2) {
        return nearest_route_vertex(position, route);
    }

    const double meters_per_deg_lat = kEarthRadiusMeters * kPi / 180.0;
    const double meters_per_deg_lon = meters_per_deg_lat * std::cos(to_radians(position.latitude));
    auto to_local = [&](const RoutePoint& p) {
        return std::make_pair((p.longitude - position.longitude) * meters_per_deg_lon,
                              (p.latitude - position.latitude) * meters_per_deg_lat);
    };

    std::optional<NearestPoint> best;
    for (std::size_t i = 0; i + 1 < route.size(); ++i) {
        const auto [ax, ay] = to_local(route[i]);
        const auto [bx, by] = to_local(route[i + 1]);
        const double dx = bx - ax;
        const double dy = by - ay;
        const double length_sq = dx * dx + dy * dy;
        double t = 0.0;
        if (length_sq > 0.0) {
            t = std::clamp(-(ax * dx + ay * dy) / length_sq, 0.0, 1.0);
        }

        RoutePoint candidate = route[i];
        candidate.latitude = route[i].latitude + t * (route[i + 1].latitude - route[i].latitude);
        candidate.longitude = route[i].longitude + t * (route[i + 1].longitude - route[i].longitude);
        candidate.timestamp = route[i].timestamp + t * (route[i + 1].timestamp - route[i].timestamp);
        const double distance = haversine_distance(position, candidate);
        if (!best.has_value() || distance < best->distance) {
            best = NearestPoint{candidate, distance, i};
        }
    }
    return best;
}

}  // namespace ridesafe
