#ifndef RIDESAFE_GEOMETRY_HPP
#define RIDESAFE_GEOMETRY_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "ridesafe/types.hpp"

namespace ridesafe {

constexpr double kEarthRadiusMeters = 6371e3;
constexpr double kMpsToKmh = 3.6;

double haversine_distance(double lat1, double lon1, double lat2, double lon2);
double haversine_distance(const RoutePoint& a, const RoutePoint& b);

// Initial bearing from a to b, degrees in [0, 360).
double initial_bearing(const RoutePoint& a, const RoutePoint& b);

// Smallest absolute difference between two headings, degrees in [0, 180].
double bearing_delta(double heading_a, double heading_b);

// Ground speed between two fixes in m/s; 0 when the fixes are not time-ordered.
double speed_between(const RoutePoint& from, const RoutePoint& to);

struct NearestPoint {
    RoutePoint point;
    double distance = 0.0;
    std::size_t index = 0;  // vertex index, or the start vertex of the matched segment
};

std::optional<NearestPoint> nearest_route_vertex(const RoutePoint& position, const std::vector<RoutePoint>& route);

// Projects onto each segment in a local equirectangular frame.
std::optional<NearestPoint> nearest_point_on_polyline(const RoutePoint& position,
                                                      const std::vector<RoutePoint>& route);

}  // namespace ridesafe

#endif  // RIDESAFE_GEOMETRY_HPP
