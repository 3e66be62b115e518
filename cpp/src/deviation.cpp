#include "ridesafe/deviation.hpp"

#include <algorithm>
#include <cmath>

#include "ridesafe/common.hpp"
#include "ridesafe/geometry.hpp"

namespace ridesafe {

namespace {

AlertRequest deviation_alert(const RouteDeviation& deviation) {
    AlertRequest request;
    request.type = AlertType::kRouteDeviation;
    request.severity = Severity::kMedium;
    request.description = "Vehicle has deviated " +
                          std::to_string(static_cast<long>(std::lround(deviation.distance_from_route))) +
                          "m from planned route";
    request.data = {{"deviation_id", deviation.id},
                    {"distance_m", format_fixed(deviation.distance_from_route, 1)},
                    {"severity", to_string(deviation.severity)}};
    return request;
}

}  // namespace

RouteDeviation* open_deviation(MonitoringSession& session) {
    if (session.deviations.empty() || session.deviations.back().is_resolved) {
        return nullptr;
    }
    return &session.deviations.back();
}

const RouteDeviation* open_deviation(const MonitoringSession& session) {
    if (session.deviations.empty() || session.deviations.back().is_resolved) {
        return nullptr;
    }
    return &session.deviations.back();
}

RouteDeviationDetector::RouteDeviationDetector(DeviationConfig config, RouteMatch match)
    : config_(config), match_(match) {}

std::optional<double> RouteDeviationDetector::distance_from_route(const MonitoringSession& session,
                                                                  const RoutePoint& position) const {
    const auto nearest = match_ == RouteMatch::kSegment
                             ? nearest_point_on_polyline(position, session.planned_route)
                             : nearest_route_vertex(position, session.planned_route);
    if (!nearest.has_value()) {
        return std::nullopt;
    }
    return nearest->distance;
}

DeviationUpdate RouteDeviationDetector::evaluate(MonitoringSession& session, const RoutePoint& position,
                                                 double threshold_m) const {
    DeviationUpdate update;
    const auto distance = distance_from_route(session, position);
    if (!distance.has_value()) {
        return update;
    }
    update.distance_from_route = *distance;
    const double major_threshold = threshold_m * config_.major_multiplier;

    if (!std::isfinite(*distance)) {
        return update;
    }
    if (*distance <= threshold_m) {
        if (auto* active = open_deviation(session)) {
            active->is_resolved = true;
            active->resolved_at = position.timestamp;
            update.change = DeviationChange::kResolved;
        }
        return update;
    }

    // Severity and the alert are fixed when the episode opens.
    if (auto* active = open_deviation(session)) {
        active->duration = std::max(0.0, position.timestamp - active->detected_at);
        active->location = position;
        active->distance_from_route = std::max(active->distance_from_route, *distance);
        update.change = DeviationChange::kExtended;
        return update;
    }

    RouteDeviation deviation;
    deviation.id = make_id("deviation", position.timestamp);
    deviation.detected_at = position.timestamp;
    deviation.severity = *distance > major_threshold ? DeviationSeverity::kMajor : DeviationSeverity::kMinor;
    deviation.distance_from_route = *distance;
    deviation.location = position;
    if (deviation.severity == DeviationSeverity::kMajor) {
        deviation.alert_triggered = true;
        update.alert = deviation_alert(deviation);
    }
    session.deviations.push_back(std::move(deviation));
    update.change = DeviationChange::kOpened;
    return update;
}

}  // namespace ridesafe
