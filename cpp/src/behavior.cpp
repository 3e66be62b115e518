#include "ridesafe/behavior.hpp"

#include <algorithm>
#include <cmath>

#include "ridesafe/common.hpp"
#include "ridesafe/geometry.hpp"

namespace ridesafe {

namespace {

double fix_speed_kmh(const std::vector<RoutePoint>& route, size_t index) {
    if (route[index].speed.has_value()) {
        return *route[index].speed * kMpsToKmh;
    }
    if (index == 0) {
        return 0.0;
    }
    return speed_between(route[index - 1], route[index]) * kMpsToKmh;
}

}  // namespace

DriverBehaviorAnalyzer::DriverBehaviorAnalyzer(BehaviorConfig config) : config_(config) {}

std::vector<AlertRequest> DriverBehaviorAnalyzer::analyze(MonitoringSession& session,
                                                          double violation_tolerance_pct) const {
    std::vector<AlertRequest> alerts;
    const auto& route = session.actual_route;
    if (route.size() < 2) {
        return alerts;
    }

    const RoutePoint& current = route[route.size() - 1];
    const RoutePoint& previous = route[route.size() - 2];
    const double dt = current.timestamp - previous.timestamp;
    if (dt <= 0.0) {
        return alerts;
    }

    auto& behavior = session.behavior;
    const double computed_kmh = speed_between(previous, current) * kMpsToKmh;
    const double current_kmh = current.speed.has_value() ? *current.speed * kMpsToKmh : computed_kmh;

    if (current.speed.has_value() || computed_kmh > 0.0) {
        behavior.max_speed = std::max(behavior.max_speed, current_kmh);
        behavior.speed_samples += 1;
        behavior.average_speed += (current_kmh - behavior.average_speed) / behavior.speed_samples;

        const double limit = config_.speed_limit_kmh * (1.0 + violation_tolerance_pct / 100.0);
        if (current_kmh > limit) {
            behavior.speed_violations += 1;
            alerts.push_back(AlertRequest{
                AlertType::kSpeedViolation, Severity::kMedium,
                "Speed violation: " + std::to_string(static_cast<long>(std::lround(current_kmh))) + " km/h in " +
                    std::to_string(static_cast<long>(std::lround(config_.speed_limit_kmh))) + " km/h zone",
                {{"speed_kmh", format_fixed(current_kmh, 1)}, {"limit_kmh", format_fixed(config_.speed_limit_kmh, 1)}}});
        }
    }

    if (route.size() >= 3) {
        const RoutePoint& before = route[route.size() - 3];
        const double previous_mps = speed_between(before, previous);
        const double current_mps = speed_between(previous, current);
        const double acceleration = (current_mps - previous_mps) / dt;
        if (std::abs(acceleration) > config_.harsh_acceleration_mps2) {
            const bool accelerating = acceleration > 0.0;
            if (accelerating) {
                behavior.harsh_accelerations += 1;
            } else {
                behavior.harsh_braking += 1;
            }
            alerts.push_back(AlertRequest{AlertType::kHarshDriving, Severity::kLow,
                                          accelerating ? "Harsh acceleration detected" : "Harsh braking detected",
                                          {{"acceleration_mps2", format_fixed(acceleration, 2)}}});
        }
    }

    if (current.heading.has_value() && previous.heading.has_value()) {
        const double change = bearing_delta(*current.heading, *previous.heading);
        if (change > config_.sharp_turn_deg && computed_kmh > config_.sharp_turn_min_speed_kmh) {
            behavior.sharp_turns += 1;
        }
    }

    if (extended_stop_reached(route)) {
        alerts.push_back(AlertRequest{
            AlertType::kExtendedStop, Severity::kLow, "Vehicle has been stopped for an extended period",
            {{"stopped_s", format_fixed(config_.extended_stop_s, 0)}}});
    }

    behavior.overall_score = score(behavior);
    behavior.risk_level = risk_level(behavior.overall_score);
    return alerts;
}

double DriverBehaviorAnalyzer::score(const DriverBehaviorMetrics& metrics) const {
    double value = 100.0;
    value -= metrics.speed_violations * config_.speed_violation_penalty;
    value -= metrics.harsh_accelerations * config_.harsh_acceleration_penalty;
    value -= metrics.harsh_braking * config_.harsh_braking_penalty;
    value -= metrics.sharp_turns * config_.sharp_turn_penalty;
    return std::clamp(value, 0.0, 100.0);
}

RiskLevel DriverBehaviorAnalyzer::risk_level(double score) const {
    if (score >= config_.low_risk_score) {
        return RiskLevel::kLow;
    }
    if (score >= config_.medium_risk_score) {
        return RiskLevel::kMedium;
    }
    if (score >= config_.high_risk_score) {
        return RiskLevel::kHigh;
    }
    return RiskLevel::kCritical;
}

// True only on the fix where the current stop first spans extended_stop_s, so
// one stop produces one alert.
bool DriverBehaviorAnalyzer::extended_stop_reached(const std::vector<RoutePoint>& route) const {
    if (config_.extended_stop_s <= 0.0 || route.size() < 2) {
        return false;
    }
    const size_t last = route.size() - 1;
    if (fix_speed_kmh(route, last) >= config_.stop_speed_kmh) {
        return false;
    }
    size_t start = last;
    while (start > 0 && fix_speed_kmh(route, start - 1) < config_.stop_speed_kmh) {
        --start;
    }
    const double stopped_now = route[last].timestamp - route[start].timestamp;
    const double stopped_before = route[last - 1].timestamp - route[start].timestamp;
    return stopped_now >= config_.extended_stop_s && (last == start || stopped_before < config_.extended_stop_s);
}

}  // namespace ridesafe
