#ifndef RIDESAFE_CONFIG_HPP
#define RIDESAFE_CONFIG_HPP

#include <optional>
#include <string>

namespace ridesafe {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

enum class RouteMatch {
    kVertex,
    kSegment,
};

struct MonitoringConfig {
    double location_poll_interval_s = 15.0;
    double location_timeout_s = 10.0;
    double check_in_response_timeout_s = 30.0;
    int communication_loss_cycles = 4;
    bool escalate_critical_alerts = true;
    RouteMatch route_match = RouteMatch::kVertex;
};

struct DeviationConfig {
    double major_multiplier = 2.0;
};

struct BehaviorConfig {
    double speed_limit_kmh = 50.0;
    double harsh_acceleration_mps2 = 3.0;
    double sharp_turn_deg = 45.0;
    double sharp_turn_min_speed_kmh = 20.0;
    double speed_violation_penalty = 5.0;
    double harsh_acceleration_penalty = 2.0;
    double harsh_braking_penalty = 2.0;
    double sharp_turn_penalty = 1.0;
    double low_risk_score = 90.0;
    double medium_risk_score = 70.0;
    double high_risk_score = 50.0;
    double stop_speed_kmh = 2.0;
    double extended_stop_s = 300.0;
};

struct RiskConfig {
    double open_deviation_weight = 10.0;
    double major_deviation_weight = 20.0;
    double active_alert_weight = 5.0;
    double high_alert_weight = 15.0;
    double critical_alert_weight = 30.0;
    double missed_check_in_weight = 25.0;
    double emergency_threshold = 80.0;
    double alert_threshold = 50.0;
};

struct IncidentConfig {
    double tracking_interval_s = 10.0;
};

struct PersistenceConfig {
    std::optional<std::string> path = std::nullopt;
};

struct RideSafeSettings {
    LoggingConfig logging{};
    MonitoringConfig monitoring{};
    DeviationConfig deviation{};
    BehaviorConfig behavior{};
    RiskConfig risk{};
    IncidentConfig incident{};
    PersistenceConfig persistence{};

    static RideSafeSettings from_toml(const std::string& path);
};

}  // namespace ridesafe

#endif  // RIDESAFE_CONFIG_HPP
