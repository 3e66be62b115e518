#include "ridesafe/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "ridesafe/common.hpp"

namespace ridesafe {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

RouteMatch parse_route_match(const std::string& value) {
    const auto stripped = strip_quotes(value);
    if (stripped == "vertex") {
        return RouteMatch::kVertex;
    }
    if (stripped == "segment") {
        return RouteMatch::kSegment;
    }
    throw std::runtime_error("route_match must be vertex or segment: " + value);
}

void apply_monitoring(MonitoringConfig& config, const std::string& key, const std::string& value) {
    if (key == "location_poll_interval_s") {
        config.location_poll_interval_s = parse_double(key, value);
    } else if (key == "location_timeout_s") {
        config.location_timeout_s = parse_double(key, value);
    } else if (key == "check_in_response_timeout_s") {
        config.check_in_response_timeout_s = parse_double(key, value);
    } else if (key == "communication_loss_cycles") {
        config.communication_loss_cycles = parse_int(key, value);
    } else if (key == "escalate_critical_alerts") {
        config.escalate_critical_alerts = parse_bool(value);
    } else if (key == "route_match") {
        config.route_match = parse_route_match(value);
    }
}

void apply_behavior(BehaviorConfig& config, const std::string& key, const std::string& value) {
    if (key == "speed_limit_kmh") {
        config.speed_limit_kmh = parse_double(key, value);
    } else if (key == "harsh_acceleration_mps2") {
        config.harsh_acceleration_mps2 = parse_double(key, value);
    } else if (key == "sharp_turn_deg") {
        config.sharp_turn_deg = parse_double(key, value);
    } else if (key == "sharp_turn_min_speed_kmh") {
        config.sharp_turn_min_speed_kmh = parse_double(key, value);
    } else if (key == "speed_violation_penalty") {
        config.speed_violation_penalty = parse_double(key, value);
    } else if (key == "harsh_acceleration_penalty") {
        config.harsh_acceleration_penalty = parse_double(key, value);
    } else if (key == "harsh_braking_penalty") {
        config.harsh_braking_penalty = parse_double(key, value);
    } else if (key == "sharp_turn_penalty") {
        config.sharp_turn_penalty = parse_double(key, value);
    } else if (key == "low_risk_score") {
        config.low_risk_score = parse_double(key, value);
    } else if (key == "medium_risk_score") {
        config.medium_risk_score = parse_double(key, value);
    } else if (key == "high_risk_score") {
        config.high_risk_score = parse_double(key, value);
    } else if (key == "stop_speed_kmh") {
        config.stop_speed_kmh = parse_double(key, value);
    } else if (key == "extended_stop_s") {
        config.extended_stop_s = parse_double(key, value);
    }
}

void apply_risk(RiskConfig& config, const std::string& key, const std::string& value) {
    if (key == "open_deviation_weight") {
        config.open_deviation_weight = parse_double(key, value);
    } else if (key == "major_deviation_weight") {
        config.major_deviation_weight = parse_double(key, value);
    } else if (key == "active_alert_weight") {
        config.active_alert_weight = parse_double(key, value);
    } else if (key == "high_alert_weight") {
        config.high_alert_weight = parse_double(key, value);
    } else if (key == "critical_alert_weight") {
        config.critical_alert_weight = parse_double(key, value);
    } else if (key == "missed_check_in_weight") {
        config.missed_check_in_weight = parse_double(key, value);
    } else if (key == "emergency_threshold") {
        config.emergency_threshold = parse_double(key, value);
    } else if (key == "alert_threshold") {
        config.alert_threshold = parse_double(key, value);
    }
}

}  // namespace

RideSafeSettings RideSafeSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    RideSafeSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "monitoring") {
            apply_monitoring(settings.monitoring, key, value);
        } else if (current_section == "deviation") {
            if (key == "major_multiplier") {
                settings.deviation.major_multiplier = parse_double(key, value);
            }
        } else if (current_section == "behavior") {
            apply_behavior(settings.behavior, key, value);
        } else if (current_section == "risk") {
            apply_risk(settings.risk, key, value);
        } else if (current_section == "incident") {
            if (key == "tracking_interval_s") {
                settings.incident.tracking_interval_s = parse_double(key, value);
            }
        } else if (current_section == "persistence") {
            if (key == "path") {
                settings.persistence.path = parse_optional_string(value);
            }
        }
    }

    if (settings.monitoring.location_poll_interval_s <= 0.0) {
        throw std::runtime_error("location_poll_interval_s must be positive");
    }
    if (settings.monitoring.check_in_response_timeout_s <= 0.0) {
        throw std::runtime_error("check_in_response_timeout_s must be positive");
    }
    if (settings.deviation.major_multiplier < 1.0) {
        throw std::runtime_error("major_multiplier must be >= 1");
    }

    return settings;
}

}  // namespace ridesafe
