#include "ridesafe/risk.hpp"

#include <algorithm>

namespace ridesafe {

RiskAggregator::RiskAggregator(RiskConfig config) : config_(config) {}

double RiskAggregator::score(const MonitoringSession& session) const {
    double risk = 0.0;

    for (const auto& deviation : session.deviations) {
        if (deviation.is_resolved) {
            continue;
        }
        risk += config_.open_deviation_weight;
        if (deviation.severity == DeviationSeverity::kMajor) {
            risk += config_.major_deviation_weight;
        }
    }

    risk += (100.0 - session.behavior.overall_score) / 2.0;

    for (const auto& alert : session.alerts) {
        if (alert.status != AlertStatus::kActive) {
            continue;
        }
        risk += config_.active_alert_weight;
        if (alert.severity == Severity::kHigh) {
            risk += config_.high_alert_weight;
        } else if (alert.severity == Severity::kCritical) {
            risk += config_.critical_alert_weight;
        }
    }

    for (const auto& check_in : session.check_ins) {
        if (check_in.status == CheckInStatus::kMissed) {
            risk += config_.missed_check_in_weight;
        }
    }

    return std::clamp(risk, 0.0, 100.0);
}

SessionStatus RiskAggregator::status_for(double score) const {
    if (score > config_.emergency_threshold) {
        return SessionStatus::kEmergency;
    }
    if (score > config_.alert_threshold) {
        return SessionStatus::kAlertTriggered;
    }
    return SessionStatus::kMonitoring;
}

void RiskAggregator::apply(MonitoringSession& session) const {
    session.risk_score = score(session);
    if (session.status != SessionStatus::kCompleted) {
        session.status = status_for(session.risk_score);
    }
}

}  // namespace ridesafe
