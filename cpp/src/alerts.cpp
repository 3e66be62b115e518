#include "ridesafe/alerts.hpp"

#include <stdexcept>

namespace ridesafe {

SafetyAlertEngine::SafetyAlertEngine(std::shared_ptr<NotificationChannels> channels, ClockFn clock, Logger logger)
    : channels_(std::move(channels)), clock_(std::move(clock)), logger_(std::move(logger)) {}

void SafetyAlertEngine::set_escalation_handler(std::shared_ptr<EscalationHandler> handler) {
    std::lock_guard<std::mutex> guard(handler_mutex_);
    escalation_ = std::move(handler);
}

std::shared_ptr<EscalationHandler> SafetyAlertEngine::escalation_handler() const {
    std::lock_guard<std::mutex> guard(handler_mutex_);
    return escalation_;
}

SafetyAlert SafetyAlertEngine::raise(MonitoringSession& session, const AlertRequest& request,
                                     const SafetySettings& safety, const EmergencySettings& emergency) {
    const double now = clock_();
    SafetyAlert alert;
    alert.id = make_id("alert", now);
    alert.type = request.type;
    alert.severity = request.severity;
    alert.status = AlertStatus::kActive;
    alert.triggered_at = now;
    if (!session.actual_route.empty()) {
        alert.location = session.actual_route.back();
    }
    alert.description = request.description;
    alert.data = request.data;

    logger_.warn("safety_alert_raised", {{"ride_id", session.ride_id},
                                         {"alert_id", alert.id},
                                         {"type", to_string(alert.type)},
                                         {"severity", to_string(alert.severity)}});

    alert.actions = execute_actions(session, alert, safety, emergency);
    session.alerts.push_back(alert);
    return alert;
}

std::vector<AlertAction> SafetyAlertEngine::execute_actions(const MonitoringSession& session,
                                                            const SafetyAlert& alert,
                                                            const SafetySettings& safety,
                                                            const EmergencySettings& emergency) {
    std::vector<AlertAction> actions;

    if (!channels_) {
        actions.push_back(make_action(AlertActionType::kNotificationSent, "No notification channel configured",
                                      false));
    } else {
        try {
            channels_->notify_user(session.user_id, "Safety alert: " + alert.description);
            actions.push_back(make_action(AlertActionType::kNotificationSent,
                                          "Safety alert notification sent to passenger", true));
        } catch (const std::exception& exc) {
            logger_.error("user_notification_failed", {{"alert_id", alert.id}, {"error", exc.what()}});
            actions.push_back(make_action(AlertActionType::kNotificationSent,
                                          std::string("Passenger notification failed: ") + exc.what(), false));
        }
    }

    const bool contact_tier = alert.severity == Severity::kMedium || alert.severity == Severity::kHigh;
    if (contact_tier && safety.emergency_contacts_on_alert) {
        for (const auto& contact : emergency.emergency_contacts) {
            if (!contact.is_active) {
                continue;
            }
            const std::string text = "Safety alert for your contact's ride " + session.ride_id + ": " +
                                     alert.description;
            try {
                if (!channels_) {
                    throw std::runtime_error("no notification channel configured");
                }
                channels_->send_sms(contact.phone_number, text);
                actions.push_back(make_action(AlertActionType::kContactNotified,
                                              "Emergency contact " + contact.name + " notified of safety alert",
                                              true));
            } catch (const std::exception& exc) {
                logger_.error("contact_notification_failed",
                              {{"alert_id", alert.id}, {"contact_id", contact.id}, {"error", exc.what()}});
                actions.push_back(make_action(AlertActionType::kContactNotified,
                                              "Emergency contact " + contact.name + " not reached: " + exc.what(),
                                              false));
            }
        }
    }

    if (alert.severity == Severity::kCritical) {
        auto handler = escalation_handler();
        if (!handler) {
            actions.push_back(make_action(AlertActionType::kEmergencyDispatched,
                                          "Escalation disabled; emergency services not contacted", false));
        } else {
            try {
                // Escalation sees the alert as it will be recorded.
                SafetyAlert snapshot = alert;
                snapshot.actions = actions;
                auto incident_id = handler->escalate(session, snapshot);
                if (incident_id.has_value()) {
                    actions.push_back(make_action(AlertActionType::kEmergencyDispatched,
                                                  "Emergency incident " + *incident_id + " opened", true));
                } else {
                    actions.push_back(make_action(AlertActionType::kEmergencyDispatched,
                                                  "Emergency incident could not be opened", false));
                }
            } catch (const std::exception& exc) {
                logger_.error("alert_escalation_failed", {{"alert_id", alert.id}, {"error", exc.what()}});
                actions.push_back(make_action(AlertActionType::kEmergencyDispatched,
                                              std::string("Escalation failed: ") + exc.what(), false));
            }
        }
    }

    return actions;
}

AlertAction SafetyAlertEngine::make_action(AlertActionType type, std::string details, bool success) const {
    const double now = clock_();
    return AlertAction{make_id("action", now), type, now, "system", std::move(details), success};
}

SafetyAlert* SafetyAlertEngine::find_active(MonitoringSession& session, const std::string& alert_id) const {
    for (auto& alert : session.alerts) {
        if (alert.id == alert_id) {
            return alert.status == AlertStatus::kActive ? &alert : nullptr;
        }
    }
    return nullptr;
}

bool SafetyAlertEngine::acknowledge(MonitoringSession& session, const std::string& alert_id,
                                    const std::string& actor) {
    auto* alert = find_active(session, alert_id);
    if (alert == nullptr) {
        return false;
    }
    alert->status = AlertStatus::kAcknowledged;
    alert->acknowledged_by = actor;
    alert->acknowledged_at = clock_();
    logger_.info("safety_alert_acknowledged", {{"alert_id", alert_id}, {"actor", actor}});
    return true;
}

bool SafetyAlertEngine::resolve(MonitoringSession& session, const std::string& alert_id) {
    auto* alert = find_active(session, alert_id);
    if (alert == nullptr) {
        return false;
    }
    alert->status = AlertStatus::kResolved;
    alert->resolved_at = clock_();
    logger_.info("safety_alert_resolved", {{"alert_id", alert_id}});
    return true;
}

bool SafetyAlertEngine::mark_false_alarm(MonitoringSession& session, const std::string& alert_id) {
    auto* alert = find_active(session, alert_id);
    if (alert == nullptr) {
        return false;
    }
    alert->status = AlertStatus::kFalseAlarm;
    alert->resolved_at = clock_();
    logger_.info("safety_alert_false_alarm", {{"alert_id", alert_id}});
    return true;
}

}  // namespace ridesafe
