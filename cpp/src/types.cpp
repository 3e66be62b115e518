#include "ridesafe/types.hpp"

#include <stdexcept>

namespace ridesafe {

std::string to_string(Severity value) {
    switch (value) {
        case Severity::kLow:
            return "low";
        case Severity::kMedium:
            return "medium";
        case Severity::kHigh:
            return "high";
        case Severity::kCritical:
            return "critical";
    }
    return "low";
}

std::string to_string(DeviationSeverity value) {
    return value == DeviationSeverity::kMajor ? "major" : "minor";
}

std::string to_string(DeviationReason value) {
    switch (value) {
        case DeviationReason::kTraffic:
            return "traffic";
        case DeviationReason::kConstruction:
            return "construction";
        case DeviationReason::kPassengerRequest:
            return "passenger_request";
        case DeviationReason::kUnknown:
            return "unknown";
    }
    return "unknown";
}

std::string to_string(RiskLevel value) {
    switch (value) {
        case RiskLevel::kLow:
            return "low";
        case RiskLevel::kMedium:
            return "medium";
        case RiskLevel::kHigh:
            return "high";
        case RiskLevel::kCritical:
            return "critical";
    }
    return "low";
}

std::string to_string(AlertType value) {
    switch (value) {
        case AlertType::kRouteDeviation:
            return "route_deviation";
        case AlertType::kSpeedViolation:
            return "speed_violation";
        case AlertType::kHarshDriving:
            return "harsh_driving";
        case AlertType::kCheckInMissed:
            return "check_in_missed";
        case AlertType::kPanicButton:
            return "panic_button";
        case AlertType::kCommunicationLoss:
            return "communication_loss";
        case AlertType::kExtendedStop:
            return "extended_stop";
    }
    return "route_deviation";
}

std::string to_string(AlertStatus value) {
    switch (value) {
        case AlertStatus::kActive:
            return "active";
        case AlertStatus::kAcknowledged:
            return "acknowledged";
        case AlertStatus::kResolved:
            return "resolved";
        case AlertStatus::kFalseAlarm:
            return "false_alarm";
    }
    return "active";
}

std::string to_string(AlertActionType value) {
    switch (value) {
        case AlertActionType::kNotificationSent:
            return "notification_sent";
        case AlertActionType::kContactNotified:
            return "contact_notified";
        case AlertActionType::kDriverContacted:
            return "driver_contacted";
        case AlertActionType::kEmergencyDispatched:
            return "emergency_dispatched";
        case AlertActionType::kRideTerminated:
            return "ride_terminated";
    }
    return "notification_sent";
}

std::string to_string(CheckInType value) {
    switch (value) {
        case CheckInType::kAutomatic:
            return "automatic";
        case CheckInType::kManual:
            return "manual";
        case CheckInType::kPrompted:
            return "prompted";
    }
    return "automatic";
}

std::string to_string(CheckInStatus value) {
    switch (value) {
        case CheckInStatus::kPending:
            return "pending";
        case CheckInStatus::kCompleted:
            return "completed";
        case CheckInStatus::kMissed:
            return "missed";
        case CheckInStatus::kOverdue:
            return "overdue";
    }
    return "pending";
}

std::string to_string(SessionStatus value) {
    switch (value) {
        case SessionStatus::kMonitoring:
            return "monitoring";
        case SessionStatus::kAlertTriggered:
            return "alert_triggered";
        case SessionStatus::kEmergency:
            return "emergency";
        case SessionStatus::kCompleted:
            return "completed";
    }
    return "monitoring";
}

std::string to_string(IncidentType value) {
    switch (value) {
        case IncidentType::kSos:
            return "sos";
        case IncidentType::kPanic:
            return "panic";
        case IncidentType::kMedical:
            return "medical";
        case IncidentType::kAccident:
            return "accident";
        case IncidentType::kHarassment:
            return "harassment";
        case IncidentType::kVehicleIssue:
            return "vehicle_issue";
        case IncidentType::kOther:
            return "other";
    }
    return "other";
}

std::string to_string(IncidentStatus value) {
    switch (value) {
        case IncidentStatus::kActive:
            return "active";
        case IncidentStatus::kResponding:
            return "responding";
        case IncidentStatus::kResolved:
            return "resolved";
        case IncidentStatus::kFalseAlarm:
            return "false_alarm";
    }
    return "active";
}

std::string to_string(ResponderType value) {
    switch (value) {
        case ResponderType::kEmergencyServices:
            return "emergency_services";
        case ResponderType::kSecurityTeam:
            return "security_team";
        case ResponderType::kSupportAgent:
            return "support_agent";
        case ResponderType::kDriver:
            return "driver";
    }
    return "support_agent";
}

std::string to_string(ResponderStatus value) {
    switch (value) {
        case ResponderStatus::kNotified:
            return "notified";
        case ResponderStatus::kResponding:
            return "responding";
        case ResponderStatus::kOnScene:
            return "on_scene";
        case ResponderStatus::kCompleted:
            return "completed";
    }
    return "notified";
}

std::string to_string(TimelineEventType value) {
    switch (value) {
        case TimelineEventType::kIncidentCreated:
            return "incident_created";
        case TimelineEventType::kTrackingStarted:
            return "tracking_started";
        case TimelineEventType::kContactsNotified:
            return "contacts_notified";
        case TimelineEventType::kServicesContacted:
            return "services_contacted";
        case TimelineEventType::kResponderAssigned:
            return "responder_assigned";
        case TimelineEventType::kMediaCapture:
            return "media_capture";
        case TimelineEventType::kDriverNotified:
            return "driver_notified";
        case TimelineEventType::kStatusUpdate:
            return "status_update";
        case TimelineEventType::kResolved:
            return "resolved";
    }
    return "status_update";
}

IncidentType parse_incident_type(const std::string& value) {
    for (auto type : {IncidentType::kSos, IncidentType::kPanic, IncidentType::kMedical, IncidentType::kAccident,
                      IncidentType::kHarassment, IncidentType::kVehicleIssue, IncidentType::kOther}) {
        if (to_string(type) == value) {
            return type;
        }
    }
    throw std::runtime_error("unknown incident type: " + value);
}

bool is_terminal(AlertStatus status) {
    return status != AlertStatus::kActive;
}

bool is_terminal(IncidentStatus status) {
    return status == IncidentStatus::kResolved || status == IncidentStatus::kFalseAlarm;
}

}  // namespace ridesafe
