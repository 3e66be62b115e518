#ifndef RIDESAFE_TYPES_HPP
#define RIDESAFE_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ridesafe {

using Attributes = std::map<std::string, std::string>;

// One positional fix. Speed is m/s, heading degrees from north, accuracy meters.
struct RoutePoint {
    double latitude = 0.0;
    double longitude = 0.0;
    double timestamp = 0.0;
    std::optional<double> speed;
    std::optional<double> heading;
    std::optional<double> accuracy;
};

enum class Severity {
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

using IncidentPriority = Severity;

enum class DeviationSeverity {
    kMinor,
    kMajor,
};

enum class DeviationReason {
    kTraffic,
    kConstruction,
    kPassengerRequest,
    kUnknown,
};

struct RouteDeviation {
    std::string id;
    double detected_at = 0.0;
    DeviationSeverity severity = DeviationSeverity::kMinor;
    double distance_from_route = 0.0;  // maximum over the episode, meters
    double duration = 0.0;             // seconds since detected_at at the latest off-route fix
    RoutePoint location;
    std::optional<DeviationReason> reason;
    bool is_resolved = false;
    std::optional<double> resolved_at;
    bool alert_triggered = false;
};

enum class RiskLevel {
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

struct DriverBehaviorMetrics {
    double average_speed = 0.0;  // km/h
    double max_speed = 0.0;      // km/h
    int speed_samples = 0;
    int speed_violations = 0;
    int harsh_accelerations = 0;
    int harsh_braking = 0;
    int sharp_turns = 0;
    double overall_score = 100.0;
    RiskLevel risk_level = RiskLevel::kLow;
};

enum class AlertType {
    kRouteDeviation,
    kSpeedViolation,
    kHarshDriving,
    kCheckInMissed,
    kPanicButton,
    kCommunicationLoss,
    kExtendedStop,
};

enum class AlertStatus {
    kActive,
    kAcknowledged,
    kResolved,
    kFalseAlarm,
};

enum class AlertActionType {
    kNotificationSent,
    kContactNotified,
    kDriverContacted,
    kEmergencyDispatched,
    kRideTerminated,
};

struct AlertAction {
    std::string id;
    AlertActionType type = AlertActionType::kNotificationSent;
    double timestamp = 0.0;
    std::string actor;
    std::string details;
    bool success = false;
};

// What a detector asks the alert engine to raise.
struct AlertRequest {
    AlertType type = AlertType::kRouteDeviation;
    Severity severity = Severity::kLow;
    std::string description;
    Attributes data;
};

struct SafetyAlert {
    std::string id;
    AlertType type = AlertType::kRouteDeviation;
    Severity severity = Severity::kLow;
    AlertStatus status = AlertStatus::kActive;
    double triggered_at = 0.0;
    std::optional<RoutePoint> location;
    std::string description;
    Attributes data;
    std::optional<std::string> acknowledged_by;
    std::optional<double> acknowledged_at;
    std::optional<double> resolved_at;
    std::vector<AlertAction> actions;
};

enum class CheckInType {
    kAutomatic,
    kManual,
    kPrompted,
};

enum class CheckInStatus {
    kPending,
    kCompleted,
    kMissed,
    kOverdue,
};

struct CheckInResponse {
    bool is_ok = true;
    std::optional<std::string> message;
    RoutePoint location;
};

struct SafetyCheckIn {
    std::string id;
    double scheduled_at = 0.0;
    double deadline = 0.0;
    std::optional<double> completed_at;
    CheckInType type = CheckInType::kAutomatic;
    CheckInStatus status = CheckInStatus::kPending;
    std::optional<CheckInResponse> response;
    bool follow_up_required = false;
};

enum class SessionStatus {
    kMonitoring,
    kAlertTriggered,
    kEmergency,
    kCompleted,
};

struct MonitoringSession {
    std::string id;
    std::string ride_id;
    std::string user_id;
    std::string driver_id;
    SessionStatus status = SessionStatus::kMonitoring;
    double start_time = 0.0;
    std::optional<double> end_time;
    std::vector<RoutePoint> planned_route;
    std::vector<RoutePoint> actual_route;
    std::vector<RouteDeviation> deviations;
    std::vector<SafetyAlert> alerts;
    std::vector<SafetyCheckIn> check_ins;
    DriverBehaviorMetrics behavior{};
    double risk_score = 0.0;
    bool is_active = true;
};

enum class IncidentType {
    kSos,
    kPanic,
    kMedical,
    kAccident,
    kHarassment,
    kVehicleIssue,
    kOther,
};

enum class IncidentStatus {
    kActive,
    kResponding,
    kResolved,
    kFalseAlarm,
};

enum class ResponderType {
    kEmergencyServices,
    kSecurityTeam,
    kSupportAgent,
    kDriver,
};

enum class ResponderStatus {
    kNotified,
    kResponding,
    kOnScene,
    kCompleted,
};

struct IncidentLocation {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<std::string> address;
    std::optional<double> accuracy;
};

struct EmergencyResponder {
    std::string id;
    ResponderType type = ResponderType::kSupportAgent;
    std::string name;
    std::optional<std::string> phone_number;
    ResponderStatus status = ResponderStatus::kNotified;
    std::optional<double> estimated_arrival;
};

enum class TimelineEventType {
    kIncidentCreated,
    kTrackingStarted,
    kContactsNotified,
    kServicesContacted,
    kResponderAssigned,
    kMediaCapture,
    kDriverNotified,
    kStatusUpdate,
    kResolved,
};

struct TimelineEvent {
    std::string id;
    double timestamp = 0.0;
    TimelineEventType type = TimelineEventType::kStatusUpdate;
    std::string description;
    std::string actor;
    Attributes data;
};

struct IncidentResolution {
    double resolved_at = 0.0;
    std::string resolved_by;
    std::string resolution;
    bool follow_up_required = false;
};

struct EmergencyIncident {
    std::string id;
    std::string user_id;
    std::optional<std::string> ride_id;
    IncidentType type = IncidentType::kOther;
    IncidentStatus status = IncidentStatus::kActive;
    IncidentPriority priority = IncidentPriority::kLow;
    IncidentLocation location{};
    double timestamp = 0.0;
    std::optional<std::string> description;
    std::vector<std::string> emergency_contacts;
    std::vector<EmergencyResponder> responders;
    std::vector<TimelineEvent> timeline;
    std::vector<std::string> media;
    std::optional<IncidentResolution> resolution;
};

std::string to_string(Severity value);
std::string to_string(DeviationSeverity value);
std::string to_string(DeviationReason value);
std::string to_string(RiskLevel value);
std::string to_string(AlertType value);
std::string to_string(AlertStatus value);
std::string to_string(AlertActionType value);
std::string to_string(CheckInType value);
std::string to_string(CheckInStatus value);
std::string to_string(SessionStatus value);
std::string to_string(IncidentType value);
std::string to_string(IncidentStatus value);
std::string to_string(ResponderType value);
std::string to_string(ResponderStatus value);
std::string to_string(TimelineEventType value);

IncidentType parse_incident_type(const std::string& value);

bool is_terminal(AlertStatus status);
bool is_terminal(IncidentStatus status);

}  // namespace ridesafe

#endif  // RIDESAFE_TYPES_HPP
