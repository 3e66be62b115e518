#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ridesafe/api.hpp"
#include "ridesafe/geometry.hpp"
#include "ridesafe/incidents.hpp"
#include "ridesafe/monitor.hpp"
#include "ridesafe/serialization.hpp"

namespace py = pybind11;

namespace {

class PyLocationProvider : public ridesafe::LocationProvider {
public:
    using ridesafe::LocationProvider::LocationProvider;

    std::optional<ridesafe::RoutePoint> sample(double timeout_s) override {
        PYBIND11_OVERRIDE_PURE(std::optional<ridesafe::RoutePoint>, ridesafe::LocationProvider, sample, timeout_s);
    }
};

class PyNotificationChannels : public ridesafe::NotificationChannels {
public:
    using ridesafe::NotificationChannels::NotificationChannels;

    void send_sms(const std::string& number, const std::string& text) override {
        PYBIND11_OVERRIDE_PURE(void, ridesafe::NotificationChannels, send_sms, number, text);
    }

    void place_call(const std::string& number, const std::string& context) override {
        PYBIND11_OVERRIDE_PURE(void, ridesafe::NotificationChannels, place_call, number, context);
    }

    void send_email(const ridesafe::EmergencyContact& contact, const std::string& context) override {
        PYBIND11_OVERRIDE_PURE(void, ridesafe::NotificationChannels, send_email, contact, context);
    }

    void notify_user(const std::string& user_id, const std::string& text) override {
        PYBIND11_OVERRIDE_PURE(void, ridesafe::NotificationChannels, notify_user, user_id, text);
    }

    void notify_driver(const std::string& ride_id, const std::string& text) override {
        PYBIND11_OVERRIDE_PURE(void, ridesafe::NotificationChannels, notify_driver, ride_id, text);
    }
};

class PyDispatchService : public ridesafe::DispatchService {
public:
    using ridesafe::DispatchService::DispatchService;

    ridesafe::EmergencyResponder contact_emergency_services(const ridesafe::EmergencyIncident& incident) override {
        PYBIND11_OVERRIDE_PURE(ridesafe::EmergencyResponder, ridesafe::DispatchService, contact_emergency_services,
                               incident);
    }
};

}  // namespace

PYBIND11_MODULE(ridesafe_python, m) {
    m.doc() = "Pybind11 bindings for the ride-safety monitoring core.";

    py::enum_<ridesafe::Severity>(m, "Severity")
        .value("LOW", ridesafe::Severity::kLow)
        .value("MEDIUM", ridesafe::Severity::kMedium)
        .value("HIGH", ridesafe::Severity::kHigh)
        .value("CRITICAL", ridesafe::Severity::kCritical);

    py::enum_<ridesafe::DeviationSeverity>(m, "DeviationSeverity")
        .value("MINOR", ridesafe::DeviationSeverity::kMinor)
        .value("MAJOR", ridesafe::DeviationSeverity::kMajor);

    py::enum_<ridesafe::RiskLevel>(m, "RiskLevel")
        .value("LOW", ridesafe::RiskLevel::kLow)
        .value("MEDIUM", ridesafe::RiskLevel::kMedium)
        .value("HIGH", ridesafe::RiskLevel::kHigh)
        .value("CRITICAL", ridesafe::RiskLevel::kCritical);

    py::enum_<ridesafe::AlertType>(m, "AlertType")
        .value("ROUTE_DEVIATION", ridesafe::AlertType::kRouteDeviation)
        .value("SPEED_VIOLATION", ridesafe::AlertType::kSpeedViolation)
        .value("HARSH_DRIVING", ridesafe::AlertType::kHarshDriving)
        .value("CHECK_IN_MISSED", ridesafe::AlertType::kCheckInMissed)
        .value("PANIC_BUTTON", ridesafe::AlertType::kPanicButton)
        .value("COMMUNICATION_LOSS", ridesafe::AlertType::kCommunicationLoss)
        .value("EXTENDED_STOP", ridesafe::AlertType::kExtendedStop);

    py::enum_<ridesafe::AlertStatus>(m, "AlertStatus")
        .value("ACTIVE", ridesafe::AlertStatus::kActive)
        .value("ACKNOWLEDGED", ridesafe::AlertStatus::kAcknowledged)
        .value("RESOLVED", ridesafe::AlertStatus::kResolved)
        .value("FALSE_ALARM", ridesafe::AlertStatus::kFalseAlarm);

    py::enum_<ridesafe::CheckInType>(m, "CheckInType")
        .value("AUTOMATIC", ridesafe::CheckInType::kAutomatic)
        .value("MANUAL", ridesafe::CheckInType::kManual)
        .value("PROMPTED", ridesafe::CheckInType::kPrompted);

    py::enum_<ridesafe::CheckInStatus>(m, "CheckInStatus")
        .value("PENDING", ridesafe::CheckInStatus::kPending)
        .value("COMPLETED", ridesafe::CheckInStatus::kCompleted)
        .value("MISSED", ridesafe::CheckInStatus::kMissed)
        .value("OVERDUE", ridesafe::CheckInStatus::kOverdue);

    py::enum_<ridesafe::SessionStatus>(m, "SessionStatus")
        .value("MONITORING", ridesafe::SessionStatus::kMonitoring)
        .value("ALERT_TRIGGERED", ridesafe::SessionStatus::kAlertTriggered)
        .value("EMERGENCY", ridesafe::SessionStatus::kEmergency)
        .value("COMPLETED", ridesafe::SessionStatus::kCompleted);

    py::enum_<ridesafe::IncidentType>(m, "IncidentType")
        .value("SOS", ridesafe::IncidentType::kSos)
        .value("PANIC", ridesafe::IncidentType::kPanic)
        .value("MEDICAL", ridesafe::IncidentType::kMedical)
        .value("ACCIDENT", ridesafe::IncidentType::kAccident)
        .value("HARASSMENT", ridesafe::IncidentType::kHarassment)
        .value("VEHICLE_ISSUE", ridesafe::IncidentType::kVehicleIssue)
        .value("OTHER", ridesafe::IncidentType::kOther);

    py::enum_<ridesafe::IncidentStatus>(m, "IncidentStatus")
        .value("ACTIVE", ridesafe::IncidentStatus::kActive)
        .value("RESPONDING", ridesafe::IncidentStatus::kResponding)
        .value("RESOLVED", ridesafe::IncidentStatus::kResolved)
        .value("FALSE_ALARM", ridesafe::IncidentStatus::kFalseAlarm);

    py::enum_<ridesafe::ResponderType>(m, "ResponderType")
        .value("EMERGENCY_SERVICES", ridesafe::ResponderType::kEmergencyServices)
        .value("SECURITY_TEAM", ridesafe::ResponderType::kSecurityTeam)
        .value("SUPPORT_AGENT", ridesafe::ResponderType::kSupportAgent)
        .value("DRIVER", ridesafe::ResponderType::kDriver);

    py::enum_<ridesafe::ResponderStatus>(m, "ResponderStatus")
        .value("NOTIFIED", ridesafe::ResponderStatus::kNotified)
        .value("RESPONDING", ridesafe::ResponderStatus::kResponding)
        .value("ON_SCENE", ridesafe::ResponderStatus::kOnScene)
        .value("COMPLETED", ridesafe::ResponderStatus::kCompleted);

    py::enum_<ridesafe::IncidentOutcome>(m, "IncidentOutcome")
        .value("RESOLVED", ridesafe::IncidentOutcome::kResolved)
        .value("FALSE_ALARM", ridesafe::IncidentOutcome::kFalseAlarm);

    py::class_<ridesafe::RoutePoint>(m, "RoutePoint")
        .def(py::init<>())
        .def_readwrite("latitude", &ridesafe::RoutePoint::latitude)
        .def_readwrite("longitude", &ridesafe::RoutePoint::longitude)
        .def_readwrite("timestamp", &ridesafe::RoutePoint::timestamp)
        .def_readwrite("speed", &ridesafe::RoutePoint::speed)
        .def_readwrite("heading", &ridesafe::RoutePoint::heading)
        .def_readwrite("accuracy", &ridesafe::RoutePoint::accuracy);

    py::class_<ridesafe::RouteDeviation>(m, "RouteDeviation")
        .def_readonly("id", &ridesafe::RouteDeviation::id)
        .def_readonly("detected_at", &ridesafe::RouteDeviation::detected_at)
        .def_readonly("severity", &ridesafe::RouteDeviation::severity)
        .def_readonly("distance_from_route", &ridesafe::RouteDeviation::distance_from_route)
        .def_readonly("duration", &ridesafe::RouteDeviation::duration)
        .def_readonly("location", &ridesafe::RouteDeviation::location)
        .def_readonly("is_resolved", &ridesafe::RouteDeviation::is_resolved)
        .def_readonly("resolved_at", &ridesafe::RouteDeviation::resolved_at)
        .def_readonly("alert_triggered", &ridesafe::RouteDeviation::alert_triggered);

    py::class_<ridesafe::DriverBehaviorMetrics>(m, "DriverBehaviorMetrics")
        .def_readonly("average_speed", &ridesafe::DriverBehaviorMetrics::average_speed)
        .def_readonly("max_speed", &ridesafe::DriverBehaviorMetrics::max_speed)
        .def_readonly("speed_violations", &ridesafe::DriverBehaviorMetrics::speed_violations)
        .def_readonly("harsh_accelerations", &ridesafe::DriverBehaviorMetrics::harsh_accelerations)
        .def_readonly("harsh_braking", &ridesafe::DriverBehaviorMetrics::harsh_braking)
        .def_readonly("sharp_turns", &ridesafe::DriverBehaviorMetrics::sharp_turns)
        .def_readonly("overall_score", &ridesafe::DriverBehaviorMetrics::overall_score)
        .def_readonly("risk_level", &ridesafe::DriverBehaviorMetrics::risk_level);

    py::class_<ridesafe::AlertAction>(m, "AlertAction")
        .def_readonly("id", &ridesafe::AlertAction::id)
        .def_property_readonly("type", [](const ridesafe::AlertAction& action) {
            return ridesafe::to_string(action.type);
        })
        .def_readonly("timestamp", &ridesafe::AlertAction::timestamp)
        .def_readonly("actor", &ridesafe::AlertAction::actor)
        .def_readonly("details", &ridesafe::AlertAction::details)
        .def_readonly("success", &ridesafe::AlertAction::success);

    py::class_<ridesafe::SafetyAlert>(m, "SafetyAlert")
        .def_readonly("id", &ridesafe::SafetyAlert::id)
        .def_readonly("type", &ridesafe::SafetyAlert::type)
        .def_readonly("severity", &ridesafe::SafetyAlert::severity)
        .def_readonly("status", &ridesafe::SafetyAlert::status)
        .def_readonly("triggered_at", &ridesafe::SafetyAlert::triggered_at)
        .def_readonly("location", &ridesafe::SafetyAlert::location)
        .def_readonly("description", &ridesafe::SafetyAlert::description)
        .def_readonly("data", &ridesafe::SafetyAlert::data)
        .def_readonly("acknowledged_by", &ridesafe::SafetyAlert::acknowledged_by)
        .def_readonly("actions", &ridesafe::SafetyAlert::actions);

    py::class_<ridesafe::CheckInResponse>(m, "CheckInResponse")
        .def_readonly("is_ok", &ridesafe::CheckInResponse::is_ok)
        .def_readonly("message", &ridesafe::CheckInResponse::message)
        .def_readonly("location", &ridesafe::CheckInResponse::location);

    py::class_<ridesafe::SafetyCheckIn>(m, "SafetyCheckIn")
        .def_readonly("id", &ridesafe::SafetyCheckIn::id)
        .def_readonly("scheduled_at", &ridesafe::SafetyCheckIn::scheduled_at)
        .def_readonly("deadline", &ridesafe::SafetyCheckIn::deadline)
        .def_readonly("completed_at", &ridesafe::SafetyCheckIn::completed_at)
        .def_readonly("type", &ridesafe::SafetyCheckIn::type)
        .def_readonly("status", &ridesafe::SafetyCheckIn::status)
        .def_readonly("response", &ridesafe::SafetyCheckIn::response)
        .def_readonly("follow_up_required", &ridesafe::SafetyCheckIn::follow_up_required);

    py::class_<ridesafe::MonitoringSession>(m, "MonitoringSession")
        .def_readonly("id", &ridesafe::MonitoringSession::id)
        .def_readonly("ride_id", &ridesafe::MonitoringSession::ride_id)
        .def_readonly("user_id", &ridesafe::MonitoringSession::user_id)
        .def_readonly("driver_id", &ridesafe::MonitoringSession::driver_id)
        .def_readonly("status", &ridesafe::MonitoringSession::status)
        .def_readonly("start_time", &ridesafe::MonitoringSession::start_time)
        .def_readonly("end_time", &ridesafe::MonitoringSession::end_time)
        .def_readonly("planned_route", &ridesafe::MonitoringSession::planned_route)
        .def_readonly("actual_route", &ridesafe::MonitoringSession::actual_route)
        .def_readonly("deviations", &ridesafe::MonitoringSession::deviations)
        .def_readonly("alerts", &ridesafe::MonitoringSession::alerts)
        .def_readonly("check_ins", &ridesafe::MonitoringSession::check_ins)
        .def_readonly("behavior", &ridesafe::MonitoringSession::behavior)
        .def_readonly("risk_score", &ridesafe::MonitoringSession::risk_score)
        .def_readonly("is_active", &ridesafe::MonitoringSession::is_active)
        .def("to_json", [](const ridesafe::MonitoringSession& session) { return ridesafe::to_json(session); });

    py::class_<ridesafe::IncidentLocation>(m, "IncidentLocation")
        .def_readonly("latitude", &ridesafe::IncidentLocation::latitude)
        .def_readonly("longitude", &ridesafe::IncidentLocation::longitude)
        .def_readonly("address", &ridesafe::IncidentLocation::address)
        .def_readonly("accuracy", &ridesafe::IncidentLocation::accuracy);

    py::class_<ridesafe::EmergencyResponder>(m, "EmergencyResponder")
        .def(py::init<>())
        .def_readwrite("id", &ridesafe::EmergencyResponder::id)
        .def_readwrite("type", &ridesafe::EmergencyResponder::type)
        .def_readwrite("name", &ridesafe::EmergencyResponder::name)
        .def_readwrite("phone_number", &ridesafe::EmergencyResponder::phone_number)
        .def_readwrite("status", &ridesafe::EmergencyResponder::status)
        .def_readwrite("estimated_arrival", &ridesafe::EmergencyResponder::estimated_arrival);

    py::class_<ridesafe::TimelineEvent>(m, "TimelineEvent")
        .def_readonly("id", &ridesafe::TimelineEvent::id)
        .def_readonly("timestamp", &ridesafe::TimelineEvent::timestamp)
        .def_property_readonly("type", [](const ridesafe::TimelineEvent& event) {
            return ridesafe::to_string(event.type);
        })
        .def_readonly("description", &ridesafe::TimelineEvent::description)
        .def_readonly("actor", &ridesafe::TimelineEvent::actor)
        .def_readonly("data", &ridesafe::TimelineEvent::data);

    py::class_<ridesafe::IncidentResolution>(m, "IncidentResolution")
        .def_readonly("resolved_at", &ridesafe::IncidentResolution::resolved_at)
        .def_readonly("resolved_by", &ridesafe::IncidentResolution::resolved_by)
        .def_readonly("resolution", &ridesafe::IncidentResolution::resolution)
        .def_readonly("follow_up_required", &ridesafe::IncidentResolution::follow_up_required);

    py::class_<ridesafe::EmergencyIncident>(m, "EmergencyIncident")
        .def_readonly("id", &ridesafe::EmergencyIncident::id)
        .def_readonly("user_id", &ridesafe::EmergencyIncident::user_id)
        .def_readonly("ride_id", &ridesafe::EmergencyIncident::ride_id)
        .def_readonly("type", &ridesafe::EmergencyIncident::type)
        .def_readonly("status", &ridesafe::EmergencyIncident::status)
        .def_readonly("priority", &ridesafe::EmergencyIncident::priority)
        .def_readonly("location", &ridesafe::EmergencyIncident::location)
        .def_readonly("timestamp", &ridesafe::EmergencyIncident::timestamp)
        .def_readonly("description", &ridesafe::EmergencyIncident::description)
        .def_readonly("emergency_contacts", &ridesafe::EmergencyIncident::emergency_contacts)
        .def_readonly("responders", &ridesafe::EmergencyIncident::responders)
        .def_readonly("timeline", &ridesafe::EmergencyIncident::timeline)
        .def_readonly("media", &ridesafe::EmergencyIncident::media)
        .def_readonly("resolution", &ridesafe::EmergencyIncident::resolution)
        .def("to_json", [](const ridesafe::EmergencyIncident& incident) { return ridesafe::to_json(incident); });

    py::class_<ridesafe::NotificationPreferences>(m, "NotificationPreferences")
        .def(py::init<>())
        .def_readwrite("sms", &ridesafe::NotificationPreferences::sms)
        .def_readwrite("call", &ridesafe::NotificationPreferences::call)
        .def_readwrite("email", &ridesafe::NotificationPreferences::email);

    py::class_<ridesafe::EmergencyContact>(m, "EmergencyContact")
        .def(py::init<>())
        .def_readwrite("id", &ridesafe::EmergencyContact::id)
        .def_readwrite("name", &ridesafe::EmergencyContact::name)
        .def_readwrite("phone_number", &ridesafe::EmergencyContact::phone_number)
        .def_readwrite("email", &ridesafe::EmergencyContact::email)
        .def_readwrite("relationship", &ridesafe::EmergencyContact::relationship)
        .def_readwrite("is_primary", &ridesafe::EmergencyContact::is_primary)
        .def_readwrite("is_active", &ridesafe::EmergencyContact::is_active)
        .def_readwrite("preferences", &ridesafe::EmergencyContact::preferences);

    py::class_<ridesafe::SafetySettings>(m, "SafetySettings")
        .def(py::init<>())
        .def_readwrite("user_id", &ridesafe::SafetySettings::user_id)
        .def_readwrite("enable_ride_monitoring", &ridesafe::SafetySettings::enable_ride_monitoring)
        .def_readwrite("route_deviation_threshold", &ridesafe::SafetySettings::route_deviation_threshold)
        .def_readwrite("speed_violation_threshold", &ridesafe::SafetySettings::speed_violation_threshold)
        .def_readwrite("check_in_interval_min", &ridesafe::SafetySettings::check_in_interval_min)
        .def_readwrite("enable_automatic_check_ins", &ridesafe::SafetySettings::enable_automatic_check_ins)
        .def_readwrite("emergency_contacts_on_alert", &ridesafe::SafetySettings::emergency_contacts_on_alert)
        .def_readwrite("driver_behavior_monitoring", &ridesafe::SafetySettings::driver_behavior_monitoring);

    py::class_<ridesafe::EmergencySettings>(m, "EmergencySettings")
        .def(py::init<>())
        .def_readwrite("user_id", &ridesafe::EmergencySettings::user_id)
        .def_readwrite("emergency_contacts", &ridesafe::EmergencySettings::emergency_contacts)
        .def_readwrite("auto_call_emergency_services", &ridesafe::EmergencySettings::auto_call_emergency_services)
        .def_readwrite("share_location_with_contacts", &ridesafe::EmergencySettings::share_location_with_contacts)
        .def_readwrite("discrete_mode", &ridesafe::EmergencySettings::discrete_mode)
        .def_readwrite("auto_record_audio", &ridesafe::EmergencySettings::auto_record_audio)
        .def_readwrite("auto_take_photos", &ridesafe::EmergencySettings::auto_take_photos);

    py::class_<ridesafe::RideSafeSettings, std::shared_ptr<ridesafe::RideSafeSettings>>(m, "RideSafeSettings")
        .def(py::init<>())
        .def_static("from_toml", &ridesafe::RideSafeSettings::from_toml);

    py::class_<ridesafe::IncidentOptions>(m, "IncidentOptions")
        .def(py::init<>())
        .def_readwrite("ride_id", &ridesafe::IncidentOptions::ride_id)
        .def_readwrite("description", &ridesafe::IncidentOptions::description)
        .def_readwrite("discrete_mode", &ridesafe::IncidentOptions::discrete_mode);

    py::class_<ridesafe::LocationProvider, PyLocationProvider, std::shared_ptr<ridesafe::LocationProvider>>(
        m, "LocationProvider")
        .def(py::init<>());

    py::class_<ridesafe::NotificationChannels, PyNotificationChannels,
               std::shared_ptr<ridesafe::NotificationChannels>>(m, "NotificationChannels")
        .def(py::init<>());

    py::class_<ridesafe::DispatchService, PyDispatchService, std::shared_ptr<ridesafe::DispatchService>>(
        m, "DispatchService")
        .def(py::init<>());

    py::class_<ridesafe::SettingsStore, std::shared_ptr<ridesafe::SettingsStore>>(m, "SettingsStore");

    py::class_<ridesafe::InMemorySettingsStore, ridesafe::SettingsStore,
               std::shared_ptr<ridesafe::InMemorySettingsStore>>(m, "InMemorySettingsStore")
        .def(py::init<>())
        .def("put_safety_settings", &ridesafe::InMemorySettingsStore::put_safety_settings)
        .def("put_emergency_settings", &ridesafe::InMemorySettingsStore::put_emergency_settings);

    py::class_<ridesafe::RideMonitor, std::shared_ptr<ridesafe::RideMonitor>>(m, "RideMonitor")
        .def("start_monitoring", &ridesafe::RideMonitor::start_monitoring, py::arg("ride_id"), py::arg("user_id"),
             py::arg("driver_id"), py::arg("planned_route"), py::arg("run_background_tasks") = true,
             py::call_guard<py::gil_scoped_release>())
        .def("stop_monitoring", &ridesafe::RideMonitor::stop_monitoring, py::call_guard<py::gil_scoped_release>())
        .def("process_fix", &ridesafe::RideMonitor::process_fix, py::call_guard<py::gil_scoped_release>())
        .def("poll_location", &ridesafe::RideMonitor::poll_location, py::call_guard<py::gil_scoped_release>())
        .def("prompt_check_in", &ridesafe::RideMonitor::prompt_check_in, py::arg("ride_id"),
             py::arg("type") = ridesafe::CheckInType::kPrompted, py::call_guard<py::gil_scoped_release>())
        .def("respond_to_check_in", &ridesafe::RideMonitor::respond_to_check_in, py::arg("ride_id"),
             py::arg("check_in_id"), py::arg("is_ok"), py::arg("message") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("perform_manual_check_in", &ridesafe::RideMonitor::perform_manual_check_in, py::arg("ride_id"),
             py::arg("is_ok"), py::arg("message") = std::nullopt, py::call_guard<py::gil_scoped_release>())
        .def("trigger_panic", &ridesafe::RideMonitor::trigger_panic, py::call_guard<py::gil_scoped_release>())
        .def("acknowledge_alert", &ridesafe::RideMonitor::acknowledge_alert,
             py::call_guard<py::gil_scoped_release>())
        .def("resolve_alert", &ridesafe::RideMonitor::resolve_alert, py::call_guard<py::gil_scoped_release>())
        .def("mark_false_alarm", &ridesafe::RideMonitor::mark_false_alarm,
             py::call_guard<py::gil_scoped_release>())
        .def("get_session", &ridesafe::RideMonitor::get_session, py::call_guard<py::gil_scoped_release>())
        .def("active_sessions", &ridesafe::RideMonitor::active_sessions, py::call_guard<py::gil_scoped_release>());

    py::class_<ridesafe::EmergencyIncidentManager, std::shared_ptr<ridesafe::EmergencyIncidentManager>>(
        m, "EmergencyIncidentManager")
        .def("create_incident", &ridesafe::EmergencyIncidentManager::create_incident, py::arg("user_id"),
             py::arg("type"), py::arg("location"), py::arg("options") = ridesafe::IncidentOptions{},
             py::call_guard<py::gil_scoped_release>())
        .def("resolve_incident", &ridesafe::EmergencyIncidentManager::resolve_incident, py::arg("incident_id"),
             py::arg("resolved_by"), py::arg("resolution"), py::arg("follow_up_required") = false,
             py::arg("outcome") = ridesafe::IncidentOutcome::kResolved, py::call_guard<py::gil_scoped_release>())
        .def("update_responder_status", &ridesafe::EmergencyIncidentManager::update_responder_status,
             py::call_guard<py::gil_scoped_release>())
        .def("add_responder", &ridesafe::EmergencyIncidentManager::add_responder,
             py::call_guard<py::gil_scoped_release>())
        .def("get_incident", &ridesafe::EmergencyIncidentManager::get_incident,
             py::call_guard<py::gil_scoped_release>())
        .def("active_incidents", &ridesafe::EmergencyIncidentManager::active_incidents,
             py::arg("user_id") = std::nullopt, py::call_guard<py::gil_scoped_release>());

    py::class_<ridesafe::RideSafeRuntime>(m, "RideSafeRuntime")
        .def_readonly("settings", &ridesafe::RideSafeRuntime::settings)
        .def_readonly("monitor", &ridesafe::RideSafeRuntime::monitor)
        .def_readonly("incidents", &ridesafe::RideSafeRuntime::incidents)
        .def("shutdown", [](ridesafe::RideSafeRuntime& runtime) {
            py::gil_scoped_release release;
            ridesafe::shutdown_runtime(runtime);
        });

    m.def("priority_for", &ridesafe::priority_for);
    m.def("haversine_distance",
          py::overload_cast<double, double, double, double>(&ridesafe::haversine_distance));

    m.def("build_runtime_py",
          [](std::shared_ptr<ridesafe::LocationProvider> location,
             std::shared_ptr<ridesafe::NotificationChannels> channels,
             std::shared_ptr<ridesafe::DispatchService> dispatch,
             std::shared_ptr<ridesafe::InMemorySettingsStore> settings_store,
             std::shared_ptr<ridesafe::RideSafeSettings> settings) {
              ridesafe::RuntimeCollaborators collaborators;
              collaborators.location = std::move(location);
              collaborators.channels = std::move(channels);
              collaborators.dispatch = std::move(dispatch);
              collaborators.settings_store = std::move(settings_store);
              return ridesafe::build_runtime(collaborators, std::move(settings));
          },
          py::arg("location") = nullptr, py::arg("channels") = nullptr, py::arg("dispatch") = nullptr,
          py::arg("settings_store") = nullptr, py::arg("settings") = nullptr);
}
