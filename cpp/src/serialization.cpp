#include "ridesafe/serialization.hpp"

#include <sstream>

#include "ridesafe/common.hpp"

namespace ridesafe {
namespace {

std::string quoted(const std::string& value) {
    return "\"" + escape_json(value) + "\"";
}

std::string number(double value, int precision = 3) {
    return format_fixed(value, precision);
}

std::string boolean(bool value) {
    return value ? "true" : "false";
}

template <typename T, typename Fn>
std::string optional_field(const std::optional<T>& value, Fn render) {
    return value.has_value() ? render(*value) : std::string("null");
}

template <typename Container, typename Fn>
std::string array(const Container& items, Fn render) {
    std::ostringstream out;
    out << "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            out << ",";
        }
        first = false;
        out << render(item);
    }
    out << "]";
    return out.str();
}

std::string object(const Attributes& attributes) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& [key, value] : attributes) {
        if (!first) {
            out << ",";
        }
        first = false;
        out << quoted(key) << ":" << quoted(value);
    }
    out << "}";
    return out.str();
}

std::string deviation_json(const RouteDeviation& deviation) {
    std::ostringstream out;
    out << "{\"id\":" << quoted(deviation.id) << ",\"detected_at\":" << number(deviation.detected_at)
        << ",\"severity\":" << quoted(to_string(deviation.severity))
        << ",\"distance_from_route\":" << number(deviation.distance_from_route, 1)
        << ",\"duration\":" << number(deviation.duration, 1) << ",\"location\":" << to_json(deviation.location)
        << ",\"reason\":"
        << optional_field(deviation.reason, [](DeviationReason reason) { return quoted(to_string(reason)); })
        << ",\"is_resolved\":" << boolean(deviation.is_resolved)
        << ",\"resolved_at\":" << optional_field(deviation.resolved_at, [](double v) { return number(v); })
        << ",\"alert_triggered\":" << boolean(deviation.alert_triggered) << "}";
    return out.str();
}

std::string action_json(const AlertAction& action) {
    std::ostringstream out;
    out << "{\"id\":" << quoted(action.id) << ",\"type\":" << quoted(to_string(action.type))
        << ",\"timestamp\":" << number(action.timestamp) << ",\"actor\":" << quoted(action.actor)
        << ",\"details\":" << quoted(action.details) << ",\"success\":" << boolean(action.success) << "}";
    return out.str();
}

std::string alert_json(const SafetyAlert& alert) {
    std::ostringstream out;
    out << "{\"id\":" << quoted(alert.id) << ",\"type\":" << quoted(to_string(alert.type))
        << ",\"severity\":" << quoted(to_string(alert.severity)) << ",\"status\":" << quoted(to_string(alert.status))
        << ",\"triggered_at\":" << number(alert.triggered_at)
        << ",\"location\":" << optional_field(alert.location, [](const RoutePoint& p) { return to_json(p); })
        << ",\"description\":" << quoted(alert.description) << ",\"data\":" << object(alert.data)
        << ",\"acknowledged_by\":" << optional_field(alert.acknowledged_by, quoted)
        << ",\"acknowledged_at\":" << optional_field(alert.acknowledged_at, [](double v) { return number(v); })
        << ",\"resolved_at\":" << optional_field(alert.resolved_at, [](double v) { return number(v); })
        << ",\"actions\":" << array(alert.actions, action_json) << "}";
    return out.str();
}

std::string check_in_json(const SafetyCheckIn& check_in) {
    std::ostringstream out;
    out << "{\"id\":" << quoted(check_in.id) << ",\"scheduled_at\":" << number(check_in.scheduled_at)
        << ",\"deadline\":" << number(check_in.deadline)
        << ",\"completed_at\":" << optional_field(check_in.completed_at, [](double v) { return number(v); })
        << ",\"type\":" << quoted(to_string(check_in.type)) << ",\"status\":" << quoted(to_string(check_in.status))
        << ",\"response\":" << optional_field(check_in.response, [](const CheckInResponse& response) {
               return "{\"is_ok\":" + boolean(response.is_ok) +
                      ",\"message\":" + optional_field(response.message, quoted) +
                      ",\"location\":" + to_json(response.location) + "}";
           })
        << ",\"follow_up_required\":" << boolean(check_in.follow_up_required) << "}";
    return out.str();
}

std::string behavior_json(const DriverBehaviorMetrics& metrics) {
    std::ostringstream out;
    out << "{\"average_speed\":" << number(metrics.average_speed, 2)
        << ",\"max_speed\":" << number(metrics.max_speed, 2) << ",\"speed_violations\":" << metrics.speed_violations
        << ",\"harsh_accelerations\":" << metrics.harsh_accelerations
        << ",\"harsh_braking\":" << metrics.harsh_braking << ",\"sharp_turns\":" << metrics.sharp_turns
        << ",\"overall_score\":" << number(metrics.overall_score, 1)
        << ",\"risk_level\":" << quoted(to_string(metrics.risk_level)) << "}";
    return out.str();
}

std::string responder_json(const EmergencyResponder& responder) {
    std::ostringstream out;
    out << "{\"id\":" << quoted(responder.id) << ",\"type\":" << quoted(to_string(responder.type))
        << ",\"name\":" << quoted(responder.name)
        << ",\"phone_number\":" << optional_field(responder.phone_number, quoted)
        << ",\"status\":" << quoted(to_string(responder.status))
        << ",\"estimated_arrival\":"
        << optional_field(responder.estimated_arrival, [](double v) { return number(v); }) << "}";
    return out.str();
}

std::string timeline_json(const TimelineEvent& event) {
    std::ostringstream out;
    out << "{\"id\":" << quoted(event.id) << ",\"timestamp\":" << number(event.timestamp)
        << ",\"type\":" << quoted(to_string(event.type)) << ",\"description\":" << quoted(event.description)
        << ",\"actor\":" << quoted(event.actor) << ",\"data\":" << object(event.data) << "}";
    return out.str();
}

}  // namespace

std::string to_json(const RoutePoint& point) {
    std::ostringstream out;
    out << "{\"latitude\":" << number(point.latitude, 6) << ",\"longitude\":" << number(point.longitude, 6)
        << ",\"timestamp\":" << number(point.timestamp)
        << ",\"speed\":" << optional_field(point.speed, [](double v) { return number(v, 2); })
        << ",\"heading\":" << optional_field(point.heading, [](double v) { return number(v, 1); })
        << ",\"accuracy\":" << optional_field(point.accuracy, [](double v) { return number(v, 1); }) << "}";
    return out.str();
}

std::string to_json(const MonitoringSession& session) {
    std::ostringstream out;
    out << "{\"kind\":\"monitoring_session\",\"id\":" << quoted(session.id)
        << ",\"ride_id\":" << quoted(session.ride_id) << ",\"user_id\":" << quoted(session.user_id)
        << ",\"driver_id\":" << quoted(session.driver_id) << ",\"status\":" << quoted(to_string(session.status))
        << ",\"start_time\":" << number(session.start_time)
        << ",\"end_time\":" << optional_field(session.end_time, [](double v) { return number(v); })
        << ",\"planned_route\":" << array(session.planned_route, [](const RoutePoint& p) { return to_json(p); })
        << ",\"actual_route\":" << array(session.actual_route, [](const RoutePoint& p) { return to_json(p); })
        << ",\"deviations\":" << array(session.deviations, deviation_json)
        << ",\"alerts\":" << array(session.alerts, alert_json)
        << ",\"check_ins\":" << array(session.check_ins, check_in_json)
        << ",\"behavior\":" << behavior_json(session.behavior) << ",\"risk_score\":" << number(session.risk_score, 1)
        << ",\"is_active\":" << boolean(session.is_active) << "}";
    return out.str();
}

std::string to_json(const EmergencyIncident& incident) {
    std::ostringstream out;
    out << "{\"kind\":\"emergency_incident\",\"id\":" << quoted(incident.id)
        << ",\"user_id\":" << quoted(incident.user_id)
        << ",\"ride_id\":" << optional_field(incident.ride_id, quoted)
        << ",\"type\":" << quoted(to_string(incident.type)) << ",\"status\":" << quoted(to_string(incident.status))
        << ",\"priority\":" << quoted(to_string(incident.priority)) << ",\"location\":{\"latitude\":"
        << number(incident.location.latitude, 6) << ",\"longitude\":" << number(incident.location.longitude, 6)
        << ",\"address\":" << optional_field(incident.location.address, quoted)
        << ",\"accuracy\":" << optional_field(incident.location.accuracy, [](double v) { return number(v, 1); })
        << "},\"timestamp\":" << number(incident.timestamp)
        << ",\"description\":" << optional_field(incident.description, quoted)
        << ",\"emergency_contacts\":" << array(incident.emergency_contacts, quoted)
        << ",\"responders\":" << array(incident.responders, responder_json)
        << ",\"timeline\":" << array(incident.timeline, timeline_json)
        << ",\"media\":" << array(incident.media, quoted) << ",\"resolution\":"
        << optional_field(incident.resolution, [](const IncidentResolution& resolution) {
               return "{\"resolved_at\":" + number(resolution.resolved_at) +
                      ",\"resolved_by\":" + quoted(resolution.resolved_by) +
                      ",\"resolution\":" + quoted(resolution.resolution) +
                      ",\"follow_up_required\":" + boolean(resolution.follow_up_required) + "}";
           })
        << "}";
    return out.str();
}

}  // namespace ridesafe
