#include "ridesafe/channels.hpp"

namespace ridesafe {

LoggingNotificationChannels::LoggingNotificationChannels(Logger logger) : logger_(std::move(logger)) {}

void LoggingNotificationChannels::send_sms(const std::string& number, const std::string& text) {
    logger_.info("sms_sent", {{"number", number}, {"text", text}});
}

void LoggingNotificationChannels::place_call(const std::string& number, const std::string& context) {
    logger_.info("call_placed", {{"number", number}, {"context", context}});
}

void LoggingNotificationChannels::send_email(const EmergencyContact& contact, const std::string& context) {
    logger_.info("email_sent", {{"contact", contact.name}, {"email", contact.email}, {"context", context}});
}

void LoggingNotificationChannels::notify_user(const std::string& user_id, const std::string& text) {
    logger_.info("user_notified", {{"user_id", user_id}, {"text", text}});
}

void LoggingNotificationChannels::notify_driver(const std::string& ride_id, const std::string& text) {
    logger_.info("driver_notified", {{"ride_id", ride_id}, {"text", text}});
}

LoggingDispatchService::LoggingDispatchService(double eta_s, ClockFn clock, Logger logger)
    : eta_s_(eta_s), clock_(std::move(clock)), logger_(std::move(logger)) {}

EmergencyResponder LoggingDispatchService::contact_emergency_services(const EmergencyIncident& incident) {
    const double now = clock_();
    EmergencyResponder responder;
    responder.id = make_id("responder", now);
    responder.type = ResponderType::kEmergencyServices;
    responder.name = "Emergency Services";
    responder.phone_number = "911";
    responder.status = ResponderStatus::kNotified;
    responder.estimated_arrival = now + eta_s_;
    logger_.info("emergency_services_contacted",
                 {{"incident_id", incident.id}, {"priority", to_string(incident.priority)}});
    return responder;
}

}  // namespace ridesafe
