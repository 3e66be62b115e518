#include "ridesafe/checkin.hpp"

namespace ridesafe {

CheckInScheduler::CheckInScheduler(double response_timeout_s, ClockFn clock, Logger logger)
    : response_timeout_s_(response_timeout_s), clock_(std::move(clock)), logger_(std::move(logger)) {}

SafetyCheckIn CheckInScheduler::prompt(MonitoringSession& session, CheckInType type) {
    const double now = clock_();
    SafetyCheckIn check_in;
    check_in.id = make_id("checkin", now);
    check_in.scheduled_at = now;
    check_in.deadline = now + response_timeout_s_;
    check_in.type = type;
    check_in.status = CheckInStatus::kPending;
    session.check_ins.push_back(check_in);
    logger_.info("check_in_prompted", {{"ride_id", session.ride_id},
                                       {"check_in_id", check_in.id},
                                       {"type", to_string(type)},
                                       {"deadline", format_fixed(check_in.deadline, 3)}});
    return check_in;
}

SafetyCheckIn* CheckInScheduler::find(MonitoringSession& session, const std::string& check_in_id) const {
    for (auto& check_in : session.check_ins) {
        if (check_in.id == check_in_id) {
            return &check_in;
        }
    }
    return nullptr;
}

CheckInResult CheckInScheduler::respond(MonitoringSession& session, const std::string& check_in_id, bool is_ok,
                                        const RoutePoint& location, std::optional<std::string> message) {
    auto* check_in = find(session, check_in_id);
    if (check_in == nullptr || check_in->status != CheckInStatus::kPending) {
        logger_.warn("check_in_response_rejected", {{"ride_id", session.ride_id}, {"check_in_id", check_in_id}});
        return {};
    }
    const double now = clock_();
    if (now > check_in->deadline) {
        CheckInResult late = expire(session, check_in_id);
        late.accepted = false;
        return late;
    }
    return complete(session, *check_in, is_ok, location, std::move(message), now);
}

CheckInResult CheckInScheduler::complete(MonitoringSession& session, SafetyCheckIn& check_in, bool is_ok,
                                         const RoutePoint& location, std::optional<std::string> message,
                                         double now) const {
    check_in.status = CheckInStatus::kCompleted;
    check_in.completed_at = now;
    check_in.response = CheckInResponse{is_ok, message, location};

    CheckInResult result;
    result.accepted = true;
    if (!is_ok) {
        check_in.follow_up_required = true;
        AlertRequest request;
        request.type = AlertType::kCheckInMissed;
        request.severity = Severity::kHigh;
        request.description = "Passenger reported issue: " + message.value_or("No details provided");
        request.data["check_in_id"] = check_in.id;
        if (message.has_value()) {
            request.data["message"] = *message;
        }
        result.alert = request;
    }
    logger_.info("check_in_completed",
                 {{"ride_id", session.ride_id}, {"check_in_id", check_in.id}, {"is_ok", is_ok ? "true" : "false"}});
    return result;
}

CheckInResult CheckInScheduler::expire(MonitoringSession& session, const std::string& check_in_id) {
    auto* check_in = find(session, check_in_id);
    if (check_in == nullptr || check_in->status != CheckInStatus::kPending) {
        return {};
    }
    check_in->status = CheckInStatus::kMissed;
    check_in->follow_up_required = true;

    AlertRequest request;
    request.type = AlertType::kCheckInMissed;
    request.severity = Severity::kMedium;
    request.description = "Passenger did not respond to safety check-in";
    request.data["check_in_id"] = check_in->id;

    logger_.warn("check_in_missed", {{"ride_id", session.ride_id}, {"check_in_id", check_in->id}});
    CheckInResult result;
    result.accepted = true;
    result.alert = request;
    return result;
}

CheckInResult CheckInScheduler::record_manual(MonitoringSession& session, bool is_ok, const RoutePoint& location,
                                              std::optional<std::string> message) {
    const double now = clock_();
    SafetyCheckIn check_in;
    check_in.id = make_id("checkin", now);
    check_in.scheduled_at = now;
    check_in.deadline = now;
    check_in.type = CheckInType::kManual;
    session.check_ins.push_back(check_in);
    return complete(session, session.check_ins.back(), is_ok, location, std::move(message), now);
}

}  // namespace ridesafe
