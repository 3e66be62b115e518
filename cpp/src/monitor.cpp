#include "ridesafe/monitor.hpp"

namespace ridesafe {

class RideMonitor::IncidentEscalation : public EscalationHandler {
public:
    explicit IncidentEscalation(RideMonitor* monitor) : monitor_(monitor) {}

    std::optional<std::string> escalate(const MonitoringSession& session, const SafetyAlert& alert) override {
        return monitor_->escalate(session, alert);
    }

private:
    RideMonitor* monitor_;
};

RideMonitor::RideMonitor(MonitorCollaborators collaborators, RideSafeSettings settings, ClockFn clock,
                         Logger logger)
    : collaborators_(std::move(collaborators)),
      settings_(std::move(settings)),
      clock_(std::move(clock)),
      logger_(std::move(logger)),
      deviation_(settings_.deviation, settings_.monitoring.route_match),
      behavior_(settings_.behavior),
      risk_(settings_.risk),
      check_ins_(settings_.monitoring.check_in_response_timeout_s, clock_),
      alerts_(collaborators_.channels, clock_) {
    if (settings_.monitoring.escalate_critical_alerts) {
        alerts_.set_escalation_handler(std::make_shared<IncidentEscalation>(this));
    }
}

RideMonitor::~RideMonitor() {
    stop_all();
}

std::optional<MonitoringSession> RideMonitor::start_monitoring(const std::string& ride_id,
                                                               const std::string& user_id,
                                                               const std::string& driver_id,
                                                               std::vector<RoutePoint> planned_route,
                                                               bool run_background_tasks) {
    const SafetySettings safety = safety_settings(user_id);
    if (!safety.enable_ride_monitoring) {
        logger_.info("monitoring_disabled_by_user", {{"ride_id", ride_id}, {"user_id", user_id}});
        return std::nullopt;
    }

    auto entry = std::make_shared<SessionEntry>();
    const double now = clock_();
    auto& session = entry->session;
    session.id = make_id("monitoring", now);
    session.ride_id = ride_id;
    session.user_id = user_id;
    session.driver_id = driver_id;
    session.status = SessionStatus::kMonitoring;
    session.start_time = now;
    session.planned_route = std::move(planned_route);
    session.is_active = true;
    entry->sampler = std::make_unique<LocationSampler>(collaborators_.location,
                                                       settings_.monitoring.location_timeout_s,
                                                       settings_.monitoring.communication_loss_cycles);

    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        if (sessions_.count(ride_id) != 0) {
            logger_.warn("monitoring_already_active", {{"ride_id", ride_id}});
            return std::nullopt;
        }
        sessions_[ride_id] = entry;
    }

    MonitoringSession snapshot;
    {
        std::lock_guard<std::mutex> guard(entry->mutex);
        if (run_background_tasks) {
            entry->tasks = std::make_unique<TaskGroup>("ride:" + ride_id, logger_);
            entry->tasks->spawn_periodic("location_poll", settings_.monitoring.location_poll_interval_s,
                                         [this, ride_id] { poll_location(ride_id); });
            if (safety.enable_automatic_check_ins && safety.check_in_interval_min > 0.0) {
                entry->tasks->spawn_periodic("check_in", safety.check_in_interval_min * 60.0, [this, ride_id] {
                    prompt_check_in(ride_id, CheckInType::kAutomatic);
                });
            }
        }
        snapshot = entry->session;
        if (collaborators_.writer) {
            collaborators_.writer->enqueue(snapshot);
        }
    }

    logger_.info("monitoring_started", {{"ride_id", ride_id},
                                        {"session_id", snapshot.id},
                                        {"user_id", user_id},
                                        {"driver_id", driver_id},
                                        {"route_points", std::to_string(snapshot.planned_route.size())}});
    return snapshot;
}

bool RideMonitor::stop_monitoring(const std::string& ride_id) {
    std::shared_ptr<SessionEntry> entry;
    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        auto it = sessions_.find(ride_id);
        if (it == sessions_.end()) {
            logger_.warn("monitoring_not_active", {{"ride_id", ride_id}});
            return false;
        }
        entry = it->second;
        sessions_.erase(it);
    }

    std::unique_ptr<TaskGroup> tasks;
    {
        std::lock_guard<std::mutex> guard(entry->mutex);
        tasks = std::move(entry->tasks);
    }
    if (tasks) {
        tasks->cancel();
    }

    std::lock_guard<std::mutex> guard(entry->mutex);
    auto& session = entry->session;
    session.is_active = false;
    session.status = SessionStatus::kCompleted;
    session.end_time = clock_();
    if (collaborators_.writer) {
        collaborators_.writer->enqueue(session);
    }
    logger_.info("monitoring_stopped", {{"ride_id", ride_id},
                                        {"session_id", session.id},
                                        {"fixes", std::to_string(session.actual_route.size())},
                                        {"alerts", std::to_string(session.alerts.size())},
                                        {"risk_score", format_fixed(session.risk_score, 1)}});
    return true;
}

bool RideMonitor::process_fix(const std::string& ride_id, const RoutePoint& fix) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    const SafetySettings safety = safety_settings(entry->session.user_id);
    std::lock_guard<std::mutex> guard(entry->mutex);
    return apply_fix_locked(*entry, fix, safety);
}

bool RideMonitor::poll_location(const std::string& ride_id) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    SampleOutcome outcome;
    {
        std::lock_guard<std::mutex> guard(entry->sample_mutex);
        outcome = entry->sampler->sample();
    }

    const SafetySettings safety = safety_settings(entry->session.user_id);
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!entry->session.is_active) {
        return false;
    }
    if (outcome.communication_lost) {
        AlertRequest request;
        request.type = AlertType::kCommunicationLoss;
        request.severity = Severity::kMedium;
        request.description = "No location received for " + std::to_string(outcome.consecutive_failures) +
                              " consecutive cycles";
        request.data["consecutive_failures"] = std::to_string(outcome.consecutive_failures);
        raise_locked(*entry, request, safety);
        refresh_locked(*entry);
    }
    if (!outcome.point.has_value()) {
        return false;
    }
    return apply_fix_locked(*entry, *outcome.point, safety);
}

bool RideMonitor::apply_fix_locked(SessionEntry& entry, const RoutePoint& fix, const SafetySettings& safety) {
    auto& session = entry.session;
    if (!session.is_active) {
        return false;
    }
    if (!is_valid_fix(fix)) {
        logger_.warn("fix_invalid", {{"ride_id", session.ride_id}});
        return false;
    }
    if (!session.actual_route.empty() && fix.timestamp < session.actual_route.back().timestamp) {
        logger_.warn("fix_out_of_order", {{"ride_id", session.ride_id},
                                          {"timestamp", format_fixed(fix.timestamp, 3)},
                                          {"last_timestamp", format_fixed(session.actual_route.back().timestamp, 3)}});
        return false;
    }
    session.actual_route.push_back(fix);

    DeviationUpdate deviation = deviation_.evaluate(session, fix, safety.route_deviation_threshold);
    if (deviation.alert.has_value()) {
        raise_locked(entry, *deviation.alert, safety);
    }

    if (safety.driver_behavior_monitoring) {
        for (const auto& request : behavior_.analyze(session, safety.speed_violation_threshold)) {
            raise_locked(entry, request, safety);
        }
    }

    refresh_locked(entry);
    logger_.debug("fix_processed", {{"ride_id", session.ride_id},
                                    {"distance_from_route", format_fixed(deviation.distance_from_route, 1)},
                                    {"behavior_score", format_fixed(session.behavior.overall_score, 1)},
                                    {"risk_score", format_fixed(session.risk_score, 1)},
                                    {"status", to_string(session.status)}});
    return true;
}

void RideMonitor::raise_locked(SessionEntry& entry, const AlertRequest& request, const SafetySettings& safety) {
    const EmergencySettings emergency = emergency_settings(entry.session.user_id);
    alerts_.raise(entry.session, request, safety, emergency);
}

void RideMonitor::refresh_locked(SessionEntry& entry) {
    const SessionStatus previous = entry.session.status;
    risk_.apply(entry.session);
    if (entry.session.status != previous) {
        logger_.info("session_status_changed", {{"ride_id", entry.session.ride_id},
                                                {"from", to_string(previous)},
                                                {"to", to_string(entry.session.status)},
                                                {"risk_score", format_fixed(entry.session.risk_score, 1)}});
    }
    if (collaborators_.writer) {
        collaborators_.writer->enqueue(entry.session);
    }
}

std::optional<SafetyCheckIn> RideMonitor::prompt_check_in(const std::string& ride_id, CheckInType type) {
    auto entry = find(ride_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!entry->session.is_active) {
        return std::nullopt;
    }
    SafetyCheckIn check_in = check_ins_.prompt(entry->session, type);
    if (collaborators_.channels) {
        try {
            collaborators_.channels->notify_user(entry->session.user_id,
                                                 "Safety check-in: are you OK? Please respond within " +
                                                     format_fixed(check_ins_.response_timeout_s(), 0) +
                                                     " seconds.");
        } catch (const std::exception& exc) {
            logger_.warn("check_in_prompt_failed", {{"ride_id", ride_id}, {"error", exc.what()}});
        }
    }
    if (entry->tasks) {
        const std::string check_in_id = check_in.id;
        entry->tasks->spawn_after("check_in_deadline", check_ins_.response_timeout_s(),
                                  [this, ride_id, check_in_id] { expire_check_in(ride_id, check_in_id); });
    }
    refresh_locked(*entry);
    return check_in;
}

bool RideMonitor::respond_to_check_in(const std::string& ride_id, const std::string& check_in_id, bool is_ok,
                                      std::optional<std::string> message) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    const SafetySettings safety = safety_settings(entry->session.user_id);
    std::lock_guard<std::mutex> guard(entry->mutex);
    RoutePoint location;
    location.timestamp = clock_();
    if (!entry->session.actual_route.empty()) {
        location = entry->session.actual_route.back();
    }
    CheckInResult result = check_ins_.respond(entry->session, check_in_id, is_ok, location, std::move(message));
    if (result.alert.has_value()) {
        raise_locked(*entry, *result.alert, safety);
    }
    if (result.accepted || result.alert.has_value()) {
        refresh_locked(*entry);
    }
    return result.accepted;
}

bool RideMonitor::expire_check_in(const std::string& ride_id, const std::string& check_in_id) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    const SafetySettings safety = safety_settings(entry->session.user_id);
    std::lock_guard<std::mutex> guard(entry->mutex);
    CheckInResult result = check_ins_.expire(entry->session, check_in_id);
    if (!result.accepted) {
        return false;
    }
    if (result.alert.has_value()) {
        raise_locked(*entry, *result.alert, safety);
    }
    refresh_locked(*entry);
    return true;
}

std::optional<RoutePoint> RideMonitor::current_location(const SessionEntry& entry) {
    if (collaborators_.location) {
        try {
            auto fix = collaborators_.location->sample(settings_.monitoring.location_timeout_s);
            if (fix.has_value()) {
                return fix;
            }
        } catch (const std::exception& exc) {
            logger_.warn("check_in_location_failed", {{"ride_id", entry.session.ride_id}, {"error", exc.what()}});
        }
    }
    return std::nullopt;
}

bool RideMonitor::perform_manual_check_in(const std::string& ride_id, bool is_ok,
                                          std::optional<std::string> message) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    const SafetySettings safety = safety_settings(entry->session.user_id);
    std::optional<RoutePoint> location = current_location(*entry);

    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!entry->session.is_active) {
        return false;
    }
    if (!location.has_value() && !entry->session.actual_route.empty()) {
        location = entry->session.actual_route.back();
    }
    if (!location.has_value()) {
        logger_.warn("manual_check_in_without_location", {{"ride_id", ride_id}});
        return false;
    }
    CheckInResult result = check_ins_.record_manual(entry->session, is_ok, *location, std::move(message));
    if (result.alert.has_value()) {
        raise_locked(*entry, *result.alert, safety);
    }
    refresh_locked(*entry);
    return result.accepted;
}

std::optional<SafetyAlert> RideMonitor::trigger_panic(const std::string& ride_id) {
    auto entry = find(ride_id);
    if (!entry) {
        return std::nullopt;
    }
    const SafetySettings safety = safety_settings(entry->session.user_id);
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!entry->session.is_active) {
        return std::nullopt;
    }
    AlertRequest request;
    request.type = AlertType::kPanicButton;
    request.severity = Severity::kCritical;
    request.description = "Passenger activated the panic button";
    const EmergencySettings emergency = emergency_settings(entry->session.user_id);
    SafetyAlert alert = alerts_.raise(entry->session, request, safety, emergency);
    refresh_locked(*entry);
    return alert;
}

bool RideMonitor::acknowledge_alert(const std::string& ride_id, const std::string& alert_id,
                                    const std::string& actor) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!alerts_.acknowledge(entry->session, alert_id, actor)) {
        return false;
    }
    refresh_locked(*entry);
    return true;
}

bool RideMonitor::resolve_alert(const std::string& ride_id, const std::string& alert_id) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!alerts_.resolve(entry->session, alert_id)) {
        return false;
    }
    refresh_locked(*entry);
    return true;
}

bool RideMonitor::mark_false_alarm(const std::string& ride_id, const std::string& alert_id) {
    auto entry = find(ride_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (!alerts_.mark_false_alarm(entry->session, alert_id)) {
        return false;
    }
    refresh_locked(*entry);
    return true;
}

std::optional<MonitoringSession> RideMonitor::get_session(const std::string& ride_id) const {
    auto entry = find(ride_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    return entry->session;
}

std::vector<MonitoringSession> RideMonitor::active_sessions() const {
    std::vector<std::shared_ptr<SessionEntry>> entries;
    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        for (const auto& [ride_id, entry] : sessions_) {
            entries.push_back(entry);
        }
    }
    std::vector<MonitoringSession> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> guard(entry->mutex);
        result.push_back(entry->session);
    }
    return result;
}

void RideMonitor::set_incident_manager(std::shared_ptr<EmergencyIncidentManager> incidents) {
    std::lock_guard<std::mutex> guard(incidents_mutex_);
    incidents_ = std::move(incidents);
}

void RideMonitor::stop_all() {
    std::vector<std::string> rides;
    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        for (const auto& [ride_id, entry] : sessions_) {
            rides.push_back(ride_id);
        }
    }
    for (const auto& ride_id : rides) {
        stop_monitoring(ride_id);
    }
}

std::shared_ptr<RideMonitor::SessionEntry> RideMonitor::find(const std::string& ride_id) const {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    auto it = sessions_.find(ride_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

SafetySettings RideMonitor::safety_settings(const std::string& user_id) const {
    if (!collaborators_.settings) {
        return default_safety_settings(user_id);
    }
    return collaborators_.settings->safety(user_id);
}

EmergencySettings RideMonitor::emergency_settings(const std::string& user_id) const {
    if (!collaborators_.settings) {
        return default_emergency_settings(user_id);
    }
    return collaborators_.settings->emergency(user_id);
}

std::optional<std::string> RideMonitor::escalate(const MonitoringSession& session, const SafetyAlert& alert) {
    std::shared_ptr<EmergencyIncidentManager> incidents;
    {
        std::lock_guard<std::mutex> guard(incidents_mutex_);
        incidents = incidents_;
    }
    if (!incidents) {
        logger_.warn("escalation_unavailable", {{"ride_id", session.ride_id}, {"alert_id", alert.id}});
        return std::nullopt;
    }

    RoutePoint location;
    location.timestamp = alert.triggered_at;
    if (alert.location.has_value()) {
        location = *alert.location;
    } else if (!session.actual_route.empty()) {
        location = session.actual_route.back();
    } else if (!session.planned_route.empty()) {
        location = session.planned_route.front();
    }

    const IncidentType type =
        alert.type == AlertType::kPanicButton ? IncidentType::kPanic : IncidentType::kSos;
    IncidentOptions options;
    options.ride_id = session.ride_id;
    options.description = alert.description;
    EmergencyIncident incident = incidents->create_incident(session.user_id, type, location, options);
    logger_.warn("alert_escalated", {{"ride_id", session.ride_id},
                                     {"alert_id", alert.id},
                                     {"incident_id", incident.id}});
    return incident.id;
}

}  // namespace ridesafe
