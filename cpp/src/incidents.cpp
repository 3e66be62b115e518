#include "ridesafe/incidents.hpp"

#include <algorithm>
#include <ctime>

namespace ridesafe {
namespace {

std::string format_utc(double timestamp) {
    const auto seconds = static_cast<std::time_t>(timestamp);
    std::tm parts{};
    gmtime_r(&seconds, &parts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &parts);
    return buffer;
}

bool engaged(ResponderStatus status) {
    return status == ResponderStatus::kResponding || status == ResponderStatus::kOnScene;
}

}  // namespace

IncidentPriority priority_for(IncidentType type) {
    switch (type) {
        case IncidentType::kSos:
        case IncidentType::kMedical:
        case IncidentType::kAccident:
            return IncidentPriority::kCritical;
        case IncidentType::kPanic:
        case IncidentType::kHarassment:
            return IncidentPriority::kHigh;
        case IncidentType::kVehicleIssue:
            return IncidentPriority::kMedium;
        case IncidentType::kOther:
            return IncidentPriority::kLow;
    }
    return IncidentPriority::kLow;
}

std::string reverse_geocode(double latitude, double longitude) {
    return format_fixed(latitude, 6) + ", " + format_fixed(longitude, 6);
}

std::string emergency_message(const EmergencyIncident& incident, const EmergencyContact& contact,
                              bool share_location) {
    std::string location = "Location not shared";
    if (share_location) {
        location = incident.location.address.value_or("Location unavailable");
    }
    return "EMERGENCY ALERT: " + contact.name +
           ", this is an automated safety message. Your emergency contact has activated an emergency alert. "
           "Type: " + to_string(incident.type) + ". Location: " + location + ". Time: " +
           format_utc(incident.timestamp) +
           ". Please contact them immediately or call emergency services if needed.";
}

EmergencyIncidentManager::EmergencyIncidentManager(IncidentCollaborators collaborators, IncidentConfig config,
                                                   ClockFn clock, Logger logger)
    : collaborators_(std::move(collaborators)),
      config_(config),
      clock_(std::move(clock)),
      logger_(std::move(logger)) {}

EmergencyIncidentManager::~EmergencyIncidentManager() {
    shutdown();
}

EmergencyIncident EmergencyIncidentManager::create_incident(const std::string& user_id, IncidentType type,
                                                            const RoutePoint& location,
                                                            const IncidentOptions& options) {
    EmergencySettings settings = collaborators_.settings ? collaborators_.settings->emergency(user_id)
                                                         : default_emergency_settings(user_id);
    const double now = clock_();

    EmergencyIncident incident;
    incident.id = make_id("emergency", now);
    incident.user_id = user_id;
    incident.ride_id = options.ride_id;
    incident.type = type;
    incident.status = IncidentStatus::kActive;
    incident.priority = priority_for(type);
    incident.location.latitude = location.latitude;
    incident.location.longitude = location.longitude;
    incident.location.accuracy = location.accuracy;
    incident.location.address = reverse_geocode(location.latitude, location.longitude);
    incident.timestamp = now;
    incident.description = options.description;
    for (const auto& contact : settings.emergency_contacts) {
        if (contact.is_active) {
            incident.emergency_contacts.push_back(contact.id);
        }
    }
    append_event(incident, TimelineEventType::kIncidentCreated, "Emergency incident created: " + to_string(type),
                 user_id);

    if (collaborators_.writer) {
        WriteResult result = collaborators_.writer->write_now(incident);
        if (!result.ok) {
            logger_.error("incident_record_failed", {{"user_id", user_id},
                                                     {"type", to_string(type)},
                                                     {"error", result.error}});
            throw IncidentError("Emergency incident could not be recorded: " + result.error);
        }
    }
    logger_.warn("incident_created", {{"incident_id", incident.id},
                                      {"user_id", user_id},
                                      {"type", to_string(type)},
                                      {"priority", to_string(incident.priority)}});

    const bool discrete = options.discrete_mode || settings.discrete_mode;

    start_tracking(incident);
    if (!discrete) {
        notify_contacts(incident, settings);
    }
    if (settings.auto_call_emergency_services && incident.priority == IncidentPriority::kCritical) {
        contact_emergency_services(incident);
    }
    assign_internal_responders(incident);
    if (!discrete) {
        capture_media(incident, settings);
    }
    if (incident.ride_id.has_value()) {
        notify_driver(incident);
    }

    {
        std::lock_guard<std::mutex> guard(mutex_);
        incidents_[incident.id] = incident;
    }
    persist(incident);
    return incident;
}

void EmergencyIncidentManager::start_tracking(EmergencyIncident& incident) {
    try {
        auto tasks = std::make_unique<TaskGroup>("incident:" + incident.id, logger_);
        const std::string incident_id = incident.id;
        tasks->spawn_periodic("location_tracking", config_.tracking_interval_s,
                              [this, incident_id] { track_location(incident_id); });

        std::unique_ptr<TaskGroup> previous;
        {
            std::lock_guard<std::mutex> guard(tracking_mutex_);
            auto& slot = tracking_[incident.user_id];
            previous = std::move(slot.tasks);
            slot.incident_id = incident.id;
            slot.tasks = std::move(tasks);
        }
        if (previous) {
            previous->cancel();
        }
        append_event(incident, TimelineEventType::kTrackingStarted, "Continuous location tracking started", "system",
                     {{"interval_s", format_fixed(config_.tracking_interval_s, 1)}});
    } catch (const std::exception& exc) {
        record_step_failure(incident, TimelineEventType::kTrackingStarted, "location_tracking", exc);
    }
}

void EmergencyIncidentManager::stop_tracking(const std::string& user_id, const std::string& incident_id) {
    std::unique_ptr<TaskGroup> tasks;
    {
        std::lock_guard<std::mutex> guard(tracking_mutex_);
        auto it = tracking_.find(user_id);
        if (it == tracking_.end() || it->second.incident_id != incident_id) {
            return;
        }
        tasks = std::move(it->second.tasks);
        tracking_.erase(it);
    }
    if (tasks) {
        tasks->cancel();
    }
    logger_.info("incident_tracking_stopped", {{"incident_id", incident_id}});
}

void EmergencyIncidentManager::track_location(const std::string& incident_id) {
    if (!collaborators_.location) {
        return;
    }
    std::optional<RoutePoint> fix;
    try {
        fix = collaborators_.location->sample(config_.tracking_interval_s);
    } catch (const std::exception& exc) {
        logger_.warn("incident_location_failed", {{"incident_id", incident_id}, {"error", exc.what()}});
        return;
    }
    if (!fix.has_value() || !is_valid_fix(*fix)) {
        return;
    }

    EmergencyIncident snapshot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end() || is_terminal(it->second.status)) {
            return;
        }
        auto& location = it->second.location;
        location.latitude = fix->latitude;
        location.longitude = fix->longitude;
        location.accuracy = fix->accuracy;
        location.address = reverse_geocode(fix->latitude, fix->longitude);
        snapshot = it->second;
    }
    logger_.debug("incident_location_updated", {{"incident_id", incident_id},
                                                {"latitude", format_fixed(fix->latitude, 6)},
                                                {"longitude", format_fixed(fix->longitude, 6)}});
    persist(snapshot);
}

void EmergencyIncidentManager::notify_contacts(EmergencyIncident& incident, const EmergencySettings& settings) {
    for (const auto& contact : settings.emergency_contacts) {
        if (!contact.is_active) {
            continue;
        }
        try {
            if (!collaborators_.channels) {
                throw std::runtime_error("no notification channel configured");
            }
            const std::string message = emergency_message(incident, contact, settings.share_location_with_contacts);
            std::vector<std::string> channels;
            if (contact.preferences.sms) {
                collaborators_.channels->send_sms(contact.phone_number, message);
                channels.push_back("sms");
            }
            if (contact.preferences.call && contact.is_primary) {
                collaborators_.channels->place_call(contact.phone_number, "Emergency incident " + incident.id);
                channels.push_back("call");
            }
            if (contact.preferences.email) {
                collaborators_.channels->send_email(contact, message);
                channels.push_back("email");
            }
            std::string joined;
            for (const auto& channel : channels) {
                joined += joined.empty() ? channel : "," + channel;
            }
            append_event(incident, TimelineEventType::kContactsNotified,
                         "Notified emergency contact: " + contact.name, "system",
                         {{"contact_id", contact.id}, {"channels", joined}});
        } catch (const std::exception& exc) {
            logger_.error("contact_notification_failed",
                          {{"incident_id", incident.id}, {"contact_id", contact.id}, {"error", exc.what()}});
            append_event(incident, TimelineEventType::kContactsNotified,
                         "Failed to notify emergency contact: " + contact.name, "system",
                         {{"contact_id", contact.id}, {"success", "false"}, {"error", exc.what()}});
        }
    }
}

void EmergencyIncidentManager::contact_emergency_services(EmergencyIncident& incident) {
    try {
        if (!collaborators_.dispatch) {
            throw std::runtime_error("no dispatch service configured");
        }
        EmergencyResponder responder = collaborators_.dispatch->contact_emergency_services(incident);
        responder.type = ResponderType::kEmergencyServices;
        if (responder.id.empty()) {
            responder.id = make_id("responder", clock_());
        }
        incident.responders.push_back(responder);
        append_event(incident, TimelineEventType::kServicesContacted, "Emergency services have been contacted",
                     "system", {{"responder_id", responder.id}});
    } catch (const std::exception& exc) {
        record_step_failure(incident, TimelineEventType::kServicesContacted, "emergency_services", exc);
    }
}

void EmergencyIncidentManager::assign_internal_responders(EmergencyIncident& incident) {
    try {
        const double now = clock_();
        if (incident.priority == IncidentPriority::kHigh || incident.priority == IncidentPriority::kCritical) {
            EmergencyResponder security;
            security.id = make_id("responder", now);
            security.type = ResponderType::kSecurityTeam;
            security.name = "Security Team";
            security.status = ResponderStatus::kNotified;
            security.estimated_arrival = now + 15.0 * 60.0;
            incident.responders.push_back(security);
        }
        EmergencyResponder support;
        support.id = make_id("responder", now);
        support.type = ResponderType::kSupportAgent;
        support.name = "Emergency Support Agent";
        support.status = ResponderStatus::kNotified;
        incident.responders.push_back(support);

        append_event(incident, TimelineEventType::kResponderAssigned, "Internal responders have been assigned");
    } catch (const std::exception& exc) {
        record_step_failure(incident, TimelineEventType::kResponderAssigned, "internal_responders", exc);
    }
}

void EmergencyIncidentManager::capture_media(EmergencyIncident& incident, const EmergencySettings& settings) {
    if (settings.auto_record_audio) {
        try {
            if (!collaborators_.media) {
                throw std::runtime_error("no media capture configured");
            }
            auto recording = collaborators_.media->start_audio_recording(incident.id);
            incident.media.push_back(recording);
            append_event(incident, TimelineEventType::kMediaCapture, "Audio recording started", "system",
                         {{"media", recording}});
        } catch (const std::exception& exc) {
            record_step_failure(incident, TimelineEventType::kMediaCapture, "audio_recording", exc);
        }
    }
    if (settings.auto_take_photos) {
        try {
            if (!collaborators_.media) {
                throw std::runtime_error("no media capture configured");
            }
            auto photos = collaborators_.media->capture_photos(incident.id);
            incident.media.insert(incident.media.end(), photos.begin(), photos.end());
            append_event(incident, TimelineEventType::kMediaCapture, "Emergency photos captured", "system",
                         {{"count", std::to_string(photos.size())}});
        } catch (const std::exception& exc) {
            record_step_failure(incident, TimelineEventType::kMediaCapture, "photo_capture", exc);
        }
    }
}

void EmergencyIncidentManager::notify_driver(EmergencyIncident& incident) {
    try {
        if (!collaborators_.channels) {
            throw std::runtime_error("no notification channel configured");
        }
        collaborators_.channels->notify_driver(*incident.ride_id,
                                               "Passenger reported an emergency (" + to_string(incident.type) +
                                                   "). Incident " + incident.id);
        append_event(incident, TimelineEventType::kDriverNotified, "Driver notified of emergency incident",
                     "system", {{"ride_id", *incident.ride_id}});
    } catch (const std::exception& exc) {
        record_step_failure(incident, TimelineEventType::kDriverNotified, "driver_notification", exc);
    }
}

bool EmergencyIncidentManager::resolve_incident(const std::string& incident_id, const std::string& resolved_by,
                                                const std::string& resolution, bool follow_up_required,
                                                IncidentOutcome outcome) {
    EmergencyIncident snapshot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end() || is_terminal(it->second.status)) {
            logger_.warn("incident_resolve_rejected", {{"incident_id", incident_id}});
            return false;
        }
        auto& incident = it->second;
        const double now = clock_();
        incident.status =
            outcome == IncidentOutcome::kFalseAlarm ? IncidentStatus::kFalseAlarm : IncidentStatus::kResolved;
        incident.resolution = IncidentResolution{now, resolved_by, resolution, follow_up_required};
        const std::string prefix =
            outcome == IncidentOutcome::kFalseAlarm ? "Incident marked as false alarm: " : "Incident resolved: ";
        append_event(incident, TimelineEventType::kResolved, prefix + resolution, resolved_by);
        snapshot = incident;
    }
    stop_tracking(snapshot.user_id, incident_id);
    logger_.info("incident_resolved", {{"incident_id", incident_id},
                                       {"status", to_string(snapshot.status)},
                                       {"resolved_by", resolved_by}});
    persist(snapshot);
    return true;
}

bool EmergencyIncidentManager::update_responder_status(const std::string& incident_id,
                                                       const std::string& responder_id, ResponderStatus status) {
    EmergencyIncident snapshot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end() || is_terminal(it->second.status)) {
            return false;
        }
        auto& incident = it->second;
        auto responder = std::find_if(incident.responders.begin(), incident.responders.end(),
                                      [&](const EmergencyResponder& r) { return r.id == responder_id; });
        if (responder == incident.responders.end()) {
            return false;
        }
        responder->status = status;
        append_event(incident, TimelineEventType::kStatusUpdate,
                     responder->name + " is " + to_string(status), "system",
                     {{"responder_id", responder_id}, {"status", to_string(status)}});
        if (incident.status == IncidentStatus::kActive && engaged(status)) {
            incident.status = IncidentStatus::kResponding;
            append_event(incident, TimelineEventType::kStatusUpdate, "Responders are en route");
        }
        snapshot = incident;
    }
    persist(snapshot);
    return true;
}

bool EmergencyIncidentManager::add_responder(const std::string& incident_id, EmergencyResponder responder) {
    EmergencyIncident snapshot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end() || is_terminal(it->second.status)) {
            return false;
        }
        auto& incident = it->second;
        if (responder.id.empty()) {
            responder.id = make_id("responder", clock_());
        }
        append_event(incident, TimelineEventType::kResponderAssigned, "Responder assigned: " + responder.name,
                     "system", {{"responder_id", responder.id}, {"type", to_string(responder.type)}});
        incident.responders.push_back(std::move(responder));
        if (incident.status == IncidentStatus::kActive) {
            incident.status = IncidentStatus::kResponding;
        }
        snapshot = incident;
    }
    persist(snapshot);
    return true;
}

std::optional<EmergencyIncident> EmergencyIncidentManager::get_incident(const std::string& incident_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EmergencyIncident> EmergencyIncidentManager::active_incidents(
    const std::optional<std::string>& user_id) const {
    std::vector<EmergencyIncident> result;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (const auto& [id, incident] : incidents_) {
            if (is_terminal(incident.status)) {
                continue;
            }
            if (user_id.has_value() && incident.user_id != *user_id) {
                continue;
            }
            result.push_back(incident);
        }
    }
    std::sort(result.begin(), result.end(), [](const EmergencyIncident& a, const EmergencyIncident& b) {
        return a.timestamp > b.timestamp;
    });
    return result;
}

void EmergencyIncidentManager::shutdown() {
    std::map<std::string, Tracking> tracking;
    {
        std::lock_guard<std::mutex> guard(tracking_mutex_);
        tracking.swap(tracking_);
    }
    for (auto& [user, entry] : tracking) {
        if (entry.tasks) {
            entry.tasks->cancel();
        }
    }
}

void EmergencyIncidentManager::append_event(EmergencyIncident& incident, TimelineEventType type,
                                            std::string description, std::string actor, Attributes data) const {
    const double now = clock_();
    incident.timeline.push_back(
        TimelineEvent{make_id("timeline", now), now, type, std::move(description), std::move(actor), std::move(data)});
}

void EmergencyIncidentManager::record_step_failure(EmergencyIncident& incident, TimelineEventType type,
                                                   const std::string& step, const std::exception& exc) const {
    logger_.error("incident_step_failed", {{"incident_id", incident.id}, {"step", step}, {"error", exc.what()}});
    append_event(incident, type, "Response step failed: " + step, "system",
                 {{"success", "false"}, {"error", exc.what()}});
}

void EmergencyIncidentManager::persist(const EmergencyIncident& incident) {
    if (collaborators_.writer) {
        collaborators_.writer->enqueue(incident);
    }
}

}  // namespace ridesafe
