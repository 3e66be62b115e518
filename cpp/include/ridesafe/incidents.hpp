#ifndef RIDESAFE_INCIDENTS_HPP
#define RIDESAFE_INCIDENTS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ridesafe/channels.hpp"
#include "ridesafe/common.hpp"
#include "ridesafe/config.hpp"
#include "ridesafe/location.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/persistence.hpp"
#include "ridesafe/settings.hpp"
#include "ridesafe/tasks.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

// Raised when an incident could not be recorded. The caller must surface it.
class IncidentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

IncidentPriority priority_for(IncidentType type);

// Coordinates as "lat, lon" with six decimals; used when no geocoder is wired.
std::string reverse_geocode(double latitude, double longitude);

std::string emergency_message(const EmergencyIncident& incident, const EmergencyContact& contact,
                              bool share_location);

struct IncidentOptions {
    std::optional<std::string> ride_id;
    std::optional<std::string> description;
    bool discrete_mode = false;
};

enum class IncidentOutcome {
    kResolved,
    kFalseAlarm,
};

struct IncidentCollaborators {
    std::shared_ptr<SettingsResolver> settings;
    std::shared_ptr<LocationProvider> location;
    std::shared_ptr<NotificationChannels> channels;
    std::shared_ptr<DispatchService> dispatch;
    std::shared_ptr<MediaCapture> media;
    std::shared_ptr<AsyncRecordWriter> writer;
};

// active -> responding -> {resolved, false_alarm}
class EmergencyIncidentManager {
public:
    explicit EmergencyIncidentManager(IncidentCollaborators collaborators, IncidentConfig config = {},
                                      ClockFn clock = system_clock(),
                                      Logger logger = get_logger("EmergencyIncidentManager"));
    ~EmergencyIncidentManager();

    EmergencyIncidentManager(const EmergencyIncidentManager&) = delete;
    EmergencyIncidentManager& operator=(const EmergencyIncidentManager&) = delete;

    // Records the incident, then runs the response workflow. Throws
    // IncidentError if the initial write fails; workflow step failures are
    // recorded on the timeline and do not throw.
    EmergencyIncident create_incident(const std::string& user_id, IncidentType type, const RoutePoint& location,
                                      const IncidentOptions& options = {});

    bool resolve_incident(const std::string& incident_id, const std::string& resolved_by,
                          const std::string& resolution, bool follow_up_required = false,
                          IncidentOutcome outcome = IncidentOutcome::kResolved);

    bool update_responder_status(const std::string& incident_id, const std::string& responder_id,
                                 ResponderStatus status);
    bool add_responder(const std::string& incident_id, EmergencyResponder responder);

    std::optional<EmergencyIncident> get_incident(const std::string& incident_id) const;

    // Open incidents, newest first.
    std::vector<EmergencyIncident> active_incidents(const std::optional<std::string>& user_id = std::nullopt) const;

    void shutdown();

private:
    struct Tracking {
        std::string incident_id;
        std::unique_ptr<TaskGroup> tasks;
    };

    void start_tracking(EmergencyIncident& incident);
    void stop_tracking(const std::string& user_id, const std::string& incident_id);
    void track_location(const std::string& incident_id);

    void notify_contacts(EmergencyIncident& incident, const EmergencySettings& settings);
    void contact_emergency_services(EmergencyIncident& incident);
    void assign_internal_responders(EmergencyIncident& incident);
    void capture_media(EmergencyIncident& incident, const EmergencySettings& settings);
    void notify_driver(EmergencyIncident& incident);

    void append_event(EmergencyIncident& incident, TimelineEventType type, std::string description,
                      std::string actor = "system", Attributes data = {}) const;
    void record_step_failure(EmergencyIncident& incident, TimelineEventType type, const std::string& step,
                             const std::exception& exc) const;
    void persist(const EmergencyIncident& incident);

    IncidentCollaborators collaborators_;
    IncidentConfig config_;
    ClockFn clock_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::map<std::string, EmergencyIncident> incidents_;

    std::mutex tracking_mutex_;
    std::map<std::string, Tracking> tracking_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_INCIDENTS_HPP
