#ifndef RIDESAFE_MONITOR_HPP
#define RIDESAFE_MONITOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ridesafe/alerts.hpp"
#include "ridesafe/behavior.hpp"
#include "ridesafe/channels.hpp"
#include "ridesafe/checkin.hpp"
#include "ridesafe/common.hpp"
#include "ridesafe/config.hpp"
#include "ridesafe/deviation.hpp"
#include "ridesafe/incidents.hpp"
#include "ridesafe/location.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/persistence.hpp"
#include "ridesafe/risk.hpp"
#include "ridesafe/settings.hpp"
#include "ridesafe/tasks.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

struct MonitorCollaborators {
    std::shared_ptr<LocationProvider> location;
    std::shared_ptr<SettingsResolver> settings;
    std::shared_ptr<NotificationChannels> channels;
    std::shared_ptr<AsyncRecordWriter> writer;
};

// Registry of live monitoring sessions keyed by ride id. Each session has its
// own lock and task group; a fix is folded through deviation, behavior, alert
// and risk evaluation as one step under that lock.
class RideMonitor {
public:
    explicit RideMonitor(MonitorCollaborators collaborators, RideSafeSettings settings = {},
                         ClockFn clock = system_clock(), Logger logger = get_logger("RideMonitor"));
    ~RideMonitor();

    RideMonitor(const RideMonitor&) = delete;
    RideMonitor& operator=(const RideMonitor&) = delete;

    // std::nullopt if the ride is already monitored or the user disabled
    // monitoring. Without background tasks the caller drives the session.
    std::optional<MonitoringSession> start_monitoring(const std::string& ride_id, const std::string& user_id,
                                                      const std::string& driver_id,
                                                      std::vector<RoutePoint> planned_route,
                                                      bool run_background_tasks = true);
    bool stop_monitoring(const std::string& ride_id);

    // False for unknown rides and out-of-order fixes.
    bool process_fix(const std::string& ride_id, const RoutePoint& fix);

    // One location cycle: sample, then process the fix if there was one.
    bool poll_location(const std::string& ride_id);

    std::optional<SafetyCheckIn> prompt_check_in(const std::string& ride_id,
                                                 CheckInType type = CheckInType::kPrompted);
    bool respond_to_check_in(const std::string& ride_id, const std::string& check_in_id, bool is_ok,
                             std::optional<std::string> message = std::nullopt);
    bool expire_check_in(const std::string& ride_id, const std::string& check_in_id);
    bool perform_manual_check_in(const std::string& ride_id, bool is_ok,
                                 std::optional<std::string> message = std::nullopt);

    std::optional<SafetyAlert> trigger_panic(const std::string& ride_id);
    bool acknowledge_alert(const std::string& ride_id, const std::string& alert_id, const std::string& actor);
    bool resolve_alert(const std::string& ride_id, const std::string& alert_id);
    bool mark_false_alarm(const std::string& ride_id, const std::string& alert_id);

    std::optional<MonitoringSession> get_session(const std::string& ride_id) const;
    std::vector<MonitoringSession> active_sessions() const;

    // Critical alerts are escalated through this manager when escalation is enabled.
    void set_incident_manager(std::shared_ptr<EmergencyIncidentManager> incidents);

    void stop_all();

private:
    struct SessionEntry {
        std::mutex mutex;
        MonitoringSession session;
        std::mutex sample_mutex;
        std::unique_ptr<LocationSampler> sampler;
        std::unique_ptr<TaskGroup> tasks;
    };

    class IncidentEscalation;

    std::shared_ptr<SessionEntry> find(const std::string& ride_id) const;
    SafetySettings safety_settings(const std::string& user_id) const;
    EmergencySettings emergency_settings(const std::string& user_id) const;
    std::optional<RoutePoint> current_location(const SessionEntry& entry);

    // The *_locked helpers require the entry's mutex.
    bool apply_fix_locked(SessionEntry& entry, const RoutePoint& fix, const SafetySettings& safety);
    void raise_locked(SessionEntry& entry, const AlertRequest& request, const SafetySettings& safety);
    void refresh_locked(SessionEntry& entry);

    std::optional<std::string> escalate(const MonitoringSession& session, const SafetyAlert& alert);

    MonitorCollaborators collaborators_;
    RideSafeSettings settings_;
    ClockFn clock_;
    Logger logger_;

    RouteDeviationDetector deviation_;
    DriverBehaviorAnalyzer behavior_;
    RiskAggregator risk_;
    CheckInScheduler check_ins_;
    SafetyAlertEngine alerts_;

    mutable std::mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<SessionEntry>> sessions_;

    mutable std::mutex incidents_mutex_;
    std::shared_ptr<EmergencyIncidentManager> incidents_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_MONITOR_HPP
