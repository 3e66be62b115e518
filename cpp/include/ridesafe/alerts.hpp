#ifndef RIDESAFE_ALERTS_HPP
#define RIDESAFE_ALERTS_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ridesafe/channels.hpp"
#include "ridesafe/common.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/settings.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

// Turns a critical alert into an emergency incident. Returns the incident id,
// or std::nullopt when no incident could be recorded.
class EscalationHandler {
public:
    virtual ~EscalationHandler() = default;
    virtual std::optional<std::string> escalate(const MonitoringSession& session, const SafetyAlert& alert) = 0;
};

// Alert lifecycle: active -> {acknowledged, resolved, false_alarm}, all terminal.
// Creation runs the severity tier of response actions; each action is
// attempted and recorded independently.
class SafetyAlertEngine {
public:
    explicit SafetyAlertEngine(std::shared_ptr<NotificationChannels> channels, ClockFn clock = system_clock(),
                               Logger logger = get_logger("SafetyAlertEngine"));

    void set_escalation_handler(std::shared_ptr<EscalationHandler> handler);

    SafetyAlert raise(MonitoringSession& session, const AlertRequest& request, const SafetySettings& safety,
                      const EmergencySettings& emergency);

    bool acknowledge(MonitoringSession& session, const std::string& alert_id, const std::string& actor);
    bool resolve(MonitoringSession& session, const std::string& alert_id);
    bool mark_false_alarm(MonitoringSession& session, const std::string& alert_id);

private:
    std::vector<AlertAction> execute_actions(const MonitoringSession& session, const SafetyAlert& alert,
                                             const SafetySettings& safety, const EmergencySettings& emergency);
    AlertAction make_action(AlertActionType type, std::string details, bool success) const;
    SafetyAlert* find_active(MonitoringSession& session, const std::string& alert_id) const;
    std::shared_ptr<EscalationHandler> escalation_handler() const;

    std::shared_ptr<NotificationChannels> channels_;
    ClockFn clock_;
    Logger logger_;
    mutable std::mutex handler_mutex_;
    std::shared_ptr<EscalationHandler> escalation_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_ALERTS_HPP
