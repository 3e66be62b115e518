#ifndef RIDESAFE_CHECKIN_HPP
#define RIDESAFE_CHECKIN_HPP

#include <optional>
#include <string>

#include "ridesafe/common.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

struct CheckInResult {
    bool accepted = false;
    std::optional<AlertRequest> alert;
};

// pending -> completed (response in time) or pending -> missed (deadline
// passed). Completed and missed are terminal.
class CheckInScheduler {
public:
    explicit CheckInScheduler(double response_timeout_s = 30.0, ClockFn clock = system_clock(),
                              Logger logger = get_logger("CheckInScheduler"));

    // Appends a pending check-in and returns a copy of it.
    SafetyCheckIn prompt(MonitoringSession& session, CheckInType type);

    // A response after the deadline expires the check-in instead and is rejected.
    CheckInResult respond(MonitoringSession& session, const std::string& check_in_id, bool is_ok,
                          const RoutePoint& location, std::optional<std::string> message = std::nullopt);

    // No-op unless the check-in is still pending.
    CheckInResult expire(MonitoringSession& session, const std::string& check_in_id);

    // Passenger-initiated check-in, completed on creation.
    CheckInResult record_manual(MonitoringSession& session, bool is_ok, const RoutePoint& location,
                                std::optional<std::string> message = std::nullopt);

    double response_timeout_s() const { return response_timeout_s_; }

private:
    SafetyCheckIn* find(MonitoringSession& session, const std::string& check_in_id) const;
    CheckInResult complete(MonitoringSession& session, SafetyCheckIn& check_in, bool is_ok,
                           const RoutePoint& location, std::optional<std::string> message, double now) const;

    double response_timeout_s_ = 30.0;
    ClockFn clock_;
    Logger logger_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_CHECKIN_HPP
