#ifndef RIDESAFE_BEHAVIOR_HPP
#define RIDESAFE_BEHAVIOR_HPP

#include <vector>

#include "ridesafe/config.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

// Derives speed, acceleration and turn rate from the tail of the actual route
// and folds violations into the session's DriverBehaviorMetrics. Call once per
// appended fix; replaying the same fix sequence yields the same metrics.
class DriverBehaviorAnalyzer {
public:
    explicit DriverBehaviorAnalyzer(BehaviorConfig config = {});

    std::vector<AlertRequest> analyze(MonitoringSession& session, double violation_tolerance_pct) const;

    double score(const DriverBehaviorMetrics& metrics) const;
    RiskLevel risk_level(double score) const;

private:
    bool extended_stop_reached(const std::vector<RoutePoint>& route) const;

    BehaviorConfig config_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_BEHAVIOR_HPP
