#ifndef RIDESAFE_RISK_HPP
#define RIDESAFE_RISK_HPP

#include "ridesafe/config.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

// Stateless fold of a session's deviations, behavior, alerts and check-ins
// into a 0-100 risk score.
class RiskAggregator {
public:
    explicit RiskAggregator(RiskConfig config = {});

    double score(const MonitoringSession& session) const;
    SessionStatus status_for(double score) const;

    // Writes score and status back; a completed session keeps its status.
    void apply(MonitoringSession& session) const;

private:
    RiskConfig config_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_RISK_HPP
