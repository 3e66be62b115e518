#ifndef RIDESAFE_DEVIATION_HPP
#define RIDESAFE_DEVIATION_HPP

#include <optional>

#include "ridesafe/config.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

enum class DeviationChange {
    kNone,
    kOpened,
    kExtended,
    kResolved,
};

struct DeviationUpdate {
    DeviationChange change = DeviationChange::kNone;
    double distance_from_route = 0.0;
    std::optional<AlertRequest> alert;
};

// Opens, extends and closes off-route episodes. A session holds at most one
// unresolved RouteDeviation, always the last element of its deviations.
class RouteDeviationDetector {
public:
    explicit RouteDeviationDetector(DeviationConfig config = {}, RouteMatch match = RouteMatch::kVertex);

    DeviationUpdate evaluate(MonitoringSession& session, const RoutePoint& position, double threshold_m) const;

    // Distance from the planned route, or std::nullopt without a route.
    std::optional<double> distance_from_route(const MonitoringSession& session, const RoutePoint& position) const;

private:
    DeviationConfig config_;
    RouteMatch match_ = RouteMatch::kVertex;
};

RouteDeviation* open_deviation(MonitoringSession& session);
const RouteDeviation* open_deviation(const MonitoringSession& session);

}  // namespace ridesafe

#endif  // RIDESAFE_DEVIATION_HPP
