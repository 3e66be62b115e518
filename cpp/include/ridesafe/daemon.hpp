#ifndef RIDESAFE_DAEMON_HPP
#define RIDESAFE_DAEMON_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "ridesafe/api.hpp"
#include "ridesafe/location.hpp"

namespace ridesafe {

struct DaemonConfig {
    std::string ride_id = "ride-local";
    std::string user_id = "user-local";
    std::string driver_id = "driver-local";
    std::vector<RoutePoint> planned_route;
    // Pause between replayed fixes; zero replays as fast as possible.
    double step_interval_s = 0.0;
};

// Replays a recorded fix stream through one monitoring session.
class RideSafeDaemon {
public:
    RideSafeDaemon(RideSafeRuntime runtime, std::shared_ptr<ReplayLocationProvider> replay, DaemonConfig config);

    // Returns once the replay is exhausted or stop() is called.
    void run();
    void stop();

private:
    RideSafeRuntime runtime_;
    std::shared_ptr<ReplayLocationProvider> replay_;
    DaemonConfig config_;
    Logger logger_;
    std::atomic<bool> running_{false};
};

}  // namespace ridesafe

#endif  // RIDESAFE_DAEMON_HPP
