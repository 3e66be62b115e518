#ifndef RIDESAFE_LOCATION_HPP
#define RIDESAFE_LOCATION_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ridesafe/common.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

// Best-effort positional source. Returns std::nullopt when no fix is available
// within the timeout; may also throw. One provider is shared by every session
// poll loop and incident tracker, so sample() must be thread-safe.
class LocationProvider {
public:
    virtual ~LocationProvider() = default;
    virtual std::optional<RoutePoint> sample(double timeout_s) = 0;
};

using LineSource = std::function<std::optional<std::string>()>;

LineSource open_line_source(const std::string& path);

// Finite coordinates and timestamp, latitude and longitude in range.
bool is_valid_fix(const RoutePoint& point);

// $GPRMC / $GNRMC; knots to m/s.
std::optional<RoutePoint> parse_rmc(const std::string& line);

// "lat,lon,timestamp[,speed_mps[,heading_deg[,accuracy_m]]]".
std::optional<RoutePoint> parse_csv_point(const std::string& line);

std::vector<RoutePoint> load_route_csv(const std::string& path);

// Replays fixes from a line source. Lines may be NMEA RMC or CSV points;
// unparseable lines count as "no fix this cycle".
class ReplayLocationProvider : public LocationProvider {
public:
    explicit ReplayLocationProvider(LineSource source, Logger logger = get_logger("ReplayLocationProvider"));

    std::optional<RoutePoint> sample(double timeout_s) override;
    bool exhausted() const;

private:
    LineSource source_;
    Logger logger_;
    mutable std::mutex mutex_;
    bool exhausted_ = false;
};

struct SampleOutcome {
    std::optional<RoutePoint> point;
    int consecutive_failures = 0;
    // Set on the single cycle where an outage crosses the loss threshold.
    bool communication_lost = false;
};

class LocationSampler {
public:
    LocationSampler(std::shared_ptr<LocationProvider> provider, double timeout_s, int loss_cycles,
                    Logger logger = get_logger("LocationSampler"));

    SampleOutcome sample();
    int consecutive_failures() const;

private:
    SampleOutcome record_failure();

    std::shared_ptr<LocationProvider> provider_;
    double timeout_s_ = 10.0;
    int loss_cycles_ = 4;
    int failures_ = 0;
    bool loss_reported_ = false;
    Logger logger_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_LOCATION_HPP
