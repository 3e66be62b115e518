#include "ridesafe/daemon.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace ridesafe {

RideSafeDaemon::RideSafeDaemon(RideSafeRuntime runtime, std::shared_ptr<ReplayLocationProvider> replay,
                               DaemonConfig config)
    : runtime_(std::move(runtime)),
      replay_(std::move(replay)),
      config_(std::move(config)),
      logger_(get_logger("RideSafeDaemon")) {
    if (!runtime_.monitor || !replay_) {
        throw std::invalid_argument("RideSafeDaemon requires a monitor and a replay source");
    }
}

void RideSafeDaemon::run() {
    running_ = true;
    auto session = runtime_.monitor->start_monitoring(config_.ride_id, config_.user_id, config_.driver_id,
                                                      config_.planned_route, false);
    if (!session.has_value()) {
        shutdown_runtime(runtime_);
        throw std::runtime_error("Unable to start monitoring for ride " + config_.ride_id);
    }
    logger_.info("daemon_started", {{"ride_id", config_.ride_id},
                                    {"interval_s", format_fixed(config_.step_interval_s, 3)}});

    std::size_t cycles = 0;
    while (running_ && !replay_->exhausted()) {
        runtime_.monitor->poll_location(config_.ride_id);
        ++cycles;
        if (config_.step_interval_s > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(config_.step_interval_s));
        }
    }

    auto final_state = runtime_.monitor->get_session(config_.ride_id);
    runtime_.monitor->stop_monitoring(config_.ride_id);
    if (final_state.has_value()) {
        logger_.info("daemon_summary", {{"ride_id", config_.ride_id},
                                        {"cycles", std::to_string(cycles)},
                                        {"fixes", std::to_string(final_state->actual_route.size())},
                                        {"deviations", std::to_string(final_state->deviations.size())},
                                        {"alerts", std::to_string(final_state->alerts.size())},
                                        {"behavior_score", format_fixed(final_state->behavior.overall_score, 1)},
                                        {"risk_score", format_fixed(final_state->risk_score, 1)},
                                        {"status", to_string(final_state->status)}});
    }
    shutdown_runtime(runtime_);
    running_ = false;
}

void RideSafeDaemon::stop() {
    running_ = false;
}

}  // namespace ridesafe
