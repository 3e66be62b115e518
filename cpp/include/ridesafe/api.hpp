#ifndef RIDESAFE_API_HPP
#define RIDESAFE_API_HPP

#include <memory>

#include "ridesafe/channels.hpp"
#include "ridesafe/common.hpp"
#include "ridesafe/config.hpp"
#include "ridesafe/incidents.hpp"
#include "ridesafe/location.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/monitor.hpp"
#include "ridesafe/persistence.hpp"
#include "ridesafe/settings.hpp"

namespace ridesafe {

// External systems the core talks to. Unset members get development defaults:
// log-only channels and dispatch, an in-memory settings store, and a
// repository chosen from the [persistence] section.
struct RuntimeCollaborators {
    std::shared_ptr<LocationProvider> location;
    std::shared_ptr<SettingsStore> settings_store;
    std::shared_ptr<NotificationChannels> channels;
    std::shared_ptr<DispatchService> dispatch;
    std::shared_ptr<MediaCapture> media;
    std::shared_ptr<Repository> repository;
};

struct RideSafeRuntime {
    std::shared_ptr<RideSafeSettings> settings;
    std::shared_ptr<SettingsResolver> resolver;
    std::shared_ptr<AsyncRecordWriter> writer;
    std::shared_ptr<EmergencyIncidentManager> incidents;
    std::shared_ptr<RideMonitor> monitor;
};

RideSafeRuntime build_runtime(RuntimeCollaborators collaborators = {},
                              std::shared_ptr<RideSafeSettings> settings = nullptr,
                              ClockFn clock = system_clock(),
                              Logger logger = get_logger("ridesafe"));

// Stops monitoring, incident tracking and the record writer, in that order.
void shutdown_runtime(RideSafeRuntime& runtime);

}  // namespace ridesafe

#endif  // RIDESAFE_API_HPP
