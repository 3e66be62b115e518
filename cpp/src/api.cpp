#include "ridesafe/api.hpp"

namespace ridesafe {

RideSafeRuntime build_runtime(RuntimeCollaborators collaborators, std::shared_ptr<RideSafeSettings> settings,
                              ClockFn clock, Logger logger) {
    auto effective_settings = settings ? std::move(settings) : std::make_shared<RideSafeSettings>();
    configure_logging(effective_settings->logging);

    if (!collaborators.settings_store) {
        collaborators.settings_store = std::make_shared<InMemorySettingsStore>();
    }
    if (!collaborators.channels) {
        collaborators.channels = std::make_shared<LoggingNotificationChannels>();
    }
    if (!collaborators.dispatch) {
        collaborators.dispatch = std::make_shared<LoggingDispatchService>(8.0 * 60.0, clock);
    }
    if (!collaborators.repository) {
        if (effective_settings->persistence.path.has_value()) {
            collaborators.repository =
                std::make_shared<JsonLinesRepository>(*effective_settings->persistence.path);
        } else {
            collaborators.repository = std::make_shared<InMemoryRepository>();
        }
    }

    auto resolver = std::make_shared<SettingsResolver>(collaborators.settings_store);
    auto writer = std::make_shared<AsyncRecordWriter>(collaborators.repository);
    writer->start();

    IncidentCollaborators incident_collaborators{resolver,
                                                 collaborators.location,
                                                 collaborators.channels,
                                                 collaborators.dispatch,
                                                 collaborators.media,
                                                 writer};
    auto incidents = std::make_shared<EmergencyIncidentManager>(std::move(incident_collaborators),
                                                                effective_settings->incident, clock);

    MonitorCollaborators monitor_collaborators{collaborators.location, resolver, collaborators.channels, writer};
    auto monitor = std::make_shared<RideMonitor>(std::move(monitor_collaborators), *effective_settings, clock);
    monitor->set_incident_manager(incidents);

    logger.info("runtime_ready", {{"persistence", effective_settings->persistence.path.value_or("memory")},
                                  {"escalation", effective_settings->monitoring.escalate_critical_alerts
                                                     ? "enabled"
                                                     : "disabled"}});
    return RideSafeRuntime{effective_settings, resolver, writer, incidents, monitor};
}

void shutdown_runtime(RideSafeRuntime& runtime) {
    if (runtime.monitor) {
        runtime.monitor->stop_all();
    }
    if (runtime.incidents) {
        runtime.incidents->shutdown();
    }
    if (runtime.writer) {
        runtime.writer->flush();
        runtime.writer->stop();
    }
}

}  // namespace ridesafe
