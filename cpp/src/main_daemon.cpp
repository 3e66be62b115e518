#include "ridesafe/api.hpp"
#include "ridesafe/config.hpp"
#include "ridesafe/daemon.hpp"
#include "ridesafe/location.hpp"
#include "ridesafe/logging.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

ridesafe::RideSafeDaemon* g_daemon = nullptr;

void handle_signal(int) {
    if (g_daemon) {
        g_daemon->stop();
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " --config <path> --route <csv> --fixes <path> [--ride <id>] [--user <id>] [--driver <id>]"
                 " [--interval <seconds>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string route_path;
    std::string fixes_path;
    ridesafe::DaemonConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            return 1;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--route") {
            route_path = argv[++i];
        } else if (arg == "--fixes") {
            fixes_path = argv[++i];
        } else if (arg == "--ride") {
            config.ride_id = argv[++i];
        } else if (arg == "--user") {
            config.user_id = argv[++i];
        } else if (arg == "--driver") {
            config.driver_id = argv[++i];
        } else if (arg == "--interval") {
            try {
                config.step_interval_s = std::stod(argv[++i]);
            } catch (const std::exception&) {
                print_usage(argv[0]);
                return 1;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty() || route_path.empty() || fixes_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto settings = std::make_shared<ridesafe::RideSafeSettings>(ridesafe::RideSafeSettings::from_toml(config_path));
        config.planned_route = ridesafe::load_route_csv(route_path);
        auto replay = std::make_shared<ridesafe::ReplayLocationProvider>(ridesafe::open_line_source(fixes_path));

        ridesafe::RuntimeCollaborators collaborators;
        collaborators.location = replay;
        auto runtime = ridesafe::build_runtime(collaborators, settings);

        ridesafe::RideSafeDaemon daemon(runtime, replay, config);
        g_daemon = &daemon;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        daemon.run();
        g_daemon = nullptr;
    } catch (const std::exception& exc) {
        g_daemon = nullptr;
        std::cerr << "ridesafed error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
