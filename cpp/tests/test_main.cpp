#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "ridesafe/alerts.hpp"
#include "ridesafe/api.hpp"
#include "ridesafe/behavior.hpp"
#include "ridesafe/checkin.hpp"
#include "ridesafe/common.hpp"
#include "ridesafe/config.hpp"
#include "ridesafe/daemon.hpp"
#include "ridesafe/deviation.hpp"
#include "ridesafe/geometry.hpp"
#include "ridesafe/incidents.hpp"
#include "ridesafe/location.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/monitor.hpp"
#include "ridesafe/persistence.hpp"
#include "ridesafe/risk.hpp"
#include "ridesafe/serialization.hpp"
#include "ridesafe/settings.hpp"
#include "ridesafe/tasks.hpp"

namespace {

int failures = 0;

constexpr double kMetersPerDegree = 6371e3 * 3.14159265358979323846 / 180.0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

ridesafe::RoutePoint point(double lat, double lon, double timestamp,
                           std::optional<double> speed = std::nullopt) {
    ridesafe::RoutePoint p;
    p.latitude = lat;
    p.longitude = lon;
    p.timestamp = timestamp;
    p.speed = speed;
    return p;
}

// Point on the equator the given number of meters east of the origin.
ridesafe::RoutePoint east_of_origin(double meters, double timestamp) {
    return point(0.0, meters / kMetersPerDegree, timestamp);
}

struct ManualClock {
    std::shared_ptr<double> now = std::make_shared<double>(1000.0);

    ridesafe::ClockFn fn() const {
        auto value = now;
        return [value] { return *value; };
    }
    void set(double value) { *now = value; }
};

class RecordingChannels : public ridesafe::NotificationChannels {
public:
    void send_sms(const std::string& number, const std::string& text) override {
        std::lock_guard<std::mutex> guard(mutex);
        if (fail_sms) {
            throw std::runtime_error("sms gateway down");
        }
        sms.emplace_back(number, text);
    }
    void place_call(const std::string& number, const std::string&) override {
        std::lock_guard<std::mutex> guard(mutex);
        calls.push_back(number);
    }
    void send_email(const ridesafe::EmergencyContact& contact, const std::string&) override {
        std::lock_guard<std::mutex> guard(mutex);
        emails.push_back(contact.email);
    }
    void notify_user(const std::string& user_id, const std::string& text) override {
        std::lock_guard<std::mutex> guard(mutex);
        if (fail_user) {
            throw std::runtime_error("push service unavailable");
        }
        user_notes.emplace_back(user_id, text);
    }
    void notify_driver(const std::string& ride_id, const std::string&) override {
        std::lock_guard<std::mutex> guard(mutex);
        driver_notes.push_back(ride_id);
    }

    std::mutex mutex;
    bool fail_sms = false;
    bool fail_user = false;
    std::vector<std::pair<std::string, std::string>> sms;
    std::vector<std::string> calls;
    std::vector<std::string> emails;
    std::vector<std::pair<std::string, std::string>> user_notes;
    std::vector<std::string> driver_notes;
};

class ScriptedLocationProvider : public ridesafe::LocationProvider {
public:
    std::optional<ridesafe::RoutePoint> sample(double) override {
        std::lock_guard<std::mutex> guard(mutex);
        calls += 1;
        if (script.empty()) {
            return std::nullopt;
        }
        auto next = script.front();
        script.pop_front();
        if (next.has_value() && next->timestamp < 0.0) {
            throw std::runtime_error("gps receiver offline");
        }
        return next;
    }

    std::mutex mutex;
    std::deque<std::optional<ridesafe::RoutePoint>> script;
    int calls = 0;
};

// Always answers with a fresh fix moving east along the equator.
class MovingLocationProvider : public ridesafe::LocationProvider {
public:
    std::optional<ridesafe::RoutePoint> sample(double) override {
        const int index = calls.fetch_add(1) + 1;
        return point(0.0, index * 1e-5, 1000.0 + index);
    }

    std::atomic<int> calls{0};
};

class FailingRepository : public ridesafe::Repository {
public:
    ridesafe::WriteResult upsert(const ridesafe::Record&, std::uint64_t) override {
        return ridesafe::WriteResult{false, "disk full"};
    }
};

class FlakySettingsStore : public ridesafe::SettingsStore {
public:
    std::optional<ridesafe::SafetySettings> get_safety_settings(const std::string& user_id) override {
        if (failing) {
            throw std::runtime_error("settings backend timeout");
        }
        return inner.get_safety_settings(user_id);
    }
    std::optional<ridesafe::EmergencySettings> get_emergency_settings(const std::string& user_id) override {
        if (failing) {
            throw std::runtime_error("settings backend timeout");
        }
        return inner.get_emergency_settings(user_id);
    }

    ridesafe::InMemorySettingsStore inner;
    bool failing = false;
};

class FixedEscalation : public ridesafe::EscalationHandler {
public:
    std::optional<std::string> escalate(const ridesafe::MonitoringSession&, const ridesafe::SafetyAlert&) override {
        calls += 1;
        return std::string("incident-7");
    }

    int calls = 0;
};

int count_alerts(const ridesafe::MonitoringSession& session, ridesafe::AlertType type) {
    int count = 0;
    for (const auto& alert : session.alerts) {
        if (alert.type == type) {
            ++count;
        }
    }
    return count;
}

bool has_event(const ridesafe::EmergencyIncident& incident, ridesafe::TimelineEventType type) {
    for (const auto& event : incident.timeline) {
        if (event.type == type) {
            return true;
        }
    }
    return false;
}

std::filesystem::path temp_file(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path;
}

void test_config_parsing() {
    const auto path = temp_file("ridesafe_test_config.toml");
    {
        std::ofstream out(path);
        out << "# test config\n"
            << "[logging]\nlevel = \"DEBUG\"\njson = false\n"
            << "[monitoring]\nlocation_poll_interval_s = 5\ncommunication_loss_cycles = 2\n"
            << "route_match = \"segment\"\nescalate_critical_alerts = false\n"
            << "[deviation]\nmajor_multiplier = 3.0\n"
            << "[behavior]\nspeed_limit_kmh = 80 # highway\nextended_stop_s = 120\n"
            << "[risk]\nemergency_threshold = 75\n"
            << "[incident]\ntracking_interval_s = 20\n"
            << "[persistence]\npath = none\n";
    }
    auto settings = ridesafe::RideSafeSettings::from_toml(path.string());
    expect_true(settings.logging.level == "DEBUG", "config logging level");
    expect_true(!settings.logging.json, "config logging json flag");
    expect_near(settings.monitoring.location_poll_interval_s, 5.0, 1e-9, "config poll interval");
    expect_true(settings.monitoring.communication_loss_cycles == 2, "config loss cycles");
    expect_true(settings.monitoring.route_match == ridesafe::RouteMatch::kSegment, "config route match");
    expect_true(!settings.monitoring.escalate_critical_alerts, "config escalation flag");
    expect_near(settings.monitoring.check_in_response_timeout_s, 30.0, 1e-9, "config keeps default timeout");
    expect_near(settings.deviation.major_multiplier, 3.0, 1e-9, "config major multiplier");
    expect_near(settings.behavior.speed_limit_kmh, 80.0, 1e-9, "config speed limit with comment");
    expect_near(settings.behavior.extended_stop_s, 120.0, 1e-9, "config extended stop");
    expect_near(settings.risk.emergency_threshold, 75.0, 1e-9, "config emergency threshold");
    expect_near(settings.incident.tracking_interval_s, 20.0, 1e-9, "config tracking interval");
    expect_true(!settings.persistence.path.has_value(), "config persistence none");

    const auto bad_path = temp_file("ridesafe_bad_config.toml");
    {
        std::ofstream out(bad_path);
        out << "[monitoring]\nescalate_critical_alerts = maybe\n";
    }
    bool threw = false;
    try {
        ridesafe::RideSafeSettings::from_toml(bad_path.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "config rejects malformed boolean");
}

void test_logging_output() {
    std::ostringstream sink;
    ridesafe::set_log_sink(&sink);
    ridesafe::get_logger("Dispatch").warn("sms_failed", {{"detail", "say \"hi\""}});
    const auto line = sink.str();
    expect_true(line.find("\"event\":\"sms_failed\"") != std::string::npos, "log line carries event");
    expect_true(line.find("\"logger\":\"Dispatch\"") != std::string::npos, "log line carries logger");
    expect_true(line.find("say \\\"hi\\\"") != std::string::npos, "log values are escaped");
    expect_true(line.find("\"ts\":") != std::string::npos, "log line carries timestamp");
}

void test_log_file_rotation() {
    const auto path = temp_file("ridesafe_test.log");
    const auto first_backup = temp_file("ridesafe_test.log.1");
    temp_file("ridesafe_test.log.2");

    ridesafe::LoggingConfig config;
    config.json = false;
    config.log_file = path.string();
    config.max_bytes = 50;
    config.backup_count = 2;
    ridesafe::set_log_sink(nullptr);
    ridesafe::configure_logging(config);
    auto logger = ridesafe::get_logger("Rotation");
    for (int index = 0; index < 4; ++index) {
        logger.info("fix_processed", {{"ride_id", "ride-" + std::to_string(index)}});
    }
    ridesafe::configure_logging(ridesafe::LoggingConfig{});

    expect_true(std::filesystem::exists(first_backup), "full log rotated to .1");
    std::ifstream current(path);
    std::string line;
    std::getline(current, line);
    expect_true(line.find(" INFO Rotation fix_processed | ride_id=ride-3") != std::string::npos,
                "plain log line format");
}

void test_json_escaping() {
    expect_true(ridesafe::escape_json(std::string("a\x01" "b")) == "a\\u0001b", "control byte escaped as unicode");
    expect_true(ridesafe::escape_json(std::string("\x1f")) == "\\u001f", "unit separator escaped");
    expect_true(ridesafe::escape_json("line\nbreak\t") == "line\\nbreak\\t", "newline and tab escaped");
    ridesafe::MonitoringSession session;
    session.ride_id = std::string("ride\x02");
    expect_true(ridesafe::to_json(session).find("ride\\u0002") != std::string::npos,
                "session json escapes control bytes");
}

void test_geometry() {
    expect_near(ridesafe::haversine_distance(0.0, 0.0, 1.0, 0.0), kMetersPerDegree, 1e-3,
                "one degree of latitude");
    expect_near(ridesafe::haversine_distance(east_of_origin(0.0, 0.0), east_of_origin(600.0, 0.0)), 600.0, 1e-6,
                "equatorial distance");
    expect_near(ridesafe::initial_bearing(point(0.0, 0.0, 0.0), point(0.0, 1.0, 0.0)), 90.0, 1e-9,
                "bearing due east");
    expect_near(ridesafe::bearing_delta(350.0, 10.0), 20.0, 1e-9, "bearing delta wraps");
    expect_near(ridesafe::speed_between(east_of_origin(0.0, 0.0), east_of_origin(100.0, 10.0)), 10.0, 1e-6,
                "speed between fixes");
    expect_near(ridesafe::speed_between(east_of_origin(0.0, 5.0), east_of_origin(100.0, 5.0)), 0.0, 1e-9,
                "speed with zero dt");

    std::vector<ridesafe::RoutePoint> route = {point(0.0, 0.0, 0.0), point(0.0, 0.01, 0.0)};
    auto midway = point(200.0 / kMetersPerDegree, 0.005, 0.0);
    auto vertex = ridesafe::nearest_route_vertex(midway, route);
    auto segment = ridesafe::nearest_point_on_polyline(midway, route);
    expect_true(vertex.has_value() && segment.has_value(), "nearest point found");
    expect_true(segment->distance < vertex->distance, "segment match is closer than vertex match");
    expect_near(segment->distance, 200.0, 1.0, "segment distance");
    expect_true(!ridesafe::nearest_route_vertex(midway, {}).has_value(), "empty route has no nearest point");
}

void test_nmea_parsing() {
    auto fix = ridesafe::parse_rmc("$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A");
    expect_true(fix.has_value(), "rmc parsed");
    if (fix) {
        expect_near(fix->latitude, 48.1173, 1e-4, "rmc latitude");
        expect_near(fix->longitude, 11.516667, 1e-5, "rmc longitude");
        expect_near(*fix->speed, 22.4 * 0.514444, 1e-6, "rmc speed in m/s");
        expect_near(*fix->heading, 84.4, 1e-9, "rmc heading");
    }
    expect_true(!ridesafe::parse_rmc("$GPRMC,123519,V,4807.038,N,01131.000,E,022.4,084.4,230394,,").has_value(),
                "void rmc rejected");
    auto csv = ridesafe::parse_csv_point("51.5, -0.12, 1700000000, 12.5");
    expect_true(csv.has_value() && csv->speed.has_value(), "csv point parsed");
    expect_true(!ridesafe::parse_csv_point("# comment").has_value(), "csv comment skipped");
}

void test_replay_provider_shared() {
    constexpr int kLines = 200;
    auto next = std::make_shared<std::atomic<int>>(0);
    ridesafe::LineSource source = [next]() -> std::optional<std::string> {
        const int index = next->fetch_add(1);
        if (index >= kLines) {
            return std::nullopt;
        }
        return "0.0," + std::to_string(index * 0.0001) + "," + std::to_string(index);
    };
    auto replay = std::make_shared<ridesafe::ReplayLocationProvider>(source);

    std::mutex seen_mutex;
    std::vector<double> seen;
    auto drain = [&]() {
        while (!replay->exhausted()) {
            auto fix = replay->sample(1.0);
            if (fix) {
                std::lock_guard<std::mutex> guard(seen_mutex);
                seen.push_back(fix->timestamp);
            }
        }
    };
    std::thread session_loop(drain);
    std::thread tracker(drain);
    session_loop.join();
    tracker.join();

    std::sort(seen.begin(), seen.end());
    expect_true(seen.size() == static_cast<size_t>(kLines), "each replayed line yields one fix");
    expect_true(std::adjacent_find(seen.begin(), seen.end()) == seen.end(), "no line is consumed twice");
    expect_true(!replay->sample(1.0).has_value(), "exhausted replay yields nothing");
}

void test_deviation_detector() {
    ridesafe::MonitoringSession session;
    session.planned_route = {point(0.0, 0.0, 0.0), point(0.001, 0.0, 0.0)};
    ridesafe::RouteDeviationDetector detector;

    auto minor = detector.evaluate(session, east_of_origin(300.0, 10.0), 250.0);
    expect_true(minor.change == ridesafe::DeviationChange::kOpened, "minor deviation opened");
    expect_true(!minor.alert.has_value(), "minor deviation raises no alert");

    auto extended = detector.evaluate(session, east_of_origin(700.0, 20.0), 250.0);
    expect_true(extended.change == ridesafe::DeviationChange::kExtended, "deviation extended");
    expect_true(!extended.alert.has_value(), "extending a minor episode raises no alert");
    expect_true(session.deviations.back().severity == ridesafe::DeviationSeverity::kMinor,
                "severity fixed when the episode opens");
    expect_true(!session.deviations.back().alert_triggered, "minor episode stays without alert");
    expect_near(session.deviations.back().distance_from_route, 700.0, 1e-6, "extension tracks max distance");
    expect_near(session.deviations.back().duration, 10.0, 1e-9, "deviation duration");
    expect_true(session.deviations.size() == 1, "single episode while off route");

    ridesafe::MonitoringSession far;
    far.planned_route = session.planned_route;
    auto major = detector.evaluate(far, east_of_origin(600.0, 10.0), 250.0);
    expect_true(major.change == ridesafe::DeviationChange::kOpened, "major deviation opened");
    expect_true(major.alert.has_value(), "episode opening major raises alert");
    expect_true(far.deviations.back().severity == ridesafe::DeviationSeverity::kMajor, "600m opens major");
    auto still_major = detector.evaluate(far, east_of_origin(650.0, 15.0), 250.0);
    expect_true(!still_major.alert.has_value(), "major deviation alerts once");
}

void test_non_finite_fixes() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    expect_true(!ridesafe::parse_csv_point("nan,nan,5").has_value(), "csv NaN coordinates rejected");
    expect_true(!ridesafe::parse_csv_point("1,2,inf").has_value(), "csv infinite timestamp rejected");
    expect_true(!ridesafe::parse_csv_point("1,2,5,nan").has_value(), "csv NaN speed rejected");
    expect_true(!ridesafe::is_valid_fix(point(nan, 0.0, 5.0)), "NaN latitude invalid");
    expect_true(!ridesafe::is_valid_fix(point(0.0, 0.0, inf)), "infinite timestamp invalid");
    expect_true(ridesafe::is_valid_fix(point(0.0, 0.0, 5.0)), "finite fix valid");

    ridesafe::MonitoringSession session;
    session.planned_route = {point(0.0, 0.0, 0.0)};
    ridesafe::RouteDeviationDetector detector;
    auto update = detector.evaluate(session, point(nan, nan, 5.0), 250.0);
    expect_true(update.change == ridesafe::DeviationChange::kNone, "NaN fix opens no deviation");
    expect_true(session.deviations.empty(), "no episode recorded for NaN fix");

    ManualClock clock;
    auto store = std::make_shared<ridesafe::InMemorySettingsStore>();
    ridesafe::SafetySettings safety = ridesafe::default_safety_settings("rider-1");
    safety.enable_automatic_check_ins = false;
    store->put_safety_settings(safety);
    ridesafe::MonitorCollaborators collaborators;
    collaborators.settings = std::make_shared<ridesafe::SettingsResolver>(store);
    collaborators.channels = std::make_shared<RecordingChannels>();
    ridesafe::RideMonitor monitor(collaborators, {}, clock.fn());
    monitor.start_monitoring("ride-nan", "rider-1", "driver-1", session.planned_route, false);

    expect_true(monitor.process_fix("ride-nan", east_of_origin(0.0, 1.0)), "finite fix accepted");
    expect_true(!monitor.process_fix("ride-nan", point(nan, 0.0, 2.0)), "NaN latitude fix rejected");
    expect_true(!monitor.process_fix("ride-nan", point(0.0, 0.0, nan)), "NaN timestamp fix rejected");
    auto stored = monitor.get_session("ride-nan");
    expect_true(stored && stored->actual_route.size() == 1, "rejected fixes leave the track unchanged");
    expect_true(stored && stored->deviations.empty(), "rejected fixes open no deviation");
    expect_true(monitor.process_fix("ride-nan", east_of_origin(0.0, 3.0)), "later finite fix accepted");
    monitor.stop_monitoring("ride-nan");
}

void test_deviation_scenario() {
    ManualClock clock;
    auto store = std::make_shared<ridesafe::InMemorySettingsStore>();
    ridesafe::SafetySettings safety = ridesafe::default_safety_settings("rider-1");
    safety.route_deviation_threshold = 250.0;
    safety.driver_behavior_monitoring = false;
    safety.enable_automatic_check_ins = false;
    store->put_safety_settings(safety);

    auto channels = std::make_shared<RecordingChannels>();
    ridesafe::MonitorCollaborators collaborators;
    collaborators.settings = std::make_shared<ridesafe::SettingsResolver>(store);
    collaborators.channels = channels;
    ridesafe::RideMonitor monitor(collaborators, {}, clock.fn());

    std::vector<ridesafe::RoutePoint> route = {point(0.0, 0.0, 0.0), point(0.001, 0.0, 0.0)};
    auto started = monitor.start_monitoring("ride-1", "rider-1", "driver-1", route, false);
    expect_true(started.has_value(), "session started");
    expect_true(started && started->id.rfind("monitoring_", 0) == 0, "session id prefix");
    expect_true(!monitor.start_monitoring("ride-1", "rider-1", "driver-1", route, false).has_value(),
                "duplicate ride rejected");

    expect_true(monitor.process_fix("ride-1", east_of_origin(0.0, 0.0)), "on-route fix accepted");
    monitor.process_fix("ride-1", east_of_origin(600.0, 10.0));
    auto session = monitor.get_session("ride-1");
    expect_true(session->deviations.size() == 1, "deviation opened at 600m");
    expect_true(session->deviations[0].severity == ridesafe::DeviationSeverity::kMajor, "600m is major");
    expect_true(count_alerts(*session, ridesafe::AlertType::kRouteDeviation) == 1, "one route deviation alert");

    monitor.process_fix("ride-1", east_of_origin(700.0, 20.0));
    session = monitor.get_session("ride-1");
    expect_true(count_alerts(*session, ridesafe::AlertType::kRouteDeviation) == 1, "no duplicate deviation alert");
    expect_near(session->deviations[0].distance_from_route, 700.0, 1e-6, "max distance tracked");

    monitor.process_fix("ride-1", east_of_origin(100.0, 30.0));
    session = monitor.get_session("ride-1");
    expect_true(session->deviations[0].is_resolved, "back on route resolves deviation");
    expect_near(*session->deviations[0].resolved_at, 30.0, 1e-9, "resolution time stamped");

    monitor.process_fix("ride-1", east_of_origin(90.0, 40.0));
    session = monitor.get_session("ride-1");
    expect_true(session->deviations.size() == 1, "resolving is idempotent");
    expect_true(!monitor.process_fix("ride-1", east_of_origin(90.0, 35.0)), "out-of-order fix rejected");
    expect_true(!monitor.process_fix("ride-unknown", east_of_origin(0.0, 50.0)), "unknown ride rejected");

    expect_true(monitor.stop_monitoring("ride-1"), "stop active session");
    expect_true(!monitor.stop_monitoring("ride-1"), "stop twice fails");
    expect_true(!monitor.get_session("ride-1").has_value(), "stopped session leaves registry");
}

void test_harsh_acceleration() {
    ridesafe::MonitoringSession session;
    ridesafe::DriverBehaviorAnalyzer analyzer;
    const double step = 1.0 / kMetersPerDegree;

    session.actual_route.push_back(point(0.0, 0.0, 0.0));
    expect_true(analyzer.analyze(session, 20.0).empty(), "single fix yields nothing");
    session.actual_route.push_back(point(10.0 * step, 0.0, 1.0));
    expect_true(analyzer.analyze(session, 20.0).empty(), "steady 36 km/h yields nothing");
    session.actual_route.push_back(point(24.0 * step, 0.0, 2.0));
    auto alerts = analyzer.analyze(session, 20.0);

    expect_true(alerts.size() == 1 && alerts[0].type == ridesafe::AlertType::kHarshDriving, "harsh driving alert");
    expect_true(alerts.size() == 1 && alerts[0].severity == ridesafe::Severity::kLow, "harsh driving is low");
    expect_true(session.behavior.harsh_accelerations == 1, "harsh acceleration counted");
    expect_true(session.behavior.harsh_braking == 0, "no harsh braking");
    expect_true(session.behavior.speed_violations == 0, "50 km/h is within tolerance");
    expect_near(session.behavior.max_speed, 50.4, 1e-6, "max speed in km/h");
    expect_near(session.behavior.overall_score, 98.0, 1e-9, "harsh acceleration penalty");
}

void test_sharp_turns_and_braking() {
    ridesafe::DriverBehaviorAnalyzer analyzer;
    const double step = 1.0 / kMetersPerDegree;

    ridesafe::MonitoringSession turning;
    turning.actual_route.push_back(point(0.0, 0.0, 0.0));
    turning.actual_route.back().heading = 0.0;
    turning.actual_route.push_back(point(10.0 * step, 0.0, 1.0));
    turning.actual_route.back().heading = 90.0;
    expect_true(analyzer.analyze(turning, 20.0).empty(), "sharp turn raises no alert");
    expect_true(turning.behavior.sharp_turns == 1, "sharp turn counted at 36 km/h");
    expect_near(turning.behavior.overall_score, 99.0, 1e-9, "sharp turn penalty");

    ridesafe::MonitoringSession wrapping;
    wrapping.actual_route.push_back(point(0.0, 0.0, 0.0));
    wrapping.actual_route.back().heading = 350.0;
    wrapping.actual_route.push_back(point(10.0 * step, 0.0, 1.0));
    wrapping.actual_route.back().heading = 10.0;
    analyzer.analyze(wrapping, 20.0);
    expect_true(wrapping.behavior.sharp_turns == 0, "350 to 10 degrees is a 20 degree change");

    ridesafe::MonitoringSession crawling;
    crawling.actual_route.push_back(point(0.0, 0.0, 0.0));
    crawling.actual_route.back().heading = 0.0;
    crawling.actual_route.push_back(point(step, 0.0, 1.0));
    crawling.actual_route.back().heading = 90.0;
    analyzer.analyze(crawling, 20.0);
    expect_true(crawling.behavior.sharp_turns == 0, "turning at walking pace is not sharp");

    ridesafe::MonitoringSession braking;
    braking.actual_route.push_back(point(0.0, 0.0, 0.0));
    braking.actual_route.push_back(point(14.0 * step, 0.0, 1.0));
    analyzer.analyze(braking, 20.0);
    braking.actual_route.push_back(point(24.0 * step, 0.0, 2.0));
    auto alerts = analyzer.analyze(braking, 20.0);
    expect_true(alerts.size() == 1 && alerts[0].type == ridesafe::AlertType::kHarshDriving, "harsh braking alert");
    expect_true(alerts.size() == 1 && alerts[0].description == "Harsh braking detected", "harsh braking message");
    expect_true(braking.behavior.harsh_braking == 1, "harsh braking counted");
    expect_true(braking.behavior.harsh_accelerations == 0, "braking is not acceleration");
    expect_near(braking.behavior.overall_score, 98.0, 1e-9, "harsh braking penalty");
}

void test_behavior_score_bounds() {
    ridesafe::MonitoringSession session;
    ridesafe::DriverBehaviorAnalyzer analyzer;
    const double step = 30.0 / kMetersPerDegree;
    int violations = 0;
    for (int i = 0; i < 30; ++i) {
        session.actual_route.push_back(point(i * step, 0.0, static_cast<double>(i), 30.0));
        for (const auto& alert : analyzer.analyze(session, 20.0)) {
            if (alert.type == ridesafe::AlertType::kSpeedViolation) {
                ++violations;
            }
        }
        expect_true(session.behavior.overall_score >= 0.0 && session.behavior.overall_score <= 100.0,
                    "score stays in range");
    }
    expect_true(violations == 29, "every analyzed fix over the limit is a violation");
    expect_near(session.behavior.overall_score, 0.0, 1e-9, "score floors at zero");
    expect_true(session.behavior.risk_level == ridesafe::RiskLevel::kCritical, "critical driver risk");
    expect_near(session.behavior.average_speed, 108.0, 1e-6, "average speed from reported speed");
}

void test_extended_stop() {
    ridesafe::BehaviorConfig config;
    config.extended_stop_s = 60.0;
    ridesafe::DriverBehaviorAnalyzer analyzer(config);
    ridesafe::MonitoringSession session;
    int stops = 0;
    for (int i = 0; i < 5; ++i) {
        session.actual_route.push_back(point(1.0, 1.0, i * 30.0, 0.0));
        for (const auto& alert : analyzer.analyze(session, 20.0)) {
            if (alert.type == ridesafe::AlertType::kExtendedStop) {
                ++stops;
            }
        }
    }
    expect_true(stops == 1, "one extended stop alert per stop");
}

void test_risk_aggregation() {
    ridesafe::RiskAggregator risk;
    ridesafe::MonitoringSession session;
    ridesafe::RouteDeviation deviation;
    deviation.severity = ridesafe::DeviationSeverity::kMajor;
    session.deviations.push_back(deviation);
    session.behavior.overall_score = 80.0;
    ridesafe::SafetyAlert alert;
    alert.severity = ridesafe::Severity::kHigh;
    session.alerts.push_back(alert);
    ridesafe::SafetyCheckIn missed;
    missed.status = ridesafe::CheckInStatus::kMissed;
    session.check_ins.push_back(missed);

    const double first = risk.score(session);
    expect_near(first, 30.0 + 10.0 + 20.0 + 25.0, 1e-9, "risk score sums signals");
    expect_near(risk.score(session), first, 1e-12, "risk score is a pure fold");
    risk.apply(session);
    expect_true(session.status == ridesafe::SessionStatus::kEmergency, "risk above 80 is emergency");

    session.alerts[0].status = ridesafe::AlertStatus::kResolved;
    risk.apply(session);
    expect_near(session.risk_score, 65.0, 1e-9, "resolved alert no longer counts");
    expect_true(session.status == ridesafe::SessionStatus::kAlertTriggered, "risk above 50 triggers alert");

    for (int i = 0; i < 10; ++i) {
        session.check_ins.push_back(missed);
    }
    expect_near(risk.score(session), 100.0, 1e-9, "risk clamps at 100");

    session.status = ridesafe::SessionStatus::kCompleted;
    risk.apply(session);
    expect_true(session.status == ridesafe::SessionStatus::kCompleted, "completed status is kept");
}

void test_alert_actions() {
    ManualClock clock;
    auto channels = std::make_shared<RecordingChannels>();
    ridesafe::SafetyAlertEngine engine(channels, clock.fn());

    ridesafe::MonitoringSession session;
    session.ride_id = "ride-a";
    session.user_id = "rider-a";
    auto safety = ridesafe::default_safety_settings("rider-a");
    auto emergency = ridesafe::default_emergency_settings("rider-a");
    ridesafe::EmergencyContact alice;
    alice.id = "c1";
    alice.name = "Alice";
    alice.phone_number = "+15550001";
    ridesafe::EmergencyContact bob = alice;
    bob.id = "c2";
    bob.name = "Bob";
    bob.is_active = false;
    emergency.emergency_contacts = {alice, bob};

    auto low = engine.raise(session, {ridesafe::AlertType::kHarshDriving, ridesafe::Severity::kLow, "harsh", {}},
                            safety, emergency);
    expect_true(low.actions.size() == 1, "low alert only notifies the user");
    expect_true(low.actions[0].type == ridesafe::AlertActionType::kNotificationSent && low.actions[0].success,
                "user notification recorded");

    auto medium = engine.raise(
        session, {ridesafe::AlertType::kRouteDeviation, ridesafe::Severity::kMedium, "off route", {}}, safety,
        emergency);
    expect_true(medium.actions.size() == 2, "medium alert notifies active contacts");
    expect_true(medium.actions[1].type == ridesafe::AlertActionType::kContactNotified && medium.actions[1].success,
                "contact notification recorded");
    expect_true(channels->sms.size() == 1 && channels->sms[0].first == "+15550001", "sms sent to active contact");

    channels->fail_user = true;
    auto high = engine.raise(
        session, {ridesafe::AlertType::kCheckInMissed, ridesafe::Severity::kHigh, "not ok", {}}, safety, emergency);
    expect_true(high.actions.size() == 2, "failed channel does not stop sibling actions");
    expect_true(!high.actions[0].success, "failed user notification recorded as failure");
    expect_true(high.actions[1].success, "contact still notified after user channel failure");
    channels->fail_user = false;

    auto critical = engine.raise(
        session, {ridesafe::AlertType::kPanicButton, ridesafe::Severity::kCritical, "panic", {}}, safety, emergency);
    expect_true(critical.actions.back().type == ridesafe::AlertActionType::kEmergencyDispatched,
                "critical alert attempts dispatch");
    expect_true(!critical.actions.back().success, "dispatch without escalation handler fails");

    auto escalation = std::make_shared<FixedEscalation>();
    engine.set_escalation_handler(escalation);
    auto escalated = engine.raise(
        session, {ridesafe::AlertType::kPanicButton, ridesafe::Severity::kCritical, "panic", {}}, safety, emergency);
    expect_true(escalated.actions.back().success, "dispatch succeeds with escalation handler");
    expect_true(escalated.actions.back().details.find("incident-7") != std::string::npos, "dispatch names incident");
    expect_true(escalation->calls == 1, "escalation invoked once");

    safety.emergency_contacts_on_alert = false;
    auto quiet = engine.raise(
        session, {ridesafe::AlertType::kSpeedViolation, ridesafe::Severity::kMedium, "fast", {}}, safety, emergency);
    expect_true(quiet.actions.size() == 1, "contacts skipped when disabled in settings");
    expect_true(session.alerts.size() == 6, "every raised alert stored on the session");

    expect_true(engine.acknowledge(session, low.id, "agent-1"), "acknowledge active alert");
    expect_true(!engine.acknowledge(session, low.id, "agent-1"), "acknowledge is one-shot");
    expect_true(!engine.resolve(session, low.id), "acknowledged alert is terminal");
    expect_true(engine.mark_false_alarm(session, medium.id), "false alarm from active");
    expect_true(engine.resolve(session, high.id), "resolve from active");
    expect_true(!engine.resolve(session, "alert_missing"), "unknown alert cannot be resolved");
    expect_true(session.alerts[0].acknowledged_by.value_or("") == "agent-1", "acknowledger recorded");
}

void test_check_in_scheduler() {
    ManualClock clock;
    ridesafe::CheckInScheduler scheduler(30.0, clock.fn());
    ridesafe::MonitoringSession session;
    const auto here = point(1.0, 1.0, 1000.0);

    auto first = scheduler.prompt(session, ridesafe::CheckInType::kAutomatic);
    expect_near(first.deadline, 1030.0, 1e-9, "check-in deadline");
    auto expired = scheduler.expire(session, first.id);
    expect_true(expired.accepted && expired.alert.has_value(), "missed check-in raises alert");
    expect_true(expired.alert && expired.alert->severity == ridesafe::Severity::kMedium, "missed alert is medium");
    expect_true(session.check_ins[0].status == ridesafe::CheckInStatus::kMissed, "check-in marked missed");
    expect_true(session.check_ins[0].follow_up_required, "missed check-in needs follow-up");
    auto again = scheduler.expire(session, first.id);
    expect_true(!again.accepted && !again.alert.has_value(), "expiring twice is a no-op");

    auto second = scheduler.prompt(session, ridesafe::CheckInType::kPrompted);
    clock.set(1010.0);
    auto ok = scheduler.respond(session, second.id, true, here);
    expect_true(ok.accepted && !ok.alert.has_value(), "ok response completes check-in");
    expect_true(!scheduler.expire(session, second.id).accepted, "deadline after completion is a no-op");
    expect_true(session.check_ins[1].status == ridesafe::CheckInStatus::kCompleted, "check-in completed");

    auto third = scheduler.prompt(session, ridesafe::CheckInType::kPrompted);
    auto not_ok = scheduler.respond(session, third.id, false, here, std::string("driver is scaring me"));
    expect_true(not_ok.alert && not_ok.alert->severity == ridesafe::Severity::kHigh, "not ok raises high alert");
    expect_true(not_ok.alert && not_ok.alert->description.find("driver is scaring me") != std::string::npos,
                "not ok alert carries message");

    auto fourth = scheduler.prompt(session, ridesafe::CheckInType::kPrompted);
    clock.set(1100.0);
    auto late = scheduler.respond(session, fourth.id, true, here);
    expect_true(!late.accepted && late.alert.has_value(), "late response expires the check-in");
    expect_true(session.check_ins[3].status == ridesafe::CheckInStatus::kMissed, "late check-in marked missed");

    auto manual = scheduler.record_manual(session, true, here);
    expect_true(manual.accepted && !manual.alert.has_value(), "manual ok check-in recorded");
    expect_true(session.check_ins.back().type == ridesafe::CheckInType::kManual, "manual check-in type");
}

void test_monitor_check_ins() {
    ManualClock clock;
    auto provider = std::make_shared<ScriptedLocationProvider>();
    auto channels = std::make_shared<RecordingChannels>();
    ridesafe::MonitorCollaborators collaborators;
    collaborators.location = provider;
    collaborators.channels = channels;
    ridesafe::RideMonitor monitor(collaborators, {}, clock.fn());
    monitor.start_monitoring("ride-c", "rider-c", "driver-c", {point(0.0, 0.0, 0.0)}, false);

    auto check_in = monitor.prompt_check_in("ride-c");
    expect_true(check_in.has_value(), "check-in prompted");
    expect_true(monitor.expire_check_in("ride-c", check_in->id), "deadline marks check-in missed");
    expect_true(!monitor.expire_check_in("ride-c", check_in->id), "second deadline ignored");
    auto session = monitor.get_session("ride-c");
    expect_true(count_alerts(*session, ridesafe::AlertType::kCheckInMissed) == 1, "exactly one missed alert");
    expect_near(session->risk_score, 25.0 + 5.0, 1e-9, "missed check-in raises risk");

    auto answered = monitor.prompt_check_in("ride-c");
    expect_true(monitor.respond_to_check_in("ride-c", answered->id, true), "response accepted");
    expect_true(!monitor.expire_check_in("ride-c", answered->id), "deadline after response is a no-op");

    expect_true(!monitor.perform_manual_check_in("ride-c", true), "manual check-in needs a location");
    provider->script.push_back(point(0.0, 0.0, 2000.0));
    expect_true(monitor.perform_manual_check_in("ride-c", false, std::string("unsafe")), "manual check-in recorded");
    session = monitor.get_session("ride-c");
    expect_true(session->check_ins.back().type == ridesafe::CheckInType::kManual, "manual check-in stored");
    expect_true(session->alerts.back().severity == ridesafe::Severity::kHigh, "manual not ok raises high alert");
}

void test_communication_loss() {
    auto provider = std::make_shared<ScriptedLocationProvider>();
    provider->script = {std::nullopt, point(0.0, 0.0, -1.0), std::nullopt, std::nullopt,
                        point(0.0, 0.0, 10.0), std::nullopt, std::nullopt, std::nullopt};
    ridesafe::LocationSampler sampler(provider, 1.0, 3);

    int losses = 0;
    std::vector<int> failures_seen;
    for (int i = 0; i < 8; ++i) {
        auto outcome = sampler.sample();
        losses += outcome.communication_lost ? 1 : 0;
        failures_seen.push_back(outcome.consecutive_failures);
    }
    expect_true(losses == 2, "one loss per outage");
    expect_true(failures_seen[1] == 2, "provider exception counts as a failed cycle");
    expect_true(failures_seen[4] == 0, "successful fix resets the outage");

    ManualClock clock;
    auto silent = std::make_shared<ScriptedLocationProvider>();
    ridesafe::MonitorCollaborators collaborators;
    collaborators.location = silent;
    ridesafe::RideMonitor monitor(collaborators, {}, clock.fn());
    monitor.start_monitoring("ride-l", "rider-l", "driver-l", {}, false);
    for (int i = 0; i < 6; ++i) {
        expect_true(!monitor.poll_location("ride-l"), "empty cycle processes no fix");
    }
    auto session = monitor.get_session("ride-l");
    expect_true(count_alerts(*session, ridesafe::AlertType::kCommunicationLoss) == 1, "communication loss alert");
    expect_true(session->actual_route.empty(), "no fixes recorded during outage");
}

void test_incident_priority() {
    using ridesafe::IncidentType;
    using ridesafe::Severity;
    expect_true(ridesafe::priority_for(IncidentType::kSos) == Severity::kCritical, "sos is critical");
    expect_true(ridesafe::priority_for(IncidentType::kMedical) == Severity::kCritical, "medical is critical");
    expect_true(ridesafe::priority_for(IncidentType::kAccident) == Severity::kCritical, "accident is critical");
    expect_true(ridesafe::priority_for(IncidentType::kPanic) == Severity::kHigh, "panic is high");
    expect_true(ridesafe::priority_for(IncidentType::kHarassment) == Severity::kHigh, "harassment is high");
    expect_true(ridesafe::priority_for(IncidentType::kVehicleIssue) == Severity::kMedium, "vehicle issue is medium");
    expect_true(ridesafe::priority_for(IncidentType::kOther) == Severity::kLow, "other is low");
    expect_true(ridesafe::parse_incident_type("vehicle_issue") == IncidentType::kVehicleIssue, "parse type");
    expect_true(ridesafe::reverse_geocode(40.5, -74.25) == "40.500000, -74.250000", "coordinate address");
}

struct IncidentFixture {
    ManualClock clock;
    std::shared_ptr<ridesafe::InMemorySettingsStore> store = std::make_shared<ridesafe::InMemorySettingsStore>();
    std::shared_ptr<RecordingChannels> channels = std::make_shared<RecordingChannels>();
    std::shared_ptr<ridesafe::InMemoryRepository> repository = std::make_shared<ridesafe::InMemoryRepository>();
    std::shared_ptr<ridesafe::AsyncRecordWriter> writer = std::make_shared<ridesafe::AsyncRecordWriter>(repository);

    std::unique_ptr<ridesafe::EmergencyIncidentManager> make_manager(
        std::shared_ptr<ridesafe::LocationProvider> location = nullptr, double tracking_interval_s = 3600.0) {
        ridesafe::IncidentCollaborators collaborators;
        collaborators.settings = std::make_shared<ridesafe::SettingsResolver>(store);
        collaborators.location = std::move(location);
        collaborators.channels = channels;
        collaborators.dispatch = std::make_shared<ridesafe::LoggingDispatchService>(480.0, clock.fn());
        collaborators.writer = writer;
        ridesafe::IncidentConfig config;
        config.tracking_interval_s = tracking_interval_s;
        return std::make_unique<ridesafe::EmergencyIncidentManager>(collaborators, config, clock.fn());
    }
};

void test_medical_incident() {
    IncidentFixture fixture;
    ridesafe::EmergencySettings settings = ridesafe::default_emergency_settings("rider-m");
    settings.auto_call_emergency_services = true;
    ridesafe::EmergencyContact primary;
    primary.id = "c1";
    primary.name = "Alice";
    primary.phone_number = "+15550001";
    primary.is_primary = true;
    primary.preferences.call = true;
    ridesafe::EmergencyContact secondary;
    secondary.id = "c2";
    secondary.name = "Bob";
    secondary.phone_number = "+15550002";
    secondary.email = "bob@example.com";
    secondary.preferences.call = true;
    secondary.preferences.email = true;
    settings.emergency_contacts = {primary, secondary};
    fixture.store->put_emergency_settings(settings);

    auto manager = fixture.make_manager();
    ridesafe::IncidentOptions options;
    options.ride_id = "ride-m";
    options.description = "chest pain";
    auto incident = manager->create_incident("rider-m", ridesafe::IncidentType::kMedical, point(40.0, -74.0, 0.0),
                                             options);

    expect_true(incident.priority == ridesafe::IncidentPriority::kCritical, "medical incident is critical");
    expect_true(incident.status == ridesafe::IncidentStatus::kActive, "new incident is active");
    expect_true(incident.responders.size() == 3, "dispatch, security and support responders");
    expect_true(!incident.responders.empty() &&
                    incident.responders[0].type == ridesafe::ResponderType::kEmergencyServices,
                "emergency services responder assigned during creation");
    expect_near(incident.responders[0].estimated_arrival.value_or(0.0), 1000.0 + 480.0, 1e-9, "dispatch eta");
    expect_true(incident.timeline.front().type == ridesafe::TimelineEventType::kIncidentCreated,
                "timeline starts with creation");
    expect_true(has_event(incident, ridesafe::TimelineEventType::kServicesContacted), "services contacted event");
    expect_true(has_event(incident, ridesafe::TimelineEventType::kTrackingStarted), "tracking started event");
    expect_true(has_event(incident, ridesafe::TimelineEventType::kDriverNotified), "driver notified event");
    expect_true(incident.location.address.value_or("") == "40.000000, -74.000000", "address fallback");
    expect_true(incident.emergency_contacts.size() == 2, "active contacts captured");
    expect_true(fixture.channels->sms.size() == 2, "sms to both contacts");
    expect_true(fixture.channels->calls.size() == 1 && fixture.channels->calls[0] == "+15550001",
                "only the primary contact is called");
    expect_true(fixture.channels->emails.size() == 1, "email where enabled");
    expect_true(fixture.channels->sms[0].second.find("EMERGENCY ALERT: Alice") == 0, "sms names the contact");
    expect_true(fixture.channels->sms[0].second.find("Type: medical") != std::string::npos, "sms names the type");
    expect_true(fixture.channels->driver_notes.size() == 1, "driver notified");
    expect_true(fixture.repository->incident(incident.id).has_value(), "incident persisted");

    const auto timeline_size = manager->get_incident(incident.id)->timeline.size();
    expect_true(manager->resolve_incident(incident.id, "agent-1", "Passenger safe"), "resolve incident");
    auto resolved = manager->get_incident(incident.id);
    expect_true(resolved->status == ridesafe::IncidentStatus::kResolved, "incident resolved");
    expect_true(resolved->resolution && resolved->resolution->resolved_by == "agent-1", "resolution recorded");
    expect_true(resolved->timeline.size() == timeline_size + 1, "resolution appended to timeline");

    expect_true(!manager->resolve_incident(incident.id, "agent-2", "again"), "second resolve fails");
    auto unchanged = manager->get_incident(incident.id);
    expect_true(unchanged->resolution->resolved_by == "agent-1", "second resolve leaves resolution");
    expect_true(unchanged->timeline.size() == timeline_size + 1, "second resolve leaves timeline");
    expect_true(!manager->resolve_incident("emergency_missing", "agent-1", "n/a"), "unknown incident fails");
    expect_true(manager->active_incidents().empty(), "resolved incident is not active");
}

void test_incident_workflow_variants() {
    IncidentFixture fixture;
    ridesafe::EmergencySettings settings = ridesafe::default_emergency_settings("rider-v");
    ridesafe::EmergencyContact contact;
    contact.id = "c1";
    contact.name = "Carol";
    contact.phone_number = "+15550003";
    settings.emergency_contacts = {contact};
    fixture.store->put_emergency_settings(settings);
    auto manager = fixture.make_manager();

    auto vehicle = manager->create_incident("rider-v", ridesafe::IncidentType::kVehicleIssue, point(0, 0, 0));
    expect_true(vehicle.responders.size() == 1 &&
                    vehicle.responders[0].type == ridesafe::ResponderType::kSupportAgent,
                "medium priority gets only a support agent");
    expect_true(fixture.channels->driver_notes.empty(), "no driver notice without a ride");

    fixture.channels->sms.clear();
    ridesafe::IncidentOptions discrete;
    discrete.discrete_mode = true;
    auto panic = manager->create_incident("rider-v", ridesafe::IncidentType::kPanic, point(0, 0, 0), discrete);
    expect_true(fixture.channels->sms.empty(), "discrete mode skips contacts");
    expect_true(panic.responders.size() == 2, "high priority adds security team");
    expect_true(!has_event(panic, ridesafe::TimelineEventType::kServicesContacted),
                "no dispatch without auto call");

    expect_true(manager->active_incidents("rider-v").size() == 2, "active incidents for user");
    expect_true(manager->active_incidents("someone-else").empty(), "active incidents filtered by user");

    const auto support_id = panic.responders.back().id;
    expect_true(manager->update_responder_status(panic.id, support_id, ridesafe::ResponderStatus::kResponding),
                "responder status updated");
    expect_true(manager->get_incident(panic.id)->status == ridesafe::IncidentStatus::kResponding,
                "engaged responder moves incident to responding");
    expect_true(!manager->update_responder_status(panic.id, "responder_missing", ridesafe::ResponderStatus::kOnScene),
                "unknown responder rejected");

    ridesafe::EmergencyResponder driver;
    driver.type = ridesafe::ResponderType::kDriver;
    driver.name = "Driver";
    expect_true(manager->add_responder(vehicle.id, driver), "responder added");
    expect_true(manager->get_incident(vehicle.id)->status == ridesafe::IncidentStatus::kResponding,
                "assigned responder moves incident to responding");

    expect_true(manager->resolve_incident(panic.id, "agent-3", "Accidental trigger", false,
                                          ridesafe::IncidentOutcome::kFalseAlarm),
                "mark false alarm");
    expect_true(manager->get_incident(panic.id)->status == ridesafe::IncidentStatus::kFalseAlarm,
                "false alarm is terminal");
    expect_true(!manager->resolve_incident(panic.id, "agent-3", "again"), "false alarm cannot be resolved");
}

void test_incident_persistence_failure() {
    auto writer = std::make_shared<ridesafe::AsyncRecordWriter>(std::make_shared<FailingRepository>());
    ridesafe::IncidentCollaborators collaborators;
    collaborators.writer = writer;
    ridesafe::EmergencyIncidentManager manager(collaborators);
    bool threw = false;
    try {
        manager.create_incident("rider-f", ridesafe::IncidentType::kSos, point(0, 0, 0));
    } catch (const ridesafe::IncidentError& exc) {
        threw = std::string(exc.what()).find("disk full") != std::string::npos;
    }
    expect_true(threw, "unrecorded incident raises IncidentError");
    expect_true(manager.active_incidents().empty(), "failed incident not registered");
    expect_true(writer->failed_writes() == 1, "failed write counted");
}

void test_incident_tracking() {
    IncidentFixture fixture;
    auto provider = std::make_shared<ScriptedLocationProvider>();
    for (int i = 0; i < 500; ++i) {
        provider->script.push_back(point(1.5, 2.5, 0.0));
    }
    fixture.writer->start();
    auto manager = fixture.make_manager(provider, 0.01);
    auto incident = manager->create_incident("rider-t", ridesafe::IncidentType::kAccident, point(0, 0, 0));
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    auto tracked = manager->get_incident(incident.id);
    expect_near(tracked->location.latitude, 1.5, 1e-9, "tracking updates incident location");
    expect_true(tracked->location.address.value_or("") == "1.500000, 2.500000", "tracking refreshes address");

    expect_true(manager->resolve_incident(incident.id, "agent-4", "Handled"), "tracked incident resolved");
    int calls_after_resolve = 0;
    {
        std::lock_guard<std::mutex> guard(provider->mutex);
        calls_after_resolve = provider->calls;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    {
        std::lock_guard<std::mutex> guard(provider->mutex);
        expect_true(provider->calls == calls_after_resolve, "resolution stops tracking");
    }
    fixture.writer->flush();
    auto stored = fixture.repository->incident(incident.id);
    expect_true(stored && stored->status == ridesafe::IncidentStatus::kResolved, "latest snapshot persisted");
    fixture.writer->stop();
}

void test_panic_escalation() {
    ManualClock clock;
    auto store = std::make_shared<ridesafe::InMemorySettingsStore>();
    auto resolver = std::make_shared<ridesafe::SettingsResolver>(store);
    auto channels = std::make_shared<RecordingChannels>();
    auto repository = std::make_shared<ridesafe::InMemoryRepository>();
    auto writer = std::make_shared<ridesafe::AsyncRecordWriter>(repository);

    ridesafe::IncidentCollaborators incident_collaborators;
    incident_collaborators.settings = resolver;
    incident_collaborators.channels = channels;
    incident_collaborators.writer = writer;
    ridesafe::IncidentConfig incident_config;
    incident_config.tracking_interval_s = 3600.0;
    auto incidents = std::make_shared<ridesafe::EmergencyIncidentManager>(incident_collaborators, incident_config,
                                                                          clock.fn());

    ridesafe::MonitorCollaborators collaborators{nullptr, resolver, channels, writer};
    ridesafe::RideMonitor monitor(collaborators, {}, clock.fn());
    monitor.set_incident_manager(incidents);
    monitor.start_monitoring("ride-p", "rider-p", "driver-p", {point(0.0, 0.0, 0.0)}, false);
    monitor.process_fix("ride-p", point(0.0, 0.0, 1.0));

    auto alert = monitor.trigger_panic("ride-p");
    expect_true(alert && alert->type == ridesafe::AlertType::kPanicButton, "panic alert raised");
    expect_true(alert && alert->severity == ridesafe::Severity::kCritical, "panic alert is critical");
    expect_true(alert && alert->actions.back().type == ridesafe::AlertActionType::kEmergencyDispatched &&
                    alert->actions.back().success,
                "panic escalated to an incident");
    auto open = incidents->active_incidents("rider-p");
    expect_true(open.size() == 1 && open[0].type == ridesafe::IncidentType::kPanic, "panic incident created");
    expect_true(open.size() == 1 && open[0].ride_id.value_or("") == "ride-p", "incident references the ride");

    expect_true(monitor.acknowledge_alert("ride-p", alert->id, "agent-5"), "panic alert acknowledged");
    expect_true(!monitor.mark_false_alarm("ride-p", alert->id), "acknowledged alert is terminal");
    expect_true(!monitor.trigger_panic("ride-missing").has_value(), "panic on unknown ride");
    incidents->shutdown();
}

void test_record_writer() {
    auto repository = std::make_shared<ridesafe::InMemoryRepository>();
    ridesafe::MonitoringSession newer;
    newer.id = "monitoring_1";
    newer.risk_score = 50.0;
    ridesafe::MonitoringSession older = newer;
    older.risk_score = 30.0;
    repository->upsert(newer, 5);
    repository->upsert(older, 3);
    expect_near(repository->session("monitoring_1")->risk_score, 50.0, 1e-9, "stale write ignored");

    auto store = std::make_shared<ridesafe::InMemoryRepository>();
    ridesafe::AsyncRecordWriter writer(store);
    writer.start();
    for (int i = 1; i <= 20; ++i) {
        ridesafe::MonitoringSession snapshot;
        snapshot.id = "monitoring_2";
        snapshot.risk_score = static_cast<double>(i);
        writer.enqueue(snapshot);
    }
    writer.flush();
    expect_near(store->session("monitoring_2")->risk_score, 20.0, 1e-9, "last enqueued snapshot wins");
    writer.stop();
    writer.stop();

    const auto path = temp_file("ridesafe_records_test.jsonl");
    {
        ridesafe::JsonLinesRepository lines(path.string());
        ridesafe::EmergencyIncident incident;
        incident.id = "emergency_1";
        incident.description = std::string("said \"help\"");
        expect_true(lines.upsert(incident, 1).ok, "json lines write ok");
    }
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    expect_true(line.rfind("{\"sequence\":1,", 0) == 0, "record line starts with sequence");
    expect_true(line.find("\"kind\":\"emergency_incident\"") != std::string::npos, "record line has kind");
    expect_true(line.find("said \\\"help\\\"") != std::string::npos, "record line escapes strings");
}

void test_serialization() {
    ridesafe::MonitoringSession session;
    session.id = "monitoring_9";
    session.ride_id = "ride-9";
    ridesafe::SafetyAlert alert;
    alert.id = "alert_1";
    alert.description = "line\nbreak";
    session.alerts.push_back(alert);
    session.actual_route.push_back(point(1.0, 2.0, 3.0, 4.0));
    const auto json = ridesafe::to_json(session);
    expect_true(json.find("\"kind\":\"monitoring_session\"") != std::string::npos, "session json kind");
    expect_true(json.find("line\\nbreak") != std::string::npos, "session json escapes newline");
    expect_true(json.find("\"heading\":null") != std::string::npos, "missing optional is null");
    expect_true(json.find("\"latitude\":1.000000") != std::string::npos, "coordinates with six decimals");
}

void test_settings_fallback() {
    auto store = std::make_shared<FlakySettingsStore>();
    ridesafe::SafetySettings custom = ridesafe::default_safety_settings("rider-s");
    custom.route_deviation_threshold = 300.0;
    store->inner.put_safety_settings(custom);
    ridesafe::SettingsResolver resolver(store);

    auto fresh = resolver.safety("rider-s");
    expect_near(fresh.route_deviation_threshold, 300.0, 1e-9, "stored settings read");
    expect_true(fresh.version > 0, "stored settings carry a version");
    store->failing = true;
    expect_near(resolver.safety("rider-s").route_deviation_threshold, 300.0, 1e-9,
                "failed fetch reuses last snapshot");
    expect_near(resolver.safety("rider-new").route_deviation_threshold, 500.0, 1e-9,
                "failed fetch without snapshot uses defaults");
    expect_true(!resolver.emergency("rider-new").auto_call_emergency_services, "emergency defaults");
}

void test_task_group() {
    std::atomic<int> ticks{0};
    std::atomic<int> fired{0};
    {
        ridesafe::TaskGroup group("test");
        group.spawn_periodic("tick", 0.005, [&ticks] { ticks.fetch_add(1); });
        group.spawn_after("once", 0.01, [&fired] { fired.fetch_add(1); });
        group.spawn_after("never", 10.0, [&fired] { fired.fetch_add(100); });
        group.spawn_periodic("throws", 0.005, [] { throw std::runtime_error("boom"); });
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        group.cancel();
        group.cancel();
        expect_true(group.cancelled(), "group cancelled");
        const int after_cancel = ticks.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        expect_true(ticks.load() == after_cancel, "no ticks after cancel");
        group.spawn_after("late", 0.0, [&fired] { fired.fetch_add(1000); });
    }
    expect_true(ticks.load() > 0, "periodic task ran");
    expect_true(fired.load() == 1, "delayed task ran once and cancelled tasks never ran");
}

void test_background_monitoring() {
    auto provider = std::make_shared<MovingLocationProvider>();
    auto store = std::make_shared<ridesafe::InMemorySettingsStore>();
    ridesafe::SafetySettings safety = ridesafe::default_safety_settings("rider-b");
    safety.check_in_interval_min = 0.0005;
    store->put_safety_settings(safety);
    auto repository = std::make_shared<ridesafe::InMemoryRepository>();
    auto writer = std::make_shared<ridesafe::AsyncRecordWriter>(repository);
    writer->start();

    ridesafe::RideSafeSettings settings;
    settings.monitoring.location_poll_interval_s = 0.01;
    settings.monitoring.check_in_response_timeout_s = 0.02;
    ridesafe::MonitorCollaborators collaborators{provider, std::make_shared<ridesafe::SettingsResolver>(store),
                                                 std::make_shared<RecordingChannels>(), writer};
    ridesafe::RideMonitor monitor(collaborators, settings);

    auto started = monitor.start_monitoring("ride-b", "rider-b", "driver-b", {point(0.0, 0.0, 0.0)});
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto running = monitor.get_session("ride-b");
    expect_true(running && !running->actual_route.empty(), "polling loop records fixes");
    expect_true(running && !running->check_ins.empty(), "check-in loop prompts");
    expect_true(monitor.active_sessions().size() == 1, "one active session");

    expect_true(monitor.stop_monitoring("ride-b"), "background session stopped");
    const int calls_after_stop = provider->calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    expect_true(provider->calls.load() == calls_after_stop, "no polling after stop");
    expect_true(monitor.active_sessions().empty(), "registry empty after stop");

    writer->flush();
    auto stored = repository->session(started->id);
    expect_true(stored && stored->status == ridesafe::SessionStatus::kCompleted, "completed session persisted");
    expect_true(stored && !stored->is_active && stored->end_time.has_value(), "completed session closed");
    writer->stop();
}

void test_daemon_replay() {
    std::vector<std::string> lines = {"0,0,1000", "0,0.0001,1010", "not a fix", "0,0.0002,1020"};
    auto cursor = std::make_shared<std::size_t>(0);
    ridesafe::LineSource source = [lines, cursor]() -> std::optional<std::string> {
        if (*cursor >= lines.size()) {
            return std::nullopt;
        }
        return lines[(*cursor)++];
    };
    auto replay = std::make_shared<ridesafe::ReplayLocationProvider>(source);
    auto repository = std::make_shared<ridesafe::InMemoryRepository>();
    ridesafe::RuntimeCollaborators collaborators;
    collaborators.location = replay;
    collaborators.channels = std::make_shared<RecordingChannels>();
    collaborators.repository = repository;
    auto runtime = ridesafe::build_runtime(collaborators);

    ridesafe::DaemonConfig config;
    config.ride_id = "ride-d";
    config.planned_route = {point(0.0, 0.0, 0.0), point(0.0, 0.001, 0.0)};
    ridesafe::RideSafeDaemon daemon(runtime, replay, config);
    daemon.run();

    auto sessions = repository->sessions();
    expect_true(sessions.size() == 1, "daemon persisted one session");
    if (sessions.size() == 1) {
        expect_true(sessions[0].actual_route.size() == 3, "daemon replayed every valid fix");
        expect_true(sessions[0].status == ridesafe::SessionStatus::kCompleted, "daemon completes the session");
    }
}

}  // namespace

int main() {
    std::ostringstream quiet;
    ridesafe::set_log_sink(&quiet);

    try {
        test_config_parsing();
        test_logging_output();
        test_log_file_rotation();
        ridesafe::set_log_sink(&quiet);
        test_json_escaping();
        test_geometry();
        test_nmea_parsing();
        test_non_finite_fixes();
        test_replay_provider_shared();
        test_deviation_detector();
        test_deviation_scenario();
        test_harsh_acceleration();
        test_sharp_turns_and_braking();
        test_behavior_score_bounds();
        test_extended_stop();
        test_risk_aggregation();
        test_alert_actions();
        test_check_in_scheduler();
        test_monitor_check_ins();
        test_communication_loss();
        test_incident_priority();
        test_medical_incident();
        test_incident_workflow_variants();
        test_incident_persistence_failure();
        test_incident_tracking();
        test_panic_escalation();
        test_record_writer();
        test_serialization();
        test_settings_fallback();
        test_task_group();
        test_background_monitoring();
        test_daemon_replay();
    } catch (const std::exception& exc) {
        ridesafe::set_log_sink(nullptr);
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }
    ridesafe::set_log_sink(nullptr);

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
