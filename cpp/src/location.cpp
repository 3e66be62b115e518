#include "ridesafe/location.hpp"

#include <cmath>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace ridesafe {

namespace {

constexpr double kKnotsToMps = 0.514444;

// NMEA ddmm.mmmm / dddmm.mmmm with hemisphere letter.
double parse_nmea_coordinate(const std::string& value, const std::string& hemisphere, int degree_digits) {
    if (value.size() <= static_cast<size_t>(degree_digits)) {
        throw std::runtime_error("Invalid NMEA coordinate");
    }
    const double degrees = std::stod(value.substr(0, degree_digits));
    const double minutes = std::stod(value.substr(degree_digits));
    double decimal = degrees + minutes / 60.0;
    if (hemisphere == "S" || hemisphere == "W") {
        decimal = -decimal;
    }
    return decimal;
}

std::optional<double> optional_field(const std::vector<std::string>& fields, size_t index) {
    if (index >= fields.size()) {
        return std::nullopt;
    }
    const auto value = trim(fields[index]);
    if (value.empty()) {
        return std::nullopt;
    }
    const double parsed = std::stod(value);
    if (!std::isfinite(parsed)) {
        throw std::invalid_argument(value);
    }
    return parsed;
}

}  // namespace

bool is_valid_fix(const RoutePoint& point) {
    return std::isfinite(point.latitude) && std::isfinite(point.longitude) && std::isfinite(point.timestamp) &&
           std::abs(point.latitude) <= 90.0 && std::abs(point.longitude) <= 180.0;
}

LineSource open_line_source(const std::string& path) {
    auto stream = std::make_shared<std::ifstream>(path);
    if (!stream->is_open()) {
        throw std::runtime_error("Unable to open line source: " + path);
    }
    return [stream]() -> std::optional<std::string> {
        std::string line;
        if (!std::getline(*stream, line)) {
            return std::nullopt;
        }
        return line;
    };
}

std::optional<RoutePoint> parse_rmc(const std::string& line) {
    const auto sentence = trim(line.substr(0, line.find('*')));
    if (sentence.rfind("$GPRMC", 0) != 0 && sentence.rfind("$GNRMC", 0) != 0) {
        return std::nullopt;
    }
    auto fields = split(sentence, ',');
    if (fields.size() < 10 || fields[2] != "A") {
        return std::nullopt;
    }
    const std::string& time_str = fields[1];
    const std::string& date_str = fields[9];
    if (time_str.size() < 6 || date_str.size() != 6) {
        return std::nullopt;
    }

    try {
        std::tm tm{};
        tm.tm_year = std::stoi(date_str.substr(4, 2)) + 2000 - 1900;
        tm.tm_mon = std::stoi(date_str.substr(2, 2)) - 1;
        tm.tm_mday = std::stoi(date_str.substr(0, 2));
        tm.tm_hour = std::stoi(time_str.substr(0, 2));
        tm.tm_min = std::stoi(time_str.substr(2, 2));
        tm.tm_sec = std::stoi(time_str.substr(4, 2));
        tm.tm_isdst = 0;
        double fractional = 0.0;
        if (time_str.size() > 6) {
            fractional = std::stod("0" + time_str.substr(6));
        }

        RoutePoint point;
        point.latitude = parse_nmea_coordinate(fields[3], fields[4], 2);
        point.longitude = parse_nmea_coordinate(fields[5], fields[6], 3);
        point.timestamp = static_cast<double>(timegm(&tm)) + fractional;
        if (auto knots = optional_field(fields, 7)) {
            point.speed = *knots * kKnotsToMps;
        }
        point.heading = optional_field(fields, 8);
        if (!is_valid_fix(point)) {
            return std::nullopt;
        }
        return point;
    } catch (const std::logic_error&) {
        return std::nullopt;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::optional<RoutePoint> parse_csv_point(const std::string& line) {
    const auto trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
        return std::nullopt;
    }
    auto fields = split(trimmed, ',');
    if (fields.size() < 3) {
        return std::nullopt;
    }
    try {
        RoutePoint point;
        point.latitude = std::stod(trim(fields[0]));
        point.longitude = std::stod(trim(fields[1]));
        point.timestamp = std::stod(trim(fields[2]));
        point.speed = optional_field(fields, 3);
        point.heading = optional_field(fields, 4);
        point.accuracy = optional_field(fields, 5);
        if (!is_valid_fix(point)) {
            return std::nullopt;
        }
        return point;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::vector<RoutePoint> load_route_csv(const std::string& path) {
    auto source = open_line_source(path);
    std::vector<RoutePoint> route;
    while (auto line = source()) {
        if (auto point = parse_csv_point(*line)) {
            route.push_back(*point);
        }
    }
    return route;
}

ReplayLocationProvider::ReplayLocationProvider(LineSource source, Logger logger)
    : source_(std::move(source)), logger_(std::move(logger)) {}

std::optional<RoutePoint> ReplayLocationProvider::sample(double) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (exhausted_) {
        return std::nullopt;
    }
    auto line = source_();
    if (!line.has_value()) {
        exhausted_ = true;
        logger_.info("replay_exhausted");
        return std::nullopt;
    }
    auto point = parse_rmc(*line);
    if (!point.has_value()) {
        point = parse_csv_point(*line);
    }
    if (!point.has_value()) {
        logger_.debug("replay_line_skipped", {{"line", *line}});
    }
    return point;
}

bool ReplayLocationProvider::exhausted() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return exhausted_;
}

LocationSampler::LocationSampler(std::shared_ptr<LocationProvider> provider, double timeout_s, int loss_cycles,
                                 Logger logger)
    : provider_(std::move(provider)), timeout_s_(timeout_s), loss_cycles_(loss_cycles), logger_(std::move(logger)) {}

SampleOutcome LocationSampler::sample() {
    if (!provider_) {
        return record_failure();
    }
    std::optional<RoutePoint> point;
    try {
        point = provider_->sample(timeout_s_);
    } catch (const std::exception& exc) {
        logger_.warn("location_sample_failed", {{"error", exc.what()}});
    }
    if (!point.has_value()) {
        return record_failure();
    }
    if (loss_reported_) {
        logger_.info("location_restored", {{"missed_cycles", std::to_string(failures_)}});
    }
    failures_ = 0;
    loss_reported_ = false;
    return SampleOutcome{point, 0, false};
}

int LocationSampler::consecutive_failures() const {
    return failures_;
}

SampleOutcome LocationSampler::record_failure() {
    failures_ += 1;
    SampleOutcome outcome{std::nullopt, failures_, false};
    if (loss_cycles_ > 0 && failures_ >= loss_cycles_ && !loss_reported_) {
        loss_reported_ = true;
        outcome.communication_lost = true;
        logger_.warn("communication_lost", {{"missed_cycles", std::to_string(failures_)}});
    }
    return outcome;
}

}  // namespace ridesafe
