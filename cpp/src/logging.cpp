#include "ridesafe/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>

#include "ridesafe/common.hpp"

namespace ridesafe {

namespace {

namespace fs = std::filesystem;

// Size-capped log file with numbered backups (ridesafe.log.1 is the newest).
class RotatingFile {
public:
    RotatingFile(fs::path path, std::uintmax_t max_bytes, int backups)
        : path_(std::move(path)), max_bytes_(max_bytes), backups_(backups) {
        reopen();
    }

    bool ok() const { return stream_ && stream_->is_open(); }
    std::ostream& stream() { return *stream_; }

    void rotate_if_full() {
        if (max_bytes_ == 0 || backups_ <= 0) {
            return;
        }
        std::error_code ec;
        const auto size = fs::file_size(path_, ec);
        if (ec || size < max_bytes_) {
            return;
        }
        stream_.reset();
        fs::remove(backup(backups_), ec);
        for (int index = backups_ - 1; index >= 1; --index) {
            fs::rename(backup(index), backup(index + 1), ec);
        }
        fs::rename(path_, backup(1), ec);
        reopen();
    }

private:
    fs::path backup(int index) const {
        fs::path name = path_;
        name += "." + std::to_string(index);
        return name;
    }

    void reopen() { stream_ = std::make_unique<std::ofstream>(path_, std::ios::app); }

    fs::path path_;
    std::uintmax_t max_bytes_;
    int backups_;
    std::unique_ptr<std::ofstream> stream_;
};

struct LoggingState {
    LogLevel level = LogLevel::kInfo;
    bool json = true;
    std::unique_ptr<RotatingFile> file;
    std::ostream* sink = nullptr;
    std::mutex mutex;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

LogLevel parse_level(const std::string& level) {
    if (level == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (level == "WARN" || level == "WARNING") {
        return LogLevel::kWarn;
    }
    if (level == "ERROR") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

std::string json_line(const std::string& ts, LogLevel level, const std::string& logger, const std::string& event,
                      const LogFields& fields) {
    std::string line = "{\"ts\":" + ts + ",\"level\":\"" + level_name(level) + "\",\"logger\":\"" +
                       escape_json(logger) + "\",\"event\":\"" + escape_json(event) + "\"";
    for (const auto& [key, value] : fields) {
        line += ",\"" + escape_json(key) + "\":\"" + escape_json(value) + "\"";
    }
    return line + "}";
}

// "<ts> <LEVEL> <logger> <event> | k=v k=v"
std::string plain_line(const std::string& ts, LogLevel level, const std::string& logger, const std::string& event,
                       const LogFields& fields) {
    std::string line = ts + " " + level_name(level) + " " + logger + " " + event;
    if (!fields.empty()) {
        line += " |";
        for (const auto& [key, value] : fields) {
            line += " " + key + "=" + value;
        }
    }
    return line;
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::log(LogLevel level, const std::string& event, const LogFields& extra) const {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    if (static_cast<int>(level) < static_cast<int>(log_state.level)) {
        return;
    }

    const std::string ts = format_fixed(seconds_since_epoch(), 3);
    const std::string line =
        log_state.json ? json_line(ts, level, name_, event, extra) : plain_line(ts, level, name_, event, extra);

    if (log_state.sink != nullptr) {
        *log_state.sink << line << '\n';
        return;
    }
    if (log_state.file && log_state.file->ok()) {
        log_state.file->rotate_if_full();
        if (log_state.file->ok()) {
            log_state.file->stream() << line << '\n';
            log_state.file->stream().flush();
            return;
        }
    }
    std::cout << line << std::endl;
}

void Logger::debug(const std::string& event, const LogFields& extra) const {
    log(LogLevel::kDebug, event, extra);
}

void Logger::info(const std::string& event, const LogFields& extra) const {
    log(LogLevel::kInfo, event, extra);
}

void Logger::warn(const std::string& event, const LogFields& extra) const {
    log(LogLevel::kWarn, event, extra);
}

void Logger::error(const std::string& event, const LogFields& extra) const {
    log(LogLevel::kError, event, extra);
}

void configure_logging(const LoggingConfig& config) {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    log_state.level = parse_level(config.level);
    log_state.json = config.json;
    log_state.file.reset();
    if (config.log_file.has_value()) {
        log_state.file = std::make_unique<RotatingFile>(
            *config.log_file, static_cast<std::uintmax_t>(std::max(0, config.max_bytes)), config.backup_count);
    }
}

Logger get_logger(const std::string& name) {
    return Logger(name);
}

void set_log_sink(std::ostream* sink) {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    log_state.sink = sink;
}

}  // namespace ridesafe
