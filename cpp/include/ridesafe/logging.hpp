#ifndef RIDESAFE_LOGGING_HPP
#define RIDESAFE_LOGGING_HPP

#include <map>
#include <optional>
#include <ostream>
#include <string>

#include "ridesafe/config.hpp"

namespace ridesafe {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& event, const LogFields& extra = {}) const;

    void debug(const std::string& event, const LogFields& extra = {}) const;
    void info(const std::string& event, const LogFields& extra = {}) const;
    void warn(const std::string& event, const LogFields& extra = {}) const;
    void error(const std::string& event, const LogFields& extra = {}) const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

// Redirects output to an in-memory stream; used by tests to silence or inspect logs.
void set_log_sink(std::ostream* sink);

}  // namespace ridesafe

#endif  // RIDESAFE_LOGGING_HPP
