#ifndef RIDESAFE_COMMON_HPP
#define RIDESAFE_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ridesafe {

// Source of "now" in seconds since the epoch. Injected so tests can drive time.
using ClockFn = std::function<double()>;

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

inline ClockFn system_clock() {
    return [] { return seconds_since_epoch(); };
}

inline std::string format_fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

inline std::string escape_json(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(kHex[(ch >> 4) & 0x0f]);
                    out.push_back(kHex[ch & 0x0f]);
                } else {
                    out.push_back(ch);
                }
                break;
        }
    }
    return out;
}

// "<prefix>_<epoch ms>_<9 base36 chars>", unique enough for in-process records.
inline std::string make_id(const std::string& prefix, double now = seconds_since_epoch()) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 35);
    std::string suffix;
    for (int i = 0; i < 9; ++i) {
        suffix.push_back(kAlphabet[dist(rng)]);
    }
    const auto millis = static_cast<std::int64_t>(now * 1000.0);
    return prefix + "_" + std::to_string(millis) + "_" + suffix;
}

}  // namespace ridesafe

#endif  // RIDESAFE_COMMON_HPP
