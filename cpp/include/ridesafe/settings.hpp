#ifndef RIDESAFE_SETTINGS_HPP
#define RIDESAFE_SETTINGS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ridesafe/logging.hpp"

namespace ridesafe {

enum class AlertSensitivity {
    kLow,
    kMedium,
    kHigh,
};

// Per-user safety preferences. Owned by an external store; read-only here.
struct SafetySettings {
    std::string user_id;
    bool enable_ride_monitoring = true;
    double route_deviation_threshold = 500.0;  // meters
    double speed_violation_threshold = 20.0;   // percent above the posted limit
    double check_in_interval_min = 10.0;
    bool enable_automatic_check_ins = true;
    bool emergency_contacts_on_alert = true;
    bool driver_behavior_monitoring = true;
    AlertSensitivity alert_sensitivity = AlertSensitivity::kMedium;
    std::uint64_t version = 0;
};

struct NotificationPreferences {
    bool sms = true;
    bool call = false;
    bool email = false;
};

struct EmergencyContact {
    std::string id;
    std::string name;
    std::string phone_number;
    std::string email;
    std::string relationship;
    bool is_primary = false;
    bool is_active = true;
    NotificationPreferences preferences{};
};

struct EmergencySettings {
    std::string user_id;
    std::vector<EmergencyContact> emergency_contacts;
    bool auto_call_emergency_services = false;
    bool share_location_with_contacts = true;
    bool discrete_mode = false;
    bool auto_record_audio = false;
    bool auto_take_photos = false;
    std::uint64_t version = 0;
};

SafetySettings default_safety_settings(const std::string& user_id);
EmergencySettings default_emergency_settings(const std::string& user_id);

std::string to_string(AlertSensitivity value);

// Returns std::nullopt when nothing is stored for the user; throws on fetch failure.
class SettingsStore {
public:
    virtual ~SettingsStore() = default;
    virtual std::optional<SafetySettings> get_safety_settings(const std::string& user_id) = 0;
    virtual std::optional<EmergencySettings> get_emergency_settings(const std::string& user_id) = 0;
};

class InMemorySettingsStore : public SettingsStore {
public:
    std::optional<SafetySettings> get_safety_settings(const std::string& user_id) override;
    std::optional<EmergencySettings> get_emergency_settings(const std::string& user_id) override;

    // Stores a snapshot and stamps the next version number on it.
    void put_safety_settings(SafetySettings settings);
    void put_emergency_settings(EmergencySettings settings);

private:
    std::mutex mutex_;
    std::map<std::string, SafetySettings> safety_;
    std::map<std::string, EmergencySettings> emergency_;
    std::uint64_t version_ = 0;
};

// Latest-snapshot reader. A failed fetch falls back to the last snapshot seen
// for the user, then to system defaults.
class SettingsResolver {
public:
    explicit SettingsResolver(std::shared_ptr<SettingsStore> store,
                              Logger logger = get_logger("SettingsResolver"));

    SafetySettings safety(const std::string& user_id);
    EmergencySettings emergency(const std::string& user_id);

private:
    std::shared_ptr<SettingsStore> store_;
    Logger logger_;
    std::mutex mutex_;
    std::map<std::string, SafetySettings> last_safety_;
    std::map<std::string, EmergencySettings> last_emergency_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_SETTINGS_HPP
