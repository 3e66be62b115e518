#include "ridesafe/settings.hpp"

#include <stdexcept>

namespace ridesafe {

SafetySettings default_safety_settings(const std::string& user_id) {
    SafetySettings settings;
    settings.user_id = user_id;
    return settings;
}

EmergencySettings default_emergency_settings(const std::string& user_id) {
    EmergencySettings settings;
    settings.user_id = user_id;
    return settings;
}

std::string to_string(AlertSensitivity value) {
    switch (value) {
        case AlertSensitivity::kLow:
            return "low";
        case AlertSensitivity::kMedium:
            return "medium";
        case AlertSensitivity::kHigh:
            return "high";
    }
    return "medium";
}

std::optional<SafetySettings> InMemorySettingsStore::get_safety_settings(const std::string& user_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = safety_.find(user_id);
    if (it == safety_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EmergencySettings> InMemorySettingsStore::get_emergency_settings(const std::string& user_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = emergency_.find(user_id);
    if (it == emergency_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySettingsStore::put_safety_settings(SafetySettings settings) {
    std::lock_guard<std::mutex> guard(mutex_);
    settings.version = ++version_;
    safety_[settings.user_id] = std::move(settings);
}

void InMemorySettingsStore::put_emergency_settings(EmergencySettings settings) {
    std::lock_guard<std::mutex> guard(mutex_);
    settings.version = ++version_;
    emergency_[settings.user_id] = std::move(settings);
}

SettingsResolver::SettingsResolver(std::shared_ptr<SettingsStore> store, Logger logger)
    : store_(std::move(store)), logger_(std::move(logger)) {}

SafetySettings SettingsResolver::safety(const std::string& user_id) {
    std::optional<SafetySettings> fetched;
    try {
        if (store_) {
            fetched = store_->get_safety_settings(user_id);
        }
        if (!fetched.has_value()) {
            fetched = default_safety_settings(user_id);
        }
    } catch (const std::exception& exc) {
        logger_.warn("safety_settings_fetch_failed", {{"user_id", user_id}, {"error", exc.what()}});
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = last_safety_.find(user_id);
        return it != last_safety_.end() ? it->second : default_safety_settings(user_id);
    }

    std::lock_guard<std::mutex> guard(mutex_);
    last_safety_[user_id] = *fetched;
    return *fetched;
}

EmergencySettings SettingsResolver::emergency(const std::string& user_id) {
    std::optional<EmergencySettings> fetched;
    try {
        if (store_) {
            fetched = store_->get_emergency_settings(user_id);
        }
        if (!fetched.has_value()) {
            fetched = default_emergency_settings(user_id);
        }
    } catch (const std::exception& exc) {
        logger_.warn("emergency_settings_fetch_failed", {{"user_id", user_id}, {"error", exc.what()}});
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = last_emergency_.find(user_id);
        return it != last_emergency_.end() ? it->second : default_emergency_settings(user_id);
    }

    std::lock_guard<std::mutex> guard(mutex_);
    last_emergency_[user_id] = *fetched;
    return *fetched;
}

}  // namespace ridesafe
