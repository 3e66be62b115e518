#ifndef RIDESAFE_CHANNELS_HPP
#define RIDESAFE_CHANNELS_HPP

#include <string>
#include <vector>

#include "ridesafe/common.hpp"
#include "ridesafe/logging.hpp"
#include "ridesafe/settings.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

// Outbound notification channels. Every call is independent; a failing
// channel throws and the caller records the failure.
class NotificationChannels {
public:
    virtual ~NotificationChannels() = default;
    virtual void send_sms(const std::string& number, const std::string& text) = 0;
    virtual void place_call(const std::string& number, const std::string& context) = 0;
    virtual void send_email(const EmergencyContact& contact, const std::string& context) = 0;
    virtual void notify_user(const std::string& user_id, const std::string& text) = 0;
    virtual void notify_driver(const std::string& ride_id, const std::string& text) = 0;
};

class DispatchService {
public:
    virtual ~DispatchService() = default;
    virtual EmergencyResponder contact_emergency_services(const EmergencyIncident& incident) = 0;
};

// Audio/photo capture; returns references to the stored media.
class MediaCapture {
public:
    virtual ~MediaCapture() = default;
    virtual std::string start_audio_recording(const std::string& incident_id) = 0;
    virtual std::vector<std::string> capture_photos(const std::string& incident_id) = 0;
};

// Writes every outbound message to the log instead of a carrier. Used by the
// daemon and in development setups.
class LoggingNotificationChannels : public NotificationChannels {
public:
    explicit LoggingNotificationChannels(Logger logger = get_logger("Notifications"));

    void send_sms(const std::string& number, const std::string& text) override;
    void place_call(const std::string& number, const std::string& context) override;
    void send_email(const EmergencyContact& contact, const std::string& context) override;
    void notify_user(const std::string& user_id, const std::string& text) override;
    void notify_driver(const std::string& ride_id, const std::string& text) override;

private:
    Logger logger_;
};

class LoggingDispatchService : public DispatchService {
public:
    explicit LoggingDispatchService(double eta_s = 8.0 * 60.0, ClockFn clock = system_clock(),
                                    Logger logger = get_logger("Dispatch"));

    EmergencyResponder contact_emergency_services(const EmergencyIncident& incident) override;

private:
    double eta_s_ = 480.0;
    ClockFn clock_;
    Logger logger_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_CHANNELS_HPP
