#ifndef _REVUSB_USB_STATUS_REPORTER_
#define _REVUSB_USB_STATUS_REPORTER_

#include "../pchheader.hpp"
#include "../errors.hpp"
#include "mount_controller.hpp"

namespace usb
{
    constexpr uint8_t WARNING_THRESHOLD = 75; // Usage percentage above which the warning band applies.
    constexpr uint8_t DANGER_THRESHOLD = 90;  // Usage percentage above which the danger band applies.

    enum USAGE_BAND
    {
        NORMAL = 0,
        WARNING = 1,
        DANGER = 2
    };

    struct usage_status
    {
        bool mounted = false;
        std::string device_name;
        std::string mount_root;
        uint64_t total = 0; // Capacity in bytes.
        uint64_t used = 0;  // Used bytes.
        uint64_t free = 0;  // Bytes available to unprivileged users.
        uint8_t usage_percent = 0;
        USAGE_BAND band = USAGE_BAND::NORMAL;
    };

    class status_reporter
    {
    private:
        const mount_controller &controller;

    public:
        explicit status_reporter(const mount_controller &controller);
        errors::code report(usage_status &status, mount_session &session) const;
    };

    uint8_t calculate_usage_percent(const uint64_t used, const uint64_t total);

    USAGE_BAND get_usage_band(const uint8_t usage_percent);

    const char *band_name(const USAGE_BAND band);

} // namespace usb

#endif
