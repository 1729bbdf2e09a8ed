#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "status_reporter.hpp"

namespace usb
{
    status_reporter::status_reporter(const mount_controller &controller) : controller(controller)
    {
    }

    /**
     * Reports the mount status with capacity figures of the mounted filesystem.
     * @param status Populated status. 'mounted' stays false when nothing is mounted.
     * @param session The session the figures were gathered for.
     * @return OK when the status could be determined. DEVICE_LOST if the mounted filesystem has vanished.
     */
    errors::code status_reporter::report(usage_status &status, mount_session &session) const
    {
        status = usage_status{};

        if (controller.get_session(session) != errors::OK)
            return errors::OK;

        if (!controller.is_live(session))
        {
            LOG_WARNING << session.mount_root << " is no longer a mount point.";
            return errors::DEVICE_LOST;
        }

        struct statvfs st;
        if (statvfs(session.mount_root.c_str(), &st) == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error reading filesystem stats of " << session.mount_root;
            return errors::from_errno(err, errors::IO_ERROR);
        }

        status.mounted = true;
        status.device_name = session.device_name;
        status.mount_root = session.mount_root;
        status.total = (uint64_t)st.f_blocks * st.f_frsize;
        status.used = (uint64_t)(st.f_blocks - st.f_bfree) * st.f_frsize;
        status.free = (uint64_t)st.f_bavail * st.f_frsize;
        status.usage_percent = calculate_usage_percent(status.used, status.total);
        status.band = get_usage_band(status.usage_percent);
        return errors::OK;
    }

    /**
     * Rounded usage percentage clamped to 0-100. Zero capacity yields 0.
     */
    uint8_t calculate_usage_percent(const uint64_t used, const uint64_t total)
    {
        if (total == 0)
            return 0;

        const double percent = std::round((double)used * 100.0 / (double)total);
        return (uint8_t)std::clamp(percent, 0.0, 100.0);
    }

    USAGE_BAND get_usage_band(const uint8_t usage_percent)
    {
        if (usage_percent > DANGER_THRESHOLD)
            return USAGE_BAND::DANGER;
        else if (usage_percent > WARNING_THRESHOLD)
            return USAGE_BAND::WARNING;
        return USAGE_BAND::NORMAL;
    }

    const char *band_name(const USAGE_BAND band)
    {
        switch (band)
        {
        case USAGE_BAND::DANGER:
            return "danger";
        case USAGE_BAND::WARNING:
            return "warning";
        default:
            return "normal";
        }
    }

} // namespace usb
