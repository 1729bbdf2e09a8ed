#ifndef _REVUSB_USB_MOUNT_CONTROLLER_
#define _REVUSB_USB_MOUNT_CONTROLLER_

#include "../pchheader.hpp"
#include "../conf.hpp"
#include "../errors.hpp"
#include "device_enumerator.hpp"
#include "mounter.hpp"

namespace usb
{
    /**
     * Owns the single active mount. At most one device is mounted at a time and all transitions are serialized.
     * Readers may take session snapshots concurrently with a transition.
     */
    class mount_controller
    {
    private:
        mounter &backend;
        device_enumerator &enumerator;
        const conf::mount_config cfg;

        std::mutex transition_mutex;           // Serializes mount/unmount/invalidate.
        mutable std::shared_mutex session_mutex; // Guards the session.
        std::atomic<MOUNT_STATE> state{MOUNT_STATE::UNMOUNTED};
        std::optional<mount_session> session;
        uint64_t last_session_id = 0;

        void clear_session();

    public:
        mount_controller(mounter &backend, device_enumerator &enumerator, const conf::mount_config &cfg);

        errors::code mount(std::string_view device_name);
        errors::code unmount();
        bool invalidate(const uint64_t session_id);

        MOUNT_STATE get_state() const;
        errors::code get_session(mount_session &out) const;
        bool is_live(const mount_session &s) const;
    };

} // namespace usb

#endif
