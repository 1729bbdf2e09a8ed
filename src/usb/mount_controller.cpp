#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "mount_controller.hpp"

namespace usb
{
    constexpr const char *DEV_PREFIX = "/dev/";

    const char *state_name(const MOUNT_STATE state)
    {
        switch (state)
        {
        case MOUNT_STATE::UNMOUNTED:
            return "unmounted";
        case MOUNT_STATE::MOUNTING:
            return "mounting";
        case MOUNT_STATE::MOUNTED:
            return "mounted";
        case MOUNT_STATE::UNMOUNTING:
            return "unmounting";
        }
        return "unknown";
    }

    // Failures preparing the mount root belong to the mount, not to a client path.
    errors::code mount_root_error(const int err)
    {
        const errors::code res = errors::from_errno(err, errors::IO_ERROR);
        return res == errors::PERMISSION_DENIED ? errors::MOUNT_PERMISSION_DENIED : res;
    }

    mount_controller::mount_controller(mounter &backend, device_enumerator &enumerator, const conf::mount_config &cfg)
        : backend(backend), enumerator(enumerator), cfg(cfg)
    {
    }

    /**
     * Mounts the named device at the configured mount root.
     * @param device_name Kernel device name. A leading /dev/ is accepted.
     * @return OK on success. ALREADY_MOUNTED if a device is already mounted or a transition is in progress.
     *         DEVICE_NOT_FOUND if the device is not among the current eligible devices.
     */
    errors::code mount_controller::mount(std::string_view device_name)
    {
        std::scoped_lock lock(transition_mutex);

        if (state != MOUNT_STATE::UNMOUNTED)
        {
            LOG_WARNING << "Mount of " << device_name << " rejected. Current state: " << state_name(state);
            return errors::ALREADY_MOUNTED;
        }

        if (device_name.rfind(DEV_PREFIX, 0) == 0)
            device_name.remove_prefix(strlen(DEV_PREFIX));

        const std::vector<block_device> devices = enumerator.list();
        const auto itr = std::find_if(devices.begin(), devices.end(), [&](const block_device &d) { return d.name == device_name; });
        if (itr == devices.end())
        {
            LOG_WARNING << "Mount requested for unknown device " << device_name;
            return errors::DEVICE_NOT_FOUND;
        }

        const block_device &device = *itr;
        if (device.mountpoint)
        {
            LOG_WARNING << "Device " << device.name << " is already mounted at " << *device.mountpoint;
            return errors::ALREADY_MOUNTED;
        }

        state = MOUNT_STATE::MOUNTING;

        if (util::create_dir_tree_recursive(cfg.mount_root) == -1)
        {
            const int err = errno;
            LOG_ERROR << err << ": Error creating mount root " << cfg.mount_root;
            state = MOUNT_STATE::UNMOUNTED;
            return mount_root_error(err);
        }

        const std::string root = util::realpath(cfg.mount_root);
        if (root.empty())
        {
            const int err = errno;
            LOG_ERROR << err << ": Error resolving mount root " << cfg.mount_root;
            state = MOUNT_STATE::UNMOUNTED;
            return mount_root_error(err);
        }

        // Something left mounted at the root from outside this session.
        if (backend.is_mounted(root))
        {
            LOG_ERROR << "Mount root " << root << " is already in use.";
            state = MOUNT_STATE::UNMOUNTED;
            return errors::ALREADY_MOUNTED;
        }

        LOG_INFO << "Mounting " << device.name << " (" << (device.fstype.empty() ? "auto" : device.fstype) << ") at " << root;
        const errors::code res = backend.mount(device, root);
        if (res != errors::OK)
        {
            LOG_ERROR << "Mount of " << device.name << " failed: " << errors::to_string(res);

            // A helper that failed or got killed late may still have attached the filesystem.
            if (backend.is_mounted(root))
            {
                LOG_WARNING << "Failed mount left " << root << " attached. Rolling back.";
                errors::code cleanup = backend.unmount(root, false);
                if (cleanup != errors::OK && cleanup != errors::NOT_MOUNTED)
                    cleanup = backend.unmount(root, true);
                if (cleanup != errors::OK && cleanup != errors::NOT_MOUNTED)
                    LOG_ERROR << "Rollback unmount of " << root << " failed: " << errors::to_string(cleanup);
            }

            state = MOUNT_STATE::UNMOUNTED;
            return res;
        }

        {
            std::unique_lock session_lock(session_mutex);
            session = mount_session{++last_session_id, device.name, root, util::get_epoch_milliseconds()};
        }
        state = MOUNT_STATE::MOUNTED;

        LOG_INFO << "Mounted " << device.name << " at " << root << " session:" << last_session_id;
        return errors::OK;
    }

    /**
     * Flushes and unmounts the active device. Busy unmounts are retried a bounded number of times
     * and never forced.
     * @return OK on success. NOT_MOUNTED if nothing is mounted. BUSY if the mount root stayed in use.
     */
    errors::code mount_controller::unmount()
    {
        std::scoped_lock lock(transition_mutex);

        if (state != MOUNT_STATE::MOUNTED)
            return errors::NOT_MOUNTED;

        mount_session current;
        {
            std::shared_lock session_lock(session_mutex);
            current = *session;
        }

        state = MOUNT_STATE::UNMOUNTING;

        // Flush pending writes of the device filesystem before detaching.
        const int root_fd = open(current.mount_root.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (root_fd == -1 || syncfs(root_fd) == -1)
            LOG_WARNING << errno << ": Error flushing " << current.mount_root << " before unmount.";
        if (root_fd != -1)
            close(root_fd);

        errors::code res = backend.unmount(current.mount_root, false);
        for (uint16_t attempt = 1; res == errors::BUSY && attempt <= cfg.unmount_retries; attempt++)
        {
            LOG_WARNING << "Mount root busy. Retrying unmount (" << attempt << "/" << cfg.unmount_retries << ")";
            util::sleep(cfg.unmount_retry_interval);
            res = backend.unmount(current.mount_root, false);
        }

        if (res == errors::NOT_MOUNTED)
        {
            LOG_WARNING << current.mount_root << " was no longer mounted.";
            res = errors::OK;
        }

        if (res != errors::OK)
        {
            LOG_ERROR << "Unmount of " << current.device_name << " failed: " << errors::to_string(res);
            state = MOUNT_STATE::MOUNTED;
            return res;
        }

        clear_session();
        LOG_INFO << "Unmounted " << current.device_name << " from " << current.mount_root;
        return errors::OK;
    }

    /**
     * Drops the given session after its device has vanished. A lazy detach of the stale mount is attempted.
     * @return true if the session was active and got invalidated. false if it was already gone.
     */
    bool mount_controller::invalidate(const uint64_t session_id)
    {
        std::scoped_lock lock(transition_mutex);

        if (state != MOUNT_STATE::MOUNTED)
            return false;

        mount_session current;
        {
            std::shared_lock session_lock(session_mutex);
            if (!session || session->id != session_id)
                return false;
            current = *session;
        }

        LOG_WARNING << "Device " << current.device_name << " lost. Invalidating session " << current.id;
        state = MOUNT_STATE::UNMOUNTING;

        const errors::code res = backend.unmount(current.mount_root, true);
        if (res != errors::OK && res != errors::NOT_MOUNTED)
            LOG_WARNING << "Lazy detach of " << current.mount_root << " failed: " << errors::to_string(res);

        clear_session();
        return true;
    }

    void mount_controller::clear_session()
    {
        {
            std::unique_lock session_lock(session_mutex);
            session.reset();
        }
        state = MOUNT_STATE::UNMOUNTED;
    }

    MOUNT_STATE mount_controller::get_state() const
    {
        return state;
    }

    /**
     * Takes a snapshot of the active session.
     * @return OK with the session populated. NOT_MOUNTED when no device is mounted.
     */
    errors::code mount_controller::get_session(mount_session &out) const
    {
        std::shared_lock session_lock(session_mutex);
        if (state != MOUNT_STATE::MOUNTED || !session)
            return errors::NOT_MOUNTED;

        out = *session;
        return errors::OK;
    }

    // Checks whether the session's filesystem is still attached at its mount root.
    bool mount_controller::is_live(const mount_session &s) const
    {
        return backend.is_mounted(s.mount_root);
    }

} // namespace usb
