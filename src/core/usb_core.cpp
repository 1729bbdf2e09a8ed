#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../fs/file_catalog.hpp"
#include "../fs/file_ops.hpp"
#include "../fs/path_resolver.hpp"
#include "usb_core.hpp"

namespace core
{
    usb_core::usb_core(usb::mounter &backend, const conf::mount_config &mount_cfg, const conf::upload_config &upload_cfg)
        : enumerator(backend),
          controller(backend, enumerator, mount_cfg),
          reporter(controller),
          upload_cfg(upload_cfg)
    {
    }

    /**
     * Post processes the result of an operation performed against the given session. Device loss, or an
     * I/O failure while the mount has vanished, drops the session.
     */
    errors::code usb_core::settle(const errors::code res, const usb::mount_session &session)
    {
        if (res == errors::DEVICE_LOST || (res == errors::IO_ERROR && !controller.is_live(session)))
        {
            controller.invalidate(session.id);
            return errors::DEVICE_LOST;
        }

        return res;
    }

    /**
     * Fetches the active mount session for a file operation. A session whose mount has vanished from
     * under the mount root is dropped so that nothing is written to the bare host directory.
     * @return OK with the session populated, NOT_MOUNTED or DEVICE_LOST.
     */
    errors::code usb_core::acquire(usb::mount_session &session)
    {
        if (controller.get_session(session) != errors::OK)
            return errors::NOT_MOUNTED;

        if (!controller.is_live(session))
        {
            LOG_ERROR << "Mount of " << session.device_name << " at " << session.mount_root << " is gone. Dropping session.";
            controller.invalidate(session.id);
            return errors::DEVICE_LOST;
        }

        return errors::OK;
    }

    const std::vector<usb::block_device> usb_core::list_devices()
    {
        return enumerator.list();
    }

    errors::code usb_core::mount(std::string_view device_name)
    {
        return controller.mount(device_name);
    }

    errors::code usb_core::unmount()
    {
        return controller.unmount();
    }

    void usb_core::status(usb::usage_status &status)
    {
        usb::mount_session session;
        const errors::code res = reporter.report(status, session);
        if (res == errors::OK)
            return;

        // Status never fails. Whatever went wrong with a mounted device is reported as unmounted.
        if (settle(res, session) != errors::DEVICE_LOST)
            LOG_WARNING << "Usage figures unavailable for " << session.mount_root << ": " << errors::to_string(res);
        status = usb::usage_status{};
        status.mounted = controller.get_state() == usb::MOUNT_STATE::MOUNTED;
        if (status.mounted)
        {
            status.device_name = session.device_name;
            status.mount_root = session.mount_root;
        }
    }

    errors::code usb_core::list_files(std::vector<fs::file_entry> &entries, std::string_view relative_path)
    {
        usb::mount_session session;
        const errors::code acquired = acquire(session);
        if (acquired != errors::OK)
            return acquired;

        const fs::path_resolver resolver(session.mount_root);
        const fs::file_catalog catalog(resolver);
        return settle(catalog.list(entries, relative_path), session);
    }

    errors::code usb_core::upload(fs::file_entry &entry, const fs::upload_request &req)
    {
        usb::mount_session session;
        const errors::code acquired = acquire(session);
        if (acquired != errors::OK)
            return acquired;

        const fs::path_resolver resolver(session.mount_root);
        const fs::file_catalog catalog(resolver);
        const fs::file_ops ops(resolver, catalog, upload_cfg);
        return settle(ops.upload(entry, req), session);
    }

    errors::code usb_core::download(uint64_t &bytes_sent, std::string_view relative_path, const int out_fd)
    {
        usb::mount_session session;
        const errors::code acquired = acquire(session);
        if (acquired != errors::OK)
            return acquired;

        const fs::path_resolver resolver(session.mount_root);
        const fs::file_catalog catalog(resolver);
        const fs::file_ops ops(resolver, catalog, upload_cfg);
        return settle(ops.download(bytes_sent, relative_path, out_fd), session);
    }

    errors::code usb_core::remove(std::string_view relative_path)
    {
        usb::mount_session session;
        const errors::code acquired = acquire(session);
        if (acquired != errors::OK)
            return acquired;

        const fs::path_resolver resolver(session.mount_root);
        const fs::file_catalog catalog(resolver);
        const fs::file_ops ops(resolver, catalog, upload_cfg);
        return settle(ops.remove(relative_path), session);
    }

    errors::code usb_core::rename(fs::file_entry &entry, std::string_view relative_path, std::string_view new_name)
    {
        usb::mount_session session;
        const errors::code acquired = acquire(session);
        if (acquired != errors::OK)
            return acquired;

        const fs::path_resolver resolver(session.mount_root);
        const fs::file_catalog catalog(resolver);
        const fs::file_ops ops(resolver, catalog, upload_cfg);
        return settle(ops.rename(entry, relative_path, new_name), session);
    }

    errors::code usb_core::create_folder(fs::file_entry &entry, std::string_view parent_relative_path, std::string_view folder_name)
    {
        usb::mount_session session;
        const errors::code acquired = acquire(session);
        if (acquired != errors::OK)
            return acquired;

        const fs::path_resolver resolver(session.mount_root);
        const fs::file_catalog catalog(resolver);
        const fs::file_ops ops(resolver, catalog, upload_cfg);
        return settle(ops.create_folder(entry, parent_relative_path, folder_name), session);
    }

    usb::MOUNT_STATE usb_core::get_state() const
    {
        return controller.get_state();
    }

} // namespace core
