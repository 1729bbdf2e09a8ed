#ifndef _REVUSB_CORE_USB_CORE_
#define _REVUSB_CORE_USB_CORE_

#include "../pchheader.hpp"
#include "../conf.hpp"
#include "../errors.hpp"
#include "../fs/fs_common.hpp"
#include "../usb/device_enumerator.hpp"
#include "../usb/mount_controller.hpp"
#include "../usb/mounter.hpp"
#include "../usb/status_reporter.hpp"

namespace core
{
    /**
     * Entry point for all device and file operations. Every operation returns one error code and writes
     * its result to an out-parameter. File operations work on a snapshot of the active mount session and
     * invalidate the session when they detect the device has gone away.
     */
    class usb_core
    {
    private:
        usb::device_enumerator enumerator;
        usb::mount_controller controller;
        usb::status_reporter reporter;
        const conf::upload_config upload_cfg;

        errors::code acquire(usb::mount_session &session);
        errors::code settle(const errors::code res, const usb::mount_session &session);

    public:
        usb_core(usb::mounter &backend, const conf::mount_config &mount_cfg, const conf::upload_config &upload_cfg);

        const std::vector<usb::block_device> list_devices();
        errors::code mount(std::string_view device_name);
        errors::code unmount();
        void status(usb::usage_status &status);

        errors::code list_files(std::vector<fs::file_entry> &entries, std::string_view relative_path);
        errors::code upload(fs::file_entry &entry, const fs::upload_request &req);
        errors::code download(uint64_t &bytes_sent, std::string_view relative_path, const int out_fd);
        errors::code remove(std::string_view relative_path);
        errors::code rename(fs::file_entry &entry, std::string_view relative_path, std::string_view new_name);
        errors::code create_folder(fs::file_entry &entry, std::string_view parent_relative_path, std::string_view folder_name);

        usb::MOUNT_STATE get_state() const;
    };

} // namespace core

#endif
