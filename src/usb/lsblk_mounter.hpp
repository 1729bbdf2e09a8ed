#ifndef _REVUSB_USB_LSBLK_MOUNTER_
#define _REVUSB_USB_LSBLK_MOUNTER_

#include "../pchheader.hpp"
#include "../conf.hpp"
#include "mounter.hpp"

namespace usb
{
    struct command_result
    {
        int exit_code = -1;
        std::string out; // Captured stdout.
        std::string err; // Captured stderr.
    };

    /**
     * Mounter implementation that drives lsblk(8), mount(8) and umount(8) helper processes.
     */
    class lsblk_mounter : public mounter
    {
    private:
        const conf::mount_config cfg;
        int execute(const std::vector<std::string> &args, const bool privileged, command_result &result);

    public:
        explicit lsblk_mounter(const conf::mount_config &cfg);

        errors::code list(std::vector<block_device> &devices) override;
        errors::code mount(const block_device &device, std::string_view mount_root) override;
        errors::code unmount(std::string_view mount_root, const bool detach) override;
        bool is_mounted(std::string_view mount_root) override;

        static errors::code parse_lsblk_json(std::vector<block_device> &devices, std::string_view json);
        static errors::code classify_error(std::string_view message);
    };

} // namespace usb

#endif
