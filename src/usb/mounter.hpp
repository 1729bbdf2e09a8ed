#ifndef _REVUSB_USB_MOUNTER_
#define _REVUSB_USB_MOUNTER_

#include "../pchheader.hpp"
#include "../errors.hpp"
#include "usb_common.hpp"

namespace usb
{
    /**
     * Privileged block device capability. The mount state machine only talks to the system through this,
     * so the subprocess based implementation can be swapped for native calls.
     */
    class mounter
    {
    public:
        virtual ~mounter() {}

        // Populates all block devices known to the system in kernel order. No filtering applied.
        virtual errors::code list(std::vector<block_device> &devices) = 0;

        virtual errors::code mount(const block_device &device, std::string_view mount_root) = 0;

        // detach=true performs a lazy unmount. Only used when the device is already gone.
        virtual errors::code unmount(std::string_view mount_root, const bool detach) = 0;

        virtual bool is_mounted(std::string_view mount_root) = 0;
    };

} // namespace usb

#endif
