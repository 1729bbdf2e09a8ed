#ifndef _REVUSB_USB_DEVICE_ENUMERATOR_
#define _REVUSB_USB_DEVICE_ENUMERATOR_

#include "../pchheader.hpp"
#include "mounter.hpp"

namespace usb
{
    /**
     * Produces the list of mountable removable devices. Devices backing the running system are never offered.
     */
    class device_enumerator
    {
    private:
        mounter &backend;

    public:
        explicit device_enumerator(mounter &backend);
        const std::vector<block_device> list();
        static const std::vector<block_device> filter_removable(const std::vector<block_device> &devices);
    };

    const std::string derive_parent_name(std::string_view partition_name);

} // namespace usb

#endif
