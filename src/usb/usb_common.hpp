#ifndef _REVUSB_USB_USB_COMMON_
#define _REVUSB_USB_USB_COMMON_

#include "../pchheader.hpp"

namespace usb
{
    // Device types as reported by lsblk.
    constexpr const char *DEVTYPE_DISK = "disk";
    constexpr const char *DEVTYPE_PART = "part";

    struct block_device
    {
        std::string name;                      // Kernel device name. eg. sdb1
        std::string type;                      // disk | part | loop | rom ...
        std::string parent;                    // Parent disk name of a partition. Empty for whole disks.
        uint64_t size = 0;                     // Size in bytes.
        std::string human_size;                // Base 1024 size with one decimal. eg. 14.9 GB
        std::optional<std::string> label;      // Filesystem label if any.
        std::string fstype;                    // Filesystem type. Empty when unknown.
        std::optional<std::string> mountpoint; // Current mount point if the device is mounted anywhere.
        bool removable = false;                // Whether the device sits on removable/hotplug media.
    };

    enum MOUNT_STATE
    {
        UNMOUNTED = 0,
        MOUNTING = 1,
        MOUNTED = 2,
        UNMOUNTING = 3
    };

    // The live binding between the mounted device and the mount root.
    struct mount_session
    {
        uint64_t id = 0;         // Increases with every successful mount.
        std::string device_name; // Kernel device name of the mounted device.
        std::string mount_root;  // Canonical absolute path the device is mounted at.
        uint64_t mounted_at = 0; // Epoch milliseconds of the mount.
    };

    const char *state_name(const MOUNT_STATE state);

} // namespace usb

#endif
