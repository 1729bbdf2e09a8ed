#include "../pchheader.hpp"
#include "../rulog.hpp"
#include "../util/util.hpp"
#include "device_enumerator.hpp"

namespace usb
{
    // Any disk hosting one of these is treated as a system disk.
    const std::unordered_set<std::string> SYSTEM_MOUNTPOINTS = {"/", "/boot", "/boot/efi", "[SWAP]"};

    device_enumerator::device_enumerator(mounter &backend) : backend(backend)
    {
    }

    /**
     * Enumerates removable devices eligible for mounting. Failures are logged and result in an empty list.
     */
    const std::vector<block_device> device_enumerator::list()
    {
        std::vector<block_device> devices;
        if (backend.list(devices) != errors::OK)
        {
            LOG_ERROR << "Device enumeration failed. Reporting no devices.";
            return {};
        }

        return filter_removable(devices);
    }

    /**
     * Picks partitions of removable disks, and removable disks which carry a filesystem directly.
     * Every partition of a disk that hosts a system mount point is excluded. Input order is kept.
     */
    const std::vector<block_device> device_enumerator::filter_removable(const std::vector<block_device> &devices)
    {
        std::unordered_map<std::string, const block_device *> disks;
        std::unordered_set<std::string> partitioned_disks;
        std::unordered_set<std::string> system_disks;

        for (const block_device &dev : devices)
        {
            const bool is_part = dev.type == DEVTYPE_PART;
            const std::string disk_name = is_part ? (dev.parent.empty() ? derive_parent_name(dev.name) : dev.parent) : dev.name;

            if (dev.type == DEVTYPE_DISK)
                disks.emplace(dev.name, &dev);
            else if (is_part)
                partitioned_disks.emplace(disk_name);

            if (dev.mountpoint && SYSTEM_MOUNTPOINTS.count(*dev.mountpoint))
                system_disks.emplace(disk_name);
        }

        std::vector<block_device> eligible;
        for (const block_device &dev : devices)
        {
            if (dev.size == 0) // Empty card reader slots.
                continue;

            if (dev.type == DEVTYPE_PART)
            {
                const std::string disk_name = dev.parent.empty() ? derive_parent_name(dev.name) : dev.parent;
                if (system_disks.count(disk_name))
                    continue;

                const auto disk_itr = disks.find(disk_name);
                const bool removable = dev.removable || (disk_itr != disks.end() && disk_itr->second->removable);
                if (!removable)
                    continue;
            }
            else if (dev.type == DEVTYPE_DISK)
            {
                // Whole disks only qualify when formatted without a partition table.
                if (!dev.removable || dev.fstype.empty() || partitioned_disks.count(dev.name) || system_disks.count(dev.name))
                    continue;
            }
            else
            {
                continue;
            }

            block_device entry = dev;
            entry.removable = true;
            if (entry.human_size.empty())
                entry.human_size = util::to_human_size(entry.size);
            eligible.push_back(std::move(entry));
        }

        return eligible;
    }

    /**
     * Derives the disk name of a partition when lsblk does not report it. eg. sdb1 -> sdb, mmcblk0p1 -> mmcblk0
     */
    const std::string derive_parent_name(std::string_view partition_name)
    {
        size_t end = partition_name.size();
        while (end > 0 && isdigit(partition_name[end - 1]))
            end--;

        // Disks whose names end with a digit separate the partition number with 'p'.
        if (end > 1 && end < partition_name.size() && partition_name[end - 1] == 'p' && isdigit(partition_name[end - 2]))
            end--;

        return std::string(partition_name.substr(0, end));
    }

} // namespace usb
