#include "../pchheader.hpp"
#include "../usb/mount_controller.hpp"
#include "shellmsg_common.hpp"
#include "shellmsg_json.hpp"

namespace shell::json
{
    constexpr const char *DEV_PREFIX = "/dev/";

    /**
     * Message format:
     * {"success":true}
     */
    void create_success(std::string &msg)
    {
        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d.dump(msg);
    }

    /**
     * Message format:
     * {"success":false,"error":"<code name>","kind":"<DeviceError|PathError|UploadError|SystemError>"}
     */
    void create_error(std::string &msg, const errors::code code)
    {
        jsoncons::ojson d;
        d[FLD_SUCCESS] = false;
        d[FLD_ERROR] = errors::to_string(code);
        d[FLD_KIND] = errors::category(code);
        d.dump(msg);
    }

    /**
     * Message format:
     * {"success":false,"error":"<invalid_command|invalid_arguments|local_file_error>","kind":"ProtocolError","message":"<details>"}
     */
    void create_protocol_error(std::string &msg, std::string_view error, std::string_view message)
    {
        jsoncons::ojson d;
        d[FLD_SUCCESS] = false;
        d[FLD_ERROR] = std::string(error);
        d[FLD_KIND] = KIND_PROTOCOL_ERROR;
        d[FLD_MESSAGE] = std::string(message);
        d.dump(msg);
    }

    /**
     * Message format:
     * {
     *   "success": true,
     *   "devices": [
     *     {"name":"sdb1","path":"/dev/sdb1","type":"part","size":<bytes>,"human_size":"14.9 GB",
     *      "label":"<label or null>","fstype":"vfat","mountpoint":"<path or null>","removable":true}, ...
     *   ]
     * }
     */
    void create_device_list(std::string &msg, const std::vector<usb::block_device> &devices)
    {
        jsoncons::ojson list(jsoncons::json_array_arg);
        for (const usb::block_device &device : devices)
        {
            jsoncons::ojson dev;
            populate_device(dev, device);
            list.push_back(std::move(dev));
        }

        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_DEVICES] = std::move(list);
        d.dump(msg);
    }

    void populate_device(jsoncons::ojson &d, const usb::block_device &device)
    {
        d[FLD_NAME] = device.name;
        d[FLD_PATH] = DEV_PREFIX + device.name;
        d[FLD_TYPE] = device.type;
        d[FLD_SIZE] = device.size;
        d[FLD_HUMAN_SIZE] = device.human_size;
        if (device.label)
            d[FLD_LABEL] = *device.label;
        else
            d[FLD_LABEL] = jsoncons::null_type();
        d[FLD_FSTYPE] = device.fstype;
        if (device.mountpoint)
            d[FLD_MOUNTPOINT] = *device.mountpoint;
        else
            d[FLD_MOUNTPOINT] = jsoncons::null_type();
        d[FLD_REMOVABLE] = device.removable;
    }

    /**
     * Message format:
     * {"success":true,"state":"mounted","device":"sdb1","mount_root":"<path>"}
     */
    void create_mount_response(std::string &msg, const usb::usage_status &status)
    {
        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_STATE] = usb::state_name(status.mounted ? usb::MOUNT_STATE::MOUNTED : usb::MOUNT_STATE::UNMOUNTED);
        d[FLD_DEVICE] = status.device_name;
        d[FLD_MOUNT_ROOT] = status.mount_root;
        d.dump(msg);
    }

    /**
     * Message format:
     * {"success":true,"mounted":false}
     * {"success":true,"mounted":true,"device":"sdb1","mount_root":"<path>","total":<bytes>,"used":<bytes>,
     *  "free":<bytes>,"usage_percent":<0-100>,"band":"<normal|warning|danger>"}
     */
    void create_status(std::string &msg, const usb::usage_status &status)
    {
        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_MOUNTED] = status.mounted;
        if (status.mounted)
        {
            d[FLD_DEVICE] = status.device_name;
            d[FLD_MOUNT_ROOT] = status.mount_root;
            d[FLD_TOTAL] = status.total;
            d[FLD_USED] = status.used;
            d[FLD_FREE] = status.free;
            d[FLD_USAGE_PERCENT] = (uint64_t)status.usage_percent;
            d[FLD_BAND] = usb::band_name(status.band);
        }
        d.dump(msg);
    }

    /**
     * Message format:
     * {"success":true,"path":"<relative dir>","files":[<file entry>, ...]}
     */
    void create_file_list(std::string &msg, std::string_view path, const std::vector<fs::file_entry> &entries)
    {
        jsoncons::ojson list(jsoncons::json_array_arg);
        for (const fs::file_entry &entry : entries)
        {
            jsoncons::ojson e;
            populate_file_entry(e, entry);
            list.push_back(std::move(e));
        }

        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_PATH] = std::string(path);
        d[FLD_FILES] = std::move(list);
        d.dump(msg);
    }

    /**
     * File entry format:
     * {"name":"a.txt","path":"docs/a.txt","is_dir":false,"size":<bytes>,"human_size":"1.5 KB",
     *  "modified":<epoch seconds>,"modified_iso":"2024-01-31T10:20:30","category":"text"}
     */
    void populate_file_entry(jsoncons::ojson &d, const fs::file_entry &entry)
    {
        d[FLD_NAME] = entry.name;
        d[FLD_PATH] = entry.path;
        d[FLD_IS_DIR] = entry.is_dir;
        d[FLD_SIZE] = entry.size;
        d[FLD_HUMAN_SIZE] = entry.human_size;
        d[FLD_MODIFIED] = (int64_t)entry.modified;
        d[FLD_MODIFIED_ISO] = entry.modified_iso;
        d[FLD_CATEGORY] = fs::category_name(entry.category);
    }

    /**
     * Message format:
     * {"success":true,"file":<file entry>}
     */
    void create_file_response(std::string &msg, const fs::file_entry &entry)
    {
        jsoncons::ojson e;
        populate_file_entry(e, entry);

        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_FILE] = std::move(e);
        d.dump(msg);
    }

    /**
     * Message format:
     * {"success":true,"bytes":<bytes written>}
     */
    void create_download_response(std::string &msg, const uint64_t bytes)
    {
        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_BYTES] = bytes;
        d.dump(msg);
    }

    /**
     * Message format:
     * {"success":true,"commands":["<usage>", ...]}
     */
    void create_help(std::string &msg, const std::vector<std::string> &commands)
    {
        jsoncons::ojson list(jsoncons::json_array_arg);
        for (const std::string &cmd : commands)
            list.push_back(cmd);

        jsoncons::ojson d;
        d[FLD_SUCCESS] = true;
        d[FLD_COMMANDS] = std::move(list);
        d.dump(msg);
    }

} // namespace shell::json
