#ifndef _REVUSB_SHELL_SHELLMSG_JSON_
#define _REVUSB_SHELL_SHELLMSG_JSON_

#include "../pchheader.hpp"
#include "../errors.hpp"
#include "../fs/fs_common.hpp"
#include "../usb/usb_common.hpp"
#include "../usb/status_reporter.hpp"

/**
 * Builds the single line json replies of the shell protocol.
 */
namespace shell::json
{
    void create_success(std::string &msg);

    void create_error(std::string &msg, const errors::code code);

    void create_protocol_error(std::string &msg, std::string_view error, std::string_view message);

    void create_device_list(std::string &msg, const std::vector<usb::block_device> &devices);

    void create_mount_response(std::string &msg, const usb::usage_status &status);

    void create_status(std::string &msg, const usb::usage_status &status);

    void create_file_list(std::string &msg, std::string_view path, const std::vector<fs::file_entry> &entries);

    void create_file_response(std::string &msg, const fs::file_entry &entry);

    void create_download_response(std::string &msg, const uint64_t bytes);

    void create_help(std::string &msg, const std::vector<std::string> &commands);

    void populate_device(jsoncons::ojson &d, const usb::block_device &device);

    void populate_file_entry(jsoncons::ojson &d, const fs::file_entry &entry);

} // namespace shell::json

#endif
