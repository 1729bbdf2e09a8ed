#ifndef _REVUSB_CONF_
#define _REVUSB_CONF_

#include "pchheader.hpp"
#include "util/util.hpp"

/**
 * Manages the central config and context structs.
 * Contains functions to config operations such as create/load.
 */
namespace conf
{
    // Log severity levels used in revusb.
    enum LOG_SEVERITY
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct mount_config
    {
        std::string mount_root;               // Fixed directory the active device gets mounted at.
        bool use_sudo = false;                // Whether to prefix privileged commands with sudo.
        std::string mount_bin;                // Full path to mount(8).
        std::string umount_bin;               // Full path to umount(8).
        std::string lsblk_bin;                // Full path to lsblk(8).
        uint32_t command_timeout = 0;         // Max ms to wait for a helper command before killing it.
        uint16_t unmount_retries = 0;         // Extra unmount attempts when the device is busy.
        uint32_t unmount_retry_interval = 0;  // Wait in ms between busy unmount attempts.
    };

    struct upload_config
    {
        uint64_t max_bytes = 0;                           // Max accepted upload size in bytes.
        std::unordered_set<std::string> allowed_extensions; // Lower case extensions including the dot.
    };

    struct log_config
    {
        std::string log_level;                   // Log severity level (dbg, inf, wrn, err)
        LOG_SEVERITY log_level_type;             // Log severity level enum (debug, info, warn, error)
        std::unordered_set<std::string> loggers; // List of enabled loggers (console, file)
        size_t max_mbytes_per_file = 0;          // Max MB size of a single log file.
        size_t max_file_count = 0;               // Max no. of log files to keep.
    };

    // Holds all the config values.
    struct revusb_config
    {
        std::string version;
        mount_config mount;
        upload_config upload;
        log_config log;
    };

    // Holds contextual information about the running instance.
    struct revusb_ctx
    {
        std::string command;     // The CLI command issued to launch revusb.
        std::string exe_dir;     // revusb executable dir.
        std::string base_dir;    // Instance base directory full path.
        std::string config_dir;  // Config dir full path.
        std::string config_file; // Full path to the config file.
        std::string log_dir;     // Log dir full path.

        int config_fd = -1;       // Config file file descriptor.
        struct flock config_lock; // Config file lock.
    };

    // Global context struct exposed to the application.
    // Other modules will access context values via this.
    extern revusb_ctx ctx;

    // Global configuration struct exposed to the application.
    // Other modules will access config values via this.
    extern revusb_config cfg;

    int init();

    void deinit();

    int create_instance();

    void set_dir_paths(std::string exepath, std::string basedir);

    void populate_defaults(revusb_config &cfg);

    //------Internal-use functions for this namespace.

    int read_config(revusb_config &cfg);

    int parse_config(revusb_config &cfg, std::string_view json);

    int write_config(const revusb_config &cfg);

    int validate_config(const revusb_config &cfg);

    int validate_dir_paths();

    LOG_SEVERITY get_loglevel_type(std::string_view severity);

    int set_config_lock();

    int release_config_lock();

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d);

} // namespace conf

#endif
