#include "pchheader.hpp"
#include "conf.hpp"
#include "util/util.hpp"
#include "util/version.hpp"

namespace conf
{

    // Global context struct exposed to the application.
    revusb_ctx ctx;

    // Global configuration struct exposed to the application.
    revusb_config cfg;

    constexpr int FILE_PERMS = 0644;

    // Upload extensions accepted by a freshly created config.
    const std::vector<std::string> DEFAULT_EXTENSIONS = {
        ".txt", ".pdf", ".png", ".jpg", ".jpeg", ".gif", ".doc", ".docx",
        ".xls", ".xlsx", ".ppt", ".pptx", ".zip", ".rar", ".mp3", ".mp4",
        ".avi", ".mov", ".wmv", ".flv", ".webm", ".mkv", ".csv", ".json",
        ".xml", ".html", ".css", ".js", ".py", ".java", ".cpp", ".c",
        ".h", ".hpp", ".md", ".log", ".ini", ".cfg", ".conf", ".yml",
        ".yaml", ".toml", ".sql", ".db", ".sqlite", ".bak", ".tmp"};

    bool init_success = false;

    const std::string extract_missing_field(std::string err_message);

    /**
     * Loads and initializes the config for execution. Must be called once during application startup.
     * @return 0 for success. -1 for failure.
     */
    int init()
    {
        // The validations/loading needs to be in this order.
        // 1. Validate instance directories
        // 2. Lock the config file so no other instance shares this directory
        // 3. Read and load the config into memory
        // 4. Validate the loaded config values

        if (validate_dir_paths() == -1 ||
            set_config_lock() == -1)
            return -1;

        if (read_config(cfg) == -1 ||
            validate_config(cfg) == -1)
        {
            release_config_lock();
            return -1;
        }

        init_success = true;
        return 0;
    }

    /**
     * Cleanup any resources.
     */
    void deinit()
    {
        if (init_success)
        {
            // Releases the config file lock at the termination.
            release_config_lock();
            init_success = false;
        }
    }

    /**
     * Populates the in-memory config struct with default settings.
     */
    void populate_defaults(revusb_config &cfg)
    {
        cfg.version = version::REVUSB_VERSION;

        cfg.mount.mount_root = "/media/usb/revusb";
        cfg.mount.use_sudo = false;
        cfg.mount.mount_bin = "/bin/mount";
        cfg.mount.umount_bin = "/bin/umount";
        cfg.mount.lsblk_bin = "/bin/lsblk";
        cfg.mount.command_timeout = 30000;
        cfg.mount.unmount_retries = 3;
        cfg.mount.unmount_retry_interval = 500;

        cfg.upload.max_bytes = 100 * 1024 * 1024;
        cfg.upload.allowed_extensions.clear();
        cfg.upload.allowed_extensions.insert(DEFAULT_EXTENSIONS.begin(), DEFAULT_EXTENSIONS.end());

        cfg.log.log_level = "inf";
        cfg.log.log_level_type = LOG_SEVERITY::INFO;
        cfg.log.loggers.clear();
        cfg.log.loggers.emplace("console");
        cfg.log.loggers.emplace("file");
        cfg.log.max_mbytes_per_file = 10;
        cfg.log.max_file_count = 50;
    }

    /**
     * Creates a new instance directory with the default config.
     * By the time this gets called, the 'ctx' struct must be populated.
     */
    int create_instance()
    {
        if (util::is_dir_exists(ctx.base_dir))
        {
            std::cerr << "Instance dir already exists. Cannot create instance at the same location.\n";
            return -1;
        }

        if (util::create_dir_tree_recursive(ctx.config_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "ERROR: unable to create directories.\n";
            return -1;
        }

        // We populate the in-memory struct with default settings and then save it to the file.
        revusb_config cfg = {};
        populate_defaults(cfg);

        if (write_config(cfg) != 0)
            return -1;

        std::cout << "Instance directory created at " << ctx.base_dir << std::endl;
        return 0;
    }

    /**
     * Updates the context with directory paths based on provided base directory.
     * This is called after parsing the command line args in order to populate the ctx.
     */
    void set_dir_paths(std::string exepath, std::string basedir)
    {
        if (exepath.empty())
        {
            // this code branch will never execute the way main is currently coded, but it might change in future
            std::cerr << "Executable path must be specified\n";
            exit(1);
        }

        if (basedir.empty())
        {
            // this code branch will never execute the way main is currently coded, but it might change in future
            std::cerr << "an instance directory must be specified\n";
            exit(1);
        }

        // resolving the path through realpath will remove any trailing slash if present.
        // The base dir does not exist yet for the 'new' command, so keep the given path in that case.
        const std::string real_basedir = util::realpath(basedir);
        if (!real_basedir.empty())
            basedir = real_basedir;
        else if (basedir.size() > 1 && basedir.back() == '/')
            basedir.pop_back();

        const std::string real_exepath = util::realpath(exepath);
        if (!real_exepath.empty())
            exepath = real_exepath;

        // Take the parent directory path.
        ctx.exe_dir = dirname(exepath.data());

        ctx.base_dir = basedir;
        ctx.config_dir = basedir + "/cfg";
        ctx.config_file = ctx.config_dir + "/revusb.cfg";
        ctx.log_dir = basedir + "/log";
    }

    /**
     * Reads the config file on disk and populates the in-memory 'cfg' struct.
     * @return 0 for successful loading of config. -1 for failure.
     */
    int read_config(revusb_config &cfg)
    {
        std::string buf;
        if (util::read_from_fd(ctx.config_fd, buf) == -1)
        {
            std::cerr << "Error reading from the config file. " << errno << '\n';
            return -1;
        }

        return parse_config(cfg, buf);
    }

    /**
     * Parses the given json text into the config struct.
     * @return 0 on success. -1 on malformed json or missing fields.
     */
    int parse_config(revusb_config &cfg, std::string_view json)
    {
        jsoncons::ojson d;
        try
        {
            d = jsoncons::ojson::parse(json, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            std::cerr << "Invalid config file format. " << e.what() << '\n';
            return -1;
        }

        try
        {
            // Check whether this config complies with the min version requirement.
            cfg.version = d["version"].as<std::string>();
            const int verresult = version::version_compare(cfg.version, version::MIN_CONFIG_VERSION);
            if (verresult == -1)
            {
                std::cerr << "Config version too old. Minimum "
                          << version::MIN_CONFIG_VERSION << " required. "
                          << cfg.version << " found.\n";
                return -1;
            }
            else if (verresult == -2)
            {
                std::cerr << "Malformed version string.\n";
                return -1;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Required config field version missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // mount
        {
            try
            {
                const jsoncons::ojson &mount = d["mount"];
                cfg.mount.mount_root = mount["mount_root"].as<std::string>();
                cfg.mount.use_sudo = mount["use_sudo"].as<bool>();
                cfg.mount.mount_bin = mount["mount_bin"].as<std::string>();
                cfg.mount.umount_bin = mount["umount_bin"].as<std::string>();
                cfg.mount.lsblk_bin = mount["lsblk_bin"].as<std::string>();
                cfg.mount.command_timeout = mount["command_timeout"].as<uint32_t>();
                cfg.mount.unmount_retries = mount["unmount_retries"].as<uint16_t>();
                cfg.mount.unmount_retry_interval = mount["unmount_retry_interval"].as<uint32_t>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required mount config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // upload
        {
            try
            {
                const jsoncons::ojson &upload = d["upload"];
                cfg.upload.max_bytes = upload["max_bytes"].as<uint64_t>();
                cfg.upload.allowed_extensions.clear();
                for (auto &v : upload["allowed_extensions"].array_range())
                    cfg.upload.allowed_extensions.emplace(util::to_lower(v.as<std::string>()));
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required upload config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // log
        {
            try
            {
                const jsoncons::ojson &log = d["log"];
                cfg.log.log_level = log["log_level"].as<std::string>();
                cfg.log.log_level_type = get_loglevel_type(cfg.log.log_level);
                cfg.log.max_mbytes_per_file = log["max_mbytes_per_file"].as<size_t>();
                cfg.log.max_file_count = log["max_file_count"].as<size_t>();
                cfg.log.loggers.clear();
                for (auto &v : log["loggers"].array_range())
                    cfg.log.loggers.emplace(v.as<std::string>());
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required log config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        return 0;
    }

    /**
     * Saves the provided 'cfg' struct into the config file.
     * @return 0 for successful save. -1 for failure.
     */
    int write_config(const revusb_config &cfg)
    {
        jsoncons::ojson d;
        d.insert_or_assign("version", cfg.version);

        // Mount configs.
        {
            jsoncons::ojson mount;
            mount.insert_or_assign("mount_root", cfg.mount.mount_root);
            mount.insert_or_assign("use_sudo", cfg.mount.use_sudo);
            mount.insert_or_assign("mount_bin", cfg.mount.mount_bin);
            mount.insert_or_assign("umount_bin", cfg.mount.umount_bin);
            mount.insert_or_assign("lsblk_bin", cfg.mount.lsblk_bin);
            mount.insert_or_assign("command_timeout", cfg.mount.command_timeout);
            mount.insert_or_assign("unmount_retries", cfg.mount.unmount_retries);
            mount.insert_or_assign("unmount_retry_interval", cfg.mount.unmount_retry_interval);
            d.insert_or_assign("mount", mount);
        }

        // Upload configs.
        {
            jsoncons::ojson upload;
            upload.insert_or_assign("max_bytes", cfg.upload.max_bytes);

            // Sorted so the written file is stable across runs.
            const std::set<std::string> sorted(cfg.upload.allowed_extensions.begin(), cfg.upload.allowed_extensions.end());
            jsoncons::ojson extensions(jsoncons::json_array_arg);
            for (const std::string &ext : sorted)
                extensions.push_back(ext);
            upload.insert_or_assign("allowed_extensions", extensions);
            d.insert_or_assign("upload", upload);
        }

        // Log configs.
        {
            jsoncons::ojson log;
            log.insert_or_assign("log_level", cfg.log.log_level);
            log.insert_or_assign("max_mbytes_per_file", cfg.log.max_mbytes_per_file);
            log.insert_or_assign("max_file_count", cfg.log.max_file_count);

            jsoncons::ojson loggers(jsoncons::json_array_arg);
            for (const std::string &logger : cfg.log.loggers)
                loggers.push_back(logger);
            log.insert_or_assign("loggers", loggers);
            d.insert_or_assign("log", log);
        }

        return write_json_file(ctx.config_file, d);
    }

    /**
     * Validates the 'cfg' struct for invalid values.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_config(const revusb_config &cfg)
    {
        bool fields_missing = false;

        fields_missing |= cfg.mount.mount_root.empty() && std::cerr << "Missing cfg field: mount_root\n";
        fields_missing |= cfg.mount.mount_bin.empty() && std::cerr << "Missing cfg field: mount_bin\n";
        fields_missing |= cfg.mount.umount_bin.empty() && std::cerr << "Missing cfg field: umount_bin\n";
        fields_missing |= cfg.mount.lsblk_bin.empty() && std::cerr << "Missing cfg field: lsblk_bin\n";
        fields_missing |= cfg.mount.command_timeout == 0 && std::cerr << "Missing cfg field: command_timeout\n";
        fields_missing |= cfg.upload.max_bytes == 0 && std::cerr << "Missing cfg field: max_bytes\n";
        fields_missing |= cfg.upload.allowed_extensions.empty() && std::cerr << "Missing cfg field: allowed_extensions\n";
        fields_missing |= cfg.log.log_level.empty() && std::cerr << "Missing cfg field: log_level\n";
        fields_missing |= cfg.log.loggers.empty() && std::cerr << "Missing cfg field: loggers\n";

        if (fields_missing)
        {
            std::cerr << "Required configuration fields missing at " << ctx.config_file << std::endl;
            return -1;
        }

        if (cfg.mount.mount_root.front() != '/' || cfg.mount.mount_root == "/")
        {
            std::cerr << "Invalid mount_root. Must be an absolute path other than /.\n";
            return -1;
        }

        for (const std::string &ext : cfg.upload.allowed_extensions)
        {
            if (ext.size() < 2 || ext.front() != '.' || ext.find('/') != std::string::npos)
            {
                std::cerr << "Invalid upload extension '" << ext << "'. Expected format: .ext\n";
                return -1;
            }
        }

        // Log settings
        const std::unordered_set<std::string> valid_loglevels({"dbg", "inf", "wrn", "err"});
        if (valid_loglevels.count(cfg.log.log_level) != 1)
        {
            std::cerr << "Invalid loglevel configured. Valid values: dbg|inf|wrn|err\n";
            return -1;
        }

        const std::unordered_set<std::string> valid_loggers({"console", "file"});
        for (const std::string &logger : cfg.log.loggers)
        {
            if (valid_loggers.count(logger) != 1)
            {
                std::cerr << "Invalid logger. Valid values: console|file\n";
                return -1;
            }
        }

        if (cfg.log.loggers.count("file") == 1 && (cfg.log.max_mbytes_per_file == 0 || cfg.log.max_file_count == 0))
        {
            std::cerr << "File logger requires non-zero max_mbytes_per_file and max_file_count.\n";
            return -1;
        }

        return 0;
    }

    /**
     * Checks for the existence of all instance sub directories.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_dir_paths()
    {
        const std::string paths[3] = {
            ctx.base_dir,
            ctx.config_file,
            ctx.log_dir};

        for (const std::string &path : paths)
        {
            if (!util::is_file_exists(path) && !util::is_dir_exists(path))
            {
                std::cerr << path << " does not exist.\n";
                return -1;
            }
        }

        return 0;
    }

    /**
     * Convert string to Log Severity enum type.
     * @param severity log severity code.
     * @return log severity type.
    */
    LOG_SEVERITY get_loglevel_type(std::string_view severity)
    {
        if (severity == "dbg")
            return LOG_SEVERITY::DEBUG;
        else if (severity == "wrn")
            return LOG_SEVERITY::WARN;
        else if (severity == "inf")
            return LOG_SEVERITY::INFO;
        else
            return LOG_SEVERITY::ERROR;
    }

    /**
     * Extracts missing config field from the jsoncons exception message.
     * @param err_message Jsoncons error message.
     * @return Missing config field.
    */
    const std::string extract_missing_field(std::string err_message)
    {
        err_message.erase(0, err_message.find("'") + 1);
        return err_message.substr(0, err_message.find("'"));
    }

    /**
     * Locks the config file. If the lock is already held by another process, revusb is already
     * running on this instance directory.
     * @return Returns 0 if lock is successfully aquired, -1 on error.
    */
    int set_config_lock()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDWR | O_CLOEXEC);
        if (ctx.config_fd == -1)
        {
            std::cerr << errno << ": Error opening config file " << ctx.config_file << "\n";
            return -1;
        }

        if (util::set_lock(ctx.config_fd, ctx.config_lock, true, 0, 0) == -1)
        {
            if (errno == EACCES || errno == EAGAIN)
            {
                std::cerr << "Another revusb instance is already running in directory " << ctx.base_dir << "\n";
            }
            // Close fd if lock aquiring failed.
            close(ctx.config_fd);
            ctx.config_fd = -1;
            return -1;
        }

        return 0;
    }

    /**
     * Releases the config file and closes the opened file descriptor.
     * @return Returns 0 if lock is successfully released, -1 on error.
    */
    int release_config_lock()
    {
        if (ctx.config_fd == -1)
            return 0;

        const int res = util::release_lock(ctx.config_fd, ctx.config_lock);
        // Close fd in termination.
        close(ctx.config_fd);
        ctx.config_fd = -1;
        return res;
    }

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d)
    {
        std::string json;
        // Convert json object to a string.
        try
        {
            jsoncons::json_options options;
            options.object_array_line_splits(jsoncons::line_split_kind::multi_line);
            options.spaces_around_comma(jsoncons::spaces_option::no_spaces);
            std::ostringstream os;
            os << jsoncons::pretty_print(d, options);
            json = os.str();
            os.clear();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Converting json to string failed. " << file_path << std::endl;
            return -1;
        }

        // O_TRUNC flag is used to trucate existing content from the file.
        const int fd = open(file_path.data(), O_CREAT | O_RDWR | O_TRUNC | O_CLOEXEC, FILE_PERMS);
        if (fd == -1 || util::write_all(fd, json.data(), json.size()) == -1)
        {
            std::cerr << "Writing file failed. " << file_path << std::endl;
            if (fd != -1)
                close(fd);
            return -1;
        }
        close(fd);
        return 0;
    }

} // namespace conf
